/* Copyright 2026, The BeaconBus Authors. All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 2 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 *
 *  If you would like to incorporate BeaconBus into a proprietary software application,
 *  please contact the BeaconBus maintainers.
 */

#pragma once

#include <beaconbus/asio/AsioWrapper.hpp>
#include <beaconbus/bus/Message.hpp>
#include <beaconbus/util/SafeAsyncHandler.hpp>
#include <array>
#include <functional>
#include <memory>
#include <set>
#include <vector>

namespace beaconbus
{
namespace bus
{

// The receiving side of the data channel. Listens on a tcp port, accepts
// any number of publishers and hands every complete message read from
// any of them to the receive handler.
template <typename Log>
class Subscriber
{
public:
  Subscriber(asio::io_context& io, Log log, const std::size_t maxMessageSize)
    : mpImpl(std::make_shared<Impl>(io, std::move(log), maxMessageSize))
  {
  }

  Subscriber(const Subscriber&) = delete;
  Subscriber& operator=(const Subscriber&) = delete;

  Subscriber(Subscriber&&) = default;
  Subscriber& operator=(Subscriber&&) = default;

  // Listen on an ephemeral port on all interfaces and start accepting.
  // Returns the port. Throws asio::system_error on failure.
  friend std::uint16_t bind(Subscriber& subscriber)
  {
    return subscriber.mpImpl->bind();
  }

  // The handler is called with every message received
  template <typename Handler>
  friend void receive(Subscriber& subscriber, Handler handler)
  {
    subscriber.mpImpl->mHandler = [handler](Message message) {
      handler(std::move(message));
    };
  }

  friend asio::ip::tcp::endpoint endpoint(const Subscriber& subscriber)
  {
    asio::error_code ec;
    return subscriber.mpImpl->mAcceptor.local_endpoint(ec);
  }

  friend std::size_t numConnections(const Subscriber& subscriber)
  {
    return subscriber.mpImpl->mConnections.size();
  }

  friend void close(Subscriber& subscriber)
  {
    subscriber.mpImpl->shutdown();
  }

private:
  struct Connection
  {
    explicit Connection(asio::ip::tcp::socket socket)
      : mSocket(std::move(socket))
    {
    }

    void close()
    {
      asio::error_code ec;
      mSocket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      mSocket.close(ec);
    }

    asio::ip::tcp::socket mSocket;
    std::array<std::uint8_t, kMessageHeaderSize> mHeader;
    std::vector<std::uint8_t> mBody;
  };

  using ConnectionPtr = std::shared_ptr<Connection>;

  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(asio::io_context& io, Log log, const std::size_t maxMessageSize)
      : mAcceptor(io)
      , mLog(std::move(log))
      , mMaxMessageSize(maxMessageSize)
      , mHandler([](Message) {})
    {
    }

    ~Impl()
    {
      shutdown();
    }

    std::uint16_t bind()
    {
      const asio::ip::tcp::endpoint any{asio::ip::address_v4::any(), 0};
      mAcceptor.open(any.protocol());
      mAcceptor.bind(any);
      mAcceptor.listen();
      accept();
      return mAcceptor.local_endpoint().port();
    }

    void accept()
    {
      mAcceptor.async_accept(util::makeAsyncSafe(this->shared_from_this()));
    }

    // Accept completion
    void operator()(const asio::error_code& ec, asio::ip::tcp::socket socket)
    {
      if (ec == asio::error::operation_aborted || !mAcceptor.is_open())
      {
        return;
      }

      if (ec)
      {
        warning(mLog) << "Failed to accept connection: " << ec.message();
      }
      else
      {
        asio::error_code endpointEc;
        const auto remote = socket.remote_endpoint(endpointEc);
        debug(mLog) << "Accepted connection from " << remote;
        auto pConnection = std::make_shared<Connection>(std::move(socket));
        mConnections.insert(pConnection);
        readHeader(pConnection);
      }
      accept();
    }

    // Each read handler holds the connection, the subscriber only weakly
    void readHeader(const ConnectionPtr& pConnection)
    {
      asio::async_read(pConnection->mSocket, asio::buffer(pConnection->mHeader),
        util::makeAsyncSafe(this->shared_from_this(),
          [pConnection](Impl& subscriber, const asio::error_code& ec, std::size_t) {
            subscriber.onHeader(pConnection, ec);
          }));
    }

    void readBody(const ConnectionPtr& pConnection, const std::uint32_t bodySize)
    {
      pConnection->mBody.resize(bodySize);
      asio::async_read(pConnection->mSocket, asio::buffer(pConnection->mBody),
        util::makeAsyncSafe(this->shared_from_this(),
          [pConnection](Impl& subscriber, const asio::error_code& ec, std::size_t) {
            subscriber.onBody(pConnection, ec);
          }));
    }

    void onHeader(const ConnectionPtr& pConnection, const asio::error_code& ec)
    {
      if (ec)
      {
        drop(pConnection, ec);
        return;
      }

      try
      {
        const auto bodySize = decodeMessageHeader(
          pConnection->mHeader.cbegin(), pConnection->mHeader.cend(), mMaxMessageSize);
        readBody(pConnection, bodySize);
      }
      catch (const MessageFormatError& e)
      {
        warning(mLog) << "Closing connection after protocol violation: " << e.what();
        drop(pConnection, {});
      }
    }

    void onBody(const ConnectionPtr& pConnection, const asio::error_code& ec)
    {
      if (ec)
      {
        drop(pConnection, ec);
        return;
      }

      try
      {
        auto message =
          decodeMessageBody(pConnection->mBody.cbegin(), pConnection->mBody.cend());
        readHeader(pConnection);
        mHandler(std::move(message));
      }
      catch (const MessageFormatError& e)
      {
        warning(mLog) << "Closing connection after protocol violation: " << e.what();
        drop(pConnection, {});
      }
    }

    void drop(const ConnectionPtr& pConnection, const asio::error_code& ec)
    {
      if (ec && ec != asio::error::operation_aborted && ec != asio::error::eof)
      {
        info(mLog) << "Connection closed: " << ec.message();
      }
      pConnection->close();
      mConnections.erase(pConnection);
    }

    void shutdown()
    {
      asio::error_code ec;
      mAcceptor.close(ec);
      for (const auto& pConnection : mConnections)
      {
        pConnection->close();
      }
      mConnections.clear();
    }

    asio::ip::tcp::acceptor mAcceptor;
    Log mLog;
    std::size_t mMaxMessageSize;
    std::function<void(Message)> mHandler;
    std::set<ConnectionPtr> mConnections;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace bus
} // namespace beaconbus
