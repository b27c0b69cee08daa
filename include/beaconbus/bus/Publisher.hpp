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
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace beaconbus
{
namespace bus
{

enum class LinkState
{
  Unknown,
  Connecting,
  Connected,
  Failed,
};

enum class ConnectResult
{
  // The link is being established or already up
  Ok,
  // The address can never be connected to
  HardError,
};

struct TcpAddress
{
  std::string host;
  std::uint16_t port;
};

// Parses "tcp://host:port". Hosts may be bracketed ("tcp://[::1]:5000").
// Returns nullopt for anything else, including port 0, which is never a
// listening port.
inline std::optional<TcpAddress> parseTcpAddress(const std::string& address)
{
  const std::string scheme = "tcp://";
  if (address.compare(0, scheme.size(), scheme) != 0)
  {
    return std::nullopt;
  }

  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon < scheme.size())
  {
    return std::nullopt;
  }

  auto host = address.substr(scheme.size(), colon - scheme.size());
  if (host.size() > 1 && host.front() == '[' && host.back() == ']')
  {
    host = host.substr(1, host.size() - 2);
  }

  const auto portText = address.substr(colon + 1);
  if (host.empty() || portText.empty() || portText.size() > 5
      || portText.find_first_not_of("0123456789") != std::string::npos)
  {
    return std::nullopt;
  }

  const auto port = std::stoul(portText);
  if (port == 0 || port > 65535)
  {
    return std::nullopt;
  }
  return TcpAddress{std::move(host), static_cast<std::uint16_t>(port)};
}

// The sending side of the data channel. Dials out to any number of
// subscribers and writes every published message to each link that is
// up. Messages published while a link is down are not delivered to it.
// Messages with a body larger than maxMessageSize are dropped, since
// subscribers close the connection on them.
template <typename Log>
class Publisher
{
public:
  Publisher(asio::io_context& io, Log log, const std::size_t maxMessageSize)
    : mpImpl(std::make_shared<Impl>(io, std::move(log), maxMessageSize))
  {
  }

  Publisher(const Publisher&) = delete;
  Publisher& operator=(const Publisher&) = delete;

  Publisher(Publisher&&) = default;
  Publisher& operator=(Publisher&&) = default;

  // Start dialing the address unless a link to it is already up or being
  // established. A failed link is dialed again.
  friend ConnectResult connect(Publisher& publisher, const std::string& address)
  {
    return publisher.mpImpl->connect(address);
  }

  friend void disconnect(Publisher& publisher, const std::string& address)
  {
    publisher.mpImpl->disconnect(address);
  }

  friend void send(Publisher& publisher, const Message& message)
  {
    publisher.mpImpl->send(message);
  }

  friend LinkState linkState(const Publisher& publisher, const std::string& address)
  {
    const auto& links = publisher.mpImpl->mLinks;
    const auto it = links.find(address);
    return it == links.end() ? LinkState::Unknown : it->second->mState;
  }

  friend void close(Publisher& publisher)
  {
    publisher.mpImpl->shutdown();
  }

private:
  struct Link : std::enable_shared_from_this<Link>
  {
    Link(asio::io_context& io, std::string address, TcpAddress target, Log log)
      : mAddress(std::move(address))
      , mTarget(std::move(target))
      , mResolver(io)
      , mSocket(io)
      , mLog(std::move(log))
    {
    }

    void dial()
    {
      mState = LinkState::Connecting;
      auto pSelf = this->shared_from_this();
      mResolver.async_resolve(mTarget.host, std::to_string(mTarget.port),
        [pSelf](const asio::error_code& ec, asio::ip::tcp::resolver::results_type results) {
          if (ec)
          {
            pSelf->fail("resolve", ec);
            return;
          }
          asio::async_connect(pSelf->mSocket, results,
            [pSelf](const asio::error_code& connectEc, const asio::ip::tcp::endpoint&) {
              if (connectEc)
              {
                pSelf->fail("connect", connectEc);
                return;
              }
              pSelf->mState = LinkState::Connected;
              asio::error_code optionEc;
              pSelf->mSocket.set_option(asio::ip::tcp::no_delay(true), optionEc);
              info(pSelf->mLog) << "Connected to " << pSelf->mAddress;
              pSelf->watchForClose();
              pSelf->writeNext();
            });
        });
    }

    // Subscribers never write back, so a completed read means the peer
    // closed the connection or the connection broke.
    void watchForClose()
    {
      auto pSelf = this->shared_from_this();
      mSocket.async_read_some(asio::buffer(mDiscard),
        [pSelf](const asio::error_code& ec, std::size_t) {
          if (pSelf->mState != LinkState::Connected)
          {
            return;
          }
          if (ec)
          {
            pSelf->fail("connection", ec);
          }
          else
          {
            pSelf->watchForClose();
          }
        });
    }

    void enqueue(std::shared_ptr<const std::vector<std::uint8_t>> pBuffer)
    {
      if (mState != LinkState::Connected)
      {
        return;
      }
      mQueue.push_back(std::move(pBuffer));
      if (mQueue.size() == 1)
      {
        writeNext();
      }
    }

    void writeNext()
    {
      if (mQueue.empty() || mState != LinkState::Connected)
      {
        return;
      }
      auto pSelf = this->shared_from_this();
      asio::async_write(mSocket, asio::buffer(*mQueue.front()),
        [pSelf](const asio::error_code& ec, std::size_t) {
          if (pSelf->mState != LinkState::Connected)
          {
            return;
          }
          if (ec)
          {
            pSelf->fail("write", ec);
            return;
          }
          pSelf->mQueue.pop_front();
          pSelf->writeNext();
        });
    }

    void fail(const char* what, const asio::error_code& ec)
    {
      if (mState == LinkState::Failed || mClosed)
      {
        return;
      }
      warning(mLog) << "Link to " << mAddress << " failed (" << what << "): "
                    << ec.message();
      mState = LinkState::Failed;
      closeSocket();
    }

    void closeSocket()
    {
      mResolver.cancel();
      asio::error_code ec;
      mSocket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
      mSocket.close(ec);
      mQueue.clear();
    }

    void shutdown()
    {
      mClosed = true;
      mState = LinkState::Unknown;
      closeSocket();
    }

    std::string mAddress;
    TcpAddress mTarget;
    asio::ip::tcp::resolver mResolver;
    asio::ip::tcp::socket mSocket;
    Log mLog;
    LinkState mState = LinkState::Unknown;
    bool mClosed = false;
    std::deque<std::shared_ptr<const std::vector<std::uint8_t>>> mQueue;
    std::array<std::uint8_t, 64> mDiscard;
  };

  struct Impl
  {
    Impl(asio::io_context& io, Log log, const std::size_t maxMessageSize)
      : mIo(io)
      , mLog(std::move(log))
      , mMaxMessageSize(maxMessageSize)
    {
    }

    ~Impl()
    {
      shutdown();
    }

    ConnectResult connect(const std::string& address)
    {
      if (mClosed)
      {
        return ConnectResult::Ok;
      }

      const auto it = mLinks.find(address);
      if (it != mLinks.end())
      {
        if (it->second->mState == LinkState::Failed)
        {
          info(mLog) << "Redialing " << address;
          // Sockets are not reused after a failure
          it->second->shutdown();
          it->second = std::make_shared<Link>(mIo, address, it->second->mTarget, mLog);
          it->second->dial();
        }
        return ConnectResult::Ok;
      }

      auto target = parseTcpAddress(address);
      if (!target)
      {
        warning(mLog) << "Cannot connect to invalid address " << address;
        return ConnectResult::HardError;
      }

      auto pLink = std::make_shared<Link>(mIo, address, std::move(*target), mLog);
      mLinks.emplace(address, pLink);
      pLink->dial();
      return ConnectResult::Ok;
    }

    void disconnect(const std::string& address)
    {
      const auto it = mLinks.find(address);
      if (it != mLinks.end())
      {
        it->second->shutdown();
        mLinks.erase(it);
        info(mLog) << "Disconnected from " << address;
      }
    }

    void send(const Message& message)
    {
      if (mClosed)
      {
        return;
      }
      const auto bodySize = sizeInByteStream(message);
      if (bodySize > mMaxMessageSize)
      {
        warning(mLog) << "Dropping message of " << bodySize << " bytes, the limit is "
                      << mMaxMessageSize;
        return;
      }
      const auto pBuffer =
        std::make_shared<const std::vector<std::uint8_t>>(encodeMessage(message));
      for (auto& link : mLinks)
      {
        link.second->enqueue(pBuffer);
      }
    }

    void shutdown()
    {
      mClosed = true;
      for (auto& link : mLinks)
      {
        link.second->shutdown();
      }
      mLinks.clear();
    }

    asio::io_context& mIo;
    Log mLog;
    std::size_t mMaxMessageSize;
    bool mClosed = false;
    std::map<std::string, std::shared_ptr<Link>> mLinks;
  };

  std::shared_ptr<Impl> mpImpl;
};

} // namespace bus
} // namespace beaconbus
