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
#include <beaconbus/util/SafeAsyncHandler.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <memory>

namespace beaconbus
{
namespace discovery
{

// UDP socket that keeps receiving datagrams of up to MaxPacketSize bytes
// once a handler has been installed. Held through a shared_ptr so that
// pending receives can refer back to it with util::makeAsyncSafe.
template <std::size_t MaxPacketSize>
struct Socket
{
  Socket(asio::io_context& io)
    : mImpl(io, asio::ip::udp::v4())
  {
  }

  ~Socket()
  {
    close(*this);
  }

  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  // Throws asio::system_error on failure
  friend std::size_t send(
    const std::shared_ptr<Socket>& socket,
    const std::uint8_t* const pData,
    const std::size_t numBytes,
    const asio::ip::udp::endpoint& to)
  {
    return socket->mImpl.send_to(asio::buffer(pData, numBytes), to);
  }

  template <typename Handler>
  friend void receive(const std::shared_ptr<Socket>& socket, Handler handler)
  {
    socket->mHandler = std::move(handler);
    socket->mpSelf = socket;
    socket->asyncReceive();
  }

  friend void close(Socket& socket)
  {
    // Ignore error codes in shutdown and close as the socket may
    // have already been forcibly closed
    asio::error_code ec;
    socket.mImpl.shutdown(asio::ip::udp::socket::shutdown_both, ec);
    socket.mImpl.close(ec);
  }

  void operator()(const asio::error_code& error, const std::size_t numBytes)
  {
    if (error == asio::error::operation_aborted || !mImpl.is_open())
    {
      return;
    }

    if (!error && numBytes > 0 && numBytes <= MaxPacketSize)
    {
      const auto bufBegin = mReceiveBuffer.cbegin();
      mHandler(mSenderEndpoint, bufBegin, bufBegin + static_cast<std::ptrdiff_t>(numBytes));
    }
    asyncReceive();
  }

  void asyncReceive()
  {
    if (auto pSelf = mpSelf.lock())
    {
      mImpl.async_receive_from(asio::buffer(mReceiveBuffer, MaxPacketSize),
        mSenderEndpoint, util::makeAsyncSafe(pSelf));
    }
  }

  asio::ip::udp::socket mImpl;
  asio::ip::udp::endpoint mSenderEndpoint;
  using Buffer = std::array<std::uint8_t, MaxPacketSize>;
  Buffer mReceiveBuffer;
  using ByteIt = typename Buffer::const_iterator;
  std::function<void(const asio::ip::udp::endpoint&, ByteIt, ByteIt)> mHandler;
  std::weak_ptr<Socket> mpSelf;
};

// Configure a socket for sending and receiving broadcast datagrams on the
// given port. Several processes on one host may bind the same port.
template <std::size_t MaxPacketSize>
void configureBroadcastSocket(Socket<MaxPacketSize>& socket, const std::uint16_t port)
{
  socket.mImpl.set_option(asio::ip::udp::socket::reuse_address(true));
  socket.mImpl.set_option(asio::socket_base::broadcast(true));
  socket.mImpl.bind({asio::ip::address_v4::any(), port});
}

} // namespace discovery
} // namespace beaconbus
