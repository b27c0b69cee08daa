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

#include <beaconbus/discovery/Socket.hpp>
#include <memory>
#include <string>

namespace beaconbus
{
namespace discovery
{

// The discovery channel: one udp socket bound to the discovery port on all
// interfaces, sending to the broadcast address and receiving every beacon
// broadcast on that port. The interface address is what the bus reports as
// its own host.
template <std::size_t MaxPacketSize>
class BroadcastInterface
{
public:
  BroadcastInterface(asio::io_context& io,
    const asio::ip::address_v4& interfaceAddr,
    const asio::ip::address_v4& broadcastAddr,
    const std::uint16_t port)
    : mpSocket(std::make_shared<Socket<MaxPacketSize>>(io))
    , mInterfaceAddr(interfaceAddr)
    , mBroadcastEndpoint(broadcastAddr, port)
  {
    configureBroadcastSocket(*mpSocket, port);
  }

  BroadcastInterface(const BroadcastInterface&) = delete;
  BroadcastInterface& operator=(const BroadcastInterface&) = delete;

  BroadcastInterface(BroadcastInterface&&) = default;
  BroadcastInterface& operator=(BroadcastInterface&&) = default;

  // Broadcast a datagram to every host listening on the discovery port.
  // Throws asio::system_error on failure.
  friend std::size_t send(
    BroadcastInterface& iface, const std::uint8_t* const pData, const std::size_t numBytes)
  {
    return send(iface.mpSocket, pData, numBytes, iface.mBroadcastEndpoint);
  }

  // Handler is called with (const asio::ip::udp::endpoint& from, It begin, It end)
  // for every datagram received until the interface is closed.
  template <typename Handler>
  friend void receive(BroadcastInterface& iface, Handler handler)
  {
    receive(iface.mpSocket, std::move(handler));
  }

  friend std::string boundAddress(const BroadcastInterface& iface)
  {
    return iface.mInterfaceAddr.to_string();
  }

  friend void close(BroadcastInterface& iface)
  {
    close(*iface.mpSocket);
  }

private:
  std::shared_ptr<Socket<MaxPacketSize>> mpSocket;
  asio::ip::address_v4 mInterfaceAddr;
  asio::ip::udp::endpoint mBroadcastEndpoint;
};

} // namespace discovery
} // namespace beaconbus
