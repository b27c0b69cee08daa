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
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace beaconbus
{
namespace discovery
{
namespace test
{

// In-memory discovery channel. Records every broadcast and lets the test
// inject datagrams as if they were received from the network.
struct Interface
{
  friend std::size_t send(
    Interface& iface, const std::uint8_t* const bytes, const std::size_t numBytes)
  {
    if (iface.failSends)
    {
      throw std::runtime_error("network unreachable");
    }
    iface.sentMessages.emplace_back(bytes, bytes + numBytes);
    return numBytes;
  }

  template <typename Callback>
  friend void receive(Interface& iface, Callback callback)
  {
    iface.mCallback = [callback](const asio::ip::udp::endpoint& from,
                        const std::vector<std::uint8_t>& buffer) {
      callback(from, buffer.cbegin(), buffer.cend());
    };
  }

  friend std::string boundAddress(const Interface& iface)
  {
    return iface.address;
  }

  friend void close(Interface& iface)
  {
    iface.closed = true;
    iface.mCallback = nullptr;
  }

  void incomingMessage(const asio::ip::udp::endpoint& from, const std::string& payload)
  {
    if (mCallback)
    {
      mCallback(from, std::vector<std::uint8_t>{payload.begin(), payload.end()});
    }
  }

  std::vector<std::string> sentPayloads() const
  {
    std::vector<std::string> payloads;
    for (const auto& message : sentMessages)
    {
      payloads.emplace_back(message.begin(), message.end());
    }
    return payloads;
  }

  std::string address = "192.168.1.10";
  bool failSends = false;
  bool closed = false;
  std::vector<std::vector<std::uint8_t>> sentMessages;

private:
  using ReceiveCallback =
    std::function<void(const asio::ip::udp::endpoint&, const std::vector<std::uint8_t>&)>;
  ReceiveCallback mCallback;
};

} // namespace test
} // namespace discovery
} // namespace beaconbus
