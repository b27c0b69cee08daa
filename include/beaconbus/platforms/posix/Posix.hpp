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
#include <algorithm>
#include <vector>

namespace beaconbus
{
namespace platform
{

struct Posix
{
  // Scan active network interfaces and return the addresses of all
  // interfaces that are up and carry an IPv4 address.
  static std::vector<asio::ip::address_v4> scanIpV4IfAddrs();
};

// The address a node reports as its own: the first non-loopback address,
// falling back to the loopback address on hosts without a network.
inline asio::ip::address_v4 selectInterfaceAddress(
  const std::vector<asio::ip::address_v4>& addrs)
{
  const auto it = std::find_if(addrs.begin(), addrs.end(),
    [](const asio::ip::address_v4& addr) { return !addr.is_loopback(); });
  return it == addrs.end() ? asio::ip::address_v4::loopback() : *it;
}

} // namespace platform
} // namespace beaconbus
