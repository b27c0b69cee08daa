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

#include <beaconbus/platforms/posix/Posix.hpp>
#include <beaconbus/test/CatchWrapper.hpp>

namespace beaconbus
{
namespace platform
{

TEST_CASE("InterfaceScanner | PrefersNonLoopbackAddress", "[InterfaceScanner]")
{
  const auto addrs = std::vector<asio::ip::address_v4>{
    asio::ip::make_address_v4("127.0.0.1"), asio::ip::make_address_v4("192.168.1.10"),
    asio::ip::make_address_v4("10.0.0.3")};
  CHECK(asio::ip::make_address_v4("192.168.1.10") == selectInterfaceAddress(addrs));
}

TEST_CASE("InterfaceScanner | FallsBackToLoopback", "[InterfaceScanner]")
{
  CHECK(asio::ip::address_v4::loopback() == selectInterfaceAddress({}));
  CHECK(asio::ip::address_v4::loopback()
        == selectInterfaceAddress({asio::ip::make_address_v4("127.0.0.1")}));
}

TEST_CASE("InterfaceScanner | ScanFindsOnlyIpV4Addresses", "[InterfaceScanner]")
{
  // Every host with a network stack has at least the loopback interface up
  const auto addrs = Posix::scanIpV4IfAddrs();
  for (const auto& addr : addrs)
  {
    CHECK_FALSE(addr.is_unspecified());
  }
}

} // namespace platform
} // namespace beaconbus
