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
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>

namespace
{

// RAII type to make [get,free]ifaddrs function pairs exception safe
struct GetIfAddrs
{
  GetIfAddrs()
  {
    if (getifaddrs(&interfaces)) // returns 0 on success
    {
      interfaces = nullptr;
    }
  }

  ~GetIfAddrs()
  {
    if (interfaces)
    {
      freeifaddrs(interfaces);
    }
  }

  GetIfAddrs(const GetIfAddrs&) = delete;
  GetIfAddrs& operator=(const GetIfAddrs&) = delete;

  template <typename Function>
  void withIfAddrs(Function f)
  {
    if (interfaces)
    {
      f(*interfaces);
    }
  }

private:
  struct ifaddrs* interfaces = nullptr;
};

} // anonymous namespace

namespace beaconbus
{
namespace platform
{

std::vector<asio::ip::address_v4> Posix::scanIpV4IfAddrs()
{
  std::vector<asio::ip::address_v4> addrs;

  GetIfAddrs getIfAddrs;
  getIfAddrs.withIfAddrs([&](const struct ifaddrs& interfaces) {
    for (auto interface = &interfaces; interface; interface = interface->ifa_next)
    {
      const auto addr = interface->ifa_addr;
      if (addr && (interface->ifa_flags & IFF_UP) && addr->sa_family == AF_INET)
      {
        const auto addr4 = reinterpret_cast<const struct sockaddr_in*>(addr);
        addrs.emplace_back(ntohl(addr4->sin_addr.s_addr));
      }
    }
  });

  return addrs;
}

} // namespace platform
} // namespace beaconbus
