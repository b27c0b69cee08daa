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

#include <beaconbus/discovery/HostResolver.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <beaconbus/util/Log.hpp>

namespace beaconbus
{
namespace discovery
{

TEST_CASE("HostResolver | CachesResultPerName", "[HostResolver]")
{
  asio::io_context io;
  auto resolver = AsioHostResolver<util::NullLog>{io, util::NullLog{}};

  const auto first = resolver("127.0.0.1");
  CHECK(1 == resolver.numCached());
  const auto second = resolver("127.0.0.1");
  CHECK(1 == resolver.numCached());
  CHECK(first == second);
}

TEST_CASE("HostResolver | NumericLookupNeverReturnsEmptyName", "[HostResolver]")
{
  asio::io_context io;
  auto resolver = AsioHostResolver<util::NullLog>{io, util::NullLog{}};

  const auto hostName = resolver("127.0.0.1");
  if (hostName)
  {
    CHECK_FALSE(hostName->empty());
  }
}

} // namespace discovery
} // namespace beaconbus
