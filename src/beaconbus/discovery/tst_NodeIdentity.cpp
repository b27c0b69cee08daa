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

#include <beaconbus/discovery/NodeIdentity.hpp>
#include <beaconbus/discovery/test/Resolver.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <sstream>
#include <unordered_set>

namespace beaconbus
{
namespace discovery
{

TEST_CASE("NodeIdentity | DerivesAddressFromNameAndPort", "[NodeIdentity]")
{
  const auto node = NodeIdentity{"192.168.1.20", 5000, "studio"};
  CHECK("tcp://192.168.1.20:5000" == node.address());
  CHECK("192.168.1.20" == node.name());
  CHECK(5000 == node.port());
  CHECK("studio" == node.hostName());

  std::ostringstream stream;
  stream << node;
  CHECK("tcp://192.168.1.20:5000" == stream.str());
}

TEST_CASE("NodeIdentity | HostNameDoesNotTakePartInEquality", "[NodeIdentity]")
{
  const auto a = NodeIdentity{"10.0.0.1", 5000, "alpha"};
  const auto b = NodeIdentity{"10.0.0.1", 5000, "10.0.0.1"};
  CHECK(a == b);
  CHECK_FALSE(a < b);
  CHECK_FALSE(b < a);
  CHECK(std::hash<NodeIdentity>{}(a) == std::hash<NodeIdentity>{}(b));
}

TEST_CASE("NodeIdentity | DistinctByNameAndByPort", "[NodeIdentity]")
{
  const auto a = NodeIdentity{"10.0.0.1", 5000, ""};
  const auto b = NodeIdentity{"10.0.0.2", 5000, ""};
  const auto c = NodeIdentity{"10.0.0.1", 5001, ""};
  CHECK(a != b);
  CHECK(a != c);
  CHECK(b != c);

  const auto nodes = std::unordered_set<NodeIdentity>{a, b, c, a};
  CHECK(3 == nodes.size());
}

TEST_CASE("NodeIdentity | ResolvesHostName", "[NodeIdentity]")
{
  auto resolver = test::Resolver{};
  resolver.hostNames["10.0.0.1"] = "alpha.local";

  const auto node = NodeIdentity::resolve("10.0.0.1", 5000, resolver);
  CHECK("alpha.local" == node.hostName());
  CHECK("tcp://10.0.0.1:5000" == node.address());
  CHECK(1 == resolver.numLookups);
}

TEST_CASE("NodeIdentity | UnresolvedHostNameFallsBackToName", "[NodeIdentity]")
{
  auto resolver = test::Resolver{};
  const auto node = NodeIdentity::resolve("10.0.0.9", 5000, resolver);
  CHECK("10.0.0.9" == node.hostName());
}

} // namespace discovery
} // namespace beaconbus
