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

#include <beaconbus/bus/MembershipTable.hpp>
#include <beaconbus/test/CatchWrapper.hpp>

namespace beaconbus
{
namespace bus
{
namespace
{

using std::chrono::seconds;
using NodeIdentity = discovery::NodeIdentity;

const auto t0 = MembershipTable::TimePoint{} + std::chrono::hours(1);
const auto timeout = std::chrono::duration_cast<MembershipTable::Duration>(seconds(10));

const auto nodeA = NodeIdentity{"10.0.0.1", 5000, "a"};
const auto nodeB = NodeIdentity{"10.0.0.2", 5000, "b"};

} // anonymous namespace

TEST_CASE("MembershipTable | InsertAndRefresh", "[MembershipTable]")
{
  auto table = MembershipTable{};
  CHECK_FALSE(table.contains(nodeA));
  CHECK_FALSE(table.refresh(nodeA, t0));

  table.insert(nodeA, t0);
  CHECK(table.contains(nodeA));
  CHECK(table.refresh(nodeA, t0 + seconds(5)));
  CHECK(1 == table.size());

  const auto entries = table.entries();
  REQUIRE(1 == entries.size());
  CHECK(t0 + seconds(5) == entries[0].lastSeen);
}

TEST_CASE("MembershipTable | ExpiresStrictlyAfterTimeout", "[MembershipTable]")
{
  auto table = MembershipTable{};
  table.insert(nodeA, t0);

  CHECK(table.removeExpired(t0 + seconds(10), timeout).empty());
  CHECK(table.contains(nodeA));

  const auto expired = table.removeExpired(t0 + seconds(10) + std::chrono::nanoseconds(1), timeout);
  REQUIRE(1 == expired.size());
  CHECK(nodeA == expired[0].key);
  CHECK(table.empty());
}

TEST_CASE("MembershipTable | RefreshPostponesExpiry", "[MembershipTable]")
{
  auto table = MembershipTable{};
  table.insert(nodeA, t0);
  table.insert(nodeB, t0);
  table.refresh(nodeB, t0 + seconds(8));

  const auto expired = table.removeExpired(t0 + seconds(11), timeout);
  REQUIRE(1 == expired.size());
  CHECK(nodeA == expired[0].key);
  CHECK(table.contains(nodeB));
}

TEST_CASE("MembershipTable | ExpiredNodesOrderedBySilence", "[MembershipTable]")
{
  auto table = MembershipTable{};
  table.insert(nodeB, t0);
  table.insert(nodeA, t0 + seconds(1));

  const auto expired = table.removeExpired(t0 + seconds(20), timeout);
  REQUIRE(2 == expired.size());
  CHECK(nodeB == expired[0].key);
  CHECK(nodeA == expired[1].key);
}

TEST_CASE("MembershipTable | AtMostOneEntryPerNameAndPort", "[MembershipTable]")
{
  auto table = MembershipTable{};
  table.insert(nodeA, t0);
  CHECK(table.refresh(NodeIdentity{"10.0.0.1", 5000, "another name"}, t0 + seconds(1)));
  CHECK_FALSE(table.refresh(NodeIdentity{"10.0.0.1", 5001, "a"}, t0 + seconds(1)));
  CHECK(1 == table.size());
}

} // namespace bus
} // namespace beaconbus
