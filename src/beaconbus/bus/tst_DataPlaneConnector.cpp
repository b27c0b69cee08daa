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

#include <beaconbus/bus/DataPlaneConnector.hpp>
#include <beaconbus/bus/test/Publisher.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <beaconbus/util/Log.hpp>

namespace beaconbus
{
namespace bus
{
namespace
{

using Connector = DataPlaneConnector<test::Publisher&, util::NullLog>;
using NodeIdentity = discovery::NodeIdentity;

const auto node = NodeIdentity{"10.0.0.1", 5000, "a"};

} // anonymous namespace

TEST_CASE("DataPlaneConnector | ConnectsToJoinedNode", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector = Connector{
    util::injectRef(publisher), ConnectRetryPolicy::RetryOnRefresh, util::NullLog{}};

  CHECK(connector.nodeJoined(node));
  REQUIRE(1 == publisher.dials.size());
  CHECK("tcp://10.0.0.1:5000" == publisher.dials[0]);
}

TEST_CASE("DataPlaneConnector | PortZeroIsAHardError", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector = Connector{
    util::injectRef(publisher), ConnectRetryPolicy::RetryOnRefresh, util::NullLog{}};

  CHECK_FALSE(connector.nodeJoined(NodeIdentity{"10.0.0.1", 0, "a"}));
  CHECK(publisher.dials.empty());
}

TEST_CASE("DataPlaneConnector | RefreshKeepsHealthyLink", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector = Connector{
    util::injectRef(publisher), ConnectRetryPolicy::RetryOnRefresh, util::NullLog{}};

  connector.nodeJoined(node);
  connector.nodeRefreshed(node);
  connector.nodeRefreshed(node);
  CHECK(1 == publisher.dials.size());
}

TEST_CASE("DataPlaneConnector | RefreshRedialsFailedLink", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector = Connector{
    util::injectRef(publisher), ConnectRetryPolicy::RetryOnRefresh, util::NullLog{}};

  connector.nodeJoined(node);
  publisher.links[node.address()] = LinkState::Failed;
  connector.nodeRefreshed(node);
  CHECK(2 == publisher.dials.size());
  CHECK(LinkState::Connected == linkState(publisher, node.address()));
}

TEST_CASE("DataPlaneConnector | NoRetryLeavesFailedLinkDown", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector =
    Connector{util::injectRef(publisher), ConnectRetryPolicy::NoRetry, util::NullLog{}};

  connector.nodeJoined(node);
  publisher.links[node.address()] = LinkState::Failed;
  connector.nodeRefreshed(node);
  CHECK(1 == publisher.dials.size());
  CHECK(LinkState::Failed == linkState(publisher, node.address()));
}

TEST_CASE("DataPlaneConnector | DisconnectsLeavingNode", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector = Connector{
    util::injectRef(publisher), ConnectRetryPolicy::RetryOnRefresh, util::NullLog{}};

  connector.nodeJoined(node);
  connector.nodeLeft(node);
  REQUIRE(1 == publisher.disconnects.size());
  CHECK(node.address() == publisher.disconnects[0]);
  CHECK(LinkState::Unknown == linkState(publisher, node.address()));
}

TEST_CASE("DataPlaneConnector | PublishesAndCloses", "[DataPlaneConnector]")
{
  auto publisher = test::Publisher{};
  auto connector = Connector{
    util::injectRef(publisher), ConnectRetryPolicy::RetryOnRefresh, util::NullLog{}};

  connector.publish(Message{"topic", "payload"});
  REQUIRE(1 == publisher.sent.size());
  CHECK((Message{"topic", "payload"}) == publisher.sent[0]);

  connector.shutdown();
  CHECK(1 == publisher.numCloses);
}

} // namespace bus
} // namespace beaconbus
