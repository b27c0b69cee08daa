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
#include <beaconbus/bus/MessageQueue.hpp>
#include <beaconbus/bus/Reactor.hpp>
#include <beaconbus/bus/test/Publisher.hpp>
#include <beaconbus/bus/test/Subscriber.hpp>
#include <beaconbus/discovery/BeaconMessenger.hpp>
#include <beaconbus/discovery/test/Interface.hpp>
#include <beaconbus/discovery/test/Resolver.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <beaconbus/util/Log.hpp>
#include <beaconbus/util/test/Timer.hpp>

namespace beaconbus
{
namespace bus
{
namespace
{

using std::chrono::seconds;

using Discovery = discovery::BeaconMessenger<discovery::test::Interface&,
  discovery::test::Resolver&,
  util::test::Timer&,
  util::NullLog>;
using DataPlane = DataPlaneConnector<test::Publisher&, util::NullLog>;
using TestReactor = Reactor<Discovery,
  test::Subscriber&,
  DataPlane,
  MessageQueue&,
  util::test::Timer&,
  util::NullLog>;

struct Fixture
{
  Fixture(const ConnectRetryPolicy policy = ConnectRetryPolicy::RetryOnRefresh)
    : reactor(makeReactor(util::injectVal(discovery::makeBeaconMessenger(
                            util::injectRef(iface),
                            util::injectRef(resolver),
                            util::injectRef(beaconTimer),
                            util::NullLog{},
                            {seconds(1), discovery::MalformedBeaconPolicy::TreatAsPortZero,
                              false})),
      util::injectRef(subscriber),
      util::injectVal(DataPlane{util::injectRef(publisher), policy, util::NullLog{}}),
      util::injectRef(owner),
      util::injectRef(timer),
      util::NullLog{},
      {seconds(1), seconds(10)}))
  {
  }

  void beacon(const std::string& host, const std::string& payload)
  {
    iface.incomingMessage(
      asio::ip::udp::endpoint{asio::ip::make_address(host), 9999}, payload);
  }

  std::vector<Message> drain()
  {
    std::vector<Message> messages;
    while (auto message = owner.tryReceive())
    {
      messages.push_back(std::move(*message));
    }
    return messages;
  }

  discovery::test::Interface iface;
  discovery::test::Resolver resolver;
  util::test::Timer beaconTimer;
  test::Subscriber subscriber;
  test::Publisher publisher;
  MessageQueue owner;
  util::test::Timer timer;
  TestReactor reactor;
};

const auto peer = std::string{"192.168.1.20"};
const auto peerAddress = std::string{"tcp://192.168.1.20:5000"};

} // anonymous namespace

TEST_CASE("Reactor | StartBindsAndAdvertisesDataPort", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  CHECK(fixture.reactor.isRunning());
  CHECK(fixture.subscriber.bound);
  CHECK(50123 == fixture.reactor.port());
  REQUIRE(1 == fixture.iface.sentPayloads().size());
  CHECK("50123" == fixture.iface.sentPayloads()[0]);
  CHECK(fixture.timer.isArmed());
}

TEST_CASE("Reactor | FailedStartReleasesEverything", "[Reactor]")
{
  Fixture fixture;
  fixture.subscriber.failBind = true;

  CHECK_THROWS_AS(fixture.reactor.start(), std::runtime_error);
  CHECK_FALSE(fixture.reactor.isRunning());
  CHECK(fixture.iface.closed);
  CHECK(1 == fixture.subscriber.numCloses);
  CHECK(1 == fixture.publisher.numCloses);
  CHECK_FALSE(fixture.timer.isArmed());
}

TEST_CASE("Reactor | RepeatedBeaconsAddNodeOnce", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  for (int i = 0; i < 5; ++i)
  {
    fixture.beacon(peer, "5000");
    fixture.timer.advance(std::chrono::milliseconds(500));
  }

  const auto messages = fixture.drain();
  REQUIRE(1 == messages.size());
  CHECK((Message{"AddedNode", peerAddress}) == messages[0]);
  CHECK(1 == fixture.publisher.dials.size());
  CHECK(1 == fixture.reactor.members().size());
}

TEST_CASE("Reactor | NodesAreDistinctByNameAndPort", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.beacon("192.168.1.20", "5000");
  fixture.beacon("192.168.1.21", "5000");
  fixture.beacon("192.168.1.20", "5001");

  const auto messages = fixture.drain();
  REQUIRE(3 == messages.size());
  CHECK((Message{"AddedNode", "tcp://192.168.1.20:5000"}) == messages[0]);
  CHECK((Message{"AddedNode", "tcp://192.168.1.21:5000"}) == messages[1]);
  CHECK((Message{"AddedNode", "tcp://192.168.1.20:5001"}) == messages[2]);
  CHECK(3 == fixture.publisher.dials.size());
}

TEST_CASE("Reactor | SilentNodeIsRemovedAfterTimeout", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  // Advertises once a second from t=0 to t=9
  fixture.beacon(peer, "5000");
  for (int t = 1; t <= 9; ++t)
  {
    fixture.timer.advance(seconds(1));
    fixture.beacon(peer, "5000");
  }

  auto messages = fixture.drain();
  REQUIRE(1 == messages.size());
  CHECK((Message{"AddedNode", peerAddress}) == messages[0]);

  // Still a member up to and including t=19
  fixture.timer.advance(seconds(10), seconds(1));
  CHECK(fixture.drain().empty());
  CHECK(fixture.publisher.disconnects.empty());
  CHECK(1 == fixture.reactor.members().size());

  fixture.timer.advance(seconds(1));
  messages = fixture.drain();
  REQUIRE(1 == messages.size());
  CHECK((Message{"RemovedNode", peerAddress}) == messages[0]);
  REQUIRE(1 == fixture.publisher.disconnects.size());
  CHECK(peerAddress == fixture.publisher.disconnects[0]);
  CHECK(fixture.reactor.members().empty());

  // Exactly once
  fixture.timer.advance(seconds(30), seconds(1));
  CHECK(fixture.drain().empty());
}

TEST_CASE("Reactor | ReturningNodeIsAddedAgain", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.beacon(peer, "5000");
  fixture.timer.advance(seconds(12), seconds(1));
  fixture.beacon(peer, "5000");

  const auto messages = fixture.drain();
  REQUIRE(3 == messages.size());
  CHECK((Message{"AddedNode", peerAddress}) == messages[0]);
  CHECK((Message{"RemovedNode", peerAddress}) == messages[1]);
  CHECK((Message{"AddedNode", peerAddress}) == messages[2]);
}

TEST_CASE("Reactor | UnconnectableNodeIsNotAdded", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.beacon(peer, "garbage");
  CHECK(fixture.drain().empty());
  CHECK(fixture.reactor.members().empty());
  CHECK(fixture.publisher.dials.empty());
}

TEST_CASE("Reactor | RefreshRedialsFailedLink", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.beacon(peer, "5000");
  fixture.publisher.links[peerAddress] = LinkState::Failed;
  fixture.beacon(peer, "5000");

  CHECK(2 == fixture.publisher.dials.size());
  CHECK(1 == fixture.drain().size());
}

TEST_CASE("Reactor | NoRetryPolicyLeavesFailedLinkDown", "[Reactor]")
{
  Fixture fixture{ConnectRetryPolicy::NoRetry};
  fixture.reactor.start();

  fixture.beacon(peer, "5000");
  fixture.publisher.links[peerAddress] = LinkState::Failed;
  fixture.beacon(peer, "5000");

  CHECK(1 == fixture.publisher.dials.size());
  CHECK(1 == fixture.drain().size());
}

TEST_CASE("Reactor | PublishForwardsPayloadToDataChannel", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.reactor.dispatch(CommandReady{makePublishCommand({"topic", ""})});
  REQUIRE(1 == fixture.publisher.sent.size());
  CHECK((Message{"topic", ""}) == fixture.publisher.sent[0]);

  // Nothing to publish
  fixture.reactor.dispatch(CommandReady{Message{"P"}});
  CHECK(1 == fixture.publisher.sent.size());
  CHECK(fixture.drain().empty());
}

TEST_CASE("Reactor | GetHostAddressRepliesWithBoundAddressAndPort", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.reactor.dispatch(CommandReady{makeGetHostAddressCommand()});
  const auto messages = fixture.drain();
  REQUIRE(1 == messages.size());
  CHECK((Message{"192.168.1.10:50123"}) == messages[0]);
  CHECK(fixture.iface.sentPayloads()[0] == std::to_string(fixture.reactor.port()));
}

TEST_CASE("Reactor | UnknownCommandsAreIgnored", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  fixture.reactor.dispatch(CommandReady{Message{"Frobnicate", "now"}});
  fixture.reactor.dispatch(CommandReady{Message{}});
  CHECK(fixture.reactor.isRunning());
  CHECK(fixture.drain().empty());
  CHECK(fixture.publisher.sent.empty());
}

TEST_CASE("Reactor | ForwardsDataUnmodified", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();

  const auto data = Message{"", std::string("\0\x01\xfe", 3), "text"};
  fixture.subscriber.incomingMessage(data);

  const auto messages = fixture.drain();
  REQUIRE(1 == messages.size());
  CHECK(data == messages[0]);
}

TEST_CASE("Reactor | TerminateReleasesResourcesOnce", "[Reactor]")
{
  Fixture fixture;
  fixture.reactor.start();
  fixture.beacon(peer, "5000");
  fixture.drain();

  fixture.reactor.dispatch(CommandReady{makeTerminateCommand()});
  CHECK_FALSE(fixture.reactor.isRunning());
  CHECK(fixture.iface.closed);
  CHECK_FALSE(fixture.timer.isArmed());
  CHECK(1 == fixture.subscriber.numCloses);
  CHECK(1 == fixture.publisher.numCloses);
  CHECK(fixture.reactor.members().empty());

  // Later events are dropped
  fixture.reactor.dispatch(DataReady{Message{"late"}});
  fixture.reactor.dispatch(DiscoveryReady{{"192.168.1.21", 5000, ""}, fixture.timer.now()});
  fixture.reactor.dispatch(CommandReady{makeGetHostAddressCommand()});
  fixture.timer.advance(seconds(20), seconds(1));
  CHECK(fixture.drain().empty());
  CHECK(fixture.reactor.members().empty());

  fixture.reactor.shutdown();
  CHECK(1 == fixture.subscriber.numCloses);
  CHECK(1 == fixture.publisher.numCloses);
}

} // namespace bus
} // namespace beaconbus
