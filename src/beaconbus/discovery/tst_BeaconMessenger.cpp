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

#include <beaconbus/discovery/BeaconMessenger.hpp>
#include <beaconbus/discovery/test/Interface.hpp>
#include <beaconbus/discovery/test/Resolver.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <beaconbus/util/Log.hpp>
#include <beaconbus/util/test/Timer.hpp>
#include <vector>

namespace beaconbus
{
namespace discovery
{
namespace
{

using Messenger =
  BeaconMessenger<test::Interface&, test::Resolver&, util::test::Timer&, util::NullLog>;

const auto kLenient =
  BeaconSettings{std::chrono::seconds(1), MalformedBeaconPolicy::TreatAsPortZero, false};

const auto peerEndpoint =
  asio::ip::udp::endpoint{asio::ip::make_address("192.168.1.20"), 9999};

struct Fixture
{
  Messenger makeMessenger(const BeaconSettings settings = kLenient)
  {
    auto messenger = makeBeaconMessenger(util::injectRef(iface),
      util::injectRef(resolver), util::injectRef(timer), util::NullLog{}, settings);
    receive(messenger, [this](NodeIdentity node) { received.push_back(std::move(node)); });
    return messenger;
  }

  test::Interface iface;
  test::Resolver resolver;
  util::test::Timer timer;
  std::vector<NodeIdentity> received;
};

} // anonymous namespace

TEST_CASE("BeaconMessenger | AdvertisesImmediately", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();
  CHECK(fixture.iface.sentMessages.empty());

  advertise(messenger, 5000);
  REQUIRE(1 == fixture.iface.sentPayloads().size());
  CHECK("5000" == fixture.iface.sentPayloads()[0]);
}

TEST_CASE("BeaconMessenger | AdvertisesEveryInterval", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();
  advertise(messenger, 5000);

  fixture.timer.advance(std::chrono::milliseconds(500));
  CHECK(1 == fixture.iface.sentMessages.size());
  fixture.timer.advance(std::chrono::milliseconds(500));
  CHECK(2 == fixture.iface.sentMessages.size());
  fixture.timer.advance(std::chrono::seconds(3), std::chrono::milliseconds(100));
  CHECK(5 == fixture.iface.sentMessages.size());
}

TEST_CASE("BeaconMessenger | RetriesFailedSendOnNextInterval", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();
  fixture.iface.failSends = true;
  advertise(messenger, 5000);
  CHECK(fixture.iface.sentMessages.empty());
  CHECK(fixture.timer.isArmed());

  fixture.iface.failSends = false;
  fixture.timer.advance(std::chrono::seconds(1));
  CHECK(1 == fixture.iface.sentMessages.size());
}

TEST_CASE("BeaconMessenger | TurnsBeaconIntoNodeIdentity", "[BeaconMessenger]")
{
  Fixture fixture;
  fixture.resolver.hostNames["192.168.1.20"] = "studio.local";
  auto messenger = fixture.makeMessenger();

  fixture.iface.incomingMessage(peerEndpoint, "5000");
  REQUIRE(1 == fixture.received.size());
  CHECK("192.168.1.20" == fixture.received[0].name());
  CHECK(5000 == fixture.received[0].port());
  CHECK("tcp://192.168.1.20:5000" == fixture.received[0].address());
  CHECK("studio.local" == fixture.received[0].hostName());
}

TEST_CASE("BeaconMessenger | MalformedBeaconAdvertisesPortZero", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();

  fixture.iface.incomingMessage(peerEndpoint, "not a port");
  REQUIRE(1 == fixture.received.size());
  CHECK(0 == fixture.received[0].port());
}

TEST_CASE("BeaconMessenger | StrictPolicyDropsMalformedBeacon", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger(
    {std::chrono::seconds(1), MalformedBeaconPolicy::Reject, false});

  fixture.iface.incomingMessage(peerEndpoint, "not a port");
  CHECK(fixture.received.empty());
  fixture.iface.incomingMessage(peerEndpoint, "5000");
  CHECK(1 == fixture.received.size());
}

TEST_CASE("BeaconMessenger | OwnBeaconsAreDeliveredByDefault", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();
  advertise(messenger, 5000);

  const auto self = asio::ip::udp::endpoint{asio::ip::make_address("192.168.1.10"), 9999};
  fixture.iface.incomingMessage(self, "5000");
  REQUIRE(1 == fixture.received.size());
  CHECK("tcp://192.168.1.10:5000" == fixture.received[0].address());
}

TEST_CASE("BeaconMessenger | IgnoresOwnBeaconsWhenConfigured", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger(
    {std::chrono::seconds(1), MalformedBeaconPolicy::TreatAsPortZero, true});
  advertise(messenger, 5000);

  const auto self = asio::ip::udp::endpoint{asio::ip::make_address("192.168.1.10"), 9999};
  fixture.iface.incomingMessage(self, "5000");
  CHECK(fixture.received.empty());

  // Another node on the same host uses a different port
  fixture.iface.incomingMessage(self, "5001");
  CHECK(1 == fixture.received.size());
}

TEST_CASE("BeaconMessenger | ReportsBoundAddress", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();
  CHECK("192.168.1.10" == boundAddress(messenger));
}

TEST_CASE("BeaconMessenger | CloseStopsAdvertisingAndListening", "[BeaconMessenger]")
{
  Fixture fixture;
  auto messenger = fixture.makeMessenger();
  advertise(messenger, 5000);

  close(messenger);
  CHECK(fixture.iface.closed);
  CHECK_FALSE(fixture.timer.isArmed());

  fixture.timer.advance(std::chrono::seconds(5), std::chrono::seconds(1));
  CHECK(1 == fixture.iface.sentMessages.size());

  fixture.iface.incomingMessage(peerEndpoint, "5000");
  CHECK(fixture.received.empty());

  // Idempotent
  close(messenger);
}

} // namespace discovery
} // namespace beaconbus
