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

#include <beaconbus/bus/Publisher.hpp>
#include <beaconbus/bus/Subscriber.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <beaconbus/util/Log.hpp>
#include <chrono>

namespace beaconbus
{
namespace bus
{
namespace
{

// Runs the io context on the calling thread until the condition holds or
// the deadline passes.
template <typename Condition>
bool runUntil(asio::io_context& io, Condition condition)
{
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!condition() && std::chrono::steady_clock::now() < deadline)
  {
    io.restart();
    io.run_for(std::chrono::milliseconds(10));
  }
  return condition();
}

std::string loopbackAddress(const std::uint16_t port)
{
  return "tcp://127.0.0.1:" + std::to_string(port);
}

struct Fixture
{
  Fixture(const std::size_t maxMessageSize = 1 << 20)
    : Fixture(maxMessageSize, maxMessageSize)
  {
  }

  Fixture(const std::size_t subscriberLimit, const std::size_t publisherLimit)
    : subscriber(io, util::NullLog{}, subscriberLimit)
    , publisher(io, util::NullLog{}, publisherLimit)
  {
    port = bind(subscriber);
    receive(subscriber, [this](Message message) { received.push_back(std::move(message)); });
  }

  bool connectAndWait()
  {
    connect(publisher, loopbackAddress(port));
    return runUntil(io, [this] {
      return linkState(publisher, loopbackAddress(port)) == LinkState::Connected
             && numConnections(subscriber) == 1;
    });
  }

  asio::io_context io;
  Subscriber<util::NullLog> subscriber;
  Publisher<util::NullLog> publisher;
  std::uint16_t port = 0;
  std::vector<Message> received;
};

} // anonymous namespace

TEST_CASE("DataChannel | ParsesTcpAddresses", "[DataChannel]")
{
  const auto address = parseTcpAddress("tcp://192.168.1.20:5000");
  REQUIRE(address);
  CHECK("192.168.1.20" == address->host);
  CHECK(5000 == address->port);

  const auto v6 = parseTcpAddress("tcp://[::1]:5000");
  REQUIRE(v6);
  CHECK("::1" == v6->host);

  CHECK_FALSE(parseTcpAddress("udp://192.168.1.20:5000"));
  CHECK_FALSE(parseTcpAddress("tcp://192.168.1.20"));
  CHECK_FALSE(parseTcpAddress("tcp://192.168.1.20:0"));
  CHECK_FALSE(parseTcpAddress("tcp://192.168.1.20:65536"));
  CHECK_FALSE(parseTcpAddress("tcp://:5000"));
}

TEST_CASE("DataChannel | BindsEphemeralPort", "[DataChannel]")
{
  Fixture fixture;
  CHECK(0 != fixture.port);
  CHECK(fixture.port == endpoint(fixture.subscriber).port());
}

TEST_CASE("DataChannel | DeliversPublishedMessages", "[DataChannel]")
{
  Fixture fixture;
  REQUIRE(fixture.connectAndWait());

  const auto first = Message{"topic", "", std::string("\0\xff", 2)};
  const auto second = Message{std::string(100000, 'x')};
  send(fixture.publisher, first);
  send(fixture.publisher, second);

  REQUIRE(runUntil(fixture.io, [&fixture] { return fixture.received.size() == 2; }));
  CHECK(first == fixture.received[0]);
  CHECK(second == fixture.received[1]);
}

TEST_CASE("DataChannel | InvalidAddressIsAHardError", "[DataChannel]")
{
  Fixture fixture;
  CHECK(ConnectResult::HardError == connect(fixture.publisher, "tcp://127.0.0.1:0"));
  CHECK(ConnectResult::HardError == connect(fixture.publisher, "not an address"));
  CHECK(LinkState::Unknown == linkState(fixture.publisher, "tcp://127.0.0.1:0"));
}

TEST_CASE("DataChannel | RefusedConnectionFailsLink", "[DataChannel]")
{
  Fixture fixture;

  // Find a port nobody listens on
  std::uint16_t closedPort = 0;
  {
    asio::ip::tcp::acceptor acceptor(
      fixture.io, asio::ip::tcp::endpoint{asio::ip::address_v4::loopback(), 0});
    closedPort = acceptor.local_endpoint().port();
  }

  const auto address = loopbackAddress(closedPort);
  CHECK(ConnectResult::Ok == connect(fixture.publisher, address));
  CHECK(LinkState::Connecting == linkState(fixture.publisher, address));
  CHECK(runUntil(fixture.io,
    [&] { return linkState(fixture.publisher, address) == LinkState::Failed; }));

  // Connecting again redials
  CHECK(ConnectResult::Ok == connect(fixture.publisher, address));
  CHECK(LinkState::Connecting == linkState(fixture.publisher, address));
}

TEST_CASE("DataChannel | OversizedMessageClosesConnection", "[DataChannel]")
{
  // A publisher with a larger limit than its subscriber
  Fixture fixture{16, 1 << 20};
  REQUIRE(fixture.connectAndWait());

  send(fixture.publisher, Message{std::string(64, 'x')});
  CHECK(runUntil(fixture.io, [&fixture] {
    return linkState(fixture.publisher, loopbackAddress(fixture.port)) == LinkState::Failed;
  }));
  CHECK(fixture.received.empty());
  CHECK(0 == numConnections(fixture.subscriber));
}

TEST_CASE("DataChannel | OversizedPublishIsDropped", "[DataChannel]")
{
  Fixture fixture{16};
  REQUIRE(fixture.connectAndWait());

  // Body of a single frame is 4 + 4 + size bytes
  const auto small = Message{"12345678"};
  send(fixture.publisher, Message{std::string(17, 'x')});
  send(fixture.publisher, small);

  REQUIRE(runUntil(fixture.io, [&fixture] { return fixture.received.size() == 1; }));
  CHECK(small == fixture.received[0]);
  CHECK(LinkState::Connected == linkState(fixture.publisher, loopbackAddress(fixture.port)));
  CHECK(1 == numConnections(fixture.subscriber));
}

TEST_CASE("DataChannel | DisconnectForgetsLink", "[DataChannel]")
{
  Fixture fixture;
  REQUIRE(fixture.connectAndWait());

  const auto address = loopbackAddress(fixture.port);
  disconnect(fixture.publisher, address);
  CHECK(LinkState::Unknown == linkState(fixture.publisher, address));
  CHECK(runUntil(fixture.io, [&fixture] { return numConnections(fixture.subscriber) == 0; }));
}

TEST_CASE("DataChannel | ClosedSubscriberStopsDelivering", "[DataChannel]")
{
  Fixture fixture;
  REQUIRE(fixture.connectAndWait());

  close(fixture.subscriber);
  CHECK(0 == numConnections(fixture.subscriber));
  send(fixture.publisher, Message{"dropped"});
  fixture.io.restart();
  fixture.io.run_for(std::chrono::milliseconds(100));
  CHECK(fixture.received.empty());
}

} // namespace bus
} // namespace beaconbus
