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

#include <beaconbus/Bus.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <beaconbus/util/Log.hpp>

namespace beaconbus
{
namespace
{

using TestBus = BasicBus<util::NullLog>;

// Beacons go unicast to the loopback address, so the bus discovers itself
// and its publisher dials its own subscriber.
Config loopbackConfig(const std::uint16_t discoveryPort)
{
  auto config = Config{};
  config.discoveryPort = discoveryPort;
  config.broadcastAddress = "127.0.0.1";
  config.interfaceAddress = "127.0.0.1";
  config.advertiseInterval = std::chrono::milliseconds(100);
  config.sweepInterval = std::chrono::milliseconds(100);
  config.deadNodeTimeout = std::chrono::milliseconds(1000);
  return config;
}

} // anonymous namespace

TEST_CASE("Bus | InvalidConfigThrows", "[Bus]")
{
  auto config = Config{};
  config.deadNodeTimeout = config.advertiseInterval;
  CHECK_THROWS_AS(TestBus(config, util::NullLog{}), std::invalid_argument);
}

TEST_CASE("Bus | DiscoveryPortInUseThrows", "[Bus]")
{
  // Without reuse_address on the first socket, binding the port again fails
  asio::io_context io;
  asio::ip::udp::socket occupant(
    io, asio::ip::udp::endpoint{asio::ip::address_v4::any(), 47814});

  CHECK_THROWS_AS(TestBus(loopbackConfig(47814), util::NullLog{}), asio::system_error);

  // The port is usable once released
  occupant.close();
  TestBus bus{loopbackConfig(47814), util::NullLog{}};
  CHECK(0 != bus.port());
}

TEST_CASE("Bus | ReportsHostAddressAndPort", "[Bus]")
{
  TestBus bus{loopbackConfig(47811), util::NullLog{}};
  CHECK(0 != bus.port());
  CHECK(47811 == bus.config().discoveryPort);

  bus.requestHostAddress();
  const auto expected = "127.0.0.1:" + std::to_string(bus.port());
  bool replied = false;
  while (const auto message = bus.receive(std::chrono::seconds(5)))
  {
    if (*message == Message{expected})
    {
      replied = true;
      break;
    }
  }
  CHECK(replied);
}

TEST_CASE("Bus | DiscoversItselfAndDeliversPublishedData", "[Bus]")
{
  TestBus bus{loopbackConfig(47812), util::NullLog{}};
  const auto self = "tcp://127.0.0.1:" + std::to_string(bus.port());

  bool added = false;
  bool delivered = false;
  const auto payload = Message{"topic", std::string("\0data", 5)};
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (!delivered && std::chrono::steady_clock::now() < deadline)
  {
    // Messages published before the link is up are not delivered
    if (added)
    {
      bus.publish(payload);
    }
    while (const auto message = bus.receive(std::chrono::milliseconds(100)))
    {
      const auto notification = bus::parseNotification(*message);
      if (notification && notification->kind == bus::Notification::Kind::NodeAdded
          && notification->address == self)
      {
        added = true;
      }
      else if (*message == payload)
      {
        delivered = true;
      }
    }
  }
  CHECK(added);
  CHECK(delivered);
}

TEST_CASE("Bus | TerminateStopsTheNode", "[Bus]")
{
  TestBus bus{loopbackConfig(47813), util::NullLog{}};
  bus.terminate();
  bus.requestHostAddress();

  // Only output produced before the terminate command can arrive
  while (const auto message = bus.receive(std::chrono::milliseconds(500)))
  {
    CHECK(bus::parseNotification(*message));
  }
}

} // namespace beaconbus
