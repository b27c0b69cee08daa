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

#include <beaconbus/Config.hpp>
#include <beaconbus/test/CatchWrapper.hpp>

namespace beaconbus
{

TEST_CASE("Config | DefaultsAreValid", "[Config]")
{
  const auto config = Config{};
  CHECK(9999 == config.discoveryPort);
  CHECK("255.255.255.255" == config.broadcastAddress);
  CHECK(config.interfaceAddress.empty());
  CHECK(std::chrono::seconds(1) == config.advertiseInterval);
  CHECK(std::chrono::seconds(1) == config.sweepInterval);
  CHECK(std::chrono::seconds(10) == config.deadNodeTimeout);
  CHECK(ConnectRetryPolicy::RetryOnRefresh == config.connectRetryPolicy);
  CHECK(MalformedBeaconPolicy::TreatAsPortZero == config.malformedBeaconPolicy);
  CHECK_FALSE(config.ignoreOwnBeacons);
  CHECK_NOTHROW(validate(config));
}

TEST_CASE("Config | TimeoutMustExceedAdvertiseInterval", "[Config]")
{
  auto config = Config{};
  config.deadNodeTimeout = config.advertiseInterval;
  CHECK_THROWS_AS(validate(config), std::invalid_argument);

  config.deadNodeTimeout = config.advertiseInterval + std::chrono::milliseconds(1);
  CHECK_NOTHROW(validate(config));
}

TEST_CASE("Config | RejectsZeroIntervals", "[Config]")
{
  auto config = Config{};
  config.advertiseInterval = std::chrono::milliseconds(0);
  CHECK_THROWS_AS(validate(config), std::invalid_argument);

  config = Config{};
  config.sweepInterval = std::chrono::milliseconds(0);
  CHECK_THROWS_AS(validate(config), std::invalid_argument);
}

TEST_CASE("Config | RejectsBadAddressesAndPorts", "[Config]")
{
  auto config = Config{};
  config.broadcastAddress = "everyone";
  CHECK_THROWS_AS(validate(config), std::invalid_argument);

  config = Config{};
  config.interfaceAddress = "::1";
  CHECK_THROWS_AS(validate(config), std::invalid_argument);

  config = Config{};
  config.discoveryPort = 0;
  CHECK_THROWS_AS(validate(config), std::invalid_argument);

  config = Config{};
  config.maxMessageSize = 0;
  CHECK_THROWS_AS(validate(config), std::invalid_argument);
}

} // namespace beaconbus
