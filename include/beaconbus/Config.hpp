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

#pragma once

#include <beaconbus/asio/AsioWrapper.hpp>
#include <beaconbus/bus/DataPlaneConnector.hpp>
#include <beaconbus/discovery/Beacon.hpp>
#include <beaconbus/util/Log.hpp>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace beaconbus
{

using bus::ConnectRetryPolicy;
using discovery::MalformedBeaconPolicy;

struct Config
{
  // Beacons are broadcast to and received on this udp port
  std::uint16_t discoveryPort = 9999;
  std::string broadcastAddress = "255.255.255.255";
  // Address reported as this node's host. Empty selects the first
  // non-loopback IPv4 interface that is up.
  std::string interfaceAddress;

  std::chrono::milliseconds advertiseInterval{1000};
  std::chrono::milliseconds sweepInterval{1000};
  // Must be longer than advertiseInterval
  std::chrono::milliseconds deadNodeTimeout{10000};

  ConnectRetryPolicy connectRetryPolicy = ConnectRetryPolicy::RetryOnRefresh;
  MalformedBeaconPolicy malformedBeaconPolicy = MalformedBeaconPolicy::TreatAsPortZero;
  bool ignoreOwnBeacons = false;

  // Larger messages from a peer are a protocol violation
  std::size_t maxMessageSize = 16 * 1024 * 1024;

  util::LogLevel logLevel = util::LogLevel::Info;
};

// Throws std::invalid_argument naming the first offending field
inline void validate(const Config& config)
{
  using std::chrono::milliseconds;

  if (config.discoveryPort == 0)
  {
    throw std::invalid_argument("discoveryPort must not be 0");
  }
  asio::error_code ec;
  asio::ip::make_address_v4(config.broadcastAddress, ec);
  if (ec)
  {
    throw std::invalid_argument("broadcastAddress is not an IPv4 address");
  }
  if (!config.interfaceAddress.empty())
  {
    asio::ip::make_address_v4(config.interfaceAddress, ec);
    if (ec)
    {
      throw std::invalid_argument("interfaceAddress is not an IPv4 address");
    }
  }
  if (config.advertiseInterval <= milliseconds{0})
  {
    throw std::invalid_argument("advertiseInterval must be positive");
  }
  if (config.sweepInterval <= milliseconds{0})
  {
    throw std::invalid_argument("sweepInterval must be positive");
  }
  if (config.deadNodeTimeout <= config.advertiseInterval)
  {
    throw std::invalid_argument("deadNodeTimeout must be longer than advertiseInterval");
  }
  if (config.maxMessageSize == 0)
  {
    throw std::invalid_argument("maxMessageSize must not be 0");
  }
}

} // namespace beaconbus
