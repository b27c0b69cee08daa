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

#include <beaconbus/bus/Message.hpp>
#include <beaconbus/discovery/NodeIdentity.hpp>
#include <chrono>
#include <variant>

namespace beaconbus
{
namespace bus
{

using TimePoint = std::chrono::steady_clock::time_point;

// A message from the owner
struct CommandReady
{
  Message command;
};

// A message from a peer's publisher
struct DataReady
{
  Message frames;
};

// A beacon from a peer
struct DiscoveryReady
{
  discovery::NodeIdentity candidate;
  TimePoint receivedAt;
};

// The sweep timer expired
struct TimerFired
{
  TimePoint now;
};

using Event = std::variant<CommandReady, DataReady, DiscoveryReady, TimerFired>;

} // namespace bus
} // namespace beaconbus
