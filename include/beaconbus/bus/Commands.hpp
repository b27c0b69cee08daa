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
#include <optional>
#include <string>

namespace beaconbus
{
namespace bus
{

// Commands are messages from the owner to the bus. The first frame names
// the command, any further frames are its arguments.
constexpr char kPublishCommand[] = "P";
constexpr char kGetHostAddressCommand[] = "GetHostAddress";
constexpr char kTerminateCommand[] = "$TERM";

// Notifications are messages from the bus to the owner
constexpr char kNodeAdded[] = "AddedNode";
constexpr char kNodeRemoved[] = "RemovedNode";

inline Message makePublishCommand(const Message& payload)
{
  Message command{kPublishCommand};
  command.insert(command.end(), payload.begin(), payload.end());
  return command;
}

inline Message makeGetHostAddressCommand()
{
  return {kGetHostAddressCommand};
}

inline Message makeTerminateCommand()
{
  return {kTerminateCommand};
}

inline Message makeNodeAddedNotification(const std::string& address)
{
  return {kNodeAdded, address};
}

inline Message makeNodeRemovedNotification(const std::string& address)
{
  return {kNodeRemoved, address};
}

struct Notification
{
  enum class Kind
  {
    NodeAdded,
    NodeRemoved,
  };

  Kind kind;
  std::string address;

  friend bool operator==(const Notification& lhs, const Notification& rhs)
  {
    return lhs.kind == rhs.kind && lhs.address == rhs.address;
  }
};

// Returns nullopt for anything that is not a membership notification, such
// as forwarded data or a host address reply.
inline std::optional<Notification> parseNotification(const Message& message)
{
  if (message.size() != 2)
  {
    return std::nullopt;
  }
  if (message[0] == kNodeAdded)
  {
    return Notification{Notification::Kind::NodeAdded, message[1]};
  }
  if (message[0] == kNodeRemoved)
  {
    return Notification{Notification::Kind::NodeRemoved, message[1]};
  }
  return std::nullopt;
}

} // namespace bus
} // namespace beaconbus
