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

#include <beaconbus/bus/Commands.hpp>
#include <beaconbus/test/CatchWrapper.hpp>

namespace beaconbus
{
namespace bus
{

TEST_CASE("Commands | PublishCommandPrefixesPayload", "[Commands]")
{
  const auto command = makePublishCommand({"topic", std::string("\0", 1)});
  CHECK((Message{"P", "topic", std::string("\0", 1)}) == command);
}

TEST_CASE("Commands | ControlCommands", "[Commands]")
{
  CHECK((Message{"GetHostAddress"}) == makeGetHostAddressCommand());
  CHECK((Message{"$TERM"}) == makeTerminateCommand());
}

TEST_CASE("Commands | ParsesNotifications", "[Commands]")
{
  const auto added = parseNotification(makeNodeAddedNotification("tcp://10.0.0.1:5000"));
  REQUIRE(added);
  CHECK(Notification::Kind::NodeAdded == added->kind);
  CHECK("tcp://10.0.0.1:5000" == added->address);

  const auto removed =
    parseNotification(Message{"RemovedNode", "tcp://10.0.0.1:5000"});
  REQUIRE(removed);
  CHECK(Notification::Kind::NodeRemoved == removed->kind);
}

TEST_CASE("Commands | OtherMessagesAreNotNotifications", "[Commands]")
{
  CHECK_FALSE(parseNotification(Message{}));
  CHECK_FALSE(parseNotification(Message{"192.168.1.10:5000"}));
  CHECK_FALSE(parseNotification(Message{"AddedNode"}));
  CHECK_FALSE(parseNotification(Message{"AddedNode", "a", "b"}));
  CHECK_FALSE(parseNotification(Message{"topic", "payload"}));
}

} // namespace bus
} // namespace beaconbus
