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
#include <beaconbus/bus/Publisher.hpp>
#include <map>
#include <string>
#include <vector>

namespace beaconbus
{
namespace bus
{
namespace test
{

// Records what the data plane asks of the publisher. Links come up
// immediately; a test marks a link as failed by setting its state.
struct Publisher
{
  friend ConnectResult connect(Publisher& publisher, const std::string& address)
  {
    if (!parseTcpAddress(address))
    {
      return ConnectResult::HardError;
    }
    const auto it = publisher.links.find(address);
    if (it != publisher.links.end() && it->second != LinkState::Failed)
    {
      return ConnectResult::Ok;
    }
    publisher.links[address] = LinkState::Connected;
    publisher.dials.push_back(address);
    return ConnectResult::Ok;
  }

  friend void disconnect(Publisher& publisher, const std::string& address)
  {
    publisher.links.erase(address);
    publisher.disconnects.push_back(address);
  }

  friend void send(Publisher& publisher, const Message& message)
  {
    publisher.sent.push_back(message);
  }

  friend LinkState linkState(const Publisher& publisher, const std::string& address)
  {
    const auto it = publisher.links.find(address);
    return it == publisher.links.end() ? LinkState::Unknown : it->second;
  }

  friend void close(Publisher& publisher)
  {
    ++publisher.numCloses;
    publisher.links.clear();
  }

  std::map<std::string, LinkState> links;
  std::vector<std::string> dials;
  std::vector<std::string> disconnects;
  std::vector<Message> sent;
  int numCloses = 0;
};

} // namespace test
} // namespace bus
} // namespace beaconbus
