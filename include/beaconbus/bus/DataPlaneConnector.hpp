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
#include <beaconbus/discovery/NodeIdentity.hpp>
#include <beaconbus/util/Injected.hpp>

namespace beaconbus
{
namespace bus
{

enum class ConnectRetryPolicy
{
  // Redial a failed link whenever the peer advertises again
  RetryOnRefresh,
  // A failed link stays down until the peer expires and is rediscovered
  NoRetry,
};

// Keeps the set of outgoing data links in step with the membership table.
//
// Publisher requirements:
//  - connect(p, address) -> ConnectResult
//  - disconnect(p, address)
//  - send(p, Message)
//  - linkState(p, address) -> LinkState
//  - close(p)
template <typename Publisher, typename Log>
class DataPlaneConnector
{
public:
  using NodeIdentity = discovery::NodeIdentity;

  DataPlaneConnector(
    util::Injected<Publisher> publisher, const ConnectRetryPolicy policy, Log log)
    : mPublisher(std::move(publisher))
    , mPolicy(policy)
    , mLog(std::move(log))
  {
  }

  // Returns false if the node can never be connected to
  bool nodeJoined(const NodeIdentity& node)
  {
    if (connect(*mPublisher, node.address()) == ConnectResult::HardError)
    {
      warning(mLog) << "Not connecting to " << node << ": address is unusable";
      return false;
    }
    debug(mLog) << "Connecting to " << node;
    return true;
  }

  void nodeRefreshed(const NodeIdentity& node)
  {
    if (mPolicy == ConnectRetryPolicy::RetryOnRefresh
        && linkState(*mPublisher, node.address()) == LinkState::Failed)
    {
      connect(*mPublisher, node.address());
    }
  }

  void nodeLeft(const NodeIdentity& node)
  {
    disconnect(*mPublisher, node.address());
  }

  void publish(const Message& message)
  {
    send(*mPublisher, message);
  }

  void shutdown()
  {
    close(*mPublisher);
  }

private:
  util::Injected<Publisher> mPublisher;
  ConnectRetryPolicy mPolicy;
  Log mLog;
};

} // namespace bus
} // namespace beaconbus
