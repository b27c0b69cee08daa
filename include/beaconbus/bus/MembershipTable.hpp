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

#include <beaconbus/discovery/NodeIdentity.hpp>
#include <algorithm>
#include <chrono>
#include <unordered_map>
#include <vector>

namespace beaconbus
{
namespace bus
{

// The liveness ledger: one entry per peer believed alive, holding the time
// its last beacon was received.
class MembershipTable
{
public:
  using NodeIdentity = discovery::NodeIdentity;
  using TimePoint = std::chrono::steady_clock::time_point;
  using Duration = std::chrono::steady_clock::duration;

  struct Entry
  {
    NodeIdentity key;
    TimePoint lastSeen;
  };

  bool contains(const NodeIdentity& node) const
  {
    return mNodes.count(node) > 0;
  }

  // Precondition: the node is not in the table
  void insert(NodeIdentity node, const TimePoint now)
  {
    mNodes.emplace(std::move(node), now);
  }

  // Returns false if the node is not in the table
  bool refresh(const NodeIdentity& node, const TimePoint now)
  {
    const auto it = mNodes.find(node);
    if (it == mNodes.end())
    {
      return false;
    }
    it->second = now;
    return true;
  }

  static bool isExpired(const TimePoint lastSeen, const TimePoint now, const Duration timeout)
  {
    return now > lastSeen + timeout;
  }

  // Remove every node that has been silent for longer than the timeout and
  // return them, longest silent first.
  std::vector<Entry> removeExpired(const TimePoint now, const Duration timeout)
  {
    std::vector<Entry> expired;
    for (auto it = mNodes.begin(); it != mNodes.end();)
    {
      if (isExpired(it->second, now, timeout))
      {
        expired.push_back({it->first, it->second});
        it = mNodes.erase(it);
      }
      else
      {
        ++it;
      }
    }

    std::sort(expired.begin(), expired.end(), [](const Entry& lhs, const Entry& rhs) {
      return lhs.lastSeen < rhs.lastSeen
             || (lhs.lastSeen == rhs.lastSeen && lhs.key < rhs.key);
    });
    return expired;
  }

  // Snapshot of the table ordered by identity
  std::vector<Entry> entries() const
  {
    std::vector<Entry> result;
    result.reserve(mNodes.size());
    for (const auto& node : mNodes)
    {
      result.push_back({node.first, node.second});
    }
    std::sort(result.begin(), result.end(),
      [](const Entry& lhs, const Entry& rhs) { return lhs.key < rhs.key; });
    return result;
  }

  std::size_t size() const
  {
    return mNodes.size();
  }

  bool empty() const
  {
    return mNodes.empty();
  }

  void clear()
  {
    mNodes.clear();
  }

private:
  std::unordered_map<NodeIdentity, TimePoint> mNodes;
};

} // namespace bus
} // namespace beaconbus
