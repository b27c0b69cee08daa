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

#include <map>
#include <optional>
#include <string>

namespace beaconbus
{
namespace discovery
{
namespace test
{

// Host name lookup from a fixed table. Counts lookups so that tests can
// check what gets cached.
struct Resolver
{
  std::optional<std::string> operator()(const std::string& name)
  {
    ++numLookups;
    const auto it = hostNames.find(name);
    if (it == hostNames.end())
    {
      return std::nullopt;
    }
    return it->second;
  }

  std::map<std::string, std::string> hostNames;
  std::size_t numLookups = 0;
};

} // namespace test
} // namespace discovery
} // namespace beaconbus
