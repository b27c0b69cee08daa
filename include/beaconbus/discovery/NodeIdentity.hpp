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

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <tuple>

namespace beaconbus
{
namespace discovery
{

// Identity of a peer on the bus: the host a beacon came from and the data
// port advertised in it. Only (name, port) take part in comparison and
// hashing. The address and the resolved host name are derived values for
// connecting and for display.
class NodeIdentity
{
public:
  NodeIdentity(std::string name, const std::uint16_t port, std::string hostName)
    : mName(std::move(name))
    , mPort(port)
    , mAddress("tcp://" + mName + ":" + std::to_string(mPort))
    , mHostName(std::move(hostName))
  {
  }

  // Resolver is a callable taking the name and returning an optional host
  // name. An unresolvable name leaves the host name equal to the name.
  template <typename Resolver>
  static NodeIdentity resolve(std::string name, const std::uint16_t port, Resolver& resolver)
  {
    auto hostName = resolver(name);
    return {name, port, hostName ? std::move(*hostName) : name};
  }

  const std::string& name() const
  {
    return mName;
  }

  std::uint16_t port() const
  {
    return mPort;
  }

  const std::string& address() const
  {
    return mAddress;
  }

  const std::string& hostName() const
  {
    return mHostName;
  }

  friend bool operator==(const NodeIdentity& lhs, const NodeIdentity& rhs)
  {
    return lhs.mPort == rhs.mPort && lhs.mName == rhs.mName;
  }

  friend bool operator!=(const NodeIdentity& lhs, const NodeIdentity& rhs)
  {
    return !(lhs == rhs);
  }

  friend bool operator<(const NodeIdentity& lhs, const NodeIdentity& rhs)
  {
    return std::tie(lhs.mName, lhs.mPort) < std::tie(rhs.mName, rhs.mPort);
  }

  friend std::ostream& operator<<(std::ostream& stream, const NodeIdentity& id)
  {
    return stream << id.mAddress;
  }

private:
  std::string mName;
  std::uint16_t mPort;
  std::string mAddress;
  std::string mHostName;
};

} // namespace discovery
} // namespace beaconbus

namespace std
{

template <>
struct hash<beaconbus::discovery::NodeIdentity>
{
  std::size_t operator()(const beaconbus::discovery::NodeIdentity& id) const
  {
    const auto nameHash = std::hash<std::string>{}(id.name());
    return (nameHash * 397) ^ std::hash<std::uint16_t>{}(id.port());
  }
};

} // namespace std
