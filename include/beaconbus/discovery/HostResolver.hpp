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
#include <optional>
#include <string>
#include <unordered_map>

namespace beaconbus
{
namespace discovery
{

// Concept: HostResolver
//
// Callable as std::optional<std::string>(const std::string& name). Returns
// the host name for the given name (usually the textual ip address a beacon
// was received from), or nullopt if it could not be resolved.

// Resolver backed by the system resolver through asio. Lookups are
// synchronous, so results are cached per name, failures included, to block
// the calling thread at most once per distinct host.
template <typename Log>
class AsioHostResolver
{
public:
  AsioHostResolver(asio::io_context& io, Log log)
    : mResolver(io)
    , mLog(std::move(log))
  {
  }

  std::optional<std::string> operator()(const std::string& name)
  {
    const auto it = mCache.find(name);
    if (it != mCache.end())
    {
      return it->second;
    }

    auto hostName = lookup(name);
    if (!hostName)
    {
      debug(mLog) << "Could not resolve host name of " << name;
    }
    mCache.emplace(name, hostName);
    return hostName;
  }

  std::size_t numCached() const
  {
    return mCache.size();
  }

private:
  std::optional<std::string> lookup(const std::string& name)
  {
    asio::error_code ec;
    const auto addr = asio::ip::make_address(name, ec);
    if (!ec)
    {
      // Reverse lookup for numeric addresses
      const auto results = mResolver.resolve(asio::ip::tcp::endpoint{addr, 0}, ec);
      if (!ec && !results.empty())
      {
        return results.begin()->host_name();
      }
      return std::nullopt;
    }

    const auto results =
      mResolver.resolve(name, "", asio::ip::resolver_base::canonical_name, ec);
    if (!ec && !results.empty())
    {
      return results.begin()->host_name();
    }
    return std::nullopt;
  }

  asio::ip::tcp::resolver mResolver;
  Log mLog;
  std::unordered_map<std::string, std::optional<std::string>> mCache;
};

} // namespace discovery
} // namespace beaconbus
