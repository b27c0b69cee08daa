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

#include <cctype>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace beaconbus
{
namespace discovery
{

// A beacon is the decimal ASCII representation of the sender's data port.
// Nothing else is transmitted: the receiver learns the sender's host from
// the datagram itself.

// Beacons larger than this are not read
constexpr std::size_t kMaxBeaconSize = 64;

enum class MalformedBeaconPolicy
{
  // A payload that is not a port number is read as port 0
  TreatAsPortZero,
  // A payload that is not a port number is dropped
  Reject,
};

inline std::string encodeBeacon(const std::uint16_t port)
{
  return std::to_string(port);
}

// Decimal port number, optionally signed with '+' and surrounded by
// whitespace. Returns nullopt for anything else, including values that do
// not fit 16 bits.
inline std::optional<std::uint16_t> parsePort(std::string text)
{
  const auto isSpace = [](const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
  };

  auto first = text.begin();
  auto last = text.end();
  while (first != last && isSpace(*first))
  {
    ++first;
  }
  while (last != first && isSpace(*(last - 1)))
  {
    --last;
  }
  if (first != last && *first == '+')
  {
    ++first;
  }
  if (first == last)
  {
    return std::nullopt;
  }

  unsigned long value = 0;
  const auto pBegin = &*first;
  const auto pEnd = pBegin + (last - first);
  const auto result = std::from_chars(pBegin, pEnd, value);
  if (result.ec != std::errc{} || result.ptr != pEnd
      || value > std::numeric_limits<std::uint16_t>::max())
  {
    return std::nullopt;
  }
  return static_cast<std::uint16_t>(value);
}

// Returns the advertised port, or nullopt if the payload is malformed and
// the policy says to drop it.
template <typename It>
std::optional<std::uint16_t> parseBeacon(
  const It begin, const It end, const MalformedBeaconPolicy policy)
{
  if (const auto port = parsePort(std::string(begin, end)))
  {
    return port;
  }
  if (policy == MalformedBeaconPolicy::TreatAsPortZero)
  {
    return std::uint16_t{0};
  }
  return std::nullopt;
}

} // namespace discovery
} // namespace beaconbus
