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

#include <algorithm>
#include <arpa/inet.h>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace beaconbus
{
namespace bus
{

// Concept: NetworkByteStreamSerializable
//
// A type that can be encoded to a stream of bytes and decoded from a
// stream of bytes in network byte order:
//
//  friend std::size_t sizeInByteStream(const T&);
//
//  // The byte stream pointed to by 'out' must have sufficient space to
//  // hold the value, as defined by sizeInByteStream.
//  template <typename It>
//  friend It toNetworkByteStream(const T&, It out);
//
// Decoding goes through Deserialize<T>, because clients must name the type
// they expect.

template <typename T>
struct Deserialize
{
  // Throws std::range_error if parsing the type from the given byte range
  // fails. Returns a pair of the parsed value and an iterator to the next
  // byte to parse.
  template <typename It>
  static std::pair<T, It> fromNetworkByteStream(It begin, It end)
  {
    return T::fromNetworkByteStream(std::move(begin), std::move(end));
  }
};

namespace detail
{

template <typename T, typename It>
It copyToByteStream(T t, It out)
{
  const auto pBytes = reinterpret_cast<const std::uint8_t*>(&t);
  return std::copy(pBytes, pBytes + sizeof(t), std::move(out));
}

template <typename T, typename It>
std::pair<T, It> copyFromByteStream(It begin, const It end)
{
  using ItDiff = typename std::iterator_traits<It>::difference_type;

  if (std::distance(begin, end) < static_cast<ItDiff>(sizeof(T)))
  {
    throw std::range_error("Parsing type from byte stream failed");
  }

  T t;
  const auto n = static_cast<ItDiff>(sizeof(t));
  std::copy(begin, begin + n, reinterpret_cast<std::uint8_t*>(&t));
  return std::make_pair(t, begin + n);
}

} // namespace detail

// uint32_t

inline std::size_t sizeInByteStream(std::uint32_t)
{
  return sizeof(std::uint32_t);
}

template <typename It>
It toNetworkByteStream(const std::uint32_t l, It out)
{
  return detail::copyToByteStream(htonl(l), std::move(out));
}

template <>
struct Deserialize<std::uint32_t>
{
  template <typename It>
  static std::pair<std::uint32_t, It> fromNetworkByteStream(It begin, It end)
  {
    auto result =
      detail::copyFromByteStream<std::uint32_t>(std::move(begin), std::move(end));
    result.first = ntohl(result.first);
    return result;
  }
};

// Byte strings, as a uint32_t length followed by the bytes

inline std::size_t sizeInByteStream(const std::string& str)
{
  return sizeInByteStream(std::uint32_t{}) + str.size();
}

template <typename It>
It toNetworkByteStream(const std::string& str, It out)
{
  out = toNetworkByteStream(static_cast<std::uint32_t>(str.size()), std::move(out));
  return std::copy(str.begin(), str.end(), std::move(out));
}

template <>
struct Deserialize<std::string>
{
  template <typename It>
  static std::pair<std::string, It> fromNetworkByteStream(It begin, It end)
  {
    using ItDiff = typename std::iterator_traits<It>::difference_type;

    auto size =
      Deserialize<std::uint32_t>::fromNetworkByteStream(std::move(begin), end);
    if (std::distance(size.second, end) < static_cast<ItDiff>(size.first))
    {
      throw std::range_error("Parsing string from byte stream failed");
    }
    const auto strEnd = size.second + static_cast<ItDiff>(size.first);
    return std::make_pair(std::string(size.second, strEnd), strEnd);
  }
};

} // namespace bus
} // namespace beaconbus
