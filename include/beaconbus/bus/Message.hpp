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

#include <beaconbus/bus/NetworkByteStreamSerializable.hpp>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace beaconbus
{
namespace bus
{

// A frame is an opaque byte string. A message is an ordered sequence of
// frames that travels as a unit.
using Frame = std::string;
using Message = std::vector<Frame>;

struct MessageFormatError : std::runtime_error
{
  using std::runtime_error::runtime_error;
};

// On a stream connection every message is sent as
//   uint32 bodySize | uint32 frameCount | (uint32 frameSize | bytes)*
// with all integers in network byte order.
constexpr std::size_t kMessageHeaderSize = sizeof(std::uint32_t);

// Size of the message body, not counting the size header
inline std::size_t sizeInByteStream(const Message& message)
{
  auto size = sizeInByteStream(std::uint32_t{});
  for (const auto& frame : message)
  {
    size += sizeInByteStream(frame);
  }
  return size;
}

template <typename It>
It toNetworkByteStream(const Message& message, It out)
{
  out = toNetworkByteStream(static_cast<std::uint32_t>(message.size()), std::move(out));
  for (const auto& frame : message)
  {
    out = toNetworkByteStream(frame, std::move(out));
  }
  return out;
}

template <>
struct Deserialize<Message>
{
  template <typename It>
  static std::pair<Message, It> fromNetworkByteStream(It begin, It end)
  {
    using ItDiff = typename std::iterator_traits<It>::difference_type;

    auto count = Deserialize<std::uint32_t>::fromNetworkByteStream(std::move(begin), end);
    // Every frame needs at least its size field
    const auto available = std::distance(count.second, end);
    if (static_cast<ItDiff>(count.first) > available / static_cast<ItDiff>(sizeof(std::uint32_t)))
    {
      throw std::range_error("Frame count exceeds message size");
    }

    Message message;
    message.reserve(count.first);
    auto it = count.second;
    for (std::uint32_t i = 0; i < count.first; ++i)
    {
      auto frame = Deserialize<Frame>::fromNetworkByteStream(std::move(it), end);
      message.push_back(std::move(frame.first));
      it = frame.second;
    }
    return std::make_pair(std::move(message), it);
  }
};

// The message with its size header, ready to be written to a connection.
// Throws MessageFormatError if the body does not fit the 32 bit size field.
inline std::vector<std::uint8_t> encodeMessage(const Message& message)
{
  const auto bodySize = sizeInByteStream(message);
  if (bodySize > std::numeric_limits<std::uint32_t>::max())
  {
    throw MessageFormatError(
      "Message of " + std::to_string(bodySize) + " bytes cannot be encoded");
  }
  std::vector<std::uint8_t> buffer(kMessageHeaderSize + bodySize);
  auto out = toNetworkByteStream(static_cast<std::uint32_t>(bodySize), buffer.begin());
  toNetworkByteStream(message, out);
  return buffer;
}

// Reads the body size from a message header. Throws MessageFormatError if
// the size exceeds maxMessageSize.
template <typename It>
std::uint32_t decodeMessageHeader(It begin, It end, const std::size_t maxMessageSize)
{
  try
  {
    const auto bodySize = Deserialize<std::uint32_t>::fromNetworkByteStream(begin, end).first;
    if (bodySize > maxMessageSize)
    {
      throw MessageFormatError(
        "Message of " + std::to_string(bodySize) + " bytes exceeds the size limit");
    }
    return bodySize;
  }
  catch (const std::range_error& e)
  {
    throw MessageFormatError(e.what());
  }
}

// Decodes a complete message body. Throws MessageFormatError if the body is
// truncated or followed by stray bytes.
template <typename It>
Message decodeMessageBody(It begin, It end)
{
  try
  {
    auto result = Deserialize<Message>::fromNetworkByteStream(begin, end);
    if (result.second != end)
    {
      throw MessageFormatError("Unexpected bytes after the last frame");
    }
    return std::move(result.first);
  }
  catch (const std::range_error& e)
  {
    throw MessageFormatError(e.what());
  }
}

} // namespace bus
} // namespace beaconbus
