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

#include <beaconbus/bus/Message.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <array>

namespace beaconbus
{
namespace bus
{

TEST_CASE("Message | EncodesSizeHeaderAndFrames", "[Message]")
{
  const auto bytes = encodeMessage(Message{"ab", ""});

  // header | count | len "ab" | len ""
  const auto expected = std::vector<std::uint8_t>{0, 0, 0, 14, 0, 0, 0, 2, 0, 0, 0, 2,
    'a', 'b', 0, 0, 0, 0};
  CHECK(expected == bytes);
}

TEST_CASE("Message | PreservesBinaryAndEmptyFrames", "[Message]")
{
  const auto message =
    Message{std::string("\0\xff\x01", 3), "", "text", std::string(1000, 'x')};
  const auto bytes = encodeMessage(message);

  const auto bodySize = decodeMessageHeader(bytes.begin(), bytes.end(), 1 << 20);
  REQUIRE(bytes.size() == kMessageHeaderSize + bodySize);
  const auto decoded = decodeMessageBody(bytes.begin() + kMessageHeaderSize, bytes.end());
  CHECK(message == decoded);
}

TEST_CASE("Message | RejectsOversizedMessages", "[Message]")
{
  const auto header = std::array<std::uint8_t, 4>{{0, 1, 0, 1}};
  CHECK_THROWS_AS(
    decodeMessageHeader(header.begin(), header.end(), 65536), MessageFormatError);
  CHECK(65537 == decodeMessageHeader(header.begin(), header.end(), 65537));
}

TEST_CASE("Message | BodySizeCountsEveryFrame", "[Message]")
{
  CHECK(4 == sizeInByteStream(Message{}));
  CHECK(4 + 8 + 1000 == sizeInByteStream(Message{"", std::string(1000, 'x')}));

  const auto bytes = encodeMessage(Message{"", std::string(1000, 'x')});
  CHECK(kMessageHeaderSize + sizeInByteStream(Message{"", std::string(1000, 'x')})
        == bytes.size());
}

TEST_CASE("Message | RejectsTruncatedBodies", "[Message]")
{
  const auto bytes = encodeMessage(Message{"hello", "world"});
  const auto body = std::vector<std::uint8_t>(bytes.begin() + kMessageHeaderSize, bytes.end());

  CHECK_THROWS_AS(
    decodeMessageBody(body.begin(), body.end() - 1), MessageFormatError);
  CHECK_THROWS_AS(decodeMessageBody(body.begin(), body.begin() + 2), MessageFormatError);
}

TEST_CASE("Message | RejectsTrailingBytes", "[Message]")
{
  const auto bytes = encodeMessage(Message{"hello"});
  auto body = std::vector<std::uint8_t>(bytes.begin() + kMessageHeaderSize, bytes.end());
  body.push_back(0);

  CHECK_THROWS_AS(decodeMessageBody(body.begin(), body.end()), MessageFormatError);
}

TEST_CASE("Message | RejectsImplausibleFrameCount", "[Message]")
{
  // Claims four billion frames in an eight byte body
  const auto body = std::vector<std::uint8_t>{0xff, 0xff, 0xff, 0xff, 0, 0, 0, 0};
  CHECK_THROWS_AS(decodeMessageBody(body.begin(), body.end()), MessageFormatError);
}

} // namespace bus
} // namespace beaconbus
