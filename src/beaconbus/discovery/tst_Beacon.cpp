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

#include <beaconbus/discovery/Beacon.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <string>

namespace beaconbus
{
namespace discovery
{
namespace
{

std::optional<std::uint16_t> parse(
  const std::string& payload, const MalformedBeaconPolicy policy)
{
  return parseBeacon(payload.begin(), payload.end(), policy);
}

} // anonymous namespace

TEST_CASE("Beacon | EncodesPortAsDecimalText", "[Beacon]")
{
  CHECK("5000" == encodeBeacon(5000));
  CHECK("0" == encodeBeacon(0));
  CHECK("65535" == encodeBeacon(65535));
}

TEST_CASE("Beacon | ParsesWellFormedPorts", "[Beacon]")
{
  for (const auto policy :
    {MalformedBeaconPolicy::TreatAsPortZero, MalformedBeaconPolicy::Reject})
  {
    CHECK(std::uint16_t{5000} == parse("5000", policy));
    CHECK(std::uint16_t{1} == parse("1", policy));
    CHECK(std::uint16_t{65535} == parse("65535", policy));
  }
}

TEST_CASE("Beacon | RejectsPortsBeyondSixteenBits", "[Beacon]")
{
  CHECK(std::uint16_t{65535} == parsePort("65535"));
  CHECK_FALSE(parsePort("65536"));
  CHECK_FALSE(parsePort("70000"));
}

TEST_CASE("Beacon | ToleratesSurroundingWhitespaceAndPlusSign", "[Beacon]")
{
  const auto policy = MalformedBeaconPolicy::Reject;
  CHECK(std::uint16_t{5000} == parse(" 5000\n", policy));
  CHECK(std::uint16_t{5000} == parse("+5000", policy));
}

TEST_CASE("Beacon | MalformedPayloadIsPortZeroWhenLenient", "[Beacon]")
{
  const auto policy = MalformedBeaconPolicy::TreatAsPortZero;
  CHECK(std::uint16_t{0} == parse("", policy));
  CHECK(std::uint16_t{0} == parse("hello", policy));
  CHECK(std::uint16_t{0} == parse("50x0", policy));
  CHECK(std::uint16_t{0} == parse("-1", policy));
  CHECK(std::uint16_t{0} == parse("65536", policy));
}

TEST_CASE("Beacon | MalformedPayloadIsDroppedWhenStrict", "[Beacon]")
{
  const auto policy = MalformedBeaconPolicy::Reject;
  CHECK_FALSE(parse("", policy));
  CHECK_FALSE(parse("hello", policy));
  CHECK_FALSE(parse("50x0", policy));
  CHECK_FALSE(parse("-1", policy));
  CHECK_FALSE(parse("99999999999999999999", policy));
  CHECK_FALSE(parse(std::string("50\0" "00", 5), policy));
}

} // namespace discovery
} // namespace beaconbus
