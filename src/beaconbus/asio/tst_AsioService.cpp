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

#include <beaconbus/asio/AsioService.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace beaconbus
{
namespace util
{
namespace
{

struct RecordingHandler
{
  using Exception = std::runtime_error;

  void operator()(const Exception& exception)
  {
    pErrors->push_back(exception.what());
  }

  std::vector<std::string>* pErrors;
};

} // anonymous namespace

TEST_CASE("AsioService | RunsPostedHandlers", "[AsioService]")
{
  int numCalls = 0;
  {
    AsioService service;
    service.post([&numCalls] { ++numCalls; });
    service.post([&numCalls] { ++numCalls; });
    service.stop();
  }
  CHECK(2 == numCalls);
}

TEST_CASE("AsioService | KeepsRunningAfterHandlerThrows", "[AsioService]")
{
  std::vector<std::string> errors;
  bool ranLater = false;
  {
    AsioService service{RecordingHandler{&errors}};
    service.post([] { throw std::runtime_error("handler failed"); });
    service.post([&ranLater] { ranLater = true; });
    // Joins the thread, so the results are safe to read afterwards
    service.stop();
  }
  REQUIRE(1 == errors.size());
  CHECK("handler failed" == errors[0]);
  CHECK(ranLater);
}

} // namespace util
} // namespace beaconbus
