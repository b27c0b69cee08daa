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

#include <beaconbus/bus/MessageQueue.hpp>
#include <beaconbus/test/CatchWrapper.hpp>
#include <atomic>
#include <functional>
#include <optional>
#include <thread>

namespace beaconbus
{
namespace bus
{

TEST_CASE("MessageQueue | DeliversInOrder", "[MessageQueue]")
{
  MessageQueue queue;
  send(queue, Message{"a"});
  send(queue, Message{"b"});
  CHECK(2 == queue.size());

  CHECK((Message{"a"}) == queue.receive());
  CHECK((Message{"b"}) == queue.receive());
  CHECK_FALSE(queue.tryReceive());
}

TEST_CASE("MessageQueue | ReceiveTimesOut", "[MessageQueue]")
{
  MessageQueue queue;
  CHECK_FALSE(queue.receive(std::chrono::milliseconds(10)));
}

TEST_CASE("MessageQueue | ReceiveWakesUpOnSend", "[MessageQueue]")
{
  MessageQueue queue;
  std::thread producer([&queue] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    send(queue, Message{"late"});
  });

  const auto message = queue.receive(std::chrono::seconds(5));
  producer.join();
  REQUIRE(message);
  CHECK((Message{"late"}) == *message);
}

TEST_CASE("MessageQueue | WakesEveryBlockedReceiver", "[MessageQueue]")
{
  MessageQueue queue;
  std::atomic<int> numWaiting{0};
  std::optional<Message> first;
  std::optional<Message> second;

  const auto consume = [&](std::optional<Message>& result) {
    ++numWaiting;
    result = queue.receive(std::chrono::seconds(5));
  };
  std::thread consumerA(consume, std::ref(first));
  std::thread consumerB(consume, std::ref(second));

  while (numWaiting < 2)
  {
    std::this_thread::yield();
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  send(queue, Message{"a"});
  send(queue, Message{"b"});

  consumerA.join();
  consumerB.join();
  REQUIRE(first);
  REQUIRE(second);
  CHECK(0 == queue.size());
}

} // namespace bus
} // namespace beaconbus
