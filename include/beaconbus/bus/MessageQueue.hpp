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

#include <beaconbus/bus/Message.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace beaconbus
{
namespace bus
{

// Unbounded queue carrying messages from the bus thread to the owner.
// send never blocks; the receive functions block until a message arrives.
// Any number of owner threads may receive concurrently.
class MessageQueue
{
public:
  MessageQueue() = default;

  MessageQueue(const MessageQueue&) = delete;
  MessageQueue& operator=(const MessageQueue&) = delete;

  friend void send(MessageQueue& queue, Message message)
  {
    {
      std::lock_guard<std::mutex> lock(queue.mMutex);
      queue.mMessages.push_back(std::move(message));
    }
    // One waiter per message, so every queued message has a receiver
    queue.mHasMessage.notify_one();
  }

  Message receive()
  {
    std::unique_lock<std::mutex> lock(mMutex);
    mHasMessage.wait(lock, [this] { return !mMessages.empty(); });
    return take();
  }

  template <typename Rep, typename Period>
  std::optional<Message> receive(const std::chrono::duration<Rep, Period> timeout)
  {
    std::unique_lock<std::mutex> lock(mMutex);
    if (!mHasMessage.wait_for(lock, timeout, [this] { return !mMessages.empty(); }))
    {
      return std::nullopt;
    }
    return take();
  }

  std::optional<Message> tryReceive()
  {
    std::lock_guard<std::mutex> lock(mMutex);
    if (mMessages.empty())
    {
      return std::nullopt;
    }
    return take();
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(mMutex);
    return mMessages.size();
  }

private:
  // Precondition: mMutex is held and the queue is not empty
  Message take()
  {
    auto message = std::move(mMessages.front());
    mMessages.pop_front();
    return message;
  }

  mutable std::mutex mMutex;
  std::condition_variable mHasMessage;
  std::deque<Message> mMessages;
};

} // namespace bus
} // namespace beaconbus
