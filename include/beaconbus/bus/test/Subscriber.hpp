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
#include <cstdint>
#include <functional>
#include <stdexcept>

namespace beaconbus
{
namespace bus
{
namespace test
{

// In-memory data port. Binding hands out a fixed port and tests inject
// messages as if a peer had published them.
struct Subscriber
{
  friend std::uint16_t bind(Subscriber& subscriber)
  {
    if (subscriber.failBind)
    {
      throw std::runtime_error("address already in use");
    }
    subscriber.bound = true;
    return subscriber.port;
  }

  template <typename Handler>
  friend void receive(Subscriber& subscriber, Handler handler)
  {
    subscriber.mHandler = [handler](Message message) { handler(std::move(message)); };
  }

  friend void close(Subscriber& subscriber)
  {
    ++subscriber.numCloses;
    subscriber.mHandler = nullptr;
  }

  void incomingMessage(Message message)
  {
    if (mHandler)
    {
      mHandler(std::move(message));
    }
  }

  std::uint16_t port = 50123;
  bool failBind = false;
  bool bound = false;
  int numCloses = 0;

private:
  std::function<void(Message)> mHandler;
};

} // namespace test
} // namespace bus
} // namespace beaconbus
