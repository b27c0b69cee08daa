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

#include <chrono>
#include <functional>

namespace beaconbus
{
namespace util
{
namespace test
{

// Manually driven model of the Timer concept:
//  - ErrorCode and TimePoint member types
//  - expires_at / expires_from_now / cancel / async_wait with the
//    asio timer semantics
//  - now(), the current time on the timer's clock
// A pending handler is called with a truthy error code when cancelled and
// with a falsy one when advance() moves the clock past the expiry.
struct Timer
{
  using ErrorCode = int;
  using TimePoint = std::chrono::steady_clock::time_point;

  // Start at an arbitrary large value to simulate the time_since_epoch of a
  // real clock.
  Timer()
    : mNow{std::chrono::milliseconds{123456789}}
  {
  }

  void expires_at(TimePoint t)
  {
    cancel();
    mFireAt = std::move(t);
  }

  template <typename T, typename Rep>
  void expires_from_now(std::chrono::duration<T, Rep> duration)
  {
    cancel();
    mFireAt = now() + duration;
  }

  ErrorCode cancel()
  {
    if (mHandler)
    {
      auto handler = std::move(mHandler);
      mHandler = nullptr;
      handler(1);
    }
    return 0;
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    mHandler = [handler](ErrorCode ec) { handler(ec); };
  }

  TimePoint now() const
  {
    return mNow;
  }

  // Advance the clock in one step. A handler that re-arms the timer from
  // within its callback is not fired again during the same step.
  template <typename T, typename Rep>
  void advance(std::chrono::duration<T, Rep> duration)
  {
    mNow += duration;
    if (mHandler && mFireAt <= mNow)
    {
      auto handler = std::move(mHandler);
      mHandler = nullptr;
      handler(0);
    }
  }

  // Advance the clock in steps so that a periodic handler fires at every
  // expiry along the way.
  template <typename T, typename Rep, typename StepT, typename StepRep>
  void advance(
    std::chrono::duration<T, Rep> duration, std::chrono::duration<StepT, StepRep> step)
  {
    const auto end = mNow + duration;
    while (mNow + step <= end)
    {
      advance(step);
    }
    if (mNow < end)
    {
      advance(end - mNow);
    }
  }

  bool isArmed() const
  {
    return static_cast<bool>(mHandler);
  }

  std::function<void(ErrorCode)> mHandler;
  TimePoint mFireAt;
  TimePoint mNow;
};

} // namespace test
} // namespace util
} // namespace beaconbus
