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

#include <beaconbus/asio/AsioWrapper.hpp>
#include <beaconbus/util/SafeAsyncHandler.hpp>
#include <chrono>
#include <functional>
#include <memory>

namespace beaconbus
{
namespace util
{

// Model of the Timer concept (see util/test/Timer.hpp) on top of
// asio::steady_timer. Membership liveness is measured against a monotonic
// clock so that wall clock adjustments cannot expire or resurrect peers.
class AsioTimer
{
public:
  using ErrorCode = asio::error_code;
  using TimePoint = std::chrono::steady_clock::time_point;

  AsioTimer(asio::io_context& io)
    : mpTimer(new asio::steady_timer(io))
    , mpAsyncHandler(std::make_shared<AsyncHandler>())
  {
  }

  ~AsioTimer()
  {
    // A moved-from timer has nothing left to cancel
    if (mpTimer != nullptr)
    {
      cancel();
    }
  }

  AsioTimer(const AsioTimer&) = delete;
  AsioTimer& operator=(const AsioTimer&) = delete;

  AsioTimer(AsioTimer&&) = default;
  AsioTimer& operator=(AsioTimer&&) = default;

  void expires_at(TimePoint tp)
  {
    mpTimer->expires_at(std::move(tp));
  }

  template <typename T, typename Rep>
  void expires_from_now(std::chrono::duration<T, Rep> duration)
  {
    mpTimer->expires_after(duration);
  }

  ErrorCode cancel()
  {
    mpAsyncHandler->mHandler = nullptr;
    try
    {
      mpTimer->cancel();
    }
    catch (const asio::system_error& e)
    {
      return e.code();
    }
    return {};
  }

  template <typename Handler>
  void async_wait(Handler handler)
  {
    *mpAsyncHandler = std::move(handler);
    mpTimer->async_wait(util::makeAsyncSafe(mpAsyncHandler));
  }

  TimePoint now() const
  {
    return std::chrono::steady_clock::now();
  }

private:
  struct AsyncHandler
  {
    template <typename Handler>
    AsyncHandler& operator=(Handler handler)
    {
      mHandler = [handler](const ErrorCode ec) { handler(ec); };
      return *this;
    }

    void operator()(const ErrorCode ec)
    {
      if (mHandler)
      {
        mHandler(ec);
      }
    }

    std::function<void(ErrorCode)> mHandler;
  };

  std::unique_ptr<asio::steady_timer> mpTimer;
  std::shared_ptr<AsyncHandler> mpAsyncHandler;
};

} // namespace util
} // namespace beaconbus
