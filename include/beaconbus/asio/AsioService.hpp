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

#include <beaconbus/asio/AsioTimer.hpp>
#include <beaconbus/asio/AsioWrapper.hpp>
#include <memory>
#include <thread>

namespace beaconbus
{
namespace util
{

// Owns an io_context and the single thread that runs it. Every handler
// posted to the service, and every completion of a socket or timer created
// from it, runs on that thread.
struct AsioService
{
  using Timer = util::AsioTimer;

  AsioService()
    : AsioService(DefaultHandler{})
  {
  }

  template <typename ExceptionHandler>
  explicit AsioService(ExceptionHandler exceptHandler)
    : mpWork(new WorkGuard(asio::make_work_guard(mService)))
  {
    mThread = std::thread{
      [](asio::io_context& service, ExceptionHandler handler) {
        for (;;)
        {
          try
          {
            service.run();
            break;
          }
          catch (const typename ExceptionHandler::Exception& exception)
          {
            handler(exception);
          }
        }
      },
      std::ref(mService), std::move(exceptHandler)};
  }

  AsioService(const AsioService&) = delete;
  AsioService& operator=(const AsioService&) = delete;

  ~AsioService()
  {
    stop();
  }

  // Let the thread finish the handlers that are already queued, then join
  // it. Safe to call more than once, but never from the service thread.
  void stop()
  {
    mpWork.reset();
    if (mThread.joinable())
    {
      mThread.join();
    }
  }

  util::AsioTimer makeTimer()
  {
    return {mService};
  }

  template <typename Handler>
  void post(Handler handler)
  {
    asio::post(mService, std::move(handler));
  }

  asio::io_context mService;

private:
  using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

  // The default handler defines a hidden exception type that is never thrown
  // by other code, so it effectively does not catch.
  struct DefaultHandler
  {
    struct Exception
    {
    };

    void operator()(const Exception&)
    {
    }
  };

  std::unique_ptr<WorkGuard> mpWork;
  std::thread mThread;
};

} // namespace util
} // namespace beaconbus
