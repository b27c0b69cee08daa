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

#include <memory>
#include <utility>

namespace beaconbus
{
namespace util
{

// Completion handlers given to asio may run after the object that started
// the operation is gone: a cancelled wait is even allowed to complete with
// success. These handlers keep only a weak reference to their target and
// drop a completion whose target has expired.

struct InvokeTarget
{
  template <typename Target, typename... Args>
  void operator()(Target& target, Args&&... args) const
  {
    target(std::forward<Args>(args)...);
  }
};

template <typename Target, typename Callback = InvokeTarget>
struct SafeAsyncHandler
{
  template <typename... Args>
  void operator()(Args&&... args) const
  {
    if (const auto pTarget = mpTarget.lock())
    {
      mCallback(*pTarget, std::forward<Args>(args)...);
    }
  }

  std::weak_ptr<Target> mpTarget;
  Callback mCallback;
};

// Calls (*pTarget)(args...) on completion
template <typename Target>
SafeAsyncHandler<Target> makeAsyncSafe(const std::shared_ptr<Target>& pTarget)
{
  return {pTarget, {}};
}

// Calls callback(*pTarget, args...) on completion
template <typename Target, typename Callback>
SafeAsyncHandler<Target, Callback> makeAsyncSafe(
  const std::shared_ptr<Target>& pTarget, Callback callback)
{
  return {pTarget, std::move(callback)};
}

} // namespace util
} // namespace beaconbus
