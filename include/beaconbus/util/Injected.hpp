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

#include <functional>
#include <memory>

namespace beaconbus
{
namespace util
{

// Dependency injection helper. Components that own a collaborator in
// production (a timer, a socket interface) but must share it with the test
// that drives them take an Injected<T>, which is either the value itself or
// a reference to it. Access is uniform through -> and *.

template <typename T>
struct Injected
{
  using type = T;

  Injected(T t)
    : val(std::move(t))
  {
  }

  Injected(Injected&&) = default;
  Injected& operator=(Injected&&) = default;

  T* operator->()
  {
    return &val;
  }

  const T* operator->() const
  {
    return &val;
  }

  T& operator*()
  {
    return val;
  }

  const T& operator*() const
  {
    return val;
  }

  T val;
};

template <typename T>
Injected<T> injectVal(T t)
{
  return {std::move(t)};
}

template <typename T>
struct Injected<T&>
{
  using type = T;

  Injected(T& t)
    : ref(std::ref(t))
  {
  }

  Injected(const Injected&) = default;
  Injected& operator=(const Injected&) = default;

  T* operator->()
  {
    return &ref.get();
  }

  const T* operator->() const
  {
    return &ref.get();
  }

  T& operator*()
  {
    return ref;
  }

  const T& operator*() const
  {
    return ref;
  }

  std::reference_wrapper<T> ref;
};

template <typename T>
Injected<T&> injectRef(T& t)
{
  return {t};
}

} // namespace util
} // namespace beaconbus
