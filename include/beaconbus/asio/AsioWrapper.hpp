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

/*!
 * \brief Wrapper file for the standalone asio library
 *
 * This file includes all headers from asio which are used by BeaconBus, and
 * also disables some compiler warnings which are specific to that library.
 */

#if !defined(ASIO_STANDALONE)
#define ASIO_STANDALONE 1
#endif

// Clang
#if defined(__clang__)
#pragma clang diagnostic push
// warning: implicit conversion loses integer precision: 'type1' to 'type2'
#pragma clang diagnostic ignored "-Wconversion"
// warning: default label in switch which covers all enumeration values
#pragma clang diagnostic ignored "-Wcovered-switch-default"
// warning: use of old-style cast
#pragma clang diagnostic ignored "-Wold-style-cast"
// warning: implicit conversion changes signedness: 'type1' to 'type2'
#pragma clang diagnostic ignored "-Wsign-conversion"
// warning: 'symbol' is not defined, evaluates to 0
#pragma clang diagnostic ignored "-Wundef"
#endif

// GCC
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wconversion"
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif

#include <asio.hpp>
#include <asio/steady_timer.hpp>

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

// Clang
#if defined(__clang__)
#pragma clang diagnostic pop
#endif
