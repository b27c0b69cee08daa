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
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>
#include <utility>

namespace beaconbus
{
namespace util
{

// Concept: Log
// Requirements:
//  - copyable
//  - selectors for debug, info, warning, and error streams
//  - channel function that provides new log object tagged with the
//    given channel name

enum class LogLevel
{
  Debug,
  Info,
  Warning,
  Error,
};

// Null object for the Log concept
struct NullLog
{
  template <typename T>
  friend NullLog& operator<<(NullLog& log, const T&)
  {
    return log;
  }

  friend NullLog& debug(NullLog& log)
  {
    return log;
  }

  friend NullLog& info(NullLog& log)
  {
    return log;
  }

  friend NullLog& warning(NullLog& log)
  {
    return log;
  }

  friend NullLog& error(NullLog& log)
  {
    return log;
  }

  friend NullLog channel(const NullLog&, std::string)
  {
    return {};
  }
};

// std streams-based log. Messages below the threshold level are dropped.
struct StdLog
{
  StdLog(std::string channelName = {}, const LogLevel threshold = LogLevel::Info)
    : mChannelName(std::move(channelName))
    , mThreshold(threshold)
  {
  }

  // Prepends the channel name and terminates the line on destruction. A
  // stream without a target swallows everything written to it.
  struct StdLogStream
  {
    StdLogStream(std::ostream* pIoStream, const std::string& channelName)
      : mpIoStream(pIoStream)
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "[" << channelName << "] ";
      }
    }

    StdLogStream(StdLogStream&& rhs)
      : mpIoStream(rhs.mpIoStream)
    {
      rhs.mpIoStream = nullptr;
    }

    StdLogStream(const StdLogStream&) = delete;
    StdLogStream& operator=(const StdLogStream&) = delete;

    ~StdLogStream()
    {
      if (mpIoStream)
      {
        (*mpIoStream) << "\n";
      }
    }

    template <typename T>
    StdLogStream& operator<<(const T& rhs)
    {
      if (mpIoStream)
      {
        (*mpIoStream) << rhs;
      }
      return *this;
    }

    std::ostream* mpIoStream;
  };

  friend StdLogStream debug(const StdLog& log)
  {
    return log.stream(LogLevel::Debug, std::clog);
  }

  friend StdLogStream info(const StdLog& log)
  {
    return log.stream(LogLevel::Info, std::clog);
  }

  friend StdLogStream warning(const StdLog& log)
  {
    return log.stream(LogLevel::Warning, std::clog);
  }

  friend StdLogStream error(const StdLog& log)
  {
    return log.stream(LogLevel::Error, std::cerr);
  }

  friend StdLog channel(const StdLog& log, const std::string& channelName)
  {
    auto compositeName =
      log.mChannelName.empty() ? channelName : log.mChannelName + "::" + channelName;
    return {std::move(compositeName), log.mThreshold};
  }

  StdLogStream stream(const LogLevel level, std::ostream& ioStream) const
  {
    return {level >= mThreshold ? &ioStream : nullptr, mChannelName};
  }

  std::string mChannelName;
  LogLevel mThreshold;
};

// Log adapter that prefixes every line with the local time of day, with
// millisecond resolution
template <typename Log>
struct Timestamped
{
  using Stream = decltype(debug(std::declval<Log>()));

  Timestamped() = default;

  Timestamped(Log log)
    : mLog(std::move(log))
  {
  }

  friend Stream debug(const Timestamped& log)
  {
    return stamped(debug(log.mLog));
  }

  friend Stream info(const Timestamped& log)
  {
    return stamped(info(log.mLog));
  }

  friend Stream warning(const Timestamped& log)
  {
    return stamped(warning(log.mLog));
  }

  friend Stream error(const Timestamped& log)
  {
    return stamped(error(log.mLog));
  }

  friend Timestamped channel(const Timestamped& log, const std::string& channelName)
  {
    return {channel(log.mLog, channelName)};
  }

  static Stream stamped(Stream stream)
  {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto time = system_clock::to_time_t(now);
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&time, &local);
    char clock[16];
    std::snprintf(clock, sizeof(clock), "%02d:%02d:%02d.%03d", local.tm_hour,
      local.tm_min, local.tm_sec, static_cast<int>(millis));
    stream << clock << " ";
    return stream;
  }

  Log mLog;
};

} // namespace util
} // namespace beaconbus
