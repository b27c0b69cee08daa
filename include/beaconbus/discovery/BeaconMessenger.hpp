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
#include <beaconbus/discovery/Beacon.hpp>
#include <beaconbus/discovery/NodeIdentity.hpp>
#include <beaconbus/util/Injected.hpp>
#include <beaconbus/util/SafeAsyncHandler.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>

namespace beaconbus
{
namespace discovery
{

// Thrown when broadcasting a beacon fails
struct BeaconSendException : std::runtime_error
{
  BeaconSendException(const std::runtime_error& e)
    : std::runtime_error(e.what())
  {
  }
};

// Throws BeaconSendException
template <typename Interface>
void sendBeacon(Interface& iface, const std::uint16_t port)
{
  const auto payload = encodeBeacon(port);
  try
  {
    send(iface, reinterpret_cast<const std::uint8_t*>(payload.data()), payload.size());
  }
  catch (const std::runtime_error& err)
  {
    throw BeaconSendException{err};
  }
}

struct BeaconSettings
{
  std::chrono::milliseconds advertiseInterval;
  MalformedBeaconPolicy malformedBeaconPolicy;
  bool ignoreOwnBeacons;
};

// The discovery adapter. Periodically broadcasts the local data port on the
// interface and turns every beacon received on it into a candidate
// NodeIdentity for the bus.
//
// BeaconMessenger uses a "shared_ptr pImpl" pattern to make it moveable
// and to support safe async handler callbacks from the interface.
template <typename Interface, typename Resolver, typename Timer, typename Log>
class BeaconMessenger
{
public:
  using TimerError = typename util::Injected<Timer>::type::ErrorCode;

  BeaconMessenger(util::Injected<Interface> iface,
    util::Injected<Resolver> resolver,
    util::Injected<Timer> timer,
    Log log,
    const BeaconSettings settings)
    : mpImpl(std::make_shared<Impl>(
      std::move(iface), std::move(resolver), std::move(timer), std::move(log), settings))
  {
    mpImpl->listen();
  }

  BeaconMessenger(const BeaconMessenger&) = delete;
  BeaconMessenger& operator=(const BeaconMessenger&) = delete;

  BeaconMessenger(BeaconMessenger&&) = default;
  BeaconMessenger& operator=(BeaconMessenger&&) = default;

  // Start advertising the given port. The first beacon goes out right away,
  // then one per advertise interval until the messenger is closed.
  friend void advertise(BeaconMessenger& m, const std::uint16_t port)
  {
    m.mpImpl->mPort = port;
    m.mpImpl->broadcast();
  }

  // The handler is called with a NodeIdentity for every accepted beacon
  template <typename Handler>
  friend void receive(BeaconMessenger& m, Handler handler)
  {
    m.mpImpl->mHandler = [handler](NodeIdentity candidate) {
      handler(std::move(candidate));
    };
  }

  friend std::string boundAddress(const BeaconMessenger& m)
  {
    return boundAddress(*m.mpImpl->mInterface);
  }

  // Stop advertising and listening. Idempotent.
  friend void close(BeaconMessenger& m)
  {
    m.mpImpl->shutdown();
  }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(util::Injected<Interface> iface,
      util::Injected<Resolver> resolver,
      util::Injected<Timer> timer,
      Log log,
      const BeaconSettings settings)
      : mInterface(std::move(iface))
      , mResolver(std::move(resolver))
      , mTimer(std::move(timer))
      , mLog(std::move(log))
      , mSettings(settings)
      , mHandler([](NodeIdentity) {})
    {
    }

    void listen()
    {
      receive(*mInterface, util::makeAsyncSafe(this->shared_from_this()));
    }

    void broadcast()
    {
      if (mClosed || !mPort)
      {
        return;
      }

      // Schedule the next beacon before sending this one so that a failed
      // send is retried on the next interval.
      mTimer->expires_from_now(mSettings.advertiseInterval);
      mTimer->async_wait([this](const TimerError e) {
        if (!e)
        {
          broadcast();
        }
      });

      try
      {
        sendBeacon(*mInterface, *mPort);
      }
      catch (const BeaconSendException& err)
      {
        warning(mLog) << "Failed to send beacon: " << err.what();
      }
    }

    template <typename It>
    void operator()(const asio::ip::udp::endpoint& from, const It begin, const It end)
    {
      if (mClosed)
      {
        return;
      }

      const auto port = parseBeacon(begin, end, mSettings.malformedBeaconPolicy);
      const auto host = from.address().to_string();
      if (!port)
      {
        info(mLog) << "Ignoring malformed beacon from " << host;
        return;
      }

      if (mSettings.ignoreOwnBeacons && mPort && *port == *mPort
          && host == boundAddress(*mInterface))
      {
        return;
      }

      mHandler(NodeIdentity::resolve(host, *port, *mResolver));
    }

    void shutdown()
    {
      if (!mClosed)
      {
        mClosed = true;
        mTimer->cancel();
        close(*mInterface);
        debug(mLog) << "Stopped advertising and listening for beacons";
      }
    }

    util::Injected<Interface> mInterface;
    util::Injected<Resolver> mResolver;
    util::Injected<Timer> mTimer;
    Log mLog;
    BeaconSettings mSettings;
    std::optional<std::uint16_t> mPort;
    bool mClosed = false;
    std::function<void(NodeIdentity)> mHandler;
  };

  std::shared_ptr<Impl> mpImpl;
};

template <typename Interface, typename Resolver, typename Timer, typename Log>
BeaconMessenger<Interface, Resolver, Timer, Log> makeBeaconMessenger(
  util::Injected<Interface> iface,
  util::Injected<Resolver> resolver,
  util::Injected<Timer> timer,
  Log log,
  const BeaconSettings settings)
{
  return {std::move(iface), std::move(resolver), std::move(timer), std::move(log), settings};
}

} // namespace discovery
} // namespace beaconbus
