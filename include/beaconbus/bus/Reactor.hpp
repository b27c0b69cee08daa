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

#include <beaconbus/bus/Commands.hpp>
#include <beaconbus/bus/Events.hpp>
#include <beaconbus/bus/MembershipTable.hpp>
#include <beaconbus/util/Injected.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace beaconbus
{
namespace bus
{

struct ReactorSettings
{
  std::chrono::milliseconds sweepInterval;
  std::chrono::milliseconds deadNodeTimeout;
};

// The control loop of a bus node. Every input, whether a command from the
// owner, a message from a peer, a beacon or a sweep tick, becomes an Event
// that is handled to completion by dispatch. All calls must come from the
// thread that runs the Discovery, Subscriber and Timer completions.
//
// Discovery models a beacon messenger:
//  - advertise(d, port), receive(d, handler(NodeIdentity)), boundAddress(d),
//    close(d)
// Subscriber models the receiving data channel:
//  - bind(s) -> port, receive(s, handler(Message)), close(s)
// DataPlane keeps the outgoing links in step with the membership (see
// DataPlaneConnector).
// Owner receives notifications, replies and data:
//  - send(o, Message)
template <typename Discovery,
  typename Subscriber,
  typename DataPlane,
  typename Owner,
  typename Timer,
  typename Log>
class Reactor
{
public:
  using NodeIdentity = discovery::NodeIdentity;
  using TimerError = typename util::Injected<Timer>::type::ErrorCode;

  Reactor(util::Injected<Discovery> discovery,
    util::Injected<Subscriber> subscriber,
    util::Injected<DataPlane> dataPlane,
    util::Injected<Owner> owner,
    util::Injected<Timer> timer,
    Log log,
    const ReactorSettings settings)
    : mpImpl(std::make_shared<Impl>(std::move(discovery),
      std::move(subscriber),
      std::move(dataPlane),
      std::move(owner),
      std::move(timer),
      std::move(log),
      settings))
  {
  }

  Reactor(const Reactor&) = delete;
  Reactor& operator=(const Reactor&) = delete;

  Reactor(Reactor&&) = default;
  Reactor& operator=(Reactor&&) = default;

  ~Reactor()
  {
    if (mpImpl)
    {
      mpImpl->shutdown();
    }
  }

  // Bind the data port, start advertising it and arm the sweep timer. If
  // any step throws, everything acquired so far is released before the
  // exception propagates.
  void start()
  {
    try
    {
      mpImpl->start();
    }
    catch (...)
    {
      mpImpl->shutdown();
      throw;
    }
  }

  // Events arriving after shutdown are dropped
  void dispatch(Event event)
  {
    mpImpl->dispatch(std::move(event));
  }

  // Release all resources. Idempotent.
  void shutdown()
  {
    mpImpl->shutdown();
  }

  bool isRunning() const
  {
    return mpImpl->mRunning;
  }

  // The port peers connect to
  std::uint16_t port() const
  {
    return mpImpl->mPort;
  }

  std::vector<MembershipTable::Entry> members() const
  {
    return mpImpl->mTable.entries();
  }

private:
  struct Impl : std::enable_shared_from_this<Impl>
  {
    Impl(util::Injected<Discovery> discovery,
      util::Injected<Subscriber> subscriber,
      util::Injected<DataPlane> dataPlane,
      util::Injected<Owner> owner,
      util::Injected<Timer> timer,
      Log log,
      const ReactorSettings settings)
      : mDiscovery(std::move(discovery))
      , mSubscriber(std::move(subscriber))
      , mDataPlane(std::move(dataPlane))
      , mOwner(std::move(owner))
      , mTimer(std::move(timer))
      , mLog(std::move(log))
      , mSettings(settings)
    {
    }

    void start()
    {
      mPort = bind(*mSubscriber);
      info(mLog) << "Accepting data connections on port " << mPort;

      std::weak_ptr<Impl> pWeakSelf = this->shared_from_this();
      receive(*mSubscriber, [pWeakSelf](Message frames) {
        if (auto pSelf = pWeakSelf.lock())
        {
          pSelf->dispatch(DataReady{std::move(frames)});
        }
      });
      receive(*mDiscovery, [pWeakSelf](NodeIdentity candidate) {
        if (auto pSelf = pWeakSelf.lock())
        {
          const auto now = pSelf->mTimer->now();
          pSelf->dispatch(DiscoveryReady{std::move(candidate), now});
        }
      });

      mRunning = true;
      info(mLog) << "Advertising port " << mPort << " from " << boundAddress(*mDiscovery);
      advertise(*mDiscovery, mPort);
      scheduleSweep();
    }

    void dispatch(Event event)
    {
      if (mRunning)
      {
        std::visit(*this, std::move(event));
      }
    }

    void operator()(const CommandReady& event)
    {
      const auto& command = event.command;
      if (command.empty())
      {
        info(mLog) << "Ignoring empty command";
        return;
      }

      const auto& name = command.front();
      if (name == kTerminateCommand)
      {
        info(mLog) << "Terminating";
        shutdown();
      }
      else if (name == kPublishCommand)
      {
        if (command.size() < 2)
        {
          debug(mLog) << "Ignoring publish command without payload";
          return;
        }
        mDataPlane->publish(Message(command.begin() + 1, command.end()));
      }
      else if (name == kGetHostAddressCommand)
      {
        send(*mOwner, Message{boundAddress(*mDiscovery) + ":" + std::to_string(mPort)});
      }
      else
      {
        info(mLog) << "Ignoring unknown command '" << name << "'";
      }
    }

    void operator()(DataReady event)
    {
      send(*mOwner, std::move(event.frames));
    }

    void operator()(const DiscoveryReady& event)
    {
      const auto& node = event.candidate;
      if (mTable.refresh(node, event.receivedAt))
      {
        mDataPlane->nodeRefreshed(node);
        return;
      }

      if (!mDataPlane->nodeJoined(node))
      {
        return;
      }
      mTable.insert(node, event.receivedAt);
      info(mLog) << "Node " << node << " (" << node.hostName() << ") joined";
      send(*mOwner, makeNodeAddedNotification(node.address()));
    }

    void operator()(const TimerFired& event)
    {
      dumpTable(event.now);

      for (const auto& entry : mTable.removeExpired(event.now, mSettings.deadNodeTimeout))
      {
        mDataPlane->nodeLeft(entry.key);
        info(mLog) << "Node " << entry.key << " (" << entry.key.hostName()
                   << ") timed out";
        send(*mOwner, makeNodeRemovedNotification(entry.key.address()));
      }

      scheduleSweep();
    }

    void dumpTable(const TimePoint now)
    {
      if (mTable.empty())
      {
        return;
      }
      debug(mLog) << "Sweeping " << mTable.size() << " node(s)";
      for (const auto& entry : mTable.entries())
      {
        const auto dead =
          MembershipTable::isExpired(entry.lastSeen, now, mSettings.deadNodeTimeout);
        debug(mLog) << "  " << entry.key.name() << " (" << entry.key.hostName()
                    << ") port " << entry.key.port() << (dead ? " dead" : "");
      }
    }

    void scheduleSweep()
    {
      std::weak_ptr<Impl> pWeakSelf = this->shared_from_this();
      mTimer->expires_from_now(mSettings.sweepInterval);
      mTimer->async_wait([pWeakSelf](const TimerError e) {
        if (e)
        {
          return;
        }
        if (auto pSelf = pWeakSelf.lock())
        {
          const auto now = pSelf->mTimer->now();
          pSelf->dispatch(TimerFired{now});
        }
      });
    }

    void shutdown()
    {
      if (mStopped)
      {
        return;
      }
      mStopped = true;
      mRunning = false;

      mTimer->cancel();
      close(*mDiscovery);
      close(*mSubscriber);
      mDataPlane->shutdown();
      mTable.clear();
      info(mLog) << "Stopped";
    }

    util::Injected<Discovery> mDiscovery;
    util::Injected<Subscriber> mSubscriber;
    util::Injected<DataPlane> mDataPlane;
    util::Injected<Owner> mOwner;
    util::Injected<Timer> mTimer;
    Log mLog;
    ReactorSettings mSettings;
    MembershipTable mTable;
    std::uint16_t mPort = 0;
    bool mRunning = false;
    bool mStopped = false;
  };

  std::shared_ptr<Impl> mpImpl;
};

template <typename Discovery,
  typename Subscriber,
  typename DataPlane,
  typename Owner,
  typename Timer,
  typename Log>
Reactor<Discovery, Subscriber, DataPlane, Owner, Timer, Log> makeReactor(
  util::Injected<Discovery> discovery,
  util::Injected<Subscriber> subscriber,
  util::Injected<DataPlane> dataPlane,
  util::Injected<Owner> owner,
  util::Injected<Timer> timer,
  Log log,
  const ReactorSettings settings)
{
  return {std::move(discovery),
    std::move(subscriber),
    std::move(dataPlane),
    std::move(owner),
    std::move(timer),
    std::move(log),
    settings};
}

} // namespace bus
} // namespace beaconbus
