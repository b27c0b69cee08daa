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

#include <beaconbus/Config.hpp>
#include <beaconbus/asio/AsioService.hpp>
#include <beaconbus/bus/Commands.hpp>
#include <beaconbus/bus/DataPlaneConnector.hpp>
#include <beaconbus/bus/MessageQueue.hpp>
#include <beaconbus/bus/Publisher.hpp>
#include <beaconbus/bus/Reactor.hpp>
#include <beaconbus/bus/Subscriber.hpp>
#include <beaconbus/discovery/BeaconMessenger.hpp>
#include <beaconbus/discovery/BroadcastInterface.hpp>
#include <beaconbus/discovery/HostResolver.hpp>
#include <beaconbus/platforms/posix/Posix.hpp>
#include <beaconbus/util/Log.hpp>
#include <exception>
#include <future>
#include <memory>
#include <optional>

namespace beaconbus
{

/*! @class BasicBus
 *  @brief Owner handle of a bus node.
 *
 *  @discussion Constructing a bus spawns the thread that runs the node:
 *  it binds a data port, advertises it on the discovery port and connects
 *  to every peer whose beacons it receives. The constructor returns once
 *  the node is running and rethrows anything that prevented it from
 *  starting.
 *
 *  Commands (see bus/Commands.hpp) are passed with send. Everything the
 *  node produces for the owner, namely membership notifications, host
 *  address replies and messages published by peers, is collected in a
 *  single queue that the owner drains with receive.
 *
 *  All member functions are thread-safe.
 */
template <typename Log>
class BasicBus
{
public:
  using Message = bus::Message;

  BasicBus(Config config, Log log)
    : mConfig((validate(config), std::move(config)))
    , mLog(std::move(log))
    , mIo(LoopExceptionHandler{channel(mLog, "loop")})
  {
    std::promise<std::uint16_t> ready;
    auto started = ready.get_future();
    mIo.post([this, &ready] {
      try
      {
        mpReactor = makeNode();
        mpReactor->start();
        ready.set_value(mpReactor->port());
      }
      catch (...)
      {
        mpReactor.reset();
        ready.set_exception(std::current_exception());
      }
    });
    mPort = started.get();
  }

  BasicBus(const BasicBus&) = delete;
  BasicBus& operator=(const BasicBus&) = delete;

  ~BasicBus()
  {
    mIo.post([this] {
      if (mpReactor)
      {
        mpReactor->shutdown();
        mpReactor.reset();
      }
    });
    mIo.stop();
  }

  // Queue a command for the node. Commands are handled in the order sent.
  void send(Message command)
  {
    mIo.post([this, command]() mutable {
      if (mpReactor)
      {
        mpReactor->dispatch(bus::CommandReady{std::move(command)});
      }
    });
  }

  void publish(const Message& payload)
  {
    send(bus::makePublishCommand(payload));
  }

  void requestHostAddress()
  {
    send(bus::makeGetHostAddressCommand());
  }

  // Stop the node. Messages already queued for the owner stay available.
  void terminate()
  {
    send(bus::makeTerminateCommand());
  }

  // Block until the node produces a message
  Message receive()
  {
    return mQueue.receive();
  }

  template <typename Rep, typename Period>
  std::optional<Message> receive(const std::chrono::duration<Rep, Period> timeout)
  {
    return mQueue.receive(timeout);
  }

  std::optional<Message> tryReceive()
  {
    return mQueue.tryReceive();
  }

  // The data port advertised to peers
  std::uint16_t port() const
  {
    return mPort;
  }

  const Config& config() const
  {
    return mConfig;
  }

private:
  using Timer = util::AsioTimer;
  using Interface = discovery::BroadcastInterface<discovery::kMaxBeaconSize>;
  using Resolver = discovery::AsioHostResolver<Log>;
  using Discovery = discovery::BeaconMessenger<Interface, Resolver, Timer, Log>;
  using Subscriber = bus::Subscriber<Log>;
  using Publisher = bus::Publisher<Log>;
  using DataPlane = bus::DataPlaneConnector<Publisher, Log>;
  using Reactor =
    bus::Reactor<Discovery, Subscriber, DataPlane, bus::MessageQueue&, Timer, Log>;

  struct LoopExceptionHandler
  {
    using Exception = std::runtime_error;

    void operator()(const Exception& exception)
    {
      error(mLog) << "Unhandled exception on the bus thread: " << exception.what();
    }

    Log mLog;
  };

  // Called on the bus thread
  std::unique_ptr<Reactor> makeNode()
  {
    auto& io = mIo.mService;

    const auto interfaceAddr =
      mConfig.interfaceAddress.empty()
        ? platform::selectInterfaceAddress(platform::Posix::scanIpV4IfAddrs())
        : asio::ip::make_address_v4(mConfig.interfaceAddress);
    const auto broadcastAddr = asio::ip::make_address_v4(mConfig.broadcastAddress);

    info(mLog) << "Discovery on udp port " << mConfig.discoveryPort << ", broadcasting to "
               << broadcastAddr << " from " << interfaceAddr;

    const auto discoveryLog = channel(mLog, "discovery");
    auto discovery = Discovery{
      util::injectVal(Interface{io, interfaceAddr, broadcastAddr, mConfig.discoveryPort}),
      util::injectVal(Resolver{io, discoveryLog}),
      util::injectVal(mIo.makeTimer()),
      discoveryLog,
      {mConfig.advertiseInterval, mConfig.malformedBeaconPolicy, mConfig.ignoreOwnBeacons}};

    auto dataPlane = DataPlane{
      util::injectVal(Publisher{io, channel(mLog, "publisher"), mConfig.maxMessageSize}),
      mConfig.connectRetryPolicy, channel(mLog, "publisher")};

    return std::unique_ptr<Reactor>(new Reactor{util::injectVal(std::move(discovery)),
      util::injectVal(Subscriber{io, channel(mLog, "subscriber"), mConfig.maxMessageSize}),
      util::injectVal(std::move(dataPlane)),
      util::injectRef(mQueue),
      util::injectVal(mIo.makeTimer()),
      channel(mLog, "bus"),
      {mConfig.sweepInterval, mConfig.deadNodeTimeout}});
  }

  Config mConfig;
  Log mLog;
  bus::MessageQueue mQueue;
  std::uint16_t mPort = 0;
  std::unique_ptr<Reactor> mpReactor;
  util::AsioService mIo;
};

using Bus = BasicBus<util::StdLog>;

inline util::StdLog makeBusLog(const Config& config)
{
  return util::StdLog{"beaconbus", config.logLevel};
}

} // namespace beaconbus
