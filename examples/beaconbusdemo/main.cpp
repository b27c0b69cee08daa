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

#include <beaconbus/Bus.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace
{

using Bus = beaconbus::BasicBus<beaconbus::util::Timestamped<beaconbus::util::StdLog>>;

void printHelp()
{
  std::cout << std::endl << " < B E A C O N  B U S >" << std::endl << std::endl;
  std::cout << "usage:" << std::endl;
  std::cout << "  publish a message: type a line of text" << std::endl;
  std::cout << "  show this node's address: /addr" << std::endl;
  std::cout << "  quit: /quit" << std::endl << std::endl;
}

void printUsage()
{
  std::cout << "Usage: BeaconBusDemo [options]" << std::endl
            << "  --port <n>           discovery udp port (default 9999)" << std::endl
            << "  --broadcast <ip>     broadcast address (default 255.255.255.255)"
            << std::endl
            << "  --interface <ip>     address to report as this host" << std::endl
            << "  --advertise-ms <n>   beacon interval" << std::endl
            << "  --timeout-ms <n>     dead node timeout" << std::endl
            << "  --no-retry           do not redial failed links" << std::endl
            << "  --strict-beacons     drop beacons that are not a port number"
            << std::endl
            << "  --ignore-own         drop this node's own beacons" << std::endl
            << "  --debug              verbose logging" << std::endl;
}

// Throws std::invalid_argument on unknown or incomplete options
beaconbus::Config parseArgs(const int nargs, char** args)
{
  auto config = beaconbus::Config{};
  for (int i = 1; i < nargs; ++i)
  {
    const std::string arg = args[i];
    const auto value = [&]() -> std::string {
      if (i + 1 >= nargs)
      {
        throw std::invalid_argument("Missing value for " + arg);
      }
      return args[++i];
    };

    if (arg == "--port")
    {
      const auto text = value();
      const auto port = beaconbus::discovery::parsePort(text);
      if (!port)
      {
        throw std::invalid_argument("Invalid port " + text);
      }
      config.discoveryPort = *port;
    }
    else if (arg == "--broadcast")
    {
      config.broadcastAddress = value();
    }
    else if (arg == "--interface")
    {
      config.interfaceAddress = value();
    }
    else if (arg == "--advertise-ms")
    {
      config.advertiseInterval = std::chrono::milliseconds(std::stol(value()));
    }
    else if (arg == "--timeout-ms")
    {
      config.deadNodeTimeout = std::chrono::milliseconds(std::stol(value()));
    }
    else if (arg == "--no-retry")
    {
      config.connectRetryPolicy = beaconbus::ConnectRetryPolicy::NoRetry;
    }
    else if (arg == "--strict-beacons")
    {
      config.malformedBeaconPolicy = beaconbus::MalformedBeaconPolicy::Reject;
    }
    else if (arg == "--ignore-own")
    {
      config.ignoreOwnBeacons = true;
    }
    else if (arg == "--debug")
    {
      config.logLevel = beaconbus::util::LogLevel::Debug;
    }
    else
    {
      throw std::invalid_argument("Unknown option " + arg);
    }
  }
  return config;
}

void printMessage(const beaconbus::bus::Message& message)
{
  using beaconbus::bus::Notification;

  if (const auto notification = beaconbus::bus::parseNotification(message))
  {
    std::cout << (notification->kind == Notification::Kind::NodeAdded ? "+ " : "- ")
              << notification->address << std::endl;
    return;
  }

  std::cout << "> ";
  for (const auto& frame : message)
  {
    std::cout << "[" << frame << "]";
  }
  std::cout << std::endl;
}

} // namespace

int main(int nargs, char** args)
{
  beaconbus::Config config;
  try
  {
    config = parseArgs(nargs, args);
  }
  catch (const std::exception& e)
  {
    std::cerr << e.what() << std::endl;
    printUsage();
    return EXIT_FAILURE;
  }

  try
  {
    Bus bus{config, {beaconbus::makeBusLog(config)}};
    std::cout << "Listening for data on port " << bus.port() << ", discovery on port "
              << bus.config().discoveryPort << std::endl;
    printHelp();

    std::atomic<bool> running{true};
    std::thread output([&] {
      while (running)
      {
        if (const auto message = bus.receive(std::chrono::milliseconds(100)))
        {
          printMessage(*message);
        }
      }
    });

    std::string line;
    while (std::getline(std::cin, line))
    {
      if (line == "/quit")
      {
        break;
      }
      else if (line == "/addr")
      {
        bus.requestHostAddress();
      }
      else if (!line.empty())
      {
        bus.publish({line});
      }
    }

    running = false;
    output.join();
    bus.terminate();
  }
  catch (const std::exception& e)
  {
    std::cerr << "Failed to run the bus: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
