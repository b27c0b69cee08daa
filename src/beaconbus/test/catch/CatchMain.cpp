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

#define CATCH_CONFIG_RUNNER

#include <beaconbus/test/CatchWrapper.hpp>
#include <string>
#include <vector>

namespace
{

bool startsWith(const std::string& arg, const std::string& prefix)
{
  return arg.compare(0, prefix.size(), prefix) == 0;
}

// CI invokes every test binary with google test flags. The ones with a
// Catch counterpart are translated, the rest are dropped since Catch
// rejects unknown arguments.
std::vector<std::string> translateArgs(const int argc, const char* const argv[])
{
  const std::string xmlOutput = "--gtest_output=xml:";
  const std::string filter = "--gtest_filter=";

  std::vector<std::string> args{argv[0]};
  for (int i = 1; i < argc; ++i)
  {
    const std::string arg = argv[i];
    if (startsWith(arg, xmlOutput))
    {
      args.insert(args.end(), {"-r", "junit", "-o", arg.substr(xmlOutput.size())});
    }
    else if (startsWith(arg, filter))
    {
      // Test names contain spaces, so a filter is matched as a wildcard
      args.push_back("*" + arg.substr(filter.size()) + "*");
    }
    else if (!startsWith(arg, "--gtest"))
    {
      args.push_back(arg);
    }
  }
  return args;
}

} // namespace

int main(const int argc, const char* const argv[])
{
  const auto args = translateArgs(argc, argv);

  std::vector<const char*> cArgs;
  for (const auto& arg : args)
  {
    cArgs.push_back(arg.c_str());
  }

  Catch::Session session;
  if (const auto result = session.applyCommandLine(int(cArgs.size()), cArgs.data()))
  {
    return result;
  }
  return session.run();
}
