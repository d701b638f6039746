// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using namespace statsdudp::sample;

namespace
{

CliOptions parse(std::vector<std::string> args)
{
  args.insert(args.begin(), "statsd_send");
  std::vector<char *> argv;
  for (auto &a : args)
  {
    argv.push_back(a.data());
  }
  return parseCliArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("statsd_send joins metric lines", "[cli][join]")
{
  REQUIRE(joinLines({"a:1|c", "b:2|c"}) == "a:1|c\nb:2|c");
  REQUIRE(joinLines({"only:1|c"}) == "only:1|c");
  REQUIRE(joinLines({}).empty());

  SECTION("Empty lines keep their separators")
  {
    REQUIRE(joinLines({"", "a:1|c"}) == "\na:1|c");
    REQUIRE(joinLines({"a:1|c", "", "b:2|c"}) == "a:1|c\n\nb:2|c");
    REQUIRE(joinLines({"", ""}) == "\n");
  }
}

TEST_CASE("statsd_send option parsing", "[cli][args]")
{
  SECTION("Destination and packet options")
  {
    auto opts = parse({"-H", "10.0.0.1", "--port", "9125", "-m", "1432", "--async", "x:1|c",
                       "y:2|c"});
    REQUIRE(opts.statsd.host == "10.0.0.1");
    REQUIRE(opts.statsd.port == 9125);
    REQUIRE(opts.statsd.maxPacketSize == 1432);
    REQUIRE(opts.async);
    REQUIRE_FALSE(opts.help);
    REQUIRE(opts.lines == std::vector<std::string>{"x:1|c", "y:2|c"});
  }

  SECTION("Logging and config options")
  {
    auto opts = parse({"-c", "agent.toml", "-l", "debug", "-f", "send.log"});
    REQUIRE(opts.configFile.value() == "agent.toml");
    REQUIRE(opts.logLevel.value() == "debug");
    REQUIRE(opts.logFile.value() == "send.log");
    REQUIRE(opts.lines.empty());
  }

  SECTION("Bad values are configuration errors")
  {
    REQUIRE_THROWS_AS(parse({"--port", "0"}), statsdudp::ConfigurationError);
    REQUIRE_THROWS_AS(parse({"-m", "-5"}), statsdudp::ConfigurationError);
    REQUIRE_THROWS_AS(parse({"--bogus"}), statsdudp::ConfigurationError);
    REQUIRE_THROWS_AS(parse({"--host"}), statsdudp::ConfigurationError);
  }
}

TEST_CASE("statsd_send command line wins over the config file", "[cli][config]")
{
  auto loader = statsdudp::core::ConfigLoader::fromString("[statsd]\n"
                                                          "host = 'file.host'\n"
                                                          "port = 7000\n"
                                                          "max_packet_size = 512\n"
                                                          "[log]\n"
                                                          "level = 'error'\n");

  auto opts = parse({"-H", "cli.host"});
  applyTomlConfig(opts, loader);
  REQUIRE(opts.statsd.host == "cli.host");
  REQUIRE(opts.statsd.port == 7000);
  REQUIRE(opts.statsd.maxPacketSize == 512);
  REQUIRE(opts.logLevel.value() == "error");
  REQUIRE_FALSE(opts.logFile.has_value());
}

TEST_CASE("statsd_send worker executor", "[cli][executor]")
{
  std::vector<int> order;
  std::thread::id ranOn;
  {
    WorkerExecutor worker;
    auto exec = worker.executor();
    for (int i = 0; i < 5; ++i)
    {
      exec([&order, &ranOn, i]
           {
             order.push_back(i);
             ranOn = std::this_thread::get_id();
           });
    }
  }
  REQUIRE(order == std::vector<int>{0, 1, 2, 3, 4});
  REQUIRE(ranOn != std::this_thread::get_id());
}
