// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

/// \file statsd_send.cpp
/// \brief Command-line sender for metric lines.
///
/// Lines given on the command line (or read from stdin when there are none)
/// are joined with '\n' and sent as one batch; the transport splits it into
/// datagrams no larger than the configured packet size. Settings come from
/// the command line, then the TOML file given with --config, then the
/// DD_AGENT_HOST / DD_DOGSTATSD_PORT environment variables.

#include "statsd_send_cli.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace statsdudp::sample;

int main(int argc, char **argv)
{
  try
  {
    CliOptions opts = parseCliArgs(argc, argv);
    if (opts.help)
    {
      printHelp();
      return 0;
    }
    if (opts.configFile)
    {
      statsdudp::core::ConfigLoader loader(*opts.configFile);
      applyTomlConfig(opts, loader);
    }

    statsdudp::core::Logger::init(
      statsdudp::core::Logger::levelFromString(opts.logLevel.value_or("warning")),
      opts.logFile.value_or(""));
    if (opts.configFile)
    {
      STATSDUDP_LOG_INFO("Using config file: " << *opts.configFile);
    }

    if (opts.lines.empty())
    {
      std::string line;
      while (std::getline(std::cin, line))
      {
        if (!line.empty())
        {
          opts.lines.push_back(line);
        }
      }
    }
    if (opts.lines.empty())
    {
      STATSDUDP_LOG_WARN("No metric lines to send");
      return 0;
    }
    std::string batch = joinLines(opts.lines);

    if (opts.async)
    {
      WorkerExecutor worker;
      statsdudp::StatsdUdp client(opts.statsd, worker.executor());
      client.sendAsync(std::move(batch)).get();
    }
    else
    {
      statsdudp::StatsdUdp client(opts.statsd);
      client.send(batch);
    }
    STATSDUDP_LOG_INFO("Sent " << opts.lines.size() << " metric line(s)");
  }
  catch (const std::exception &ex)
  {
    std::cerr << "statsd_send: " << ex.what() << std::endl;
    statsdudp::core::Logger::shutdown();
    return EXIT_FAILURE;
  }

  statsdudp::core::Logger::shutdown();
  return 0;
}
