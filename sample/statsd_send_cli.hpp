// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file statsd_send_cli.hpp
/// \brief Option parsing and helpers for the statsd_send command

#include <statsdudp/statsdudp.hpp>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace statsdudp
{
namespace sample
{

struct CliOptions
{
  statsdudp::StatsdUdpConfig statsd;
  std::optional<std::string> configFile;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  bool async = false;
  bool help = false;
  std::vector<std::string> lines;
};

inline void printHelp()
{
  std::cout << "Usage: statsd_send [options] [metric-line ...]\n"
            << "  -h, --help                   Show this help message\n"
            << "  -c, --config <file>          TOML configuration file ([statsd], [log])\n"
            << "  -H, --host <name>            Destination host or address\n"
            << "  -p, --port <port>            Destination port (default: 8125)\n"
            << "  -m, --max-packet-size <n>    Datagram size ceiling, 0 = unlimited "
               "(default: 8192)\n"
            << "  -l, --log-level <level>      Log level (trace, debug, info, warning, error, "
               "fatal)\n"
            << "  -f, --log-file <file>        Log file path\n"
            << "      --async                  Send through the asynchronous path\n"
            << "Without metric lines, lines are read from stdin.\n";
}

inline CliOptions parseCliArgs(int argc, char **argv)
{
  CliOptions opts;
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    bool hasValue = i + 1 < argc;
    if (arg == "-h" || arg == "--help")
    {
      opts.help = true;
    }
    else if ((arg == "-c" || arg == "--config") && hasValue)
    {
      opts.configFile = argv[++i];
    }
    else if ((arg == "-H" || arg == "--host") && hasValue)
    {
      opts.statsd.host = argv[++i];
    }
    else if ((arg == "-p" || arg == "--port") && hasValue)
    {
      opts.statsd.port = statsdudp::StatsdUdpConfig::parsePort(argv[++i], "--port");
    }
    else if ((arg == "-m" || arg == "--max-packet-size") && hasValue)
    {
      std::string value = argv[++i];
      try
      {
        std::size_t used = 0;
        long long size = std::stoll(value, &used);
        if (used != value.size() || size < 0)
        {
          throw std::invalid_argument(value);
        }
        opts.statsd.maxPacketSize = static_cast<std::size_t>(size);
      }
      catch (const std::exception &)
      {
        throw statsdudp::ConfigurationError("invalid --max-packet-size: " + value);
      }
    }
    else if ((arg == "-l" || arg == "--log-level") && hasValue)
    {
      opts.logLevel = argv[++i];
    }
    else if ((arg == "-f" || arg == "--log-file") && hasValue)
    {
      opts.logFile = argv[++i];
    }
    else if (arg == "--async")
    {
      opts.async = true;
    }
    else if (!arg.empty() && arg[0] == '-')
    {
      throw statsdudp::ConfigurationError("unknown or incomplete option: " + arg);
    }
    else
    {
      opts.lines.push_back(arg);
    }
  }
  return opts;
}

/// \brief Command-line values win; the file only fills what is still unset
inline void applyTomlConfig(CliOptions &opts, const statsdudp::core::ConfigLoader &loader)
{
  statsdudp::StatsdUdpConfig fromFile = statsdudp::StatsdUdpConfig::fromConfigLoader(loader);
  if (opts.statsd.host.empty())
  {
    opts.statsd.host = fromFile.host;
  }
  if (opts.statsd.port == 0)
  {
    opts.statsd.port = fromFile.port;
  }
  if (loader.contains("statsd.max_packet_size") &&
      opts.statsd.maxPacketSize == statsdudp::network::kDefaultMaxPacketSize)
  {
    opts.statsd.maxPacketSize = fromFile.maxPacketSize;
  }
  if (opts.statsd.sendBufferSize == 0)
  {
    opts.statsd.sendBufferSize = fromFile.sendBufferSize;
  }
  if (!opts.logLevel)
  {
    opts.logLevel = loader.getString("log.level");
  }
  if (!opts.logFile)
  {
    opts.logFile = loader.getString("log.file");
  }
}

/// \brief Single worker thread standing in for an application's executor.
/// Pending tasks are run before the destructor returns.
class WorkerExecutor
{
public:
  WorkerExecutor() : _worker([this] { run(); }) {}

  ~WorkerExecutor()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _stop = true;
    }
    _cv.notify_one();
    _worker.join();
  }

  statsdudp::network::Executor executor()
  {
    return [this](std::function<void()> task)
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        _tasks.push_back(std::move(task));
      }
      _cv.notify_one();
    };
  }

private:
  void run()
  {
    std::unique_lock<std::mutex> lock(_mutex);
    for (;;)
    {
      _cv.wait(lock, [this] { return _stop || !_tasks.empty(); });
      if (_tasks.empty())
      {
        return;
      }
      auto task = std::move(_tasks.front());
      _tasks.pop_front();
      lock.unlock();
      task();
      lock.lock();
    }
  }

  std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<std::function<void()>> _tasks;
  bool _stop = false;
  std::thread _worker;
};

/// \brief Join metric lines with '\n'; empty lines keep their separator
inline std::string joinLines(const std::vector<std::string> &lines)
{
  std::string batch;
  for (std::size_t i = 0; i < lines.size(); ++i)
  {
    if (i > 0)
    {
      batch += '\n';
    }
    batch += lines[i];
  }
  return batch;
}

} // namespace sample
} // namespace statsdudp
