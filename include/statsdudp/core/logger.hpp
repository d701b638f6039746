// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace statsdudp
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

/// \brief Thread-safe synchronous logger with levels, a pre-compiled line
/// format, optional file output and an external handler hook.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  /// \brief External log handler function type
  /// Takes log level, formatted message, and original message without prefix
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure level, output file and timestamp format
  /// \param filePath Empty string logs to stdout
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
    else
    {
      std::cout.flush();
    }
  }

  /// \brief Flush and close the log file; later messages go to stdout
  static void shutdown()
  {
    flush();
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.fileStream.reset();
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Register an external log handler
  /// While a handler is registered, file and console output are bypassed.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the log format string
  /// Supported placeholders:
  ///   %T - timestamp (uses timestampFormat from init())
  ///   %t - thread ID (hex hash)
  ///   %L - log level (e.g., INFO, DEBUG, ERROR)
  ///   %m - message content
  ///   %F - source file name (only filename, no directory path)
  ///   %l - source line number
  ///   %f - function name
  ///   %% - literal percent sign
  /// \note Empty format strings are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    compileFormat(format, data.compiledFormat);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log a message with source location information
  /// \param file Source file name (from __FILE__), may be null
  /// \param line Source line number (from __LINE__)
  /// \param function Function name (from __func__), may be null
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }
    if (data.compiledFormat.empty())
    {
      compileFormat(data.logFormat, data.compiledFormat);
    }

    std::string output = formatLine(level, message, file, line, function, data.compiledFormat,
                                    data.timestampFormat);

    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output;
      data.fileStream->flush();
    }
    else
    {
      std::cout << output;
    }
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Parse a level name, case-insensitive; unknown names map to Info
  static Level levelFromString(const std::string &name)
  {
    std::string v;
    v.reserve(name.size());
    for (char c : name)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    ThreadId,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal; ///< Only used when token == Literal
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat;
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static void compileFormat(const std::string &format, std::vector<FormatSegment> &segments)
  {
    segments.clear();
    std::string currentLiteral;

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        currentLiteral += format[i];
        continue;
      }

      FormatToken token;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 't':
        token = FormatToken::ThreadId;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        currentLiteral += '%';
        ++i;
        continue;
      default:
        // Unknown placeholder, keep the % as literal
        currentLiteral += format[i];
        continue;
      }

      if (!currentLiteral.empty())
      {
        segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
        currentLiteral.clear();
      }
      segments.push_back({token, ""});
      ++i;
    }

    if (!currentLiteral.empty())
    {
      segments.push_back({FormatToken::Literal, std::move(currentLiteral)});
    }
  }

  static std::string timestamp(const std::string &timestampFmt)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm local{};
    ::localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, timestampFmt.c_str());
    if (timestampFmt.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  /// \note Caller holds the logger mutex
  static std::string formatLine(Level level, const std::string &message, const char *file,
                                int line, const char *function,
                                const std::vector<FormatSegment> &segments,
                                const std::string &timestampFmt)
  {
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(timestampFmt);
        break;
      case FormatToken::ThreadId:
        {
          std::hash<std::thread::id> hasher;
          oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
              << hasher(std::this_thread::get_id()) << std::dec;
        }
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case FormatToken::Line:
        if (file)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        if (function)
        {
          oss << function;
        }
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

} // namespace core
} // namespace statsdudp

/// \brief Stream-style logging macro with source location support
#define STATSDUDP_LOG_WITH_LEVEL(level, msg)                                                       \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    statsdudp::core::Logger::log(statsdudp::core::Logger::Level::level, _oss.str(), __FILE__,     \
                                 __LINE__, __func__);                                              \
  } while (0)

#define STATSDUDP_LOG_TRACE(msg) STATSDUDP_LOG_WITH_LEVEL(Trace, msg)
#define STATSDUDP_LOG_DEBUG(msg) STATSDUDP_LOG_WITH_LEVEL(Debug, msg)
#define STATSDUDP_LOG_INFO(msg) STATSDUDP_LOG_WITH_LEVEL(Info, msg)
#define STATSDUDP_LOG_WARN(msg) STATSDUDP_LOG_WITH_LEVEL(Warning, msg)
#define STATSDUDP_LOG_ERROR(msg) STATSDUDP_LOG_WITH_LEVEL(Error, msg)
#define STATSDUDP_LOG_FATAL(msg) STATSDUDP_LOG_WITH_LEVEL(Fatal, msg)
