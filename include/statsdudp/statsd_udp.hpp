// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "statsdudp/core/config_loader.hpp"
#include "statsdudp/core/logger.hpp"
#include "statsdudp/network/async_sender.hpp"
#include "statsdudp/network/endpoint_resolver.hpp"
#include "statsdudp/network/sync_sender.hpp"
#include "statsdudp/network/transport_errors.hpp"
#include "statsdudp/network/transport_handle.hpp"
#include "statsdudp/network/transport_types.hpp"

#include <cstdint>
#include <cstdlib>
#include <functional>
#include <future>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace statsdudp
{

/// \brief Destination and datagram settings for a StatsdUdp client
struct StatsdUdpConfig
{
  static constexpr const char *kHostEnvVar = "DD_AGENT_HOST";
  static constexpr const char *kPortEnvVar = "DD_DOGSTATSD_PORT";

  using EnvLookup = std::function<std::optional<std::string>(const std::string &name)>;

  std::string host;      ///< empty: taken from DD_AGENT_HOST
  std::uint16_t port{0}; ///< 0: DD_DOGSTATSD_PORT, then 8125
  std::size_t maxPacketSize{network::kDefaultMaxPacketSize}; ///< 0 disables splitting
  int sendBufferSize{0}; ///< SO_SNDBUF, 0 keeps the system default

  /// \brief Reads the process environment
  static std::optional<std::string> processEnv(const std::string &name)
  {
    const char *value = std::getenv(name.c_str());
    if (!value)
    {
      return std::nullopt;
    }
    return std::string(value);
  }

  /// \brief Fill unset host and port from the environment, then defaults.
  /// \throws ConfigurationError on a malformed port variable or when no host
  /// is available from either source
  StatsdUdpConfig withDefaults(const EnvLookup &env = &StatsdUdpConfig::processEnv) const
  {
    StatsdUdpConfig out = *this;
    if (out.host.empty())
    {
      if (auto h = env(kHostEnvVar))
      {
        out.host = *h;
      }
    }
    if (out.host.empty())
    {
      throw ConfigurationError(std::string("no destination host given and ") + kHostEnvVar +
                               " is not set");
    }
    if (out.port == 0)
    {
      out.port = network::kDefaultStatsdPort;
      if (auto p = env(kPortEnvVar))
      {
        out.port = parsePort(*p, std::string("environment variable '") + kPortEnvVar + "'");
      }
    }
    return out;
  }

  /// \brief Read the [statsd] table of a configuration file.
  /// Keys: host, port, max_packet_size, send_buffer_size. Missing keys stay
  /// unset so environment and defaults still apply.
  static StatsdUdpConfig fromConfigLoader(const core::ConfigLoader &loader)
  {
    StatsdUdpConfig cfg;
    if (loader.contains("statsd.host"))
    {
      auto host = loader.getString("statsd.host");
      if (!host)
      {
        throw ConfigurationError("statsd.host must be a string");
      }
      cfg.host = *host;
    }
    if (auto port = requireInt(loader, "statsd.port"))
    {
      if (*port < 1 || *port > std::numeric_limits<std::uint16_t>::max())
      {
        throw ConfigurationError("statsd.port out of range: " + std::to_string(*port));
      }
      cfg.port = static_cast<std::uint16_t>(*port);
    }
    if (auto size = requireInt(loader, "statsd.max_packet_size"))
    {
      if (*size < 0)
      {
        throw ConfigurationError("statsd.max_packet_size must not be negative");
      }
      cfg.maxPacketSize = static_cast<std::size_t>(*size);
    }
    if (auto buf = requireInt(loader, "statsd.send_buffer_size"))
    {
      if (*buf < 0 || *buf > std::numeric_limits<int>::max())
      {
        throw ConfigurationError("statsd.send_buffer_size out of range");
      }
      cfg.sendBufferSize = static_cast<int>(*buf);
    }
    return cfg;
  }

  /// \brief Strict decimal port parse
  /// \throws ConfigurationError naming source on bad format or range
  static std::uint16_t parsePort(const std::string &text, const std::string &source)
  {
    std::size_t used = 0;
    long value = 0;
    try
    {
      value = std::stol(text, &used);
    }
    catch (const std::exception &)
    {
      throw ConfigurationError(source + " bad format: '" + text + "'");
    }
    if (used != text.size())
    {
      throw ConfigurationError(source + " bad format: '" + text + "'");
    }
    if (value < 1 || value > std::numeric_limits<std::uint16_t>::max())
    {
      throw ConfigurationError(source + " out of range: " + text);
    }
    return static_cast<std::uint16_t>(value);
  }

private:
  static std::optional<int64_t> requireInt(const core::ConfigLoader &loader,
                                           const std::string &key)
  {
    if (!loader.contains(key))
    {
      return std::nullopt;
    }
    auto value = loader.getInt(key);
    if (!value)
    {
      throw ConfigurationError(key + " must be an integer");
    }
    return value;
  }
};

/// \brief Datagram client for metric-protocol text.
///
/// Resolves the destination once at construction, owns the socket, and
/// offers a blocking send() and an executor-driven sendAsync() over the same
/// newline-preserving splitter. close() releases the socket; no sends are
/// allowed afterwards.
class StatsdUdp
{
public:
  /// \throws ConfigurationError, AddressResolutionError, TransportError
  explicit StatsdUdp(const StatsdUdpConfig &config = StatsdUdpConfig(),
                     network::Executor executor = network::inlineExecutor(),
                     const network::EndpointResolver &resolver = network::EndpointResolver())
      : StatsdUdp(config.withDefaults(), std::move(executor), resolver, ResolvedTag{})
  {
  }

  /// \brief Use an existing transport handle, e.g. a test double
  StatsdUdp(std::unique_ptr<network::ITransportHandle> handle, std::size_t maxPacketSize,
            network::Executor executor = network::inlineExecutor())
      : _handle(requireHandle(std::move(handle))), _maxPacketSize(maxPacketSize),
        _syncSender(*_handle, maxPacketSize),
        _asyncSender(*_handle, maxPacketSize, std::move(executor))
  {
  }

  ~StatsdUdp() { close(); }

  StatsdUdp(const StatsdUdp &) = delete;
  StatsdUdp &operator=(const StatsdUdp &) = delete;

  /// \brief Blocking send of one message or newline-joined batch
  /// \throws TransportError from the first chunk that fails
  void send(const std::string &text) { _syncSender.send(text); }

  /// \brief Queue a send of one message or batch on the executor
  /// \pre This client outlives every future returned here. Tasks still queued
  /// on a deferred executor refer to the transport handle, so drain or
  /// discard them before the client is destroyed. After close() they fail
  /// with TransportError instead of sending.
  std::future<void> sendAsync(std::string text)
  {
    return _asyncSender.sendAsync(std::move(text));
  }

  void close() { _handle->close(); }

  bool isOpen() const { return _handle->isOpen(); }

  const network::Endpoint &endpoint() const { return _handle->endpoint(); }

  std::size_t maxPacketSize() const { return _maxPacketSize; }

private:
  struct ResolvedTag
  {
  };

  static std::unique_ptr<network::ITransportHandle>
  requireHandle(std::unique_ptr<network::ITransportHandle> handle)
  {
    if (!handle)
    {
      throw std::invalid_argument("StatsdUdp: transport handle must not be null");
    }
    return handle;
  }

  StatsdUdp(const StatsdUdpConfig &resolved, network::Executor executor,
            const network::EndpointResolver &resolver, ResolvedTag)
      : StatsdUdp(std::make_unique<network::UdpTransportHandle>(
                    resolved.host, resolved.port, resolver,
                    network::UdpTransportHandle::Config{resolved.sendBufferSize}),
                  resolved.maxPacketSize, std::move(executor))
  {
    STATSDUDP_LOG_INFO("StatsdUdp: sending to " << _handle->endpoint().toString()
                                                << " (host " << resolved.host
                                                << ", max packet " << _maxPacketSize << ")");
  }

  std::unique_ptr<network::ITransportHandle> _handle;
  const std::size_t _maxPacketSize;
  network::SyncSender _syncSender;
  network::AsyncSender _asyncSender;
};

} // namespace statsdudp
