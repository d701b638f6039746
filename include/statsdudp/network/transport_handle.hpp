// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "endpoint_resolver.hpp"
#include "statsdudp/core/logger.hpp"
#include "transport_errors.hpp"
#include "transport_types.hpp"

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace statsdudp
{
namespace network
{

/// \brief Send-to-endpoint primitive shared by the sync and async senders
class ITransportHandle
{
public:
  virtual ~ITransportHandle() = default;

  /// \brief Send one datagram to the endpoint, blocking until the kernel
  /// accepts it.
  /// \throws TransportError on failure or after close()
  virtual void sendTo(const ByteView &datagram) = 0;

  virtual const Endpoint &endpoint() const = 0;

  virtual bool isOpen() const = 0;

  /// \brief Release the underlying resource. Repeated calls are no-ops.
  virtual void close() = 0;
};

/// \brief Socket options for UdpTransportHandle (exposed as UdpTransportHandle::Config)
struct UdpTransportHandleConfig
{
  int soSndBuf = 0; ///< 0 keeps the system default
};

/// \brief Owns one UDP socket aimed at one resolved IPv4 Endpoint.
class UdpTransportHandle : public ITransportHandle
{
public:
  using Config = UdpTransportHandleConfig;

  struct Stats
  {
    std::uint64_t datagramsSent{0};
    std::uint64_t bytesSent{0};
    std::uint64_t sendErrors{0};
  };

  /// \brief Open a socket for an already resolved endpoint
  /// \throws TransportError if the socket cannot be created
  explicit UdpTransportHandle(const Endpoint &endpoint, const Config &cfg = Config())
      : _endpoint(endpoint)
  {
    int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP);
    if (fd < 0)
    {
      throw TransportError("socket", errno);
    }
    if (cfg.soSndBuf > 0 &&
        ::setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &cfg.soSndBuf, sizeof(cfg.soSndBuf)) != 0)
    {
      int err = errno;
      ::close(fd);
      throw TransportError("setsockopt(SO_SNDBUF)", err);
    }
    _fd.store(fd);
    STATSDUDP_LOG_INFO("UdpTransportHandle: opened fd=" << fd << " for "
                                                       << _endpoint.toString());
  }

  /// \brief Resolve the destination, then open the socket
  /// \throws AddressResolutionError before any socket is created
  UdpTransportHandle(const std::string &name, std::uint16_t port,
                     const EndpointResolver &resolver = EndpointResolver(),
                     const Config &cfg = Config())
      : UdpTransportHandle(resolver.resolve(name, port), cfg)
  {
  }

  ~UdpTransportHandle() override { close(); }

  UdpTransportHandle(const UdpTransportHandle &) = delete;
  UdpTransportHandle &operator=(const UdpTransportHandle &) = delete;

  void sendTo(const ByteView &datagram) override
  {
    int fd = _fd.load();
    if (fd < 0)
    {
      _sendErrors.fetch_add(1);
      throw TransportError("sendto " + _endpoint.toString() + " (transport closed)", EBADF);
    }

    ssize_t n;
    do
    {
      n = ::sendto(fd, datagram.data(), datagram.size(), MSG_NOSIGNAL, _endpoint.sockAddr(),
                   _endpoint.sockAddrLen());
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
      int err = errno;
      _sendErrors.fetch_add(1);
      STATSDUDP_LOG_WARN("UdpTransportHandle: sendto " << _endpoint.toString() << " failed ("
                                                       << datagram.size()
                                                       << " bytes): " << std::strerror(err));
      throw TransportError("sendto " + _endpoint.toString(), err);
    }
    if (static_cast<std::size_t>(n) != datagram.size())
    {
      _sendErrors.fetch_add(1);
      throw TransportError("sendto " + _endpoint.toString() + " (short datagram write)", EMSGSIZE);
    }

    _datagramsSent.fetch_add(1);
    _bytesSent.fetch_add(datagram.size());
  }

  const Endpoint &endpoint() const override { return _endpoint; }

  bool isOpen() const override { return _fd.load() >= 0; }

  void close() override
  {
    int fd = _fd.exchange(-1);
    if (fd < 0)
    {
      return;
    }
    ::close(fd);
    STATSDUDP_LOG_DEBUG("UdpTransportHandle: closed fd=" << fd);
  }

  Stats stats() const
  {
    Stats s;
    s.datagramsSent = _datagramsSent.load();
    s.bytesSent = _bytesSent.load();
    s.sendErrors = _sendErrors.load();
    return s;
  }

private:
  const Endpoint _endpoint;
  std::atomic<int> _fd{-1};
  std::atomic<std::uint64_t> _datagramsSent{0};
  std::atomic<std::uint64_t> _bytesSent{0};
  std::atomic<std::uint64_t> _sendErrors{0};
};

} // namespace network
} // namespace statsdudp
