// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "statsdudp/core/logger.hpp"
#include "transport_errors.hpp"
#include "transport_types.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <vector>

namespace statsdudp
{
namespace network
{

/// \brief Resolved IPv4 destination. Immutable once built.
class Endpoint
{
public:
  Endpoint(const in_addr &address, std::uint16_t port)
  {
    _sockaddr.sin_family = AF_INET;
    _sockaddr.sin_addr = address;
    _sockaddr.sin_port = htons(port);
  }

  std::uint16_t port() const { return ntohs(_sockaddr.sin_port); }

  const in_addr &address() const { return _sockaddr.sin_addr; }

  std::string addressString() const
  {
    char buf[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &_sockaddr.sin_addr, buf, sizeof(buf));
    return buf;
  }

  std::string toString() const { return addressString() + ":" + std::to_string(port()); }

  const sockaddr *sockAddr() const { return reinterpret_cast<const sockaddr *>(&_sockaddr); }

  socklen_t sockAddrLen() const { return static_cast<socklen_t>(sizeof(_sockaddr)); }

  bool operator==(const Endpoint &other) const
  {
    return _sockaddr.sin_addr.s_addr == other._sockaddr.sin_addr.s_addr &&
           _sockaddr.sin_port == other._sockaddr.sin_port;
  }

  bool operator!=(const Endpoint &other) const { return !(*this == other); }

private:
  sockaddr_in _sockaddr{};
};

/// \brief One address returned by a name lookup
struct ResolvedAddress
{
  int family{AF_UNSPEC};
  in_addr v4{};
  in6_addr v6{};

  static ResolvedAddress ipv4(const in_addr &addr)
  {
    ResolvedAddress r;
    r.family = AF_INET;
    r.v4 = addr;
    return r;
  }

  static ResolvedAddress ipv6(const in6_addr &addr)
  {
    ResolvedAddress r;
    r.family = AF_INET6;
    r.v6 = addr;
    return r;
  }

  /// \brief Build from a literal; family stays AF_UNSPEC if it is not one
  /// \note IPv4 accepts the inet_aton forms a.b.c.d, a.b.c, a.b and a
  static ResolvedAddress fromLiteral(const std::string &text)
  {
    ResolvedAddress r;
    if (isIpv4Literal(text, r.v4))
    {
      r.family = AF_INET;
    }
    else if (::inet_pton(AF_INET6, text.c_str(), &r.v6) == 1)
    {
      r.family = AF_INET6;
    }
    return r;
  }

private:
  /// inet_aton stops at the first whitespace, so such text is not a literal
  static bool isIpv4Literal(const std::string &text, in_addr &out)
  {
    if (text.empty())
    {
      return false;
    }
    for (char c : text)
    {
      if (std::isspace(static_cast<unsigned char>(c)))
      {
        return false;
      }
    }
    return ::inet_aton(text.c_str(), &out) != 0;
  }
};

/// \brief Turns a configured destination name and port into an IPv4 Endpoint.
///
/// Literal IPv4 text, including the shorthand forms 127.1 and 2130706433, is
/// used as-is without a lookup. Digits-and-dots text that is not a valid
/// literal (999.999.999.999) is rejected without a lookup. An IPv4-mapped IPv6
/// literal yields its embedded IPv4 address; any other IPv6 literal is
/// rejected. Host names go through the lookup function, whose results are
/// scanned from the last entry backward for the first IPv4 address, since
/// resolvers tend to list IPv4 after IPv6. Failure to produce an IPv4 address
/// is reported here, before any socket exists, instead of at first send.
class EndpointResolver
{
public:
  /// Returns every address for the host, in resolver order; throws
  /// AddressResolutionError on lookup failure.
  using LookupFunction = std::function<std::vector<ResolvedAddress>(const std::string &host)>;

  EndpointResolver() : _lookup(&EndpointResolver::systemLookup) {}

  explicit EndpointResolver(LookupFunction lookup) : _lookup(std::move(lookup)) {}

  /// \throws AddressResolutionError when no IPv4 address can be produced
  Endpoint resolve(const std::string &name, std::uint16_t port) const
  {
    if (name.empty())
    {
      throw AddressResolutionError(name, "destination host is empty");
    }

    ResolvedAddress literal = ResolvedAddress::fromLiteral(name);
    if (literal.family == AF_INET)
    {
      STATSDUDP_LOG_DEBUG("EndpointResolver: using literal IPv4 address " << name);
      return Endpoint(literal.v4, port);
    }
    if (literal.family == AF_INET6)
    {
      if (IN6_IS_ADDR_V4MAPPED(&literal.v6))
      {
        in_addr v4{};
        std::memcpy(&v4, &literal.v6.s6_addr[12], sizeof(v4));
        STATSDUDP_LOG_DEBUG("EndpointResolver: using IPv4-mapped literal " << name);
        return Endpoint(v4, port);
      }
      throw AddressResolutionError(name, "IPv6 literal has no IPv4 form");
    }
    if (looksLikeDottedQuad(name))
    {
      throw AddressResolutionError(name, "malformed IPv4 literal");
    }

    std::vector<ResolvedAddress> addresses = _lookup(name);
    for (auto it = addresses.rbegin(); it != addresses.rend(); ++it)
    {
      if (it->family == AF_INET)
      {
        Endpoint endpoint(it->v4, port);
        STATSDUDP_LOG_INFO("EndpointResolver: resolved " << name << " to " << endpoint.toString()
                                                         << " (" << addresses.size()
                                                         << " candidates)");
        return endpoint;
      }
    }
    throw AddressResolutionError(name, "no IPv4 address among " +
                                         std::to_string(addresses.size()) + " lookup results");
  }

  /// \brief Blocking getaddrinfo lookup returning all families
  static std::vector<ResolvedAddress> systemLookup(const std::string &host)
  {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;
    hints.ai_protocol = IPPROTO_UDP;

    addrinfo *raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    if (rc != 0 || !raw)
    {
      throw AddressResolutionError(host, std::string("getaddrinfo: ") + gai_strerror(rc));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> res(raw, ::freeaddrinfo);

    std::vector<ResolvedAddress> out;
    for (addrinfo *ai = res.get(); ai; ai = ai->ai_next)
    {
      if (ai->ai_family == AF_INET && ai->ai_addrlen >= sizeof(sockaddr_in))
      {
        out.push_back(
          ResolvedAddress::ipv4(reinterpret_cast<const sockaddr_in *>(ai->ai_addr)->sin_addr));
      }
      else if (ai->ai_family == AF_INET6 && ai->ai_addrlen >= sizeof(sockaddr_in6))
      {
        out.push_back(
          ResolvedAddress::ipv6(reinterpret_cast<const sockaddr_in6 *>(ai->ai_addr)->sin6_addr));
      }
    }
    return out;
  }

private:
  /// \pre name was already refused as an IPv4 literal
  static bool looksLikeDottedQuad(const std::string &name)
  {
    bool sawDigit = false;
    for (char c : name)
    {
      if (c >= '0' && c <= '9')
      {
        sawDigit = true;
      }
      else if (c != '.')
      {
        return false;
      }
    }
    return sawDigit;
  }

  LookupFunction _lookup;
};

} // namespace network
} // namespace statsdudp
