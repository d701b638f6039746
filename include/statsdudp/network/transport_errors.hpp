// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

namespace statsdudp
{

/// \brief Base class for every error raised by the transport
class StatsdUdpException : public std::runtime_error
{
public:
  explicit StatsdUdpException(const std::string &message) : std::runtime_error(message) {}
};

/// \brief No IPv4 address could be derived from the configured destination
class AddressResolutionError : public StatsdUdpException
{
public:
  AddressResolutionError(const std::string &name, const std::string &reason)
      : StatsdUdpException("Address resolution failed for '" + name + "': " + reason), _name(name)
  {
  }

  const std::string &name() const noexcept { return _name; }

private:
  std::string _name;
};

/// \brief A configuration value or override is malformed
class ConfigurationError : public StatsdUdpException
{
public:
  explicit ConfigurationError(const std::string &message)
      : StatsdUdpException("Configuration error: " + message)
  {
  }
};

/// \brief The underlying socket reported a failure
class TransportError : public StatsdUdpException
{
public:
  TransportError(const std::string &context, int sysErrno)
      : StatsdUdpException(context + ": " + std::strerror(sysErrno)), _sysErrno(sysErrno)
  {
  }

  int sysErrno() const noexcept { return _sysErrno; }

private:
  int _sysErrno{0};
};

} // namespace statsdudp
