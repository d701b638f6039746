// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (BSD sockets, getaddrinfo)"
#endif

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace statsdudp
{
namespace network
{

using ByteBuffer = std::vector<std::uint8_t>;

/// Well-known DogStatsD agent port.
constexpr std::uint16_t kDefaultStatsdPort = 8125;

/// Conservative datagram ceiling; 0 disables splitting.
constexpr std::size_t kDefaultMaxPacketSize = 8192;

constexpr std::uint8_t kLineDelimiter = '\n';

/// \brief Non-owning window over a byte sequence
/// \details A view is a base pointer plus an offset and length into it, so
/// sub-views of one payload share the same base and never copy.
class ByteView
{
public:
  ByteView() = default;

  ByteView(const std::uint8_t *base, std::size_t offset, std::size_t length)
      : _base(base), _offset(offset), _length(length)
  {
  }

  static ByteView of(const std::string &text)
  {
    return ByteView(reinterpret_cast<const std::uint8_t *>(text.data()), 0, text.size());
  }

  static ByteView of(const ByteBuffer &buffer) { return ByteView(buffer.data(), 0, buffer.size()); }

  const std::uint8_t *base() const { return _base; }
  std::size_t offset() const { return _offset; }
  std::size_t size() const { return _length; }
  bool empty() const { return _length == 0; }

  const std::uint8_t *data() const { return _base + _offset; }

  std::uint8_t operator[](std::size_t index) const { return _base[_offset + index]; }

  /// \brief Sub-view relative to this view's start
  ByteView subview(std::size_t relativeOffset, std::size_t length) const
  {
    return ByteView(_base, _offset + relativeOffset, length);
  }

  std::string toString() const
  {
    return std::string(reinterpret_cast<const char *>(data()), _length);
  }

private:
  const std::uint8_t *_base{nullptr};
  std::size_t _offset{0};
  std::size_t _length{0};
};

} // namespace network
} // namespace statsdudp
