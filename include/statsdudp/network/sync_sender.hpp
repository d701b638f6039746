// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "payload_splitter.hpp"
#include "statsdudp/core/logger.hpp"
#include "transport_handle.hpp"
#include "transport_types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace statsdudp
{
namespace network
{

/// \brief Blocking send path: split, then send each chunk on the caller's
/// thread. The first TransportError aborts the remaining chunks of that call.
class SyncSender
{
public:
  SyncSender(ITransportHandle &handle, std::size_t maxPacketSize)
      : _handle(handle), _maxPacketSize(maxPacketSize)
  {
  }

  void send(const std::string &text) { send(ByteView::of(text)); }

  void send(const ByteView &payload)
  {
    std::vector<ByteView> chunks = PayloadSplitter::split(payload, _maxPacketSize);
    if (chunks.size() > 1)
    {
      STATSDUDP_LOG_TRACE("SyncSender: " << payload.size() << " bytes split into "
                                         << chunks.size() << " datagrams");
    }
    for (const auto &chunk : chunks)
    {
      if (_maxPacketSize > 0 && chunk.size() > _maxPacketSize)
      {
        STATSDUDP_LOG_DEBUG("SyncSender: sending unsplittable " << chunk.size()
                                                                << "-byte datagram (limit "
                                                                << _maxPacketSize << ")");
      }
      _handle.sendTo(chunk);
    }
  }

  std::size_t maxPacketSize() const { return _maxPacketSize; }

private:
  ITransportHandle &_handle;
  const std::size_t _maxPacketSize;
};

} // namespace network
} // namespace statsdudp
