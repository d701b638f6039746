// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "transport_types.hpp"

#include <cstddef>
#include <vector>

namespace statsdudp
{
namespace network
{

/// \brief Splits an oversized batch into datagram-sized chunks on line
/// boundaries.
/// \details
///   - limit == 0 or payload.size() <= limit: the payload is returned whole.
///   - Otherwise the rightmost '\n' at relative index limit..1 (inclusive)
///     is the split point: everything before it becomes one chunk (at most
///     limit bytes), the delimiter is dropped, and the rest is split again.
///   - A segment with no usable '\n' is returned whole even though it is
///     larger than limit; the platform decides what happens to it.
///   - Chunks are views into the payload, in payload order, and together
///     cover every byte except the consumed delimiters.
///
/// A newline at relative index 0 is never a split point, since it would
/// produce an empty datagram.
class PayloadSplitter
{
public:
  static std::vector<ByteView> split(const ByteView &payload, std::size_t limit)
  {
    std::vector<ByteView> chunks;
    if (limit == 0 || payload.size() <= limit)
    {
      chunks.push_back(payload);
      return chunks;
    }

    ByteView rest = payload;
    while (rest.size() > limit)
    {
      std::size_t splitAt = findSplitPoint(rest, limit);
      if (splitAt == 0)
      {
        // Oversized segment without a line break inside the limit
        chunks.push_back(rest);
        return chunks;
      }

      chunks.push_back(rest.subview(0, splitAt));
      std::size_t remaining = rest.size() - splitAt - 1;
      if (remaining == 0)
      {
        return chunks;
      }
      rest = rest.subview(splitAt + 1, remaining);
    }
    chunks.push_back(rest);
    return chunks;
  }

  /// \brief Relative index of the rightmost '\n' in [1, limit], 0 if none
  /// \pre view.size() > limit
  static std::size_t findSplitPoint(const ByteView &view, std::size_t limit)
  {
    for (std::size_t i = limit; i > 0; --i)
    {
      if (view[i] == kLineDelimiter)
      {
        return i;
      }
    }
    return 0;
  }
};

} // namespace network
} // namespace statsdudp
