// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of statsdudp, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

/// \file async_sender.hpp
/// \brief Non-blocking send path
/// \details
///   - Each chunk send is a task handed to a caller-supplied Executor.
///   - Chunk k+1 is only posted once chunk k has been sent, so one call never
///     has two sends in flight and line order is kept.
///   - The returned future is satisfied after the last chunk, or carries the
///     first TransportError; later chunks are then never attempted.
///   - No threads are created here; the executor decides where tasks run.

#include "payload_splitter.hpp"
#include "statsdudp/core/logger.hpp"
#include "transport_handle.hpp"
#include "transport_types.hpp"

#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace statsdudp
{
namespace network
{

/// \brief Runs a task now or later, on a thread owned by the caller
using Executor = std::function<void(std::function<void()>)>;

/// \brief Executor that runs each task immediately on the posting thread
inline Executor inlineExecutor()
{
  return [](std::function<void()> task) { task(); };
}

class AsyncSender
{
public:
  /// \note handle must outlive every future returned by sendAsync()
  AsyncSender(ITransportHandle &handle, std::size_t maxPacketSize, Executor executor)
      : _handle(handle), _maxPacketSize(maxPacketSize), _executor(std::move(executor))
  {
  }

  std::future<void> sendAsync(std::string text)
  {
    auto chain = std::make_shared<SendChain>(
      _handle, std::make_shared<const std::string>(std::move(text)), _maxPacketSize, _executor);
    std::future<void> result = chain->future();
    chain->start();
    return result;
  }

  std::size_t maxPacketSize() const { return _maxPacketSize; }

private:
  /// \brief State of one sendAsync() call; owns the payload the chunk views
  /// point into until the last task has run.
  class SendChain : public std::enable_shared_from_this<SendChain>
  {
  public:
    SendChain(ITransportHandle &handle, std::shared_ptr<const std::string> payload,
              std::size_t limit, Executor executor)
        : _handle(handle), _payload(std::move(payload)),
          _chunks(PayloadSplitter::split(ByteView::of(*_payload), limit)),
          _executor(std::move(executor))
    {
      if (_chunks.size() > 1)
      {
        STATSDUDP_LOG_TRACE("AsyncSender: " << _payload->size() << " bytes split into "
                                            << _chunks.size() << " datagrams");
      }
    }

    std::future<void> future() { return _promise.get_future(); }

    void start() { post(); }

  private:
    /// \return true when another chunk remains to be sent
    bool sendNext()
    {
      try
      {
        _handle.sendTo(_chunks[_next]);
      }
      catch (...)
      {
        STATSDUDP_LOG_DEBUG("AsyncSender: chunk " << (_next + 1) << "/" << _chunks.size()
                                                  << " failed, dropping the rest");
        _promise.set_exception(std::current_exception());
        return false;
      }
      if (++_next == _chunks.size())
      {
        _promise.set_value();
        return false;
      }
      return true;
    }

    /// Tasks that an executor runs on the posting stack only mark themselves
    /// and the loop below sends, so inline executors do not recurse per chunk.
    void post()
    {
      for (;;)
      {
        bool ranInline = false;
        auto self = shared_from_this();
        const SendChain *outer = postingChain();
        postingChain() = this;
        try
        {
          // ranInline is only touched while this frame is still posting
          _executor(
            [self, &ranInline]()
            {
              if (postingChain() == self.get())
              {
                ranInline = true;
                return;
              }
              if (self->sendNext())
              {
                self->post();
              }
            });
        }
        catch (...)
        {
          postingChain() = outer;
          STATSDUDP_LOG_WARN("AsyncSender: executor rejected chunk " << (_next + 1) << "/"
                                                                     << _chunks.size());
          _promise.set_exception(std::current_exception());
          return;
        }
        postingChain() = outer;

        if (!ranInline || !sendNext())
        {
          return;
        }
      }
    }

    static const SendChain *&postingChain()
    {
      thread_local const SendChain *current = nullptr;
      return current;
    }

    ITransportHandle &_handle;
    std::shared_ptr<const std::string> _payload;
    std::vector<ByteView> _chunks;
    std::size_t _next{0};
    Executor _executor;
    std::promise<void> _promise;
  };

  ITransportHandle &_handle;
  const std::size_t _maxPacketSize;
  Executor _executor;
};

} // namespace network
} // namespace statsdudp
