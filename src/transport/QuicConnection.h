#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tpuproxy
{

// Transport-level outcome of sending one payload as one unidirectional
// stream. Success means the whole payload and the stream FIN were handed to
// the transport; nothing is ever read back from the peer.
enum class StreamResult
{
    Success,
    OpenRefused,
    WriteFailed,
    TimedOut,
    ConnectionClosed
};

char const* toString(StreamResult r);

/**
 * One live QUIC session to a validator. All methods must be called on the
 * main thread, and every callback is delivered on the main thread too.
 *
 * A stream callback is invoked exactly once per sendUniStream call and never
 * from within sendUniStream itself. Closing the connection (locally or by the
 * peer) completes every outstanding stream with ConnectionClosed.
 */
class QuicConnection : public std::enable_shared_from_this<QuicConnection>
{
  public:
    using pointer = std::shared_ptr<QuicConnection>;
    using StreamCallback = std::function<void(StreamResult)>;
    using CloseHandler = std::function<void(std::string const& reason)>;

    virtual ~QuicConnection()
    {
    }

    // Opens a new unidirectional stream, writes `payload` and finishes the
    // stream. The callback reports TimedOut if the stream is not fully sent
    // within `timeout`.
    virtual void sendUniStream(std::vector<uint8_t> const& payload,
                               std::chrono::milliseconds timeout,
                               StreamCallback callback) = 0;

    // Number of concurrent unidirectional streams the peer allows us.
    virtual uint32_t getMaxConcurrentStreams() const = 0;

    virtual bool isClosed() const = 0;

    // Local close; does not invoke the close handler.
    virtual void close(std::string const& reason) = 0;

    // Invoked at most once, when the connection dies for any reason other
    // than a local close() (peer CONNECTION_CLOSE, idle timeout, socket
    // error).
    virtual void setCloseHandler(CloseHandler handler) = 0;

    virtual std::string getRemoteAddress() const = 0;
};
}
