#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/QuicConnection.h"
#include "transport/QuicConnector.h"
#include "util/Timer.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tpuproxy
{

class LoopbackQuicConnection;

// [testing] In-process stand-in for a validator's QUIC ingestion port. It
// accepts handshakes and unidirectional streams from LoopbackQuicConnections
// driven entirely by the owning VirtualClock, records every stream it
// receives as one byte vector, and can be told to misbehave.
class LoopbackQuicListener
    : public std::enable_shared_from_this<LoopbackQuicListener>
{
  public:
    struct Stats
    {
        size_t handshakesAttempted{0};
        size_t handshakesAccepted{0};
        size_t streamsOpened{0};
        size_t streamsRefused{0};
        size_t streamsFailed{0};
        size_t maxConcurrentStreams{0};
        size_t peerCloses{0};
    };

  private:
    friend class LoopbackQuicConnection;
    friend class LoopbackQuicConnector;

    VirtualClock& mClock;
    std::string const mAddress;

    uint32_t mMaxConcurrentStreams{128};
    std::chrono::milliseconds mHandshakeDelay{0};
    std::chrono::milliseconds mStreamDelay{0};
    uint32_t mHandshakeFailures{0};
    uint32_t mOpenRefusals{0};
    uint32_t mWriteFailures{0};
    uint32_t mClosesAfterHandshake{0};
    bool mRefuseHandshakes{false};
    bool mCorked{false};

    std::vector<std::weak_ptr<LoopbackQuicConnection>> mConnections;
    std::vector<std::vector<uint8_t>> mReceived;
    Stats mStats;

    bool takeHandshakeFailure();
    bool takeOpenRefusal();
    bool takeWriteFailure();
    bool takeCloseAfterHandshake();
    void noteConcurrentStreams(size_t n);
    void record(std::vector<uint8_t> const& payload);
    void addConnection(std::shared_ptr<LoopbackQuicConnection> conn);

  public:
    LoopbackQuicListener(VirtualClock& clock, std::string const& address);

    std::string const& getAddress() const;

    // Unidirectional stream limit advertised to connections accepted from
    // now on.
    void setMaxConcurrentStreams(uint32_t n);
    void setHandshakeDelay(std::chrono::milliseconds d);
    // Streams complete this long after they are opened, unless corked.
    void setStreamDelay(std::chrono::milliseconds d);
    void setRefuseHandshakes(bool refuse);
    void failNextHandshakes(uint32_t n);
    void refuseNextStreamOpens(uint32_t n);
    void failNextWrites(uint32_t n);
    // The next `n` handshakes complete, but the peer closes each connection
    // before the connector reports it.
    void closeNextAfterHandshake(uint32_t n);

    // A corked listener holds every stream open until uncorked (or until the
    // sender's stream timeout fires).
    bool getCorked() const;
    void setCorked(bool c);

    // Peer-initiated close of every live connection.
    void closeAllConnections(std::string const& reason);

    size_t getLiveConnectionCount() const;
    std::vector<std::vector<uint8_t>> const& getReceivedStreams() const;
    Stats const& getStats() const;
};

class LoopbackQuicConnection : public QuicConnection
{
    struct PendingStream
    {
        std::vector<uint8_t> mPayload;
        StreamCallback mCallback;
        std::unique_ptr<VirtualTimer> mTimer;
    };

    VirtualClock& mClock;
    std::weak_ptr<LoopbackQuicListener> mListener;
    std::string const mRemoteAddress;
    uint32_t const mMaxStreams;
    bool mClosed{false};
    CloseHandler mCloseHandler;
    uint64_t mNextStreamID{2}; // client-initiated unidirectional ids
    std::map<uint64_t, PendingStream> mStreams;

    void complete(uint64_t id, StreamResult result);
    void deliver(uint64_t id);
    void failAllStreams();

  public:
    LoopbackQuicConnection(VirtualClock& clock,
                           std::shared_ptr<LoopbackQuicListener> listener,
                           uint32_t maxStreams);
    ~LoopbackQuicConnection();

    void sendUniStream(std::vector<uint8_t> const& payload,
                       std::chrono::milliseconds timeout,
                       StreamCallback callback) override;
    uint32_t getMaxConcurrentStreams() const override;
    bool isClosed() const override;
    void close(std::string const& reason) override;
    void setCloseHandler(CloseHandler handler) override;
    std::string getRemoteAddress() const override;

    // Listener side.
    void peerClose(std::string const& reason);
    void deliverAll();
    size_t getOpenStreamCount() const;
};

// Connects to LoopbackQuicListeners by the destination's "host:port" string.
class LoopbackQuicConnector : public QuicConnector
{
    VirtualClock& mClock;
    std::map<std::string, std::shared_ptr<LoopbackQuicListener>> mListeners;
    std::map<uint64_t, std::unique_ptr<VirtualTimer>> mPendingHandshakes;
    uint64_t mNextHandshakeID{0};

    void finishHandshake(uint64_t id, ConnectCallback const& callback,
                         QuicConnection::pointer conn,
                         std::string const& error);

  public:
    explicit LoopbackQuicConnector(VirtualClock& clock);

    void addListener(std::shared_ptr<LoopbackQuicListener> listener);

    // Creates, registers and returns a listener for `destination`.
    std::shared_ptr<LoopbackQuicListener>
    listen(Destination const& destination);

    void connect(Destination const& destination,
                 std::chrono::milliseconds handshakeTimeout,
                 ConnectCallback callback) override;
};
}
