#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/QuicConnection.h"
#include "transport/StreamSendBuffer.h"
#include "util/Timer.h"
#include "util/asio.h"

#include <gnutls/gnutls.h>
#include <ngtcp2/ngtcp2.h>
#include <ngtcp2/ngtcp2_crypto.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tpuproxy
{

class Config;
class IdentityProvider;

/**
 * A QUIC client session over its own connected UDP socket, built on ngtcp2
 * with GnuTLS doing the TLS 1.3 handshake.
 *
 * The session presents the proxy's self-signed identity certificate and
 * does not verify the server's (validators use self-signed certificates as
 * well). Only client-initiated unidirectional streams are ever opened; the
 * peer may not open any stream towards us.
 *
 * ngtcp2 is not driven by any thread of its own: every received datagram,
 * every expiry of the ngtcp2 loss/idle timer and every new stream calls back
 * into the connection on the main thread, after which pending packets are
 * flushed to the socket.
 */
class NgtcpConnection : public QuicConnection
{
  public:
    // Empty error means the handshake completed.
    using HandshakeCallback = std::function<void(std::string const& error)>;

  private:
    // A stream whose writer has not been told the outcome yet.
    struct PendingStream
    {
        StreamCallback mCallback;
        std::unique_ptr<VirtualTimer> mTimer;
    };

    VirtualClock& mClock;
    Config const& mConfig;
    IdentityProvider const& mIdentity;
    std::string const mRemoteName;
    // Abbreviated source connection id, for logs.
    std::string mConnectionID;

    asio::ip::udp::socket mSocket;
    asio::ip::udp::endpoint mLocalEndpoint;
    asio::ip::udp::endpoint mRemoteEndpoint;
    std::vector<uint8_t> mRecvBuffer;
    std::vector<uint8_t> mSendBuffer;

    ngtcp2_conn* mConn{nullptr};
    gnutls_session_t mSession{nullptr};
    ngtcp2_crypto_conn_ref mConnRef;
    ngtcp2_ccerr mLastError;

    VirtualTimer mExpiryTimer;
    VirtualTimer mHandshakeTimer;
    HandshakeCallback mOnHandshake;
    bool mHandshakeDone{false};
    bool mClosed{false};
    CloseHandler mCloseHandler;

    std::map<int64_t, PendingStream> mStreams;
    // Released after ngtcp2_conn_del in the destructor, by member order.
    StreamSendBuffer mSendData;

    void setupTls();
    void setupConnection();
    ngtcp2_tstamp timestamp() const;
    ngtcp2_path path();

    void startReceive();
    void onDatagram(size_t length);
    void flush();
    void send(uint8_t const* data, size_t length);
    void scheduleExpiry();
    void onExpiry();
    void writeConnectionClose();

    void streamConsumed(int64_t id, ngtcp2_ssize n);
    void completeStream(int64_t id, StreamResult result);
    void failAllStreams(StreamResult result);
    void die(std::string const& reason);

    static ngtcp2_conn* getConn(ngtcp2_crypto_conn_ref* ref);
    static int onHandshakeCompleted(ngtcp2_conn* conn, void* userData);
    static int onStreamClose(ngtcp2_conn* conn, uint32_t flags,
                             int64_t streamID, uint64_t appErrorCode,
                             void* userData, void* streamUserData);
    static int onAckedStreamData(ngtcp2_conn* conn, int64_t streamID,
                                 uint64_t offset, uint64_t datalen,
                                 void* userData, void* streamUserData);
    static void onRand(uint8_t* dest, size_t destlen,
                       ngtcp2_rand_ctx const* ctx);
    static int onGetNewConnectionID(ngtcp2_conn* conn, ngtcp2_cid* cid,
                                    uint8_t* token, size_t cidlen,
                                    void* userData);

  public:
    NgtcpConnection(VirtualClock& clock, Config const& cfg,
                    IdentityProvider const& identity,
                    std::string const& remoteName);
    ~NgtcpConnection();

    // Opens the socket towards `remote` and starts the handshake. `cb` runs
    // once on the main thread with an empty error on success.
    void start(asio::ip::udp::endpoint const& remote,
               std::chrono::milliseconds handshakeTimeout,
               HandshakeCallback cb);

    void sendUniStream(std::vector<uint8_t> const& payload,
                       std::chrono::milliseconds timeout,
                       StreamCallback callback) override;
    uint32_t getMaxConcurrentStreams() const override;
    bool isClosed() const override;
    void close(std::string const& reason) override;
    void setCloseHandler(CloseHandler handler) override;
    std::string getRemoteAddress() const override;

    // Stream bytes still held for possible retransmission.
    size_t getRetainedStreamBytes() const;
};
}
