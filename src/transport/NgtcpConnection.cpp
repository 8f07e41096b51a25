// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/NgtcpConnection.h"
#include "crypto/Hex.h"
#include "crypto/IdentityProvider.h"
#include "main/Config.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <gnutls/crypto.h>
#include <ngtcp2/ngtcp2_crypto_gnutls.h>

#include <limits>
#include <set>
#include <stdexcept>
#include <tuple>

namespace tpuproxy
{

namespace
{
// Large enough for any datagram ngtcp2 writes with default settings.
constexpr size_t MAX_UDP_PAYLOAD = 1452;
constexpr size_t RECV_BUFFER_SIZE = 65536;
constexpr size_t CLIENT_SCID_LEN = 17;
constexpr size_t CLIENT_DCID_LEN = 18;

constexpr char const* TLS_PRIORITY =
    "NORMAL:-VERS-ALL:+VERS-TLS1.3:-CIPHER-ALL:+AES-128-GCM:+AES-256-GCM:"
    "+CHACHA20-POLY1305:+AES-128-CCM:-GROUP-ALL:+GROUP-X25519:"
    "+GROUP-SECP256R1:+GROUP-SECP384R1:+GROUP-SECP521R1:"
    "%DISABLE_TLS13_COMPAT_MODE";

// Application error code carried by our CONNECTION_CLOSE frames and stream
// resets.
constexpr uint64_t APP_ERROR_CLOSED = 0;
}

NgtcpConnection::NgtcpConnection(VirtualClock& clock, Config const& cfg,
                                 IdentityProvider const& identity,
                                 std::string const& remoteName)
    : mClock(clock)
    , mConfig(cfg)
    , mIdentity(identity)
    , mRemoteName(remoteName)
    , mSocket(clock.getIOContext())
    , mRecvBuffer(RECV_BUFFER_SIZE)
    , mSendBuffer(MAX_UDP_PAYLOAD)
    , mExpiryTimer(clock)
    , mHandshakeTimer(clock)
{
    mConnRef.get_conn = &NgtcpConnection::getConn;
    mConnRef.user_data = this;
    ngtcp2_ccerr_default(&mLastError);
}

NgtcpConnection::~NgtcpConnection()
{
    mExpiryTimer.cancel();
    mHandshakeTimer.cancel();
    failAllStreams(StreamResult::ConnectionClosed);
    if (mConn)
    {
        ngtcp2_conn_del(mConn);
    }
    if (mSession)
    {
        gnutls_deinit(mSession);
    }
    asio::error_code ec;
    mSocket.close(ec);
}

ngtcp2_conn*
NgtcpConnection::getConn(ngtcp2_crypto_conn_ref* ref)
{
    return static_cast<NgtcpConnection*>(ref->user_data)->mConn;
}

int
NgtcpConnection::onHandshakeCompleted(ngtcp2_conn*, void* userData)
{
    auto self = static_cast<NgtcpConnection*>(userData);
    self->mHandshakeDone = true;
    self->mHandshakeTimer.cancel();
    CLOG_DEBUG(Quic, "Handshake with {} completed, peer allows {} uni streams",
               self->mRemoteName, self->getMaxConcurrentStreams());
    if (self->mOnHandshake)
    {
        auto cb = std::move(self->mOnHandshake);
        self->mOnHandshake = nullptr;
        self->mClock.postAction([cb]() { cb(""); },
                                "NgtcpConnection: handshake completed");
    }
    return 0;
}

int
NgtcpConnection::onStreamClose(ngtcp2_conn*, uint32_t, int64_t streamID,
                               uint64_t appErrorCode, void* userData, void*)
{
    auto self = static_cast<NgtcpConnection*>(userData);
    if (self->mStreams.find(streamID) != self->mStreams.end())
    {
        CLOG_DEBUG(Quic, "Stream {} to {} closed by peer before FIN (code {})",
                   streamID, self->mRemoteName, appErrorCode);
        self->completeStream(streamID, StreamResult::WriteFailed);
    }
    self->mSendData.release(streamID);
    return 0;
}

int
NgtcpConnection::onAckedStreamData(ngtcp2_conn*, int64_t streamID, uint64_t,
                                   uint64_t datalen, void* userData, void*)
{
    auto self = static_cast<NgtcpConnection*>(userData);
    self->mSendData.markAcked(streamID, datalen);
    return 0;
}

void
NgtcpConnection::onRand(uint8_t* dest, size_t destlen, ngtcp2_rand_ctx const*)
{
    // Only used for packet padding and the like; failure is not fatal.
    std::ignore = gnutls_rnd(GNUTLS_RND_RANDOM, dest, destlen);
}

int
NgtcpConnection::onGetNewConnectionID(ngtcp2_conn*, ngtcp2_cid* cid,
                                      uint8_t* token, size_t cidlen, void*)
{
    if (gnutls_rnd(GNUTLS_RND_RANDOM, cid->data, cidlen) != 0 ||
        gnutls_rnd(GNUTLS_RND_RANDOM, token,
                   NGTCP2_STATELESS_RESET_TOKENLEN) != 0)
    {
        return NGTCP2_ERR_CALLBACK_FAILURE;
    }
    cid->datalen = cidlen;
    return 0;
}

ngtcp2_tstamp
NgtcpConnection::timestamp() const
{
    return static_cast<ngtcp2_tstamp>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(
            mClock.now().time_since_epoch())
            .count());
}

ngtcp2_path
NgtcpConnection::path()
{
    ngtcp2_path p;
    ngtcp2_addr_init(
        &p.local,
        reinterpret_cast<ngtcp2_sockaddr const*>(mLocalEndpoint.data()),
        static_cast<ngtcp2_socklen>(mLocalEndpoint.size()));
    ngtcp2_addr_init(
        &p.remote,
        reinterpret_cast<ngtcp2_sockaddr const*>(mRemoteEndpoint.data()),
        static_cast<ngtcp2_socklen>(mRemoteEndpoint.size()));
    p.user_data = nullptr;
    return p;
}

void
NgtcpConnection::setupTls()
{
    int rv = gnutls_init(&mSession, GNUTLS_CLIENT | GNUTLS_ENABLE_EARLY_DATA |
                                        GNUTLS_NO_END_OF_EARLY_DATA);
    if (rv != 0)
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("gnutls_init: {}"), gnutls_strerror(rv)));
    }
    if (ngtcp2_crypto_gnutls_configure_client_session(mSession) != 0)
    {
        throw std::runtime_error(
            "ngtcp2_crypto_gnutls_configure_client_session failed");
    }
    rv = gnutls_priority_set_direct(mSession, TLS_PRIORITY, nullptr);
    if (rv != 0)
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("gnutls_priority_set_direct: {}"), gnutls_strerror(rv)));
    }
    gnutls_session_set_ptr(mSession, &mConnRef);

    auto const& cert = mIdentity.certificateFor(mIdentity.identity());
    rv = gnutls_credentials_set(mSession, GNUTLS_CRD_CERTIFICATE,
                                cert.getCredentials());
    if (rv != 0)
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("gnutls_credentials_set: {}"), gnutls_strerror(rv)));
    }

    gnutls_datum_t alpn;
    alpn.data = reinterpret_cast<unsigned char*>(
        const_cast<char*>(mConfig.QUIC_ALPN.data()));
    alpn.size = static_cast<unsigned int>(mConfig.QUIC_ALPN.size());
    rv = gnutls_alpn_set_protocols(mSession, &alpn, 1, GNUTLS_ALPN_MANDATORY);
    if (rv != 0)
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("gnutls_alpn_set_protocols: {}"), gnutls_strerror(rv)));
    }
}

void
NgtcpConnection::setupConnection()
{
    ngtcp2_callbacks callbacks{};
    callbacks.client_initial = ngtcp2_crypto_client_initial_cb;
    callbacks.recv_crypto_data = ngtcp2_crypto_recv_crypto_data_cb;
    callbacks.encrypt = ngtcp2_crypto_encrypt_cb;
    callbacks.decrypt = ngtcp2_crypto_decrypt_cb;
    callbacks.hp_mask = ngtcp2_crypto_hp_mask_cb;
    callbacks.recv_retry = ngtcp2_crypto_recv_retry_cb;
    callbacks.update_key = ngtcp2_crypto_update_key_cb;
    callbacks.delete_crypto_aead_ctx = ngtcp2_crypto_delete_crypto_aead_ctx_cb;
    callbacks.delete_crypto_cipher_ctx =
        ngtcp2_crypto_delete_crypto_cipher_ctx_cb;
    callbacks.get_path_challenge_data =
        ngtcp2_crypto_get_path_challenge_data_cb;
    callbacks.version_negotiation = ngtcp2_crypto_version_negotiation_cb;
    callbacks.rand = &NgtcpConnection::onRand;
    callbacks.get_new_connection_id = &NgtcpConnection::onGetNewConnectionID;
    callbacks.handshake_completed = &NgtcpConnection::onHandshakeCompleted;
    callbacks.stream_close = &NgtcpConnection::onStreamClose;
    callbacks.acked_stream_data_offset = &NgtcpConnection::onAckedStreamData;

    ngtcp2_settings settings;
    ngtcp2_settings_default(&settings);
    settings.initial_ts = timestamp();
    settings.max_tx_udp_payload_size = MAX_UDP_PAYLOAD;

    auto idleTimeout = std::chrono::duration_cast<std::chrono::nanoseconds>(
        mConfig.CONNECTION_IDLE_TIMEOUT_MS);

    ngtcp2_transport_params params;
    ngtcp2_transport_params_default(&params);
    // We only ever send; the peer gets no stream credit at all.
    params.initial_max_streams_uni = 0;
    params.initial_max_streams_bidi = 0;
    params.initial_max_data = 0;
    params.max_idle_timeout = static_cast<ngtcp2_duration>(2 * idleTimeout.count());

    uint8_t scidData[CLIENT_SCID_LEN];
    uint8_t dcidData[CLIENT_DCID_LEN];
    if (gnutls_rnd(GNUTLS_RND_RANDOM, scidData, sizeof(scidData)) != 0 ||
        gnutls_rnd(GNUTLS_RND_RANDOM, dcidData, sizeof(dcidData)) != 0)
    {
        throw std::runtime_error("could not generate connection ids");
    }
    mConnectionID = hexAbbrev(ByteSlice(scidData, sizeof(scidData)));
    ngtcp2_cid scid, dcid;
    ngtcp2_cid_init(&scid, scidData, sizeof(scidData));
    ngtcp2_cid_init(&dcid, dcidData, sizeof(dcidData));

    auto p = path();
    int rv = ngtcp2_conn_client_new(&mConn, &dcid, &scid, &p,
                                    NGTCP2_PROTO_VER_V1, &callbacks,
                                    &settings, &params, nullptr, this);
    if (rv != 0)
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("ngtcp2_conn_client_new: {}"), ngtcp2_strerror(rv)));
    }
    ngtcp2_conn_set_tls_native_handle(mConn, mSession);
    // Keep the session alive at the QUIC level; the pool decides when an
    // idle connection goes away.
    ngtcp2_conn_set_keep_alive_timeout(
        mConn, static_cast<ngtcp2_duration>(idleTimeout.count() / 2));
}

void
NgtcpConnection::start(asio::ip::udp::endpoint const& remote,
                       std::chrono::milliseconds handshakeTimeout,
                       HandshakeCallback cb)
{
    releaseAssert(threadIsMain());
    releaseAssert(!mConn);
    mOnHandshake = std::move(cb);
    mRemoteEndpoint = remote;

    asio::error_code ec;
    mSocket.open(remote.protocol(), ec);
    if (!ec)
    {
        mSocket.connect(remote, ec);
    }
    if (!ec)
    {
        mLocalEndpoint = mSocket.local_endpoint(ec);
    }
    if (ec)
    {
        die(fmt::format(FMT_STRING("socket: {}"), ec.message()));
        return;
    }

    try
    {
        setupTls();
        setupConnection();
    }
    catch (std::runtime_error const& e)
    {
        die(e.what());
        return;
    }

    CLOG_DEBUG(Quic, "Starting handshake with {} ({}) from {}, scid {}",
               mRemoteName, remote.address().to_string(),
               mLocalEndpoint.address().to_string(), mConnectionID);

    mHandshakeTimer.expires_from_now(handshakeTimeout);
    mHandshakeTimer.async_wait([this]() { die("handshake timed out"); },
                               VirtualTimer::onFailureNoop);

    startReceive();
    flush();
}

void
NgtcpConnection::startReceive()
{
    if (mClosed)
    {
        return;
    }
    std::weak_ptr<NgtcpConnection> weak =
        std::static_pointer_cast<NgtcpConnection>(shared_from_this());
    mSocket.async_receive(
        asio::buffer(mRecvBuffer),
        [weak](asio::error_code const& ec, std::size_t length) {
            if (ec == asio::error::operation_aborted)
            {
                return;
            }
            auto self = weak.lock();
            if (!self || self->mClosed)
            {
                return;
            }
            if (ec)
            {
                self->die(fmt::format(FMT_STRING("socket: {}"), ec.message()));
                return;
            }
            self->onDatagram(length);
            self->startReceive();
        });
}

void
NgtcpConnection::onDatagram(size_t length)
{
    ngtcp2_pkt_info pi{};
    auto p = path();
    int rv = ngtcp2_conn_read_pkt(mConn, &p, &pi, mRecvBuffer.data(), length,
                                  timestamp());
    if (rv != 0)
    {
        switch (rv)
        {
        case NGTCP2_ERR_DRAINING:
            die("peer closed connection");
            return;
        case NGTCP2_ERR_CRYPTO:
            ngtcp2_ccerr_set_tls_alert(&mLastError,
                                       ngtcp2_conn_get_tls_alert(mConn),
                                       nullptr, 0);
            writeConnectionClose();
            die(fmt::format(FMT_STRING("TLS failure (alert {})"),
                            ngtcp2_conn_get_tls_alert(mConn)));
            return;
        case NGTCP2_ERR_DROP_CONN:
            die(ngtcp2_strerror(rv));
            return;
        default:
            ngtcp2_ccerr_set_liberr(&mLastError, rv, nullptr, 0);
            writeConnectionClose();
            die(ngtcp2_strerror(rv));
            return;
        }
    }
    flush();
}

void
NgtcpConnection::send(uint8_t const* data, size_t length)
{
    asio::error_code ec;
    mSocket.send(asio::buffer(data, length), 0, ec);
    if (ec)
    {
        CLOG_DEBUG(Quic, "Send of {} bytes to {} failed: {}", length,
                   mRemoteName, ec.message());
    }
}

void
NgtcpConnection::streamConsumed(int64_t id, ngtcp2_ssize n)
{
    if (n < 0)
    {
        return;
    }
    if (mStreams.find(id) == mStreams.end())
    {
        return;
    }
    if (mSendData.markSent(id, static_cast<size_t>(n)))
    {
        // Everything including the FIN has been handed to ngtcp2, which
        // keeps reading mSendData until the peer acknowledges it.
        completeStream(id, StreamResult::Success);
    }
}

void
NgtcpConnection::flush()
{
    if (mClosed || !mConn)
    {
        return;
    }
    auto ts = timestamp();
    std::set<int64_t> blocked;

    for (;;)
    {
        int64_t streamID = -1;
        ngtcp2_vec vec{};
        size_t vcnt = 0;
        uint32_t flags = NGTCP2_WRITE_STREAM_FLAG_MORE;

        for (auto& kv : mStreams)
        {
            if (blocked.find(kv.first) == blocked.end())
            {
                auto data = mSendData.unsent(kv.first);
                streamID = kv.first;
                vec.base = const_cast<uint8_t*>(data.first);
                vec.len = data.second;
                vcnt = 1;
                flags |= NGTCP2_WRITE_STREAM_FLAG_FIN;
                break;
            }
        }

        ngtcp2_pkt_info pi{};
        ngtcp2_path_storage ps;
        ngtcp2_path_storage_zero(&ps);
        ngtcp2_ssize ndatalen = -1;
        auto nwrite = ngtcp2_conn_writev_stream(
            mConn, &ps.path, &pi, mSendBuffer.data(), mSendBuffer.size(),
            &ndatalen, flags, streamID, vcnt ? &vec : nullptr, vcnt, ts);

        if (nwrite < 0)
        {
            switch (nwrite)
            {
            case NGTCP2_ERR_WRITE_MORE:
                streamConsumed(streamID, ndatalen);
                continue;
            case NGTCP2_ERR_STREAM_DATA_BLOCKED:
                blocked.insert(streamID);
                continue;
            case NGTCP2_ERR_STREAM_SHUT_WR:
            case NGTCP2_ERR_STREAM_NOT_FOUND:
                completeStream(streamID, StreamResult::WriteFailed);
                continue;
            default:
                CLOG_WARNING(Quic, "Fatal write error on connection to {}: {}",
                             mRemoteName, ngtcp2_strerror(int(nwrite)));
                ngtcp2_ccerr_set_liberr(&mLastError, int(nwrite), nullptr, 0);
                die(ngtcp2_strerror(int(nwrite)));
                return;
            }
        }

        if (streamID >= 0)
        {
            streamConsumed(streamID, ndatalen);
        }
        if (nwrite == 0)
        {
            if (streamID >= 0 && ndatalen <= 0)
            {
                // Congested: nothing more fits right now.
                break;
            }
            if (streamID < 0)
            {
                break;
            }
            continue;
        }
        send(mSendBuffer.data(), static_cast<size_t>(nwrite));
    }

    ngtcp2_conn_update_pkt_tx_time(mConn, ts);
    scheduleExpiry();
}

void
NgtcpConnection::scheduleExpiry()
{
    auto expiry = ngtcp2_conn_get_expiry(mConn);
    if (expiry == std::numeric_limits<ngtcp2_tstamp>::max())
    {
        mExpiryTimer.cancel();
        return;
    }
    auto now = timestamp();
    auto delay = expiry > now ? expiry - now : 0;
    mExpiryTimer.expires_from_now(std::chrono::nanoseconds(delay));
    mExpiryTimer.async_wait([this]() { onExpiry(); },
                            VirtualTimer::onFailureNoop);
}

void
NgtcpConnection::onExpiry()
{
    if (mClosed)
    {
        return;
    }
    int rv = ngtcp2_conn_handle_expiry(mConn, timestamp());
    if (rv != 0)
    {
        if (rv == NGTCP2_ERR_IDLE_CLOSE)
        {
            die("idle timeout");
            return;
        }
        ngtcp2_ccerr_set_liberr(&mLastError, rv, nullptr, 0);
        writeConnectionClose();
        die(ngtcp2_strerror(rv));
        return;
    }
    flush();
}

void
NgtcpConnection::writeConnectionClose()
{
    if (!mConn || ngtcp2_conn_in_closing_period(mConn) ||
        ngtcp2_conn_in_draining_period(mConn))
    {
        return;
    }
    ngtcp2_pkt_info pi{};
    ngtcp2_path_storage ps;
    ngtcp2_path_storage_zero(&ps);
    auto n = ngtcp2_conn_write_connection_close(
        mConn, &ps.path, &pi, mSendBuffer.data(), mSendBuffer.size(),
        &mLastError, timestamp());
    if (n > 0)
    {
        send(mSendBuffer.data(), static_cast<size_t>(n));
    }
}

void
NgtcpConnection::completeStream(int64_t id, StreamResult result)
{
    auto it = mStreams.find(id);
    if (it == mStreams.end())
    {
        return;
    }
    auto cb = std::move(it->second.mCallback);
    if (it->second.mTimer)
    {
        it->second.mTimer->cancel();
    }
    mStreams.erase(it);
    mClock.postAction([cb, result]() { cb(result); },
                      "NgtcpConnection: stream finished");
}

void
NgtcpConnection::failAllStreams(StreamResult result)
{
    while (!mStreams.empty())
    {
        completeStream(mStreams.begin()->first, result);
    }
}

void
NgtcpConnection::die(std::string const& reason)
{
    if (mClosed)
    {
        return;
    }
    mClosed = true;
    mExpiryTimer.cancel();
    mHandshakeTimer.cancel();
    failAllStreams(StreamResult::ConnectionClosed);
    asio::error_code ec;
    mSocket.close(ec);

    if (mOnHandshake)
    {
        CLOG_DEBUG(Quic, "Handshake with {} failed: {}", mRemoteName, reason);
        auto cb = std::move(mOnHandshake);
        mOnHandshake = nullptr;
        mClock.postAction([cb, reason]() { cb(reason); },
                          "NgtcpConnection: handshake failed");
        return;
    }

    CLOG_INFO(Quic, "Connection to {} lost: {}", mRemoteName, reason);
    if (mCloseHandler)
    {
        auto handler = std::move(mCloseHandler);
        mCloseHandler = nullptr;
        mClock.postAction([handler, reason]() { handler(reason); },
                          "NgtcpConnection: closed");
    }
}

void
NgtcpConnection::sendUniStream(std::vector<uint8_t> const& payload,
                               std::chrono::milliseconds timeout,
                               StreamCallback callback)
{
    releaseAssert(threadIsMain());
    if (mClosed || !mHandshakeDone)
    {
        mClock.postAction(
            [callback]() { callback(StreamResult::ConnectionClosed); },
            "NgtcpConnection: closed");
        return;
    }

    int64_t id = -1;
    int rv = ngtcp2_conn_open_uni_stream(mConn, &id, nullptr);
    if (rv != 0)
    {
        auto res = rv == NGTCP2_ERR_STREAM_ID_BLOCKED ? StreamResult::OpenRefused
                                                      : StreamResult::WriteFailed;
        CLOG_TRACE(Quic, "Cannot open stream to {}: {}", mRemoteName,
                   ngtcp2_strerror(rv));
        mClock.postAction([callback, res]() { callback(res); },
                          "NgtcpConnection: open failed");
        return;
    }

    mSendData.add(id, payload);
    auto& s = mStreams[id];
    s.mCallback = std::move(callback);
    s.mTimer = std::make_unique<VirtualTimer>(mClock);
    s.mTimer->expires_from_now(timeout);
    s.mTimer->async_wait(
        [this, id]() {
            if (mConn && !mClosed &&
                ngtcp2_conn_shutdown_stream(mConn, 0, id, APP_ERROR_CLOSED) !=
                    0)
            {
                // No stream_close will follow for a stream ngtcp2 no
                // longer knows.
                mSendData.release(id);
            }
            completeStream(id, StreamResult::TimedOut);
            flush();
        },
        VirtualTimer::onFailureNoop);

    flush();
}

uint32_t
NgtcpConnection::getMaxConcurrentStreams() const
{
    if (!mConn)
    {
        return 0;
    }
    auto params = ngtcp2_conn_get_remote_transport_params(mConn);
    if (!params)
    {
        return 0;
    }
    return static_cast<uint32_t>(
        std::min<uint64_t>(params->initial_max_streams_uni,
                           std::numeric_limits<uint32_t>::max()));
}

bool
NgtcpConnection::isClosed() const
{
    return mClosed;
}

void
NgtcpConnection::close(std::string const& reason)
{
    if (mClosed)
    {
        return;
    }
    CLOG_DEBUG(Quic, "Closing connection to {}: {}", mRemoteName, reason);
    ngtcp2_ccerr_set_application_error(
        &mLastError, APP_ERROR_CLOSED,
        reinterpret_cast<uint8_t const*>(reason.data()), reason.size());
    writeConnectionClose();
    mCloseHandler = nullptr;
    mOnHandshake = nullptr;
    die(reason);
}

void
NgtcpConnection::setCloseHandler(CloseHandler handler)
{
    mCloseHandler = std::move(handler);
}

std::string
NgtcpConnection::getRemoteAddress() const
{
    return mRemoteName;
}

size_t
NgtcpConnection::getRetainedStreamBytes() const
{
    return mSendData.retainedBytes();
}
}
