// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/LoopbackQuic.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <algorithm>

namespace tpuproxy
{

///////////////////////////////////////////////////////////////////////
// LoopbackQuicListener
///////////////////////////////////////////////////////////////////////

LoopbackQuicListener::LoopbackQuicListener(VirtualClock& clock,
                                           std::string const& address)
    : mClock(clock), mAddress(address)
{
}

std::string const&
LoopbackQuicListener::getAddress() const
{
    return mAddress;
}

void
LoopbackQuicListener::setMaxConcurrentStreams(uint32_t n)
{
    mMaxConcurrentStreams = n;
}

void
LoopbackQuicListener::setHandshakeDelay(std::chrono::milliseconds d)
{
    mHandshakeDelay = d;
}

void
LoopbackQuicListener::setStreamDelay(std::chrono::milliseconds d)
{
    mStreamDelay = d;
}

void
LoopbackQuicListener::setRefuseHandshakes(bool refuse)
{
    mRefuseHandshakes = refuse;
}

void
LoopbackQuicListener::failNextHandshakes(uint32_t n)
{
    mHandshakeFailures = n;
}

void
LoopbackQuicListener::closeNextAfterHandshake(uint32_t n)
{
    mClosesAfterHandshake = n;
}

void
LoopbackQuicListener::refuseNextStreamOpens(uint32_t n)
{
    mOpenRefusals = n;
}

void
LoopbackQuicListener::failNextWrites(uint32_t n)
{
    mWriteFailures = n;
}

bool
LoopbackQuicListener::takeCloseAfterHandshake()
{
    if (mClosesAfterHandshake == 0)
    {
        return false;
    }
    --mClosesAfterHandshake;
    return true;
}

bool
LoopbackQuicListener::takeHandshakeFailure()
{
    ++mStats.handshakesAttempted;
    if (mRefuseHandshakes)
    {
        return true;
    }
    if (mHandshakeFailures > 0)
    {
        --mHandshakeFailures;
        return true;
    }
    return false;
}

bool
LoopbackQuicListener::takeOpenRefusal()
{
    if (mOpenRefusals > 0)
    {
        --mOpenRefusals;
        ++mStats.streamsRefused;
        return true;
    }
    return false;
}

bool
LoopbackQuicListener::takeWriteFailure()
{
    if (mWriteFailures > 0)
    {
        --mWriteFailures;
        ++mStats.streamsFailed;
        return true;
    }
    return false;
}

void
LoopbackQuicListener::noteConcurrentStreams(size_t n)
{
    ++mStats.streamsOpened;
    mStats.maxConcurrentStreams = std::max(mStats.maxConcurrentStreams, n);
}

void
LoopbackQuicListener::record(std::vector<uint8_t> const& payload)
{
    mReceived.emplace_back(payload);
}

void
LoopbackQuicListener::addConnection(
    std::shared_ptr<LoopbackQuicConnection> conn)
{
    ++mStats.handshakesAccepted;
    mConnections.erase(
        std::remove_if(mConnections.begin(), mConnections.end(),
                       [](std::weak_ptr<LoopbackQuicConnection> const& w) {
                           auto c = w.lock();
                           return !c || c->isClosed();
                       }),
        mConnections.end());
    mConnections.emplace_back(conn);
}

bool
LoopbackQuicListener::getCorked() const
{
    return mCorked;
}

void
LoopbackQuicListener::setCorked(bool c)
{
    mCorked = c;
    if (!mCorked)
    {
        for (auto const& w : mConnections)
        {
            if (auto conn = w.lock())
            {
                conn->deliverAll();
            }
        }
    }
}

void
LoopbackQuicListener::closeAllConnections(std::string const& reason)
{
    auto conns = mConnections;
    mConnections.clear();
    for (auto const& w : conns)
    {
        if (auto conn = w.lock())
        {
            if (!conn->isClosed())
            {
                ++mStats.peerCloses;
                conn->peerClose(reason);
            }
        }
    }
}

size_t
LoopbackQuicListener::getLiveConnectionCount() const
{
    size_t n = 0;
    for (auto const& w : mConnections)
    {
        auto c = w.lock();
        if (c && !c->isClosed())
        {
            ++n;
        }
    }
    return n;
}

std::vector<std::vector<uint8_t>> const&
LoopbackQuicListener::getReceivedStreams() const
{
    return mReceived;
}

LoopbackQuicListener::Stats const&
LoopbackQuicListener::getStats() const
{
    return mStats;
}

///////////////////////////////////////////////////////////////////////
// LoopbackQuicConnection
///////////////////////////////////////////////////////////////////////

LoopbackQuicConnection::LoopbackQuicConnection(
    VirtualClock& clock, std::shared_ptr<LoopbackQuicListener> listener,
    uint32_t maxStreams)
    : mClock(clock)
    , mListener(listener)
    , mRemoteAddress(listener->getAddress())
    , mMaxStreams(maxStreams)
{
}

LoopbackQuicConnection::~LoopbackQuicConnection()
{
    mClosed = true;
    failAllStreams();
}

void
LoopbackQuicConnection::sendUniStream(std::vector<uint8_t> const& payload,
                                      std::chrono::milliseconds timeout,
                                      StreamCallback callback)
{
    auto listener = mListener.lock();
    if (mClosed || !listener)
    {
        mClock.postAction(
            [callback]() { callback(StreamResult::ConnectionClosed); },
            "loopback stream on closed connection");
        return;
    }
    if (mStreams.size() >= mMaxStreams || listener->takeOpenRefusal())
    {
        mClock.postAction([callback]() { callback(StreamResult::OpenRefused); },
                          "loopback stream refused");
        return;
    }

    uint64_t id = mNextStreamID;
    mNextStreamID += 4;
    auto& s = mStreams[id];
    s.mPayload = payload;
    s.mCallback = callback;
    s.mTimer = std::make_unique<VirtualTimer>(mClock);
    listener->noteConcurrentStreams(mStreams.size());

    if (listener->getCorked() || listener->mStreamDelay >= timeout)
    {
        s.mTimer->expires_from_now(timeout);
        s.mTimer->async_wait(
            [this, id]() { complete(id, StreamResult::TimedOut); },
            VirtualTimer::onFailureNoop);
    }
    else
    {
        s.mTimer->expires_from_now(listener->mStreamDelay);
        s.mTimer->async_wait([this, id]() { deliver(id); },
                             VirtualTimer::onFailureNoop);
    }
}

void
LoopbackQuicConnection::complete(uint64_t id, StreamResult result)
{
    auto it = mStreams.find(id);
    if (it == mStreams.end())
    {
        return;
    }
    auto cb = std::move(it->second.mCallback);
    mStreams.erase(it);
    cb(result);
}

void
LoopbackQuicConnection::deliver(uint64_t id)
{
    auto it = mStreams.find(id);
    if (it == mStreams.end())
    {
        return;
    }
    auto listener = mListener.lock();
    if (!listener)
    {
        complete(id, StreamResult::ConnectionClosed);
        return;
    }
    if (listener->takeWriteFailure())
    {
        complete(id, StreamResult::WriteFailed);
        return;
    }
    listener->record(it->second.mPayload);
    complete(id, StreamResult::Success);
}

void
LoopbackQuicConnection::deliverAll()
{
    std::vector<uint64_t> ids;
    for (auto const& s : mStreams)
    {
        ids.emplace_back(s.first);
    }
    auto self = std::static_pointer_cast<LoopbackQuicConnection>(
        shared_from_this());
    for (auto id : ids)
    {
        mClock.postAction([self, id]() { self->deliver(id); },
                          "loopback uncork");
    }
}

void
LoopbackQuicConnection::failAllStreams()
{
    auto streams = std::move(mStreams);
    mStreams.clear();
    for (auto& s : streams)
    {
        auto cb = std::move(s.second.mCallback);
        mClock.postAction(
            [cb]() { cb(StreamResult::ConnectionClosed); },
            "loopback stream aborted");
    }
}

uint32_t
LoopbackQuicConnection::getMaxConcurrentStreams() const
{
    return mMaxStreams;
}

bool
LoopbackQuicConnection::isClosed() const
{
    return mClosed;
}

void
LoopbackQuicConnection::close(std::string const& reason)
{
    if (mClosed)
    {
        return;
    }
    CLOG_DEBUG(Quic, "Loopback connection to {} closed locally: {}",
               mRemoteAddress, reason);
    mClosed = true;
    failAllStreams();
}

void
LoopbackQuicConnection::peerClose(std::string const& reason)
{
    if (mClosed)
    {
        return;
    }
    CLOG_DEBUG(Quic, "Loopback connection to {} closed by peer: {}",
               mRemoteAddress, reason);
    mClosed = true;
    failAllStreams();
    if (mCloseHandler)
    {
        auto handler = std::move(mCloseHandler);
        mCloseHandler = nullptr;
        mClock.postAction([handler, reason]() { handler(reason); },
                          "loopback peer close");
    }
}

void
LoopbackQuicConnection::setCloseHandler(CloseHandler handler)
{
    mCloseHandler = std::move(handler);
}

std::string
LoopbackQuicConnection::getRemoteAddress() const
{
    return mRemoteAddress;
}

size_t
LoopbackQuicConnection::getOpenStreamCount() const
{
    return mStreams.size();
}

///////////////////////////////////////////////////////////////////////
// LoopbackQuicConnector
///////////////////////////////////////////////////////////////////////

LoopbackQuicConnector::LoopbackQuicConnector(VirtualClock& clock)
    : mClock(clock)
{
}

void
LoopbackQuicConnector::addListener(
    std::shared_ptr<LoopbackQuicListener> listener)
{
    mListeners[listener->getAddress()] = listener;
}

std::shared_ptr<LoopbackQuicListener>
LoopbackQuicConnector::listen(Destination const& destination)
{
    auto listener =
        std::make_shared<LoopbackQuicListener>(mClock, destination.toString());
    addListener(listener);
    return listener;
}

void
LoopbackQuicConnector::finishHandshake(uint64_t id,
                                       ConnectCallback const& callback,
                                       QuicConnection::pointer conn,
                                       std::string const& error)
{
    mPendingHandshakes.erase(id);
    callback(conn, error);
}

void
LoopbackQuicConnector::connect(Destination const& destination,
                               std::chrono::milliseconds handshakeTimeout,
                               ConnectCallback callback)
{
    auto it = mListeners.find(destination.toString());
    if (it == mListeners.end())
    {
        mClock.postAction(
            [callback]() { callback(nullptr, "connection refused"); },
            "loopback connect refused");
        return;
    }
    auto listener = it->second;
    uint64_t id = mNextHandshakeID++;
    auto& timer = mPendingHandshakes[id];
    timer = std::make_unique<VirtualTimer>(mClock);

    if (listener->mHandshakeDelay >= handshakeTimeout)
    {
        timer->expires_from_now(handshakeTimeout);
        timer->async_wait(
            [this, id, callback]() {
                finishHandshake(id, callback, nullptr, "handshake timed out");
            },
            VirtualTimer::onFailureNoop);
        return;
    }

    timer->expires_from_now(listener->mHandshakeDelay);
    std::weak_ptr<LoopbackQuicListener> weakListener = listener;
    timer->async_wait(
        [this, id, callback, weakListener]() {
            auto l = weakListener.lock();
            if (!l)
            {
                finishHandshake(id, callback, nullptr, "listener gone");
                return;
            }
            if (l->takeHandshakeFailure())
            {
                finishHandshake(id, callback, nullptr,
                                "handshake rejected by peer");
                return;
            }
            auto conn = std::make_shared<LoopbackQuicConnection>(
                mClock, l, l->mMaxConcurrentStreams);
            l->addConnection(conn);
            if (l->takeCloseAfterHandshake())
            {
                ++l->mStats.peerCloses;
                conn->peerClose("closed right after handshake");
            }
            finishHandshake(id, callback, conn, "");
        },
        VirtualTimer::onFailureNoop);
}
}
