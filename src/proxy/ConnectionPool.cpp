// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ConnectionPool.h"
#include "main/Config.h"
#include "proxy/AdmissionController.h"
#include "proxy/ProxyMetrics.h"
#include "transport/QuicConnector.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include "medida/counter.h"
#include "medida/meter.h"

#include <algorithm>

namespace tpuproxy
{

ConnectionPool::ConnectionPool(VirtualClock& clock, Config const& cfg,
                               QuicConnector& connector,
                               AdmissionController& admission,
                               ProxyMetrics& metrics)
    : mClock(clock)
    , mConfig(cfg)
    , mConnector(connector)
    , mAdmission(admission)
    , mMetrics(metrics)
{
    for (size_t i = 0; i < cfg.DESTINATIONS.size(); ++i)
    {
        mSlots.emplace_back(std::make_unique<Slot>());
    }
}

ConnectionPool::~ConnectionPool()
{
    for (auto& slot : mSlots)
    {
        MutexLocker lock(slot->mMutex);
        for (auto& h : slot->mHandles)
        {
            h->mHealth = ConnectionHealth::Dead;
            h->mConnection->close("pool destroyed");
        }
        slot->mHandles.clear();
    }
}

ConnectionPool::Slot&
ConnectionPool::getSlot(DestinationIndex dest) const
{
    releaseAssert(dest < mSlots.size());
    return *mSlots[dest];
}

ConnectionHandle::pointer
ConnectionPool::pickHandle(Slot& slot)
{
    ConnectionHandle::pointer degraded;
    for (auto const& h : slot.mHandles)
    {
        if (!h->hasSpareCapacity())
        {
            continue;
        }
        if (h->mHealth == ConnectionHealth::Healthy)
        {
            return h;
        }
        if (!degraded)
        {
            degraded = h;
        }
    }
    return degraded;
}

void
ConnectionPool::acquire(DestinationIndex dest, AcquireCallback callback)
{
    if (mShuttingDown)
    {
        callback(nullptr, AcquireError::ShuttingDown);
        return;
    }
    {
        auto& slot = getSlot(dest);
        MutexLocker lock(slot.mMutex);
        slot.mWaiters.emplace_back(std::move(callback));
    }
    serveWaiters(dest);
}

void
ConnectionPool::serveWaiters(DestinationIndex dest)
{
    std::vector<std::pair<AcquireCallback, ConnectionHandle::pointer>> granted;
    std::vector<AcquireCallback> failed;
    AcquireError failure = AcquireError::None;
    uint32_t toConnect = 0;
    {
        auto& slot = getSlot(dest);
        MutexLocker lock(slot.mMutex);
        if (mShuttingDown)
        {
            failure = AcquireError::ShuttingDown;
            failed.assign(std::make_move_iterator(slot.mWaiters.begin()),
                          std::make_move_iterator(slot.mWaiters.end()));
            slot.mWaiters.clear();
        }
        while (!slot.mWaiters.empty())
        {
            auto handle = pickHandle(slot);
            if (handle)
            {
                ++handle->mOpenStreams;
                handle->mLastUsed = mClock.now();
                granted.emplace_back(std::move(slot.mWaiters.front()), handle);
                slot.mWaiters.pop_front();
                continue;
            }

            // Waiters that connections already being established will cover
            // do not need another one.
            uint64_t covered = static_cast<uint64_t>(slot.mPendingConnects) *
                               mConfig.MAX_STREAMS_PER_CONNECTION;
            if (slot.mWaiters.size() <= covered)
            {
                break;
            }

            auto admission = mAdmission.tryAdmitConnection(dest);
            if (admission ==
                AdmissionController::ConnectionAdmission::Admitted)
            {
                ++slot.mPendingConnects;
                ++toConnect;
                continue;
            }

            CLOG_TRACE(Pool, "No new connection to destination {}: {}", dest,
                       toString(admission));
            if (admission ==
                    AdmissionController::ConnectionAdmission::RateLimited &&
                slot.mHandles.empty() && slot.mPendingConnects == 0)
            {
                // Nothing will ever free up a stream slot for these.
                failure = AcquireError::RateLimited;
                failed.assign(std::make_move_iterator(slot.mWaiters.begin()),
                              std::make_move_iterator(slot.mWaiters.end()));
                slot.mWaiters.clear();
            }
            break;
        }
    }

    for (uint32_t i = 0; i < toConnect; ++i)
    {
        startConnect(dest);
    }
    for (auto& g : granted)
    {
        g.first(g.second, AcquireError::None);
    }
    for (auto& cb : failed)
    {
        cb(nullptr, failure);
    }
}

void
ConnectionPool::startConnect(DestinationIndex dest)
{
    auto const& d = mConfig.DESTINATIONS.at(dest);
    mMetrics.forDestination(dest).mConnectionAttempt.Mark();
    CLOG_DEBUG(Pool, "Opening connection to {} ({})", d.mName, d.toString());

    std::weak_ptr<ConnectionPool> weak = shared_from_this();
    mConnector.connect(
        d, mConfig.HANDSHAKE_TIMEOUT_MS,
        [weak, dest](QuicConnection::pointer conn, std::string const& error) {
            auto self = weak.lock();
            if (!self)
            {
                if (conn)
                {
                    conn->close("pool destroyed");
                }
                return;
            }
            self->connectFinished(dest, conn, error);
        });
}

void
ConnectionPool::connectFinished(DestinationIndex dest,
                                std::shared_ptr<QuicConnection> conn,
                                std::string const& error)
{
    auto const& d = mConfig.DESTINATIONS.at(dest);
    auto& slot = getSlot(dest);
    ConnectionHandle::pointer handle;
    std::vector<AcquireCallback> failed;
    std::string failReason = error;
    {
        MutexLocker lock(slot.mMutex);
        releaseAssert(slot.mPendingConnects > 0);
        --slot.mPendingConnects;

        if (conn && !mShuttingDown && conn->isClosed())
        {
            // Lost between handshake and this callback; its close handler
            // would never fire.
            failReason = "connection closed before it could be used";
        }
        else if (conn && !mShuttingDown)
        {
            uint32_t limit = std::min(conn->getMaxConcurrentStreams(),
                                      mConfig.MAX_STREAMS_PER_CONNECTION);
            if (limit == 0)
            {
                failReason = "peer allows no unidirectional streams";
            }
            else
            {
                handle = std::make_shared<ConnectionHandle>(
                    mNextHandleID++, dest, conn, mClock.now(), limit);
                slot.mHandles.emplace_back(handle);
            }
        }

        if (!handle && !mShuttingDown && slot.mHandles.empty() &&
            slot.mPendingConnects == 0)
        {
            failed.assign(std::make_move_iterator(slot.mWaiters.begin()),
                          std::make_move_iterator(slot.mWaiters.end()));
            slot.mWaiters.clear();
        }
    }

    if (!handle)
    {
        mAdmission.connectionClosed(dest);
        if (conn)
        {
            conn->close(mShuttingDown ? "shutting down" : failReason);
        }
        if (!mShuttingDown)
        {
            mMetrics.forDestination(dest).mConnectionHandshakeFailure.Mark();
            CLOG_WARNING(Pool, "Handshake with {} ({}) failed: {}", d.mName,
                         d.toString(), failReason);
            for (auto& cb : failed)
            {
                cb(nullptr, AcquireError::HandshakeFailed);
            }
            serveWaiters(dest);
        }
        return;
    }

    auto& metrics = mMetrics.forDestination(dest);
    metrics.mConnectionEstablished.Mark();
    metrics.mOpenConnections.inc();
    CLOG_INFO(Pool, "Connection {} to {} ({}) established, stream limit {}",
              handle->mID, d.mName, conn->getRemoteAddress(),
              handle->mStreamLimit);

    std::weak_ptr<ConnectionPool> weak = shared_from_this();
    std::weak_ptr<ConnectionHandle> weakHandle = handle;
    conn->setCloseHandler([weak, weakHandle](std::string const& reason) {
        auto self = weak.lock();
        auto h = weakHandle.lock();
        if (self && h)
        {
            CLOG_INFO(Pool, "Connection {} closed by peer: {}", h->getID(),
                      reason);
            self->evict(h, EvictionReason::PeerClosed);
        }
    });
    serveWaiters(dest);
}

void
ConnectionPool::release(ConnectionHandle::pointer const& handle)
{
    auto dest = handle->mDestination;
    {
        auto& slot = getSlot(dest);
        MutexLocker lock(slot.mMutex);
        releaseAssert(handle->mOpenStreams > 0);
        --handle->mOpenStreams;
        handle->mLastUsed = mClock.now();
    }
    serveWaiters(dest);
}

void
ConnectionPool::recordStreamSuccess(ConnectionHandle::pointer const& handle)
{
    auto& slot = getSlot(handle->mDestination);
    MutexLocker lock(slot.mMutex);
    if (handle->mHealth == ConnectionHealth::Dead)
    {
        return;
    }
    handle->mConsecutiveFailures = 0;
    handle->mHealth = ConnectionHealth::Healthy;
}

void
ConnectionPool::recordStreamFailure(ConnectionHandle::pointer const& handle)
{
    bool overThreshold;
    {
        auto& slot = getSlot(handle->mDestination);
        MutexLocker lock(slot.mMutex);
        if (handle->mHealth == ConnectionHealth::Dead)
        {
            return;
        }
        ++handle->mConsecutiveFailures;
        handle->mHealth = ConnectionHealth::Degraded;
        overThreshold =
            handle->mConsecutiveFailures >= mConfig.CONNECTION_ERROR_THRESHOLD;
    }
    if (overThreshold)
    {
        evict(handle, EvictionReason::ErrorThreshold);
    }
}

void
ConnectionPool::evict(ConnectionHandle::pointer const& handle,
                      EvictionReason reason)
{
    auto dest = handle->mDestination;
    {
        auto& slot = getSlot(dest);
        MutexLocker lock(slot.mMutex);
        if (handle->mHealth == ConnectionHealth::Dead)
        {
            return;
        }
        handle->mHealth = ConnectionHealth::Dead;
        auto it =
            std::find(slot.mHandles.begin(), slot.mHandles.end(), handle);
        releaseAssert(it != slot.mHandles.end());
        slot.mHandles.erase(it);
        ++slot.mEvictions;
    }

    mAdmission.connectionClosed(dest);
    auto& metrics = mMetrics.forDestination(dest);
    metrics.eviction(reason).Mark();
    metrics.mOpenConnections.dec();

    EvictionEvent ev{dest, reason,
                     std::chrono::duration_cast<std::chrono::milliseconds>(
                         mClock.now() - handle->mCreatedAt)};
    CLOG_INFO(Pool, "Evicted connection {} to {} after {} ms: {}",
              handle->mID, mConfig.DESTINATIONS.at(dest).mName,
              ev.mConnectionAge.count(), toString(reason));
    for (auto const& l : mEvictionListeners)
    {
        l(ev);
    }
    handle->mConnection->close(toString(reason));
    serveWaiters(dest);
}

size_t
ConnectionPool::sweepIdle()
{
    auto now = mClock.now();
    std::vector<ConnectionHandle::pointer> idle;
    for (auto& slot : mSlots)
    {
        MutexLocker lock(slot->mMutex);
        for (auto const& h : slot->mHandles)
        {
            if (h->mOpenStreams == 0 &&
                now - h->mLastUsed >= mConfig.CONNECTION_IDLE_TIMEOUT_MS)
            {
                idle.emplace_back(h);
            }
        }
    }
    for (auto const& h : idle)
    {
        evict(h, EvictionReason::IdleTimeout);
    }
    return idle.size();
}

void
ConnectionPool::closeAll(EvictionReason reason)
{
    mShuttingDown = true;
    for (DestinationIndex dest = 0; dest < mSlots.size(); ++dest)
    {
        std::vector<ConnectionHandle::pointer> handles;
        {
            auto& slot = getSlot(dest);
            MutexLocker lock(slot.mMutex);
            handles = slot.mHandles;
        }
        for (auto const& h : handles)
        {
            evict(h, reason);
        }
        serveWaiters(dest);
    }
}

void
ConnectionPool::addEvictionListener(EvictionListener listener)
{
    mEvictionListeners.emplace_back(std::move(listener));
}

std::vector<ConnectionHandle::pointer>
ConnectionPool::getHandles(DestinationIndex dest) const
{
    auto& slot = getSlot(dest);
    MutexLocker lock(slot.mMutex);
    return slot.mHandles;
}

size_t
ConnectionPool::getWaiterCount(DestinationIndex dest) const
{
    auto& slot = getSlot(dest);
    MutexLocker lock(slot.mMutex);
    return slot.mWaiters.size();
}

uint32_t
ConnectionPool::getPendingConnects(DestinationIndex dest) const
{
    auto& slot = getSlot(dest);
    MutexLocker lock(slot.mMutex);
    return slot.mPendingConnects;
}

uint64_t
ConnectionPool::getEvictionCount(DestinationIndex dest) const
{
    auto& slot = getSlot(dest);
    MutexLocker lock(slot.mMutex);
    return slot.mEvictions;
}

char const*
toString(AcquireError e)
{
    switch (e)
    {
    case AcquireError::None:
        return "none";
    case AcquireError::HandshakeFailed:
        return "handshake-failed";
    case AcquireError::RateLimited:
        return "rate-limited";
    case AcquireError::ShuttingDown:
        return "shutting-down";
    }
    return "unknown-acquire-error";
}
}
