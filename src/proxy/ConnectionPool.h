#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ConnectionHandle.h"
#include "proxy/Destination.h"
#include "util/ThreadAnnotations.h"
#include "util/Timer.h"

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tpuproxy
{

class AdmissionController;
class Config;
class ProxyMetrics;
class QuicConnector;

enum class AcquireError
{
    None,
    HandshakeFailed,
    RateLimited,
    ShuttingDown
};

char const* toString(AcquireError e);

/**
 * Owns every QUIC connection the proxy has open, grouped per destination.
 *
 * acquire() hands out one stream slot on a handle: a Healthy handle with
 * spare capacity if there is one, else a Degraded one with spare capacity,
 * else it asks the AdmissionController for a new connection and waits for
 * its handshake. Requests that cannot be served yet (every handle saturated
 * and no new connection allowed) wait in FIFO order and are served as soon
 * as a stream slot is released or a handshake completes; a waiter is failed
 * only when no connection is live or pending.
 *
 * Each destination slot has its own mutex. Callbacks are never invoked with
 * a slot lock held.
 */
class ConnectionPool : public std::enable_shared_from_this<ConnectionPool>
{
  public:
    typedef std::function<void(ConnectionHandle::pointer, AcquireError)>
        AcquireCallback;
    typedef std::function<void(EvictionEvent const&)> EvictionListener;

  private:
    struct Slot
    {
        Mutex mMutex;
        std::vector<ConnectionHandle::pointer> mHandles GUARDED_BY(mMutex);
        std::deque<AcquireCallback> mWaiters GUARDED_BY(mMutex);
        uint32_t mPendingConnects GUARDED_BY(mMutex){0};
        uint64_t mEvictions GUARDED_BY(mMutex){0};
    };

    VirtualClock& mClock;
    Config const& mConfig;
    QuicConnector& mConnector;
    AdmissionController& mAdmission;
    ProxyMetrics& mMetrics;
    std::vector<std::unique_ptr<Slot>> mSlots;
    std::vector<EvictionListener> mEvictionListeners;
    uint64_t mNextHandleID{1};
    bool mShuttingDown{false};

    Slot& getSlot(DestinationIndex dest) const;
    ConnectionHandle::pointer pickHandle(Slot& slot) REQUIRES(slot.mMutex);
    void serveWaiters(DestinationIndex dest);
    void startConnect(DestinationIndex dest);
    void connectFinished(DestinationIndex dest,
                         std::shared_ptr<QuicConnection> conn,
                         std::string const& error);

  public:
    ConnectionPool(VirtualClock& clock, Config const& cfg,
                   QuicConnector& connector, AdmissionController& admission,
                   ProxyMetrics& metrics);
    ~ConnectionPool();

    // Resolves exactly once, never from inside this call for a handle that
    // still needs a handshake. On success the handle's open-stream count
    // already includes the caller's stream.
    void acquire(DestinationIndex dest, AcquireCallback callback);

    // Returns the stream slot taken by acquire.
    void release(ConnectionHandle::pointer const& handle);

    void recordStreamSuccess(ConnectionHandle::pointer const& handle);
    // Counts a failed stream open; CONNECTION_ERROR_THRESHOLD consecutive
    // failures evict the handle.
    void recordStreamFailure(ConnectionHandle::pointer const& handle);

    // Marks the handle Dead, removes it and closes its connection. Evicting
    // a Dead handle does nothing.
    void evict(ConnectionHandle::pointer const& handle, EvictionReason reason);

    // Evicts handles with no open stream that have been unused for longer
    // than CONNECTION_IDLE_TIMEOUT_MS.
    size_t sweepIdle();

    // Evicts everything and fails all waiters with ShuttingDown; later
    // acquire calls fail the same way.
    void closeAll(EvictionReason reason);

    void addEvictionListener(EvictionListener listener);

    std::vector<ConnectionHandle::pointer>
    getHandles(DestinationIndex dest) const;
    size_t getWaiterCount(DestinationIndex dest) const;
    uint32_t getPendingConnects(DestinationIndex dest) const;
    uint64_t getEvictionCount(DestinationIndex dest) const;
};
}
