#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"
#include "transport/QuicConnection.h"
#include "util/Timer.h"

#include <chrono>
#include <memory>

namespace tpuproxy
{

enum class ConnectionHealth
{
    Healthy,
    Degraded,
    Dead
};

enum class EvictionReason
{
    IdleTimeout,
    ErrorThreshold,
    PeerClosed,
    WriteFailure,
    Shutdown
};

char const* toString(ConnectionHealth h);
char const* toString(EvictionReason r);

struct EvictionEvent
{
    DestinationIndex mDestination;
    EvictionReason mReason;
    std::chrono::milliseconds mConnectionAge;
};

/**
 * One live QUIC session in the ConnectionPool. Everything mutable about a
 * handle (stream count, health, last use) is changed only by the pool, under
 * the lock of the handle's destination; forwarding code borrows the handle
 * for exactly one stream between ConnectionPool::acquire and
 * ConnectionPool::release.
 */
class ConnectionHandle
{
  public:
    typedef std::shared_ptr<ConnectionHandle> pointer;

  private:
    friend class ConnectionPool;

    uint64_t const mID;
    DestinationIndex const mDestination;
    QuicConnection::pointer const mConnection;
    VirtualClock::time_point const mCreatedAt;
    VirtualClock::time_point mLastUsed;
    uint32_t mOpenStreams{0};
    uint32_t const mStreamLimit;
    uint32_t mConsecutiveFailures{0};
    ConnectionHealth mHealth{ConnectionHealth::Healthy};

  public:
    ConnectionHandle(uint64_t id, DestinationIndex destination,
                     QuicConnection::pointer connection,
                     VirtualClock::time_point now, uint32_t streamLimit);

    uint64_t
    getID() const
    {
        return mID;
    }
    DestinationIndex
    getDestination() const
    {
        return mDestination;
    }
    QuicConnection::pointer const&
    getConnection() const
    {
        return mConnection;
    }
    VirtualClock::time_point
    getCreatedAt() const
    {
        return mCreatedAt;
    }
    VirtualClock::time_point
    getLastUsed() const
    {
        return mLastUsed;
    }
    uint32_t
    getOpenStreams() const
    {
        return mOpenStreams;
    }
    uint32_t
    getStreamLimit() const
    {
        return mStreamLimit;
    }
    uint32_t
    getConsecutiveFailures() const
    {
        return mConsecutiveFailures;
    }
    ConnectionHealth
    getHealth() const
    {
        return mHealth;
    }

    bool hasSpareCapacity() const;
};
}
