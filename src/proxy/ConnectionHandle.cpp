// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ConnectionHandle.h"

namespace tpuproxy
{

ConnectionHandle::ConnectionHandle(uint64_t id, DestinationIndex destination,
                                   QuicConnection::pointer connection,
                                   VirtualClock::time_point now,
                                   uint32_t streamLimit)
    : mID(id)
    , mDestination(destination)
    , mConnection(std::move(connection))
    , mCreatedAt(now)
    , mLastUsed(now)
    , mStreamLimit(streamLimit)
{
}

bool
ConnectionHandle::hasSpareCapacity() const
{
    return mHealth != ConnectionHealth::Dead && !mConnection->isClosed() &&
           mOpenStreams < mStreamLimit;
}

char const*
toString(ConnectionHealth h)
{
    switch (h)
    {
    case ConnectionHealth::Healthy:
        return "healthy";
    case ConnectionHealth::Degraded:
        return "degraded";
    case ConnectionHealth::Dead:
        return "dead";
    }
    return "unknown-health";
}

char const*
toString(EvictionReason r)
{
    switch (r)
    {
    case EvictionReason::IdleTimeout:
        return "idle-timeout";
    case EvictionReason::ErrorThreshold:
        return "error-threshold";
    case EvictionReason::PeerClosed:
        return "peer-closed";
    case EvictionReason::WriteFailure:
        return "write-failure";
    case EvictionReason::Shutdown:
        return "shutdown";
    }
    return "unknown-eviction-reason";
}
}
