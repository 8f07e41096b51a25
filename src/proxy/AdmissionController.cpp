// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/AdmissionController.h"
#include "main/Config.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include <algorithm>

namespace tpuproxy
{

namespace
{
std::chrono::seconds const CONNECTION_RATE_WINDOW(60);
}

AdmissionController::AdmissionController(VirtualClock& clock,
                                         Config const& cfg)
    : mClock(clock)
    , mMaxConnections(cfg.MAX_CONNECTIONS_PER_DESTINATION)
    , mMaxAttemptsPerMinute(cfg.MAX_CONNECTION_ATTEMPTS_PER_MINUTE)
{
    auto totalStake = cfg.totalStake();
    for (auto const& d : cfg.DESTINATIONS)
    {
        auto quota = computeStreamQuota(cfg, d, totalStake);
        CLOG_INFO(Admission, "Destination {} ({}): stake {}, stream quota {}",
                  d.mName, d.toString(), d.mStake, quota);
        mStates.emplace_back(std::make_unique<QuotaState>(quota));
    }
}

uint32_t
AdmissionController::computeStreamQuota(Config const& cfg,
                                        Destination const& dest,
                                        uint64_t totalStake)
{
    uint64_t quota;
    if (dest.mStake == 0 || totalStake == 0)
    {
        quota = cfg.UNSTAKED_CONCURRENT_STREAMS;
    }
    else
    {
        // stake * TOTAL overflows 64 bits for lamport-scale stakes.
        unsigned __int128 share =
            static_cast<unsigned __int128>(cfg.TOTAL_STAKED_CONCURRENT_STREAMS) *
            dest.mStake / totalStake;
        quota = static_cast<uint64_t>(
            std::min<unsigned __int128>(share, UINT64_MAX));
        quota = std::max<uint64_t>(quota, cfg.MIN_STAKED_CONCURRENT_STREAMS);
        quota = std::min<uint64_t>(quota, cfg.MAX_STAKED_CONCURRENT_STREAMS);
    }
    if (cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION != 0)
    {
        quota =
            std::min<uint64_t>(quota, cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION);
    }
    return static_cast<uint32_t>(quota);
}

AdmissionController::QuotaState&
AdmissionController::getState(DestinationIndex dest) const
{
    releaseAssert(dest < mStates.size());
    return *mStates[dest];
}

bool
AdmissionController::tryAdmit(DestinationIndex dest)
{
    auto& s = getState(dest);
    MutexLocker lock(s.mMutex);
    if (s.mInFlight >= s.mQuota)
    {
        return false;
    }
    ++s.mInFlight;
    return true;
}

void
AdmissionController::release(DestinationIndex dest)
{
    auto& s = getState(dest);
    MutexLocker lock(s.mMutex);
    releaseAssert(s.mInFlight > 0);
    --s.mInFlight;
}

AdmissionController::ConnectionAdmission
AdmissionController::tryAdmitConnection(DestinationIndex dest)
{
    auto& s = getState(dest);
    auto now = mClock.now();
    MutexLocker lock(s.mMutex);
    while (!s.mConnectionAttempts.empty() &&
           now - s.mConnectionAttempts.front() >= CONNECTION_RATE_WINDOW)
    {
        s.mConnectionAttempts.pop_front();
    }
    if (s.mOpenConnections >= mMaxConnections)
    {
        return ConnectionAdmission::TooManyConnections;
    }
    if (s.mConnectionAttempts.size() >= mMaxAttemptsPerMinute)
    {
        return ConnectionAdmission::RateLimited;
    }
    s.mConnectionAttempts.emplace_back(now);
    ++s.mOpenConnections;
    return ConnectionAdmission::Admitted;
}

void
AdmissionController::connectionClosed(DestinationIndex dest)
{
    auto& s = getState(dest);
    MutexLocker lock(s.mMutex);
    releaseAssert(s.mOpenConnections > 0);
    --s.mOpenConnections;
}

uint32_t
AdmissionController::getQuota(DestinationIndex dest) const
{
    return getState(dest).mQuota;
}

uint32_t
AdmissionController::getInFlight(DestinationIndex dest) const
{
    auto& s = getState(dest);
    MutexLocker lock(s.mMutex);
    return s.mInFlight;
}

uint32_t
AdmissionController::getOpenConnections(DestinationIndex dest) const
{
    auto& s = getState(dest);
    MutexLocker lock(s.mMutex);
    return s.mOpenConnections;
}

char const*
toString(AdmissionController::ConnectionAdmission a)
{
    switch (a)
    {
    case AdmissionController::ConnectionAdmission::Admitted:
        return "admitted";
    case AdmissionController::ConnectionAdmission::TooManyConnections:
        return "too-many-connections";
    case AdmissionController::ConnectionAdmission::RateLimited:
        return "rate-limited";
    }
    return "unknown-connection-admission";
}
}
