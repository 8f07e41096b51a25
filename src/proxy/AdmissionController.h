#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"
#include "util/ThreadAnnotations.h"
#include "util/Timer.h"

#include <deque>
#include <memory>
#include <vector>

namespace tpuproxy
{

class Config;

/**
 * Self-imposed per-destination limits that mirror what a validator enforces
 * on the proxy's identity: a stream quota derived from stake weight and a
 * cap on concurrent connections and on connection attempts per minute.
 *
 * Each destination's Quota State sits behind its own mutex, so admission for
 * one destination never contends with another. Every successful tryAdmit
 * must be paired with exactly one release, and every Admitted
 * tryAdmitConnection with exactly one connectionClosed.
 */
class AdmissionController
{
  public:
    enum class ConnectionAdmission
    {
        Admitted,
        TooManyConnections,
        RateLimited
    };

  private:
    struct QuotaState
    {
        Mutex mMutex;
        uint32_t const mQuota;
        uint32_t mInFlight GUARDED_BY(mMutex){0};
        uint32_t mOpenConnections GUARDED_BY(mMutex){0};
        std::deque<VirtualClock::time_point>
            mConnectionAttempts GUARDED_BY(mMutex);

        explicit QuotaState(uint32_t quota) : mQuota(quota)
        {
        }
    };

    VirtualClock& mClock;
    uint32_t const mMaxConnections;
    uint32_t const mMaxAttemptsPerMinute;
    std::vector<std::unique_ptr<QuotaState>> mStates;

    QuotaState& getState(DestinationIndex dest) const;

  public:
    AdmissionController(VirtualClock& clock, Config const& cfg);

    // Stream quota for `dest`: the validator-side stake formula, clamped to
    // the configured staked bounds, then capped by
    // MAX_CONCURRENT_STREAMS_PER_DESTINATION when that is non-zero.
    static uint32_t computeStreamQuota(Config const& cfg,
                                       Destination const& dest,
                                       uint64_t totalStake);

    // Takes one stream slot if the destination is below its quota.
    bool tryAdmit(DestinationIndex dest);
    void release(DestinationIndex dest);

    // Takes one connection slot if both the concurrent connection cap and
    // the one-minute attempt window allow it. Every admitted attempt counts
    // against the window, whether or not the handshake succeeds.
    ConnectionAdmission tryAdmitConnection(DestinationIndex dest);
    void connectionClosed(DestinationIndex dest);

    uint32_t getQuota(DestinationIndex dest) const;
    uint32_t getInFlight(DestinationIndex dest) const;
    uint32_t getOpenConnections(DestinationIndex dest) const;
    size_t
    getDestinationCount() const
    {
        return mStates.size();
    }
};

char const* toString(AdmissionController::ConnectionAdmission a);
}
