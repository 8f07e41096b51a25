#pragma once

// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Application.h"
#include "main/Config.h"
#include "proxy/ForwardRequest.h"
#include "transport/LoopbackQuic.h"
#include "util/Timer.h"

#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace tpuproxy
{

namespace testutil
{
void crankSome(VirtualClock& clock);
void crankFor(VirtualClock& clock, VirtualClock::duration duration);
// Cranks until `predicate` holds or `timeout` of clock time has passed;
// returns the final value of `predicate`.
bool crankUntil(VirtualClock& clock, std::function<bool()> const& predicate,
                VirtualClock::duration timeout);
bool crankUntil(Application& app, std::function<bool()> const& predicate,
                VirtualClock::duration timeout);

// Runs everything scheduled within the next `duration` of clock time and
// leaves the clock exactly that far ahead.
void advanceTime(VirtualClock& clock, VirtualClock::duration duration);

Blob makePayload(size_t size, uint8_t fill = 0xab);
// Bytes drawn from the global test PRNG, reseeded per test case.
Blob makeRandomPayload(size_t size);
}

// Collects the terminal outcome of every request a test submits.
class OutcomeRecorder
{
    std::map<uint64_t, ForwardOutcome> mOutcomes;
    size_t mCalls{0};

  public:
    OutcomeCallback callback();

    size_t
    size() const
    {
        return mOutcomes.size();
    }
    // Number of callback invocations; equals size() unless some request was
    // notified twice.
    size_t
    calls() const
    {
        return mCalls;
    }
    size_t count(RequestState state) const;
    size_t count(DropReason reason) const;
    ForwardOutcome const& get(uint64_t requestID) const;
    std::vector<ForwardOutcome> all() const;
};

// A loopback connector plus one listener per configured destination, all
// driven by `clock`.
struct LoopbackValidators
{
    LoopbackQuicConnector mConnector;
    std::vector<std::shared_ptr<LoopbackQuicListener>> mListeners;

    LoopbackValidators(VirtualClock& clock, Config const& cfg);
};

// Builds an Application over a LoopbackQuicConnector whose listeners are
// handed back through `listeners`.
Application::pointer createTestApplication(
    VirtualClock& clock, Config const& cfg,
    std::vector<std::shared_ptr<LoopbackQuicListener>>& listeners);
}
