// Copyright 2016 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "test/TestUtils.h"
#include "util/GlobalChecks.h"
#include "util/Math.h"

#include <stdexcept>

namespace tpuproxy
{

namespace testutil
{
void
crankSome(VirtualClock& clock)
{
    auto start = clock.now();
    for (size_t i = 0;
         (i < 100 && clock.now() < (start + std::chrono::seconds(1)) &&
          clock.crank(false) > 0);
         ++i)
        ;
}

void
crankFor(VirtualClock& clock, VirtualClock::duration duration)
{
    auto start = clock.now();
    while (clock.now() < (start + duration) && clock.crank(false) > 0)
        ;
}

bool
crankUntil(VirtualClock& clock, std::function<bool()> const& predicate,
           VirtualClock::duration timeout)
{
    auto start = clock.now();
    while (!predicate())
    {
        if (clock.now() - start > timeout)
        {
            break;
        }
        if (clock.crank(false) == 0 &&
            clock.getMode() == VirtualClock::VIRTUAL_TIME)
        {
            // Nothing scheduled at all; time will not move on its own.
            break;
        }
    }
    return predicate();
}

bool
crankUntil(Application& app, std::function<bool()> const& predicate,
           VirtualClock::duration timeout)
{
    return crankUntil(app.getClock(), predicate, timeout);
}

void
advanceTime(VirtualClock& clock, VirtualClock::duration duration)
{
    bool fired = false;
    VirtualTimer timer(clock);
    timer.expires_from_now(duration);
    timer.async_wait([&fired]() { fired = true; },
                     VirtualTimer::onFailureNoop);
    while (!fired)
    {
        clock.crank(true);
    }
}

Blob
makePayload(size_t size, uint8_t fill)
{
    return Blob(size, fill);
}

Blob
makeRandomPayload(size_t size)
{
    Blob res(size);
    for (auto& b : res)
    {
        b = static_cast<uint8_t>(rand_uniform<unsigned int>(0, 255));
    }
    return res;
}
}

OutcomeCallback
OutcomeRecorder::callback()
{
    return [this](ForwardOutcome const& o) {
        ++mCalls;
        mOutcomes[o.mRequestID] = o;
    };
}

size_t
OutcomeRecorder::count(RequestState state) const
{
    size_t n = 0;
    for (auto const& kv : mOutcomes)
    {
        if (kv.second.mState == state)
        {
            ++n;
        }
    }
    return n;
}

size_t
OutcomeRecorder::count(DropReason reason) const
{
    size_t n = 0;
    for (auto const& kv : mOutcomes)
    {
        if (kv.second.mReason && *kv.second.mReason == reason)
        {
            ++n;
        }
    }
    return n;
}

ForwardOutcome const&
OutcomeRecorder::get(uint64_t requestID) const
{
    auto it = mOutcomes.find(requestID);
    if (it == mOutcomes.end())
    {
        throw std::out_of_range("no outcome recorded for request");
    }
    return it->second;
}

std::vector<ForwardOutcome>
OutcomeRecorder::all() const
{
    std::vector<ForwardOutcome> res;
    for (auto const& kv : mOutcomes)
    {
        res.emplace_back(kv.second);
    }
    return res;
}

LoopbackValidators::LoopbackValidators(VirtualClock& clock, Config const& cfg)
    : mConnector(clock)
{
    for (auto const& d : cfg.DESTINATIONS)
    {
        mListeners.emplace_back(mConnector.listen(d));
    }
}

Application::pointer
createTestApplication(
    VirtualClock& clock, Config const& cfg,
    std::vector<std::shared_ptr<LoopbackQuicListener>>& listeners)
{
    auto connector = std::make_unique<LoopbackQuicConnector>(clock);
    listeners.clear();
    for (auto const& d : cfg.DESTINATIONS)
    {
        listeners.emplace_back(connector->listen(d));
    }
    return Application::create(clock, cfg, std::move(connector));
}
}
