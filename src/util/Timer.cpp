// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Timer.h"
#include "main/Application.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include <algorithm>
#include <chrono>

namespace tpuproxy
{

// Upper bounds on the IO completions, and on the posted actions, run in a
// single crank.
static const std::chrono::milliseconds CRANK_TIME_SLICE(500);
static const size_t CRANK_EVENT_SLICE = 100;

VirtualClock::VirtualClock(Mode mode) : mMode(mode), mRealTimer(mIOContext)
{
}

VirtualClock::~VirtualClock()
{
    mDestructing = true;
    auto events = std::move(mEvents);
    mEvents.clear();
    for (auto& kv : events)
    {
        kv.second(asio::error::operation_aborted);
    }
}

VirtualClock::time_point
VirtualClock::now() const noexcept
{
    return mMode == REAL_TIME ? std::chrono::steady_clock::now() : mVirtualNow;
}

VirtualClock::system_time_point
VirtualClock::system_now() const noexcept
{
    if (mMode == REAL_TIME)
    {
        return std::chrono::system_clock::now();
    }
    // Virtual time starts at the epoch.
    return system_time_point(
        std::chrono::duration_cast<system_time_point::duration>(
            mVirtualNow.time_since_epoch()));
}

std::time_t
VirtualClock::to_time_t(system_time_point point)
{
    return static_cast<std::time_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            point.time_since_epoch())
            .count());
}

asio::io_context&
VirtualClock::getIOContext()
{
    return mIOContext;
}

VirtualClock::EventKey
VirtualClock::schedule(time_point when, EventCallback cb)
{
    releaseAssert(threadIsMain());
    EventKey key{when, mNextSeq++};
    if (mDestructing)
    {
        return key;
    }
    mEvents.emplace(key, std::move(cb));
    armRealTimer();
    return key;
}

void
VirtualClock::unschedule(EventKey const& key)
{
    auto it = mEvents.find(key);
    if (it == mEvents.end())
    {
        return;
    }
    auto cb = std::move(it->second);
    mEvents.erase(it);
    cb(asio::error::operation_aborted);
}

size_t
VirtualClock::fireDueEvents()
{
    if (mDestructing)
    {
        return 0;
    }

    // Snapshot first: events scheduled by a callback for "now" wait for the
    // next crank.
    auto t = now();
    std::vector<EventKey> due;
    for (auto it = mEvents.begin(); it != mEvents.end() && it->first.first <= t;
         ++it)
    {
        due.emplace_back(it->first);
    }

    size_t fired = 0;
    for (auto const& key : due)
    {
        auto it = mEvents.find(key);
        if (it == mEvents.end())
        {
            // Cancelled by an earlier callback in this batch.
            continue;
        }
        auto cb = std::move(it->second);
        mEvents.erase(it);
        cb(asio::error_code());
        ++fired;
    }
    armRealTimer();
    return fired;
}

size_t
VirtualClock::jumpToNextEvent()
{
    releaseAssert(mMode == VIRTUAL_TIME);
    if (mDestructing || mEvents.empty())
    {
        return 0;
    }
    mVirtualNow = std::max(mVirtualNow, mEvents.begin()->first.first);
    return fireDueEvents();
}

void
VirtualClock::armRealTimer()
{
    if (mMode != REAL_TIME || mEvents.empty())
    {
        return;
    }
    auto next = mEvents.begin()->first.first;
    if (next == mRealTimer.expiry())
    {
        return;
    }
    mRealTimer.expires_at(next);
    mRealTimer.async_wait([this](asio::error_code const& ec) {
        if (ec == asio::error::operation_aborted)
        {
            // Re-armed; not progress.
            ++mRealTimerCancels;
        }
        else
        {
            fireDueEvents();
        }
    });
}

size_t
VirtualClock::runOneAction()
{
    PostedAction action;
    {
        MutexLocker lock(mActionsMutex);
        if (mActions.empty())
        {
            return 0;
        }
        action = std::move(mActions.front());
        mActions.pop_front();
    }
    CLOG_TRACE(Main, "Running action '{}'", action.mName);
    action.mAction();
    return 1;
}

static size_t
runSlice(VirtualClock& clock, std::function<size_t()> const& step)
{
    auto deadline = clock.now() + CRANK_TIME_SLICE;
    size_t total = 0;
    for (size_t i = 0; i < CRANK_EVENT_SLICE && clock.now() < deadline; ++i)
    {
        auto n = step();
        if (n == 0)
        {
            break;
        }
        total += n;
    }
    return total;
}

size_t
VirtualClock::crank(bool block)
{
    if (mDestructing)
    {
        return 0;
    }

    size_t progress = 0;
    {
        std::lock_guard<std::recursive_mutex> guard(mDispatchMutex);
        mDispatching = true;
        mRealTimerCancels = 0;

        if (mMode == REAL_TIME)
        {
            progress += fireDueEvents();
        }
        progress += runSlice(*this, [this]() { return mIOContext.poll_one(); });
        progress += runSlice(*this, [this]() { return runOneAction(); });
        progress -= std::min(progress, mRealTimerCancels);

        // Idle in virtual time: skip ahead to the next deadline.
        if (mMode == VIRTUAL_TIME && progress == 0)
        {
            progress += jumpToNextEvent();
        }
        mDispatching = false;
    }

    // From here on other threads may post work for the next crank.
    if (block && progress == 0)
    {
        progress += mIOContext.run_one();
    }
    return progress;
}

void
VirtualClock::postAction(std::function<void()>&& f, std::string&& name)
{
    {
        MutexLocker lock(mActionsMutex);
        mActions.push_back(PostedAction{std::move(name), std::move(f)});
    }
    std::lock_guard<std::recursive_mutex> guard(mDispatchMutex);
    if (!mDispatching)
    {
        // The main thread may be parked in run_one(); an empty handler wakes
        // it up so the next crank picks up the action.
        mDispatching = true;
        asio::post(mIOContext, []() {});
    }
}

size_t
VirtualClock::getActionQueueSize() const
{
    MutexLocker lock(mActionsMutex);
    return mActions.size();
}

VirtualTimer::VirtualTimer(Application& app) : VirtualTimer(app.getClock())
{
}

VirtualTimer::VirtualTimer(VirtualClock& clock)
    : mClock(clock), mExpiry(clock.now())
{
}

VirtualTimer::~VirtualTimer()
{
    cancel();
}

void
VirtualTimer::cancel()
{
    mCancelled = true;
    auto pending = std::move(mPending);
    mPending.clear();
    for (auto const& key : pending)
    {
        mClock.unschedule(key);
    }
}

void
VirtualTimer::expires_from_now(VirtualClock::duration d)
{
    cancel();
    mExpiry = mClock.now() + d;
    mCancelled = false;
}

void
VirtualTimer::async_wait(std::function<void(asio::error_code)> const& fn)
{
    if (mCancelled)
    {
        return;
    }
    mPending.emplace_back(mClock.schedule(mExpiry, fn));
}

void
VirtualTimer::async_wait(std::function<void()> const& onSuccess,
                         std::function<void(asio::error_code)> const& onFailure)
{
    async_wait([onSuccess, onFailure](asio::error_code ec) {
        if (ec)
        {
            onFailure(ec);
        }
        else
        {
            onSuccess();
        }
    });
}
}
