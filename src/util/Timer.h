#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// ASIO is somewhat particular about when it gets included -- it wants to be the
// first to include <windows.h> -- so we try to include it before everything
// else.
#include "util/asio.h"
#include "util/ThreadAnnotations.h"

#include <chrono>
#include <ctime>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace tpuproxy
{

/**
 * Timing service for the proxy. Every timeout in the system (handshake,
 * stream, retry backoff, idle sweep, shutdown grace) is measured on a
 * VirtualClock rather than the wall clock.
 *
 * In REAL_TIME mode the clock follows std::chrono::steady_clock and crank()
 * sleeps until the next timer or IO completion. In VIRTUAL_TIME mode crank()
 * drains pending IO and posted actions, and when there is nothing left to do
 * it jumps straight to the next scheduled timer. Tests use VIRTUAL_TIME so
 * that a "1 second stream timeout" costs nothing to exercise.
 */

class Application;
class VirtualTimer;

class VirtualClock
{
  public:
    typedef std::chrono::steady_clock::duration duration;
    typedef duration::rep rep;
    typedef duration::period period;
    typedef std::chrono::steady_clock::time_point time_point;
    static const bool is_steady = true;

    // Wall/calendar time, used only for log output and certificate validity.
    typedef std::chrono::system_clock::time_point system_time_point;

    static std::time_t to_time_t(system_time_point);

    enum Mode
    {
        REAL_TIME,
        VIRTUAL_TIME
    };

  private:
    friend class VirtualTimer;

    // Events fire in deadline order, ties in scheduling order.
    typedef std::pair<time_point, uint64_t> EventKey;
    typedef std::function<void(asio::error_code)> EventCallback;

    asio::io_context mIOContext;
    Mode const mMode;
    time_point mVirtualNow;

    std::map<EventKey, EventCallback> mEvents;
    uint64_t mNextSeq{0};
    size_t mRealTimerCancels{0};
    bool mDestructing{false};

    std::recursive_mutex mDispatchMutex;
    bool mDispatching{true};

    // Actions handed over with postAction, possibly from other threads.
    struct PostedAction
    {
        std::string mName;
        std::function<void()> mAction;
    };
    mutable Mutex mActionsMutex;
    std::deque<PostedAction> mActions GUARDED_BY(mActionsMutex);

    EventKey schedule(time_point when, EventCallback cb);
    // Runs the callback of `key` with operation_aborted, if still pending.
    void unschedule(EventKey const& key);

    size_t fireDueEvents();
    size_t jumpToNextEvent();
    size_t runOneAction();
    void armRealTimer();

    // Declared last so that it is destroyed first.
    asio::steady_timer mRealTimer;

  public:
    explicit VirtualClock(Mode mode = VIRTUAL_TIME);
    ~VirtualClock();
    VirtualClock(VirtualClock const&) = delete;
    VirtualClock& operator=(VirtualClock const&) = delete;

    // Dispatches due timers, some IO completions and some posted actions.
    // Returns the amount of work done; with `block` set and nothing to do,
    // waits for one IO event.
    size_t crank(bool block = true);

    asio::io_context& getIOContext();
    Mode
    getMode() const
    {
        return mMode;
    }

    // Not a static method: each virtual clock has its own time.
    time_point now() const noexcept;
    system_time_point system_now() const noexcept;

    // Thread-safe: queues `f` to run on the main thread during a later crank
    // and wakes up a blocked crank if needed.
    void postAction(std::function<void()>&& f, std::string&& name);
    size_t getActionQueueSize() const;
};

/**
 * One-shot timer on a VirtualClock. Every async_wait registered since the
 * last expires_from_now() fires at the same deadline; cancel(), re-arming
 * and destruction deliver operation_aborted to whatever has not fired yet.
 */
class VirtualTimer
{
    VirtualClock& mClock;
    VirtualClock::time_point mExpiry;
    std::vector<VirtualClock::EventKey> mPending;
    bool mCancelled{false};

  public:
    explicit VirtualTimer(Application& app);
    explicit VirtualTimer(VirtualClock& clock);
    ~VirtualTimer();
    VirtualTimer(VirtualTimer const&) = delete;
    VirtualTimer& operator=(VirtualTimer const&) = delete;

    void expires_from_now(VirtualClock::duration d);
    template <typename R, typename P>
    void
    expires_from_now(std::chrono::duration<R, P> const& d)
    {
        expires_from_now(std::chrono::duration_cast<VirtualClock::duration>(d));
    }

    // Ignored after cancel() until the next expires_from_now().
    void async_wait(std::function<void(asio::error_code)> const& fn);
    void async_wait(std::function<void()> const& onSuccess,
                    std::function<void(asio::error_code)> const& onFailure);
    void cancel();

    static void onFailureNoop(asio::error_code const&){};
};
}
