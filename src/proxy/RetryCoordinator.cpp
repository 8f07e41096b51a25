// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/RetryCoordinator.h"
#include "main/Config.h"
#include "proxy/AdmissionController.h"
#include "proxy/ProxyMetrics.h"
#include "proxy/StreamForwarder.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include "util/Math.h"

#include "medida/counter.h"
#include "medida/meter.h"

namespace tpuproxy
{

RetryCoordinator::RetryCoordinator(VirtualClock& clock, Config const& cfg,
                                   AdmissionController& admission,
                                   ConnectionPool& pool,
                                   StreamForwarder& forwarder,
                                   ProxyMetrics& metrics)
    : mClock(clock)
    , mConfig(cfg)
    , mAdmission(admission)
    , mPool(pool)
    , mForwarder(forwarder)
    , mMetrics(metrics)
    , mQueues(cfg.DESTINATIONS.size())
{
}

void
RetryCoordinator::schedule(ForwardRequest::pointer const& req)
{
    releaseAssert(threadIsMain());
    releaseAssert(!isTerminal(req->mState));

    auto dest = req->mDestination;
    if (req->mAttempts == 0)
    {
        req->mEnqueuedAt = mClock.now();
    }
    if (dest >= mQueues.size())
    {
        finish(req, RequestState::Dropped, DropReason::UnknownDestination);
        return;
    }
    if (mShuttingDown)
    {
        finish(req, RequestState::Dropped, DropReason::ShuttingDown);
        return;
    }
    if (req->mPayload.size() > mConfig.MAX_PAYLOAD_SIZE)
    {
        finish(req, RequestState::Dropped, DropReason::PayloadTooLarge);
        return;
    }

    // Requests already waiting go first.
    if (!mQueues[dest].empty())
    {
        enqueue(req);
        pump(dest);
        return;
    }
    if (mAdmission.tryAdmit(dest))
    {
        start(req);
        return;
    }
    mMetrics.forDestination(dest).mRequestRejected.Mark();
    enqueue(req);
}

void
RetryCoordinator::enqueue(ForwardRequest::pointer const& req)
{
    auto dest = req->mDestination;
    if (!mConfig.QUEUE_ON_SATURATION || mConfig.INBOUND_QUEUE_CAPACITY == 0)
    {
        finish(req, RequestState::Dropped, DropReason::DestinationSaturated);
        return;
    }

    auto& q = mQueues[dest];
    if (q.size() >= mConfig.INBOUND_QUEUE_CAPACITY)
    {
        auto oldest = q.front();
        q.pop_front();
        finish(oldest, RequestState::Dropped, DropReason::QueueOverflow);
    }
    req->mState = RequestState::Queued;
    q.emplace_back(req);
    mMetrics.forDestination(dest).mRequestQueued.Mark();
}

void
RetryCoordinator::pump(DestinationIndex dest)
{
    if (mShuttingDown)
    {
        return;
    }
    auto& q = mQueues[dest];
    while (!q.empty() && mAdmission.tryAdmit(dest))
    {
        auto req = q.front();
        q.pop_front();
        start(req);
    }
}

void
RetryCoordinator::start(ForwardRequest::pointer const& req)
{
    auto dest = req->mDestination;
    req->mState = RequestState::Admitted;
    ++req->mAttempts;
    mActive[req->mID] = req;

    auto& metrics = mMetrics.forDestination(dest);
    metrics.mRequestAdmitted.Mark();
    metrics.mInFlightStreams.inc();
    CLOG_TRACE(Retry, "Request {} admitted for attempt {}", req->mID,
               req->mAttempts);

    std::weak_ptr<RetryCoordinator> weak = shared_from_this();
    mPool.acquire(dest, [weak, req](ConnectionHandle::pointer handle,
                                    AcquireError err) {
        auto self = weak.lock();
        if (self)
        {
            self->onAcquired(req, handle, err);
        }
    });
}

void
RetryCoordinator::streamFinished(ForwardRequest::pointer const& req)
{
    mAdmission.release(req->mDestination);
    mMetrics.forDestination(req->mDestination).mInFlightStreams.dec();
}

void
RetryCoordinator::onAcquired(ForwardRequest::pointer const& req,
                             ConnectionHandle::pointer const& handle,
                             AcquireError err)
{
    auto dest = req->mDestination;
    if (err != AcquireError::None || isTerminal(req->mState))
    {
        if (handle)
        {
            mPool.release(handle);
        }
        streamFinished(req);
        if (!isTerminal(req->mState))
        {
            mActive.erase(req->mID);
            if (err == AcquireError::ShuttingDown)
            {
                finish(req, RequestState::Dropped, DropReason::ShuttingDown);
            }
            else
            {
                CLOG_DEBUG(Retry, "Request {} got no connection: {}",
                           req->mID, toString(err));
                retryOrDrop(req);
            }
        }
        pump(dest);
        maybeDrained();
        return;
    }

    req->mState = RequestState::Forwarding;
    std::weak_ptr<RetryCoordinator> weak = shared_from_this();
    mForwarder.forward(handle, req->mPayload,
                       [weak, req, handle](ForwardResult result) {
                           auto self = weak.lock();
                           if (self)
                           {
                               self->onForwarded(req, handle, result);
                           }
                       });
}

void
RetryCoordinator::onForwarded(ForwardRequest::pointer const& req,
                              ConnectionHandle::pointer const& handle,
                              ForwardResult result)
{
    switch (result)
    {
    case ForwardResult::Sent:
        mPool.recordStreamSuccess(handle);
        break;
    case ForwardResult::OpenRefused:
    case ForwardResult::TimedOut:
        mPool.recordStreamFailure(handle);
        break;
    case ForwardResult::WriteFailed:
        mPool.evict(handle, EvictionReason::WriteFailure);
        break;
    case ForwardResult::ConnectionClosed:
        mPool.evict(handle, EvictionReason::PeerClosed);
        break;
    case ForwardResult::PayloadTooLarge:
        break;
    }
    mPool.release(handle);
    streamFinished(req);

    if (!isTerminal(req->mState))
    {
        mActive.erase(req->mID);
        switch (classify(result))
        {
        case Classification::Success:
            finish(req, RequestState::Succeeded, std::nullopt);
            break;
        case Classification::Permanent:
            finish(req, RequestState::Dropped, DropReason::PayloadTooLarge);
            break;
        default:
            CLOG_DEBUG(Retry, "Request {} attempt {} failed: {} ({})",
                       req->mID, req->mAttempts, toString(result),
                       toString(classify(result)));
            retryOrDrop(req);
            break;
        }
    }
    pump(req->mDestination);
    maybeDrained();
}

void
RetryCoordinator::retryOrDrop(ForwardRequest::pointer const& req)
{
    if (mShuttingDown)
    {
        finish(req, RequestState::Dropped, DropReason::ShuttingDown);
        return;
    }
    if (req->mAttempts >= mConfig.MAX_RETRY_ATTEMPTS)
    {
        finish(req, RequestState::Dropped, DropReason::RetriesExhausted);
        return;
    }

    req->mState = RequestState::Retrying;
    mMetrics.forDestination(req->mDestination).mRequestRetried.Mark();
    auto delay =
        exponentialBackoff(req->mAttempts, mConfig.RETRY_BACKOFF_BASE_MS,
                           mConfig.RETRY_BACKOFF_MAX_MS);

    auto id = req->mID;
    auto& entry = mRetrying[id];
    entry.mRequest = req;
    entry.mTimer = std::make_unique<VirtualTimer>(mClock);
    entry.mTimer->expires_from_now(delay);
    std::weak_ptr<RetryCoordinator> weak = shared_from_this();
    entry.mTimer->async_wait(
        [weak, id]() {
            auto self = weak.lock();
            if (!self)
            {
                return;
            }
            auto it = self->mRetrying.find(id);
            if (it == self->mRetrying.end())
            {
                return;
            }
            auto r = it->second.mRequest;
            self->mRetrying.erase(it);
            self->schedule(r);
        },
        VirtualTimer::onFailureNoop);
}

void
RetryCoordinator::finish(ForwardRequest::pointer const& req,
                         RequestState state, std::optional<DropReason> reason)
{
    releaseAssert(!isTerminal(req->mState));
    releaseAssert(isTerminal(state));
    releaseAssert(state == RequestState::Succeeded || reason);

    req->mState = state;
    mActive.erase(req->mID);

    auto dest = req->mDestination;
    if (dest < mQueues.size())
    {
        auto& metrics = mMetrics.forDestination(dest);
        if (state == RequestState::Succeeded)
        {
            metrics.mRequestSucceeded.Mark();
        }
        else
        {
            metrics.mRequestDropped.Mark();
            metrics.drop(*reason).Mark();
        }
    }
    if (state == RequestState::Succeeded)
    {
        CLOG_TRACE(Retry, "Request {} forwarded after {} attempts", req->mID,
                   req->mAttempts);
    }
    else
    {
        CLOG_DEBUG(Retry, "Request {} to destination {} dropped after {} "
                          "attempts: {}",
                   req->mID, dest, req->mAttempts, toString(*reason));
    }

    if (req->mOnOutcome)
    {
        ForwardOutcome outcome;
        outcome.mRequestID = req->mID;
        outcome.mDestination = dest;
        outcome.mState = state;
        outcome.mReason = reason;
        outcome.mAttempts = req->mAttempts;
        auto cb = std::move(req->mOnOutcome);
        req->mOnOutcome = nullptr;
        cb(outcome);
    }
}

void
RetryCoordinator::maybeDrained()
{
    if (mShuttingDown && mActive.empty() && mOnDrained)
    {
        auto cb = std::move(mOnDrained);
        mOnDrained = nullptr;
        cb();
    }
}

void
RetryCoordinator::shutdown(std::function<void()> onDrained)
{
    releaseAssert(threadIsMain());
    mShuttingDown = true;
    mOnDrained = std::move(onDrained);

    size_t dropped = 0;
    for (auto& q : mQueues)
    {
        auto queued = std::move(q);
        q.clear();
        for (auto const& req : queued)
        {
            finish(req, RequestState::Dropped, DropReason::ShuttingDown);
            ++dropped;
        }
    }
    auto retrying = std::move(mRetrying);
    mRetrying.clear();
    for (auto& r : retrying)
    {
        r.second.mTimer->cancel();
        finish(r.second.mRequest, RequestState::Dropped,
               DropReason::ShuttingDown);
        ++dropped;
    }

    CLOG_INFO(Retry,
              "Stopped intake: dropped {} waiting requests, {} in flight",
              dropped, mActive.size());
    maybeDrained();
}

void
RetryCoordinator::dropAllActive()
{
    auto active = mActive;
    if (!active.empty())
    {
        CLOG_INFO(Retry, "Dropping {} requests still in flight",
                  active.size());
    }
    for (auto& a : active)
    {
        finish(a.second, RequestState::Dropped, DropReason::ShuttingDown);
    }
    maybeDrained();
}

size_t
RetryCoordinator::getQueueDepth(DestinationIndex dest) const
{
    return mQueues.at(dest).size();
}

size_t
RetryCoordinator::getActiveCount() const
{
    return mActive.size();
}

size_t
RetryCoordinator::getRetryingCount() const
{
    return mRetrying.size();
}
}
