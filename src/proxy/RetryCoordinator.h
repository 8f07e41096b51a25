#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ConnectionPool.h"
#include "proxy/ForwardRequest.h"
#include "util/Timer.h"

#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <vector>

namespace tpuproxy
{

class AdmissionController;
class Config;
class ProxyMetrics;
class StreamForwarder;

/**
 * Drives every ForwardRequest to exactly one terminal outcome.
 *
 * A scheduled request is admitted (one stream slot from the
 * AdmissionController), given a connection by the ConnectionPool and handed
 * to the StreamForwarder. The result is classified: transient failures are
 * retried after an exponential backoff until MAX_RETRY_ATTEMPTS attempts
 * have been made, write failures also evict the connection, permanent
 * failures are dropped straight away.
 *
 * When a destination is saturated a request waits in that destination's
 * bounded queue (the oldest entry is dropped once the queue is full), or is
 * dropped at once if QUEUE_ON_SATURATION is off. The queue is pumped every
 * time a stream slot comes back.
 *
 * Runs on the main thread only.
 */
class RetryCoordinator : public std::enable_shared_from_this<RetryCoordinator>
{
    struct RetryEntry
    {
        ForwardRequest::pointer mRequest;
        std::unique_ptr<VirtualTimer> mTimer;
    };

    VirtualClock& mClock;
    Config const& mConfig;
    AdmissionController& mAdmission;
    ConnectionPool& mPool;
    StreamForwarder& mForwarder;
    ProxyMetrics& mMetrics;

    std::vector<std::deque<ForwardRequest::pointer>> mQueues;
    // Admitted or forwarding, keyed by request id.
    std::map<uint64_t, ForwardRequest::pointer> mActive;
    std::map<uint64_t, RetryEntry> mRetrying;

    bool mShuttingDown{false};
    std::function<void()> mOnDrained;

    void enqueue(ForwardRequest::pointer const& req);
    void start(ForwardRequest::pointer const& req);
    void pump(DestinationIndex dest);
    void onAcquired(ForwardRequest::pointer const& req,
                    ConnectionHandle::pointer const& handle,
                    AcquireError err);
    void onForwarded(ForwardRequest::pointer const& req,
                     ConnectionHandle::pointer const& handle,
                     ForwardResult result);
    void streamFinished(ForwardRequest::pointer const& req);
    void retryOrDrop(ForwardRequest::pointer const& req);
    void finish(ForwardRequest::pointer const& req, RequestState state,
                std::optional<DropReason> reason);
    void maybeDrained();

  public:
    RetryCoordinator(VirtualClock& clock, Config const& cfg,
                     AdmissionController& admission, ConnectionPool& pool,
                     StreamForwarder& forwarder, ProxyMetrics& metrics);

    // Entry point for a new request and for a request coming back from a
    // retry delay.
    void schedule(ForwardRequest::pointer const& req);

    // Stops taking work: queued and retry-waiting requests are dropped with
    // ShuttingDown, in-flight ones may still finish. `onDrained` runs once
    // nothing is in flight any more.
    void shutdown(std::function<void()> onDrained);

    // Drops every request still in flight with ShuttingDown. Their transport
    // callbacks, if they ever arrive, only return resources.
    void dropAllActive();

    bool
    isShuttingDown() const
    {
        return mShuttingDown;
    }
    size_t getQueueDepth(DestinationIndex dest) const;
    size_t getActiveCount() const;
    size_t getRetryingCount() const;
};
}
