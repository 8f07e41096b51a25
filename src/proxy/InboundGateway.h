#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"
#include "proxy/ForwardRequest.h"
#include "util/types.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>

namespace tpuproxy
{

class Config;
class ProxyMetrics;
class RetryCoordinator;
class VirtualClock;

/**
 * The only data-plane entry into the proxy. submit() may be called from any
 * thread: it validates the request on the caller's thread, answers
 * immediately, and posts accepted requests to the main thread for the
 * RetryCoordinator. It never waits on the pipeline.
 *
 * The optional outcome callback runs later on the main thread, once, with
 * the request's terminal state.
 */
class InboundGateway
{
    VirtualClock& mClock;
    Config const& mConfig;
    ProxyMetrics& mMetrics;
    std::weak_ptr<RetryCoordinator> mCoordinator;
    std::atomic<bool> mStopped{false};
    std::atomic<uint64_t> mNextRequestID{1};

    SubmitResult reject(SubmitResult result, size_t size);

  public:
    InboundGateway(VirtualClock& clock, Config const& cfg,
                   ProxyMetrics& metrics,
                   std::weak_ptr<RetryCoordinator> coordinator);

    SubmitResult submit(Blob payload, DestinationIndex destination,
                        OutcomeCallback onOutcome = nullptr);
    // `selector` is a destination name or its "host:port" address.
    SubmitResult submit(Blob payload, std::string const& selector,
                        OutcomeCallback onOutcome = nullptr);

    std::optional<DestinationIndex>
    resolveDestination(std::string const& selector) const;

    // Every later submit is rejected with RejectedShuttingDown.
    void stop();
    bool isStopped() const;
};
}
