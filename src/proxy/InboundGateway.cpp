// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/InboundGateway.h"
#include "main/Config.h"
#include "proxy/ProxyMetrics.h"
#include "proxy/RetryCoordinator.h"
#include "util/Logging.h"
#include "util/Timer.h"

#include "medida/meter.h"

namespace tpuproxy
{

InboundGateway::InboundGateway(VirtualClock& clock, Config const& cfg,
                               ProxyMetrics& metrics,
                               std::weak_ptr<RetryCoordinator> coordinator)
    : mClock(clock)
    , mConfig(cfg)
    , mMetrics(metrics)
    , mCoordinator(std::move(coordinator))
{
}

SubmitResult
InboundGateway::reject(SubmitResult result, size_t size)
{
    mMetrics.mGatewayRejected.Mark();
    CLOG_DEBUG(Gateway, "Rejected {}-byte submission: {} ({})", size,
               toString(result), toString(classify(result)));
    return result;
}

SubmitResult
InboundGateway::submit(Blob payload, DestinationIndex destination,
                       OutcomeCallback onOutcome)
{
    if (mStopped)
    {
        return reject(SubmitResult::RejectedShuttingDown, payload.size());
    }
    if (payload.empty())
    {
        return reject(SubmitResult::RejectedEmptyPayload, 0);
    }
    if (payload.size() > mConfig.MAX_PAYLOAD_SIZE)
    {
        return reject(SubmitResult::RejectedPayloadTooLarge, payload.size());
    }
    if (destination >= mConfig.DESTINATIONS.size())
    {
        return reject(SubmitResult::RejectedUnknownDestination,
                      payload.size());
    }

    auto req = std::make_shared<ForwardRequest>(
        mNextRequestID++, std::move(payload), destination,
        std::move(onOutcome));
    mMetrics.mGatewayAccepted.Mark();

    std::weak_ptr<RetryCoordinator> weak = mCoordinator;
    mClock.postAction(
        [weak, req]() {
            auto coordinator = weak.lock();
            if (coordinator)
            {
                coordinator->schedule(req);
            }
        },
        "InboundGateway: schedule request");
    return SubmitResult::Accepted;
}

SubmitResult
InboundGateway::submit(Blob payload, std::string const& selector,
                       OutcomeCallback onOutcome)
{
    auto dest = resolveDestination(selector);
    if (!dest)
    {
        return reject(SubmitResult::RejectedUnknownDestination,
                      payload.size());
    }
    return submit(std::move(payload), *dest, std::move(onOutcome));
}

std::optional<DestinationIndex>
InboundGateway::resolveDestination(std::string const& selector) const
{
    auto const& dests = mConfig.DESTINATIONS;
    for (DestinationIndex i = 0; i < dests.size(); ++i)
    {
        if (dests[i].mName == selector || dests[i].toString() == selector)
        {
            return i;
        }
    }
    return std::nullopt;
}

void
InboundGateway::stop()
{
    mStopped = true;
}

bool
InboundGateway::isStopped() const
{
    return mStopped;
}
}
