// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/StreamForwarder.h"
#include "main/Config.h"
#include "proxy/ProxyMetrics.h"
#include "util/Logging.h"

#include "medida/timer.h"

namespace tpuproxy
{

namespace
{
ForwardResult
toForwardResult(StreamResult r)
{
    switch (r)
    {
    case StreamResult::Success:
        return ForwardResult::Sent;
    case StreamResult::OpenRefused:
        return ForwardResult::OpenRefused;
    case StreamResult::WriteFailed:
        return ForwardResult::WriteFailed;
    case StreamResult::TimedOut:
        return ForwardResult::TimedOut;
    case StreamResult::ConnectionClosed:
        return ForwardResult::ConnectionClosed;
    }
    return ForwardResult::WriteFailed;
}
}

StreamForwarder::StreamForwarder(VirtualClock& clock, Config const& cfg,
                                 ProxyMetrics& metrics)
    : mClock(clock)
    , mConfig(cfg)
    , mMetrics(metrics)
    , mAlive(std::make_shared<bool>(true))
{
}

void
StreamForwarder::forward(ConnectionHandle::pointer const& handle,
                         Blob const& payload, ForwardCallback callback)
{
    if (payload.size() > mConfig.MAX_PAYLOAD_SIZE)
    {
        CLOG_DEBUG(Forward, "Refusing {}-byte payload, limit is {}",
                   payload.size(), mConfig.MAX_PAYLOAD_SIZE);
        callback(ForwardResult::PayloadTooLarge);
        return;
    }

    auto& latency = mMetrics.forDestination(handle->getDestination())
                        .mStreamLatency;
    auto start = mClock.now();
    auto& clock = mClock;
    auto connID = handle->getID();
    std::weak_ptr<bool> alive = mAlive;
    handle->getConnection()->sendUniStream(
        payload, mConfig.STREAM_TIMEOUT_MS,
        [alive, &latency, &clock, start, connID, callback](StreamResult r) {
            if (!alive.expired())
            {
                latency.Update(clock.now() - start);
            }
            auto result = toForwardResult(r);
            if (result != ForwardResult::Sent)
            {
                CLOG_DEBUG(Forward, "Stream on connection {} failed: {}",
                           connID, toString(r));
            }
            callback(result);
        });
}
}
