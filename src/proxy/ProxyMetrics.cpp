// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ProxyMetrics.h"
#include "main/Config.h"
#include "util/GlobalChecks.h"

#include "medida/counter.h"
#include "medida/meter.h"
#include "medida/metrics_registry.h"
#include "medida/timer.h"

namespace tpuproxy
{

static std::vector<DropReason> const kDropReasons = {
    DropReason::PayloadTooLarge,      DropReason::UnknownDestination,
    DropReason::RetriesExhausted,     DropReason::QueueOverflow,
    DropReason::DestinationSaturated, DropReason::ShuttingDown};

static std::vector<EvictionReason> const kEvictionReasons = {
    EvictionReason::IdleTimeout, EvictionReason::ErrorThreshold,
    EvictionReason::PeerClosed, EvictionReason::WriteFailure,
    EvictionReason::Shutdown};

DestinationMetrics::DestinationMetrics(medida::MetricsRegistry& registry,
                                       std::string const& scope)
    : mRequestAdmitted(registry.NewMeter(
          {"proxy", "request", "admitted", scope}, "request"))
    , mRequestRejected(registry.NewMeter(
          {"proxy", "request", "rejected", scope}, "request"))
    , mRequestQueued(
          registry.NewMeter({"proxy", "request", "queued", scope}, "request"))
    , mRequestSucceeded(registry.NewMeter(
          {"proxy", "request", "succeeded", scope}, "request"))
    , mRequestDropped(
          registry.NewMeter({"proxy", "request", "dropped", scope}, "request"))
    , mRequestRetried(
          registry.NewMeter({"proxy", "request", "retried", scope}, "request"))
    , mConnectionAttempt(registry.NewMeter(
          {"proxy", "connection", "attempt", scope}, "connection"))
    , mConnectionEstablished(registry.NewMeter(
          {"proxy", "connection", "established", scope}, "connection"))
    , mConnectionHandshakeFailure(registry.NewMeter(
          {"proxy", "connection", "handshake-failure", scope}, "connection"))
    , mOpenConnections(
          registry.NewCounter({"proxy", "connection", "open", scope}))
    , mInFlightStreams(
          registry.NewCounter({"proxy", "stream", "in-flight", scope}))
    , mStreamLatency(registry.NewTimer({"proxy", "stream", "latency", scope}))
{
    for (auto r : kDropReasons)
    {
        mDrops[r] = &registry.NewMeter({"proxy", "drop", toString(r), scope},
                                       "request");
    }
    for (auto r : kEvictionReasons)
    {
        mEvictions[r] = &registry.NewMeter(
            {"proxy", "eviction", toString(r), scope}, "connection");
    }
}

medida::Meter&
DestinationMetrics::drop(DropReason reason)
{
    auto it = mDrops.find(reason);
    releaseAssert(it != mDrops.end());
    return *it->second;
}

medida::Meter&
DestinationMetrics::eviction(EvictionReason reason)
{
    auto it = mEvictions.find(reason);
    releaseAssert(it != mEvictions.end());
    return *it->second;
}

ProxyMetrics::ProxyMetrics(medida::MetricsRegistry& registry,
                           Config const& cfg)
    : mGatewayAccepted(
          registry.NewMeter({"proxy", "gateway", "accepted"}, "request"))
    , mGatewayRejected(
          registry.NewMeter({"proxy", "gateway", "rejected"}, "request"))
{
    for (auto const& d : cfg.DESTINATIONS)
    {
        mDestinations.emplace_back(
            std::make_unique<DestinationMetrics>(registry, d.mName));
    }
}

DestinationMetrics&
ProxyMetrics::forDestination(DestinationIndex index)
{
    releaseAssert(index < mDestinations.size());
    return *mDestinations[index];
}
}
