#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Caches the medida metrics of the forwarding pipeline so the hot path never
// looks them up by name. Per-destination metrics use the destination name as
// metric scope.

#include "proxy/ConnectionHandle.h"
#include "proxy/Destination.h"
#include "proxy/ForwardRequest.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace medida
{
class MetricsRegistry;
class Timer;
class Meter;
class Counter;
}

namespace tpuproxy
{

class Config;

// medida metrics are thread-safe, so is this struct.
struct DestinationMetrics
{
    DestinationMetrics(medida::MetricsRegistry& registry,
                       std::string const& scope);

    medida::Meter& mRequestAdmitted;
    medida::Meter& mRequestRejected;
    medida::Meter& mRequestQueued;
    medida::Meter& mRequestSucceeded;
    medida::Meter& mRequestDropped;
    medida::Meter& mRequestRetried;

    medida::Meter& mConnectionAttempt;
    medida::Meter& mConnectionEstablished;
    medida::Meter& mConnectionHandshakeFailure;

    medida::Counter& mOpenConnections;
    medida::Counter& mInFlightStreams;

    medida::Timer& mStreamLatency;

    std::map<DropReason, medida::Meter*> mDrops;
    std::map<EvictionReason, medida::Meter*> mEvictions;

    medida::Meter& drop(DropReason reason);
    medida::Meter& eviction(EvictionReason reason);
};

class ProxyMetrics
{
    std::vector<std::unique_ptr<DestinationMetrics>> mDestinations;

  public:
    ProxyMetrics(medida::MetricsRegistry& registry, Config const& cfg);

    DestinationMetrics& forDestination(DestinationIndex index);

    medida::Meter& mGatewayAccepted;
    medida::Meter& mGatewayRejected;
};
}
