#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ConnectionHandle.h"
#include "proxy/Destination.h"
#include "proxy/ForwardRequest.h"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

/**
 * ProxyManager owns the forwarding pipeline of one Application:
 *
 *  - the InboundGateway, where requests enter (in process or through the
 *    optional GatewayDoor TCP listener),
 *
 *  - the RetryCoordinator, which drives each request through admission,
 *    connection acquisition and stream forwarding to a terminal outcome,
 *
 *  - the AdmissionController, which bounds in-flight streams and connection
 *    churn per destination,
 *
 *  - the ConnectionPool, which keeps a few authenticated QUIC sessions per
 *    destination and evicts unhealthy or idle ones,
 *
 *  - the StreamForwarder, which writes one payload as one unidirectional
 *    stream.
 *
 * Requests are fire-and-forget towards the validators: nothing is ever read
 * back from a stream. The only feedback a submitter gets is the terminal
 * ForwardOutcome.
 */

namespace tpuproxy
{

class Application;
class AdmissionController;
class ConnectionPool;
class InboundGateway;
class ProxyMetrics;
class RetryCoordinator;

// Point-in-time view of one destination, for tests and external sinks.
struct DestinationStats
{
    std::string mName;
    std::string mAddress;

    uint32_t mQuota{0};
    uint32_t mInFlight{0};
    uint32_t mOpenConnections{0};
    size_t mQueueDepth{0};
    size_t mWaiters{0};
    uint64_t mEvictions{0};

    uint64_t mAdmitted{0};
    uint64_t mRejected{0};
    uint64_t mQueued{0};
    uint64_t mSucceeded{0};
    uint64_t mDropped{0};
    uint64_t mRetried{0};

    uint64_t mConnectionAttempts{0};
    uint64_t mConnectionsEstablished{0};
    uint64_t mHandshakeFailures{0};

    std::map<DropReason, uint64_t> mDrops;
    std::map<EvictionReason, uint64_t> mEvictionsByReason;
};

class ProxyManager
{
  public:
    static std::unique_ptr<ProxyManager> create(Application& app);

    // Starts the periodic idle sweep, and the gateway listener when
    // GATEWAY_PORT is set.
    virtual void start() = 0;

    virtual InboundGateway& getInboundGateway() = 0;
    virtual ConnectionPool& getConnectionPool() = 0;
    virtual AdmissionController& getAdmissionController() = 0;
    virtual RetryCoordinator& getRetryCoordinator() = 0;
    virtual ProxyMetrics& getProxyMetrics() = 0;

    virtual DestinationStats getDestinationStats(DestinationIndex dest) = 0;

    virtual void
    addEvictionListener(std::function<void(EvictionEvent const&)> l) = 0;

    // Graceful drain: stop intake, drop queued and retry-waiting requests
    // with ShuttingDown, give in-flight streams SHUTDOWN_GRACE_PERIOD_MS to
    // finish, then close every connection and drop what is left. `onStopped`
    // runs once, when all of that is done.
    virtual void shutdown(std::function<void()> onStopped) = 0;

    virtual bool isShuttingDown() const = 0;

    virtual ~ProxyManager()
    {
    }
};
}
