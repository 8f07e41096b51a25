// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ProxyManagerImpl.h"
#include "main/Application.h"
#include "main/Config.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include "medida/counter.h"
#include "medida/meter.h"

namespace tpuproxy
{

std::unique_ptr<ProxyManager>
ProxyManager::create(Application& app)
{
    return std::make_unique<ProxyManagerImpl>(app);
}

ProxyManagerImpl::ProxyManagerImpl(Application& app)
    : mApp(app)
    , mMetrics(app.getMetrics(), app.getConfig())
    , mAdmission(app.getClock(), app.getConfig())
    , mPool(std::make_shared<ConnectionPool>(app.getClock(), app.getConfig(),
                                             app.getQuicConnector(),
                                             mAdmission, mMetrics))
    , mForwarder(app.getClock(), app.getConfig(), mMetrics)
    , mCoordinator(std::make_shared<RetryCoordinator>(
          app.getClock(), app.getConfig(), mAdmission, *mPool, mForwarder,
          mMetrics))
    , mGateway(app.getClock(), app.getConfig(), mMetrics, mCoordinator)
    , mSweepTimer(app)
    , mGraceTimer(app)
{
    if (app.getConfig().GATEWAY_PORT != 0)
    {
        mDoor = std::make_unique<GatewayDoor>(app, mGateway);
    }
}

ProxyManagerImpl::~ProxyManagerImpl()
{
    mSweepTimer.cancel();
    mGraceTimer.cancel();
    if (mDoor)
    {
        mDoor->close();
    }
}

void
ProxyManagerImpl::start()
{
    releaseAssert(threadIsMain());
    auto const& cfg = mApp.getConfig();
    CLOG_INFO(Main, "Forwarding to {} destination(s), total stake {}",
              cfg.DESTINATIONS.size(), cfg.totalStake());
    scheduleIdleSweep();
    if (mDoor)
    {
        mDoor->start();
    }
}

void
ProxyManagerImpl::scheduleIdleSweep()
{
    mSweepTimer.expires_from_now(mApp.getConfig().IDLE_SWEEP_INTERVAL_MS);
    mSweepTimer.async_wait(
        [this]() {
            if (mShuttingDown)
            {
                return;
            }
            mPool->sweepIdle();
            scheduleIdleSweep();
        },
        VirtualTimer::onFailureNoop);
}

InboundGateway&
ProxyManagerImpl::getInboundGateway()
{
    return mGateway;
}

ConnectionPool&
ProxyManagerImpl::getConnectionPool()
{
    return *mPool;
}

AdmissionController&
ProxyManagerImpl::getAdmissionController()
{
    return mAdmission;
}

RetryCoordinator&
ProxyManagerImpl::getRetryCoordinator()
{
    return *mCoordinator;
}

ProxyMetrics&
ProxyManagerImpl::getProxyMetrics()
{
    return mMetrics;
}

DestinationStats
ProxyManagerImpl::getDestinationStats(DestinationIndex dest)
{
    auto const& cfg = mApp.getConfig();
    releaseAssert(dest < cfg.DESTINATIONS.size());
    auto const& d = cfg.DESTINATIONS[dest];
    auto& m = mMetrics.forDestination(dest);

    DestinationStats s;
    s.mName = d.mName;
    s.mAddress = d.toString();
    s.mQuota = mAdmission.getQuota(dest);
    s.mInFlight = mAdmission.getInFlight(dest);
    s.mOpenConnections = mAdmission.getOpenConnections(dest);
    s.mQueueDepth = mCoordinator->getQueueDepth(dest);
    s.mWaiters = mPool->getWaiterCount(dest);
    s.mEvictions = mPool->getEvictionCount(dest);

    s.mAdmitted = m.mRequestAdmitted.count();
    s.mRejected = m.mRequestRejected.count();
    s.mQueued = m.mRequestQueued.count();
    s.mSucceeded = m.mRequestSucceeded.count();
    s.mDropped = m.mRequestDropped.count();
    s.mRetried = m.mRequestRetried.count();

    s.mConnectionAttempts = m.mConnectionAttempt.count();
    s.mConnectionsEstablished = m.mConnectionEstablished.count();
    s.mHandshakeFailures = m.mConnectionHandshakeFailure.count();

    for (auto const& kv : m.mDrops)
    {
        s.mDrops[kv.first] = kv.second->count();
    }
    for (auto const& kv : m.mEvictions)
    {
        s.mEvictionsByReason[kv.first] = kv.second->count();
    }
    return s;
}

void
ProxyManagerImpl::addEvictionListener(
    std::function<void(EvictionEvent const&)> l)
{
    mPool->addEvictionListener(std::move(l));
}

void
ProxyManagerImpl::shutdown(std::function<void()> onStopped)
{
    releaseAssert(threadIsMain());
    if (mShuttingDown)
    {
        return;
    }
    mShuttingDown = true;
    mOnStopped = std::move(onStopped);

    CLOG_INFO(Main, "Shutting down: {} in flight, {} waiting for retry",
              mCoordinator->getActiveCount(),
              mCoordinator->getRetryingCount());

    mGateway.stop();
    if (mDoor)
    {
        mDoor->close();
    }
    mSweepTimer.cancel();

    mGraceTimer.expires_from_now(mApp.getConfig().SHUTDOWN_GRACE_PERIOD_MS);
    mGraceTimer.async_wait(
        [this]() {
            CLOG_WARNING(Main,
                         "Shutdown grace period elapsed with {} stream(s) "
                         "still in flight",
                         mCoordinator->getActiveCount());
            finishShutdown();
        },
        VirtualTimer::onFailureNoop);

    // May call back synchronously when nothing is in flight.
    mCoordinator->shutdown([this]() {
        CLOG_INFO(Main, "All in-flight streams finished");
        finishShutdown();
    });
}

void
ProxyManagerImpl::finishShutdown()
{
    if (mStopped)
    {
        return;
    }
    mStopped = true;
    mGraceTimer.cancel();

    mPool->closeAll(EvictionReason::Shutdown);
    mCoordinator->dropAllActive();
    CLOG_INFO(Main, "Proxy stopped");

    if (mOnStopped)
    {
        auto cb = std::move(mOnStopped);
        mOnStopped = nullptr;
        cb();
    }
}

bool
ProxyManagerImpl::isShuttingDown() const
{
    return mShuttingDown;
}
}
