// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/ApplicationImpl.h"
#include "crypto/IdentityProvider.h"
#include "main/ProxyVersion.h"
#include "proxy/ProxyManager.h"
#include "transport/NgtcpConnector.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"

#include "medida/metrics_registry.h"

#include <fmt/chrono.h>

namespace tpuproxy
{

ApplicationImpl::ApplicationImpl(VirtualClock& clock, Config const& cfg,
                                 std::unique_ptr<QuicConnector> connector)
    : mVirtualClock(clock)
    , mConfig(cfg)
    , mMetrics(std::make_unique<medida::MetricsRegistry>())
    , mQuicConnector(std::move(connector))
    , mStopSignals(clock.getIOContext(), SIGINT)
    , mStarted(false)
    , mStopping(false)
    , mStartedOn(clock.system_now())
{
#ifdef SIGTERM
    mStopSignals.add(SIGTERM);
#endif

    mStopSignals.async_wait([this](asio::error_code const& ec, int sig) {
        if (!ec)
        {
            CLOG_INFO(Main, "got signal {}, shutting down", sig);
            this->gracefulStop([this]() { shutdownMainIOContext(); });
        }
    });
}

void
ApplicationImpl::initialize()
{
    auto identity = IdentityProvider::loadIdentity(mConfig.IDENTITY_KEYPAIR_FILE);
    mIdentityProvider = std::make_unique<IdentityProvider>(
        identity, mConfig.CERTIFICATE_COMMON_NAME, mVirtualClock.system_now());

    if (!mQuicConnector)
    {
        mQuicConnector = std::make_unique<NgtcpConnector>(
            mVirtualClock, mConfig, *mIdentityProvider);
    }
    mProxyManager = ProxyManager::create(*this);

    CLOG_DEBUG(Main, "Application constructed");
}

ApplicationImpl::~ApplicationImpl()
{
    CLOG_INFO(Main, "Application destructing");
    asio::error_code ec;
    mStopSignals.cancel(ec);
    // The pool closes its connections on destruction; that has to happen
    // while the connector is still alive.
    mProxyManager.reset();
    mQuicConnector.reset();
    CLOG_INFO(Main, "Application destroyed");
}

Config const&
ApplicationImpl::getConfig()
{
    return mConfig;
}

bool
ApplicationImpl::isStopping() const
{
    return mStopping;
}

VirtualClock&
ApplicationImpl::getClock()
{
    return mVirtualClock;
}

medida::MetricsRegistry&
ApplicationImpl::getMetrics()
{
    return *mMetrics;
}

IdentityProvider const&
ApplicationImpl::getIdentityProvider()
{
    return *mIdentityProvider;
}

QuicConnector&
ApplicationImpl::getQuicConnector()
{
    return *mQuicConnector;
}

ProxyManager&
ApplicationImpl::getProxyManager()
{
    return *mProxyManager;
}

void
ApplicationImpl::start()
{
    if (mStarted)
    {
        CLOG_INFO(Main, "App already started");
        return;
    }
    mStarted = true;

    if (!mConfig.LOG_FILE_PATH.empty())
    {
        Logging::setLoggingToFile(mConfig.LOG_FILE_PATH);
    }
    Logging::setLoggingColor(mConfig.LOG_COLOR);

    CLOG_INFO(Main, "Starting tpu-forward-proxy {}",
              TPU_FORWARD_PROXY_VERSION);
    mProxyManager->start();
}

void
ApplicationImpl::gracefulStop(std::function<void()> onStopped)
{
    if (mStopping)
    {
        return;
    }
    mStopping = true;
    mProxyManager->shutdown([onStopped]() {
        CLOG_INFO(Main, "Graceful stop complete");
        if (onStopped)
        {
            onStopped();
        }
    });
}

void
ApplicationImpl::shutdownMainIOContext()
{
    if (!mVirtualClock.getIOContext().stopped())
    {
        mVirtualClock.getIOContext().stop();
    }
}

Json::Value
ApplicationImpl::getJsonInfo()
{
    auto root = Json::Value{};
    auto& info = root["info"];

    info["build"] = TPU_FORWARD_PROXY_VERSION;
    info["state"] = mStopping ? "Stopping" : (mStarted ? "Running" : "Booting");
    info["startedOn"] = fmt::format(
        FMT_STRING("{:%Y-%m-%dT%H:%M:%SZ}"),
        fmt::gmtime(VirtualClock::to_time_t(mStartedOn)));
    info["identity"] = mIdentityProvider->identity().getPublicKeyBase58();

    auto& dests = info["destinations"];
    for (DestinationIndex i = 0; i < mConfig.DESTINATIONS.size(); ++i)
    {
        auto s = mProxyManager->getDestinationStats(i);
        Json::Value d;
        d["name"] = s.mName;
        d["address"] = s.mAddress;
        d["quota"] = s.mQuota;
        d["in_flight"] = s.mInFlight;
        d["open_connections"] = s.mOpenConnections;
        d["queue_depth"] = static_cast<Json::UInt64>(s.mQueueDepth);
        d["succeeded"] = static_cast<Json::UInt64>(s.mSucceeded);
        d["dropped"] = static_cast<Json::UInt64>(s.mDropped);
        d["retried"] = static_cast<Json::UInt64>(s.mRetried);
        d["evictions"] = static_cast<Json::UInt64>(s.mEvictions);
        for (auto const& kv : s.mDrops)
        {
            d["drops"][toString(kv.first)] =
                static_cast<Json::UInt64>(kv.second);
        }
        dests.append(d);
    }
    return root;
}
}
