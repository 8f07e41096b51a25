#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/AdmissionController.h"
#include "proxy/ConnectionPool.h"
#include "proxy/GatewayDoor.h"
#include "proxy/InboundGateway.h"
#include "proxy/ProxyManager.h"
#include "proxy/ProxyMetrics.h"
#include "proxy/RetryCoordinator.h"
#include "proxy/StreamForwarder.h"
#include "util/Timer.h"

#include <memory>

namespace tpuproxy
{

class ProxyManagerImpl : public ProxyManager
{
  protected:
    Application& mApp;

    ProxyMetrics mMetrics;
    AdmissionController mAdmission;
    std::shared_ptr<ConnectionPool> mPool;
    StreamForwarder mForwarder;
    std::shared_ptr<RetryCoordinator> mCoordinator;
    InboundGateway mGateway;
    std::unique_ptr<GatewayDoor> mDoor;

    VirtualTimer mSweepTimer;
    VirtualTimer mGraceTimer;

    bool mShuttingDown{false};
    bool mStopped{false};
    std::function<void()> mOnStopped;

    void scheduleIdleSweep();
    void finishShutdown();

  public:
    ProxyManagerImpl(Application& app);
    ~ProxyManagerImpl();

    void start() override;

    InboundGateway& getInboundGateway() override;
    ConnectionPool& getConnectionPool() override;
    AdmissionController& getAdmissionController() override;
    RetryCoordinator& getRetryCoordinator() override;
    ProxyMetrics& getProxyMetrics() override;

    DestinationStats getDestinationStats(DestinationIndex dest) override;

    void
    addEvictionListener(std::function<void(EvictionEvent const&)> l) override;

    void shutdown(std::function<void()> onStopped) override;
    bool isShuttingDown() const override;
};
}
