#pragma once

// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Application.h"
#include "main/Config.h"
#include "util/Timer.h"
#include "util/asio.h"

#include <memory>

namespace tpuproxy
{

class ApplicationImpl : public Application
{
  public:
    ApplicationImpl(VirtualClock& clock, Config const& cfg,
                    std::unique_ptr<QuicConnector> connector);

    // Loads the identity and builds the subsystems. Separate from the
    // constructor so a failure leaves no half-built Application behind.
    void initialize();

    virtual ~ApplicationImpl() override;

    virtual Config const& getConfig() override;

    virtual bool isStopping() const override;

    virtual VirtualClock& getClock() override;

    virtual medida::MetricsRegistry& getMetrics() override;

    virtual IdentityProvider const& getIdentityProvider() override;
    virtual QuicConnector& getQuicConnector() override;
    virtual ProxyManager& getProxyManager() override;

    virtual void start() override;

    virtual void gracefulStop(std::function<void()> onStopped) override;

    virtual Json::Value getJsonInfo() override;

  private:
    VirtualClock& mVirtualClock;
    Config mConfig;

    // NB: the metrics registry and identity come before the subsystems that
    // borrow them; the connector comes before the ProxyManager whose pool
    // opens connections through it. Do not reorder these fields.
    std::unique_ptr<medida::MetricsRegistry> mMetrics;
    std::unique_ptr<IdentityProvider> mIdentityProvider;
    std::unique_ptr<QuicConnector> mQuicConnector;
    std::unique_ptr<ProxyManager> mProxyManager;

    asio::signal_set mStopSignals;

    bool mStarted;
    bool mStopping;

    VirtualClock::system_time_point mStartedOn;

    void shutdownMainIOContext();
};
}
