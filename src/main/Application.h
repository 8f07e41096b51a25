#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include <json/json.h>
#include <functional>
#include <memory>
#include <string>

namespace medida
{
class MetricsRegistry;
}

namespace tpuproxy
{

class VirtualClock;
class IdentityProvider;
class QuicConnector;
class ProxyManager;

/*
 * State of a single instance of the proxy.
 *
 * Multiple instances may exist in the same process, eg. for the sake of testing
 * several proxies against the same set of loopback listeners.
 *
 *
 * Clocks, time and events
 * -----------------------
 *
 * An Application is connected to a VirtualClock, that both manages the
 * Application's view of time and also owns an IO event loop that dispatches
 * events for the main thread. See VirtualClock for details.
 *
 * In order to advance an Application's view of time, as well as dispatch any IO
 * events, timers or callbacks, the associated VirtualClock must be cranked. See
 * VirtualClock::crank().
 *
 *
 * Configuration
 * -------------
 *
 * Each Application owns a Config object. A local copy of the Config object is
 * made on construction of each Application, after which the local copy cannot
 * be further altered; the Application should be destroyed and recreated if any
 * change to configuration is desired.
 *
 *
 * Subsystems
 * ----------
 *
 * The Application owns the process identity (IdentityProvider), the QUIC
 * connector every outbound session is opened through, the metrics registry
 * and the ProxyManager that holds the forwarding pipeline. The connector is
 * an ngtcp2 one unless the caller supplies another (tests pass a
 * LoopbackQuicConnector).
 *
 *
 * Threading
 * ---------
 *
 * The Application expects to run on a single thread -- the main thread.
 * The one exception is InboundGateway::submit, which may be called from any
 * thread and hands its work to the main thread through
 * VirtualClock::postAction.
 */

class Application
{
  public:
    typedef std::shared_ptr<Application> pointer;

    virtual ~Application(){};

    virtual Config const& getConfig() = 0;

    virtual bool isStopping() const = 0;

    // Get the external VirtualClock to which this Application is bound.
    virtual VirtualClock& getClock() = 0;

    // Get the registry of metrics owned by this application. Metrics are
    // reported through the "info" JSON and to any external sink.
    virtual medida::MetricsRegistry& getMetrics() = 0;

    virtual IdentityProvider const& getIdentityProvider() = 0;
    virtual QuicConnector& getQuicConnector() = 0;
    virtual ProxyManager& getProxyManager() = 0;

    // Start the idle sweep and, when configured, the gateway listener.
    virtual void start() = 0;

    // Stop intake and drain the pipeline. `onStopped` runs on the main thread
    // once every request has reached a terminal state and every connection
    // is closed.
    virtual void gracefulStop(std::function<void()> onStopped) = 0;

    // Report information about the instance to the JSON object
    virtual Json::Value getJsonInfo() = 0;

    // Factory: create a new Application object bound to `clock`, with a local
    // copy made of `cfg`. When `connector` is null an ngtcp2 connector is
    // created.
    static pointer create(VirtualClock& clock, Config const& cfg,
                          std::unique_ptr<QuicConnector> connector = nullptr);

  protected:
    Application()
    {
    }
};
}
