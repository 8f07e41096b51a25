#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/ConnectionHandle.h"
#include "proxy/ForwardRequest.h"
#include "util/Timer.h"
#include "util/types.h"

#include <functional>
#include <memory>

namespace tpuproxy
{

class Config;
class ProxyMetrics;

/**
 * Sends one payload as the entire body of one new unidirectional stream and
 * reports Sent as soon as the transport has taken the payload and the FIN.
 * Nothing is read back from the validator.
 *
 * An oversized payload is reported as PayloadTooLarge from within forward()
 * itself, before the connection is touched; every other result arrives
 * later, on the main thread.
 */
class StreamForwarder
{
  public:
    typedef std::function<void(ForwardResult)> ForwardCallback;

  private:
    VirtualClock& mClock;
    Config const& mConfig;
    ProxyMetrics& mMetrics;
    // Stream results can arrive after the forwarder and its metrics are
    // gone; they only touch either while this is alive.
    std::shared_ptr<bool> mAlive;

  public:
    StreamForwarder(VirtualClock& clock, Config const& cfg,
                    ProxyMetrics& metrics);

    void forward(ConnectionHandle::pointer const& handle, Blob const& payload,
                 ForwardCallback callback);
};
}
