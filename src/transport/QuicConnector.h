#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"
#include "transport/QuicConnection.h"

#include <chrono>
#include <functional>
#include <string>

namespace tpuproxy
{

// Establishes authenticated QUIC sessions. The production implementation is
// NgtcpConnector; tests use LoopbackQuicConnector.
class QuicConnector
{
  public:
    // Exactly one of `connection` and `error` is set.
    using ConnectCallback = std::function<void(
        QuicConnection::pointer connection, std::string const& error)>;

    virtual ~QuicConnector()
    {
    }

    // Starts a handshake with `destination`; the callback runs on the main
    // thread once the handshake completes, fails or exceeds
    // `handshakeTimeout`.
    virtual void connect(Destination const& destination,
                         std::chrono::milliseconds handshakeTimeout,
                         ConnectCallback callback) = 0;
};
}
