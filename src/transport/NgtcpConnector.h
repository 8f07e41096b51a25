#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/QuicConnector.h"
#include "util/Timer.h"
#include "util/asio.h"

#include <map>
#include <memory>
#include <set>

namespace tpuproxy
{

class Config;
class IdentityProvider;
class NgtcpConnection;

// Production QuicConnector: resolves the destination host, then runs an
// ngtcp2 client handshake against it. Connections are kept alive here until
// their handshake resolves. The handshake timeout covers name resolution as
// well: one deadline timer per connect() runs from the call itself.
class NgtcpConnector : public QuicConnector
{
    struct PendingResolve
    {
        std::unique_ptr<asio::ip::udp::resolver> mResolver;
        std::unique_ptr<VirtualTimer> mDeadline;
        ConnectCallback mCallback;
    };

    VirtualClock& mClock;
    Config const& mConfig;
    IdentityProvider const& mIdentity;
    uint64_t mNextResolveID{0};
    std::map<uint64_t, PendingResolve> mResolving;
    std::set<std::shared_ptr<NgtcpConnection>> mHandshaking;
    // Expires with the connector; resolver completions already queued check
    // it before touching `this`.
    std::shared_ptr<bool> mAlive;

    void resolved(uint64_t resolveID, Destination const& destination,
                  VirtualClock::time_point deadline, asio::error_code const& ec,
                  asio::ip::udp::resolver::results_type const& results);
    void resolveTimedOut(uint64_t resolveID, Destination const& destination);

    void startHandshake(Destination const& destination,
                        asio::ip::udp::endpoint const& endpoint,
                        std::chrono::milliseconds handshakeTimeout,
                        ConnectCallback callback);

  public:
    NgtcpConnector(VirtualClock& clock, Config const& cfg,
                   IdentityProvider const& identity);
    ~NgtcpConnector();

    void connect(Destination const& destination,
                 std::chrono::milliseconds handshakeTimeout,
                 ConnectCallback callback) override;
};
}
