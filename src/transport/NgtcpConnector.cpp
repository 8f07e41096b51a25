// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "transport/NgtcpConnector.h"
#include "transport/NgtcpConnection.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include "util/Timer.h"

#include <algorithm>

namespace tpuproxy
{

NgtcpConnector::NgtcpConnector(VirtualClock& clock, Config const& cfg,
                               IdentityProvider const& identity)
    : mClock(clock)
    , mConfig(cfg)
    , mIdentity(identity)
    , mAlive(std::make_shared<bool>(true))
{
}

NgtcpConnector::~NgtcpConnector()
{
    mAlive.reset();
    for (auto& kv : mResolving)
    {
        kv.second.mResolver->cancel();
        kv.second.mDeadline->cancel();
    }
    for (auto const& conn : mHandshaking)
    {
        conn->close("connector destroyed");
    }
}

void
NgtcpConnector::connect(Destination const& destination,
                        std::chrono::milliseconds handshakeTimeout,
                        ConnectCallback callback)
{
    releaseAssert(threadIsMain());
    auto id = mNextResolveID++;
    auto deadline = mClock.now() + handshakeTimeout;

    auto& pending = mResolving[id];
    pending.mResolver =
        std::make_unique<asio::ip::udp::resolver>(mClock.getIOContext());
    pending.mDeadline = std::make_unique<VirtualTimer>(mClock);
    pending.mCallback = std::move(callback);

    pending.mDeadline->expires_from_now(handshakeTimeout);
    pending.mDeadline->async_wait(
        [this, id, destination]() { resolveTimedOut(id, destination); },
        VirtualTimer::onFailureNoop);

    std::weak_ptr<bool> alive = mAlive;
    pending.mResolver->async_resolve(
        destination.mHost, std::to_string(destination.mPort),
        [this, alive, id, destination,
         deadline](asio::error_code const& ec,
                   asio::ip::udp::resolver::results_type results) {
            if (ec == asio::error::operation_aborted || alive.expired())
            {
                return;
            }
            resolved(id, destination, deadline, ec, results);
        });
}

void
NgtcpConnector::resolveTimedOut(uint64_t resolveID,
                                Destination const& destination)
{
    auto it = mResolving.find(resolveID);
    if (it == mResolving.end())
    {
        return;
    }
    CLOG_DEBUG(Quic, "Resolving {} did not finish before the deadline",
               destination.toString());
    auto callback = std::move(it->second.mCallback);
    it->second.mResolver->cancel();
    mResolving.erase(it);
    callback(nullptr, "handshake timed out");
}

void
NgtcpConnector::resolved(uint64_t resolveID, Destination const& destination,
                         VirtualClock::time_point deadline,
                         asio::error_code const& ec,
                         asio::ip::udp::resolver::results_type const& results)
{
    auto it = mResolving.find(resolveID);
    if (it == mResolving.end())
    {
        // The deadline already reported this attempt.
        return;
    }
    auto callback = std::move(it->second.mCallback);
    it->second.mDeadline->cancel();
    mResolving.erase(it);

    if (ec || results.empty())
    {
        auto msg = fmt::format(FMT_STRING("cannot resolve {}: {}"),
                               destination.mHost,
                               ec ? ec.message() : "no address");
        callback(nullptr, msg);
        return;
    }
    auto now = mClock.now();
    if (now >= deadline)
    {
        callback(nullptr, "handshake timed out");
        return;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    startHandshake(destination, results.begin()->endpoint(),
                   std::max(remaining, std::chrono::milliseconds(1)),
                   callback);
}

void
NgtcpConnector::startHandshake(Destination const& destination,
                               asio::ip::udp::endpoint const& endpoint,
                               std::chrono::milliseconds handshakeTimeout,
                               ConnectCallback callback)
{
    auto conn = std::make_shared<NgtcpConnection>(mClock, mConfig, mIdentity,
                                                  destination.toString());
    mHandshaking.insert(conn);
    std::weak_ptr<NgtcpConnection> weak = conn;
    conn->start(endpoint, handshakeTimeout,
                [this, weak, callback](std::string const& error) {
                    auto c = weak.lock();
                    if (!c)
                    {
                        return;
                    }
                    mHandshaking.erase(c);
                    if (error.empty())
                    {
                        callback(c, "");
                    }
                    else
                    {
                        callback(nullptr, error);
                    }
                });
}
}
