// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Application.h"
#include "main/Config.h"
#include "proxy/ConnectionPool.h"
#include "proxy/InboundGateway.h"
#include "proxy/ProxyManager.h"
#include "proxy/RetryCoordinator.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/test.h"
#include "util/Timer.h"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <vector>

using namespace tpuproxy;

namespace
{
struct AppFixture
{
    VirtualClock mClock;
    Config mCfg;
    std::vector<std::shared_ptr<LoopbackQuicListener>> mListeners;
    Application::pointer mApp;
    OutcomeRecorder mOutcomes;
    std::vector<EvictionEvent> mEvictions;
    int mStoppedCalls{0};

    explicit AppFixture(Config const& cfg) : mCfg(cfg)
    {
        mApp = createTestApplication(mClock, mCfg, mListeners);
        mApp->getProxyManager().addEvictionListener(
            [this](EvictionEvent const& e) { mEvictions.emplace_back(e); });
        mApp->start();
    }

    SubmitResult
    send(DestinationIndex dest, size_t size = 32)
    {
        return mApp->getProxyManager().getInboundGateway().submit(
            testutil::makeRandomPayload(size), dest, mOutcomes.callback());
    }

    bool
    crankUntil(std::function<bool()> const& pred,
               VirtualClock::duration timeout = std::chrono::seconds(5))
    {
        return testutil::crankUntil(*mApp, pred, timeout);
    }

    void
    stop()
    {
        mApp->gracefulStop([this]() { ++mStoppedCalls; });
    }

    size_t
    evictionsFor(EvictionReason reason) const
    {
        return std::count_if(
            mEvictions.begin(), mEvictions.end(),
            [reason](EvictionEvent const& e) { return e.mReason == reason; });
    }
};
}

TEST_CASE("stop with nothing in flight completes at once", "[shutdown]")
{
    AppFixture f(getTestConfig(2));
    REQUIRE(f.send(0) == SubmitResult::Accepted);
    REQUIRE(f.crankUntil([&]() { return f.mOutcomes.size() == 1; }));
    CHECK(f.mApp->getProxyManager().getDestinationStats(0).mOpenConnections ==
          1);

    f.stop();
    CHECK(f.mApp->isStopping());
    CHECK(f.mApp->getProxyManager().isShuttingDown());
    CHECK(f.mStoppedCalls == 1);
    CHECK(f.evictionsFor(EvictionReason::Shutdown) == 1);
    CHECK(f.mApp->getProxyManager().getDestinationStats(0).mOpenConnections ==
          0);

    // A second stop is ignored.
    f.stop();
    testutil::crankSome(f.mClock);
    CHECK(f.mStoppedCalls == 1);
    CHECK(f.mListeners[0]->getLiveConnectionCount() == 0);
}

TEST_CASE("graceful stop lets in-flight streams finish", "[shutdown]")
{
    auto cfg = getTestConfig(2);
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 2;
    AppFixture f(cfg);
    auto& listener = *f.mListeners[0];
    listener.setCorked(true);

    for (int i = 0; i < 4; ++i)
    {
        REQUIRE(f.send(0) == SubmitResult::Accepted);
    }
    REQUIRE(f.crankUntil(
        [&]() { return listener.getStats().streamsOpened == 2; }));
    CHECK(f.mApp->getProxyManager().getDestinationStats(0).mQueueDepth == 2);

    f.stop();
    // Queued requests go right away.
    CHECK(f.mOutcomes.count(DropReason::ShuttingDown) == 2);
    CHECK(f.mStoppedCalls == 0);
    CHECK(f.mApp->getJsonInfo()["info"]["state"].asString() == "Stopping");

    // Intake is closed.
    CHECK(f.send(1) == SubmitResult::RejectedShuttingDown);

    listener.setCorked(false);
    REQUIRE(f.crankUntil([&]() { return f.mStoppedCalls == 1; }));
    CHECK(f.mOutcomes.size() == 4);
    CHECK(f.mOutcomes.count(RequestState::Succeeded) == 2);
    CHECK(f.mOutcomes.calls() == 4);
    CHECK(listener.getReceivedStreams().size() == 2);
    CHECK(f.evictionsFor(EvictionReason::Shutdown) == 1);
    CHECK(f.mApp->getProxyManager().getDestinationStats(0).mInFlight == 0);
}

TEST_CASE("grace period bounds the drain", "[shutdown]")
{
    auto cfg = getTestConfig(2);
    cfg.STREAM_TIMEOUT_MS = std::chrono::milliseconds(10000);
    cfg.SHUTDOWN_GRACE_PERIOD_MS = std::chrono::milliseconds(500);
    AppFixture f(cfg);
    auto& listener = *f.mListeners[1];
    listener.setCorked(true);

    REQUIRE(f.send(1) == SubmitResult::Accepted);
    REQUIRE(f.send(1) == SubmitResult::Accepted);
    REQUIRE(f.crankUntil(
        [&]() { return listener.getStats().streamsOpened == 2; }));

    auto start = f.mClock.now();
    f.stop();
    REQUIRE(f.crankUntil([&]() { return f.mStoppedCalls == 1; },
                         std::chrono::seconds(20)));
    auto elapsed = f.mClock.now() - start;
    CHECK(elapsed >= cfg.SHUTDOWN_GRACE_PERIOD_MS);
    CHECK(elapsed < cfg.STREAM_TIMEOUT_MS);

    CHECK(f.mOutcomes.size() == 2);
    CHECK(f.mOutcomes.count(DropReason::ShuttingDown) == 2);
    CHECK(f.evictionsFor(EvictionReason::Shutdown) == 1);

    // Stream failures arriving after the stop only release resources.
    testutil::crankSome(f.mClock);
    CHECK(f.mOutcomes.calls() == 2);
    CHECK(f.mStoppedCalls == 1);
    CHECK(f.mApp->getProxyManager().getDestinationStats(1).mInFlight == 0);
    CHECK(listener.getLiveConnectionCount() == 0);
    CHECK(listener.getReceivedStreams().empty());
}

TEST_CASE("idle connections are swept", "[shutdown][pool]")
{
    AppFixture f(getTestConfig(1));
    REQUIRE(f.send(0) == SubmitResult::Accepted);
    REQUIRE(f.crankUntil([&]() { return f.mOutcomes.size() == 1; }));
    REQUIRE(f.mApp->getProxyManager().getDestinationStats(0).mOpenConnections ==
            1);

    testutil::advanceTime(f.mClock, f.mCfg.CONNECTION_IDLE_TIMEOUT_MS / 2);
    CHECK(f.evictionsFor(EvictionReason::IdleTimeout) == 0);

    testutil::advanceTime(f.mClock, f.mCfg.CONNECTION_IDLE_TIMEOUT_MS / 2 +
                                        2 * f.mCfg.IDLE_SWEEP_INTERVAL_MS);
    CHECK(f.evictionsFor(EvictionReason::IdleTimeout) == 1);
    auto stats = f.mApp->getProxyManager().getDestinationStats(0);
    CHECK(stats.mOpenConnections == 0);
    CHECK(stats.mEvictions == 1);
    CHECK(stats.mEvictionsByReason[EvictionReason::IdleTimeout] == 1);

    // The next request reconnects.
    REQUIRE(f.send(0) == SubmitResult::Accepted);
    REQUIRE(f.crankUntil([&]() { return f.mOutcomes.size() == 2; }));
    CHECK(f.mListeners[0]->getStats().handshakesAccepted == 2);
}

TEST_CASE("destination stats", "[shutdown]")
{
    AppFixture f(getTestConfig(2));
    f.mListeners[1]->refuseNextStreamOpens(1);

    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(f.send(1) == SubmitResult::Accepted);
    }
    REQUIRE(f.crankUntil([&]() { return f.mOutcomes.size() == 3; }));

    auto s = f.mApp->getProxyManager().getDestinationStats(1);
    CHECK(s.mName == "v1");
    CHECK(s.mAddress == f.mCfg.DESTINATIONS[1].toString());
    CHECK(s.mQuota == 16);
    CHECK(s.mInFlight == 0);
    CHECK(s.mOpenConnections == 1);
    CHECK(s.mQueueDepth == 0);
    CHECK(s.mWaiters == 0);
    CHECK(s.mSucceeded == 3);
    CHECK(s.mRetried == 1);
    CHECK(s.mDropped == 0);
    CHECK(s.mConnectionsEstablished == 1);
    CHECK(s.mHandshakeFailures == 0);

    auto other = f.mApp->getProxyManager().getDestinationStats(0);
    CHECK(other.mSucceeded == 0);
    CHECK(other.mConnectionAttempts == 0);
}

TEST_CASE("application info", "[shutdown]")
{
    VirtualClock clock;
    auto cfg = getTestConfig(2);
    std::vector<std::shared_ptr<LoopbackQuicListener>> listeners;
    auto app = createTestApplication(clock, cfg, listeners);

    auto info = app->getJsonInfo()["info"];
    CHECK(info["state"].asString() == "Booting");
    CHECK(!info["identity"].asString().empty());
    CHECK(!info["build"].asString().empty());

    app->start();
    OutcomeRecorder outcomes;
    auto& gw = app->getProxyManager().getInboundGateway();
    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(gw.submit(testutil::makePayload(10), std::string("v1"),
                          outcomes.callback()) == SubmitResult::Accepted);
    }
    REQUIRE(testutil::crankUntil(
        *app, [&]() { return outcomes.size() == 3; },
        std::chrono::seconds(5)));

    info = app->getJsonInfo()["info"];
    CHECK(info["state"].asString() == "Running");
    auto const& dests = info["destinations"];
    REQUIRE(dests.size() == 2);
    CHECK(dests[0]["name"].asString() == "v0");
    CHECK(dests[1]["name"].asString() == "v1");
    CHECK(dests[1]["address"].asString() == cfg.DESTINATIONS[1].toString());
    CHECK(dests[1]["quota"].asUInt() == 16);
    CHECK(dests[1]["succeeded"].asUInt64() == 3);
    CHECK(dests[1]["open_connections"].asUInt() == 1);
    CHECK(dests[0]["succeeded"].asUInt64() == 0);
}

TEST_CASE("application refuses an invalid config", "[shutdown][config]")
{
    VirtualClock clock;
    std::vector<std::shared_ptr<LoopbackQuicListener>> listeners;

    SECTION("no destinations")
    {
        auto cfg = getTestConfig(1);
        cfg.DESTINATIONS.clear();
        REQUIRE_THROWS_AS(createTestApplication(clock, cfg, listeners),
                          std::invalid_argument);
    }
    SECTION("no retries")
    {
        auto cfg = getTestConfig(1);
        cfg.MAX_RETRY_ATTEMPTS = 0;
        REQUIRE_THROWS_AS(createTestApplication(clock, cfg, listeners),
                          std::invalid_argument);
    }
}
