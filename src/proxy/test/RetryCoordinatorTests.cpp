// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "proxy/AdmissionController.h"
#include "proxy/ConnectionPool.h"
#include "proxy/ProxyMetrics.h"
#include "proxy/RetryCoordinator.h"
#include "proxy/StreamForwarder.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/test.h"
#include "util/Timer.h"

#include "medida/meter.h"
#include "medida/metrics_registry.h"

using namespace tpuproxy;

namespace
{

class CoordinatorFixture
{
  public:
    VirtualClock mClock;
    Config mCfg;
    std::unique_ptr<LoopbackValidators> mValidators;
    medida::MetricsRegistry mRegistry;
    std::unique_ptr<ProxyMetrics> mMetrics;
    std::unique_ptr<AdmissionController> mAdmission;
    std::shared_ptr<ConnectionPool> mPool;
    std::unique_ptr<StreamForwarder> mForwarder;
    std::shared_ptr<RetryCoordinator> mCoordinator;
    std::vector<EvictionEvent> mEvictions;
    OutcomeRecorder mOutcomes;
    uint64_t mNextID{1};

    explicit CoordinatorFixture(Config const& cfg) : mCfg(cfg)
    {
        mValidators = std::make_unique<LoopbackValidators>(mClock, mCfg);
        mMetrics = std::make_unique<ProxyMetrics>(mRegistry, mCfg);
        mAdmission = std::make_unique<AdmissionController>(mClock, mCfg);
        mPool = std::make_shared<ConnectionPool>(
            mClock, mCfg, mValidators->mConnector, *mAdmission, *mMetrics);
        mForwarder = std::make_unique<StreamForwarder>(mClock, mCfg, *mMetrics);
        mCoordinator = std::make_shared<RetryCoordinator>(
            mClock, mCfg, *mAdmission, *mPool, *mForwarder, *mMetrics);
        mPool->addEvictionListener(
            [this](EvictionEvent const& ev) { mEvictions.emplace_back(ev); });
    }

    LoopbackQuicListener&
    listener(DestinationIndex i = 0)
    {
        return *mValidators->mListeners.at(i);
    }

    uint64_t
    send(DestinationIndex dest = 0, size_t size = 100)
    {
        auto id = mNextID++;
        mCoordinator->schedule(std::make_shared<ForwardRequest>(
            id, testutil::makePayload(size), dest, mOutcomes.callback()));
        return id;
    }

    bool
    crankUntilOutcomes(size_t n)
    {
        return testutil::crankUntil(
            mClock, [&]() { return mOutcomes.size() >= n; },
            std::chrono::seconds(10));
    }

    uint64_t
    droppedCount(DropReason reason, DestinationIndex dest = 0)
    {
        return mMetrics->forDestination(dest).drop(reason).count();
    }
};
}

TEST_CASE("requests are forwarded once each", "[retry]")
{
    CoordinatorFixture f(getTestConfig());
    for (int i = 0; i < 5; ++i)
    {
        f.send();
    }
    REQUIRE(f.crankUntilOutcomes(5));

    CHECK(f.mOutcomes.count(RequestState::Succeeded) == 5);
    CHECK(f.mOutcomes.calls() == 5);
    for (auto const& o : f.mOutcomes.all())
    {
        CHECK(o.mAttempts == 1);
        CHECK(!o.mReason);
    }
    CHECK(f.listener().getReceivedStreams().size() == 5);
    CHECK(f.mAdmission->getInFlight(0) == 0);
    CHECK(f.mCoordinator->getActiveCount() == 0);
    for (auto const& h : f.mPool->getHandles(0))
    {
        CHECK(h->getOpenStreams() == 0);
    }
    auto& m = f.mMetrics->forDestination(0);
    CHECK(m.mRequestSucceeded.count() == 5);
    CHECK(m.mRequestAdmitted.count() == 5);
}

TEST_CASE("invalid requests are dropped without an attempt", "[retry]")
{
    CoordinatorFixture f(getTestConfig());

    auto big = f.send(0, f.mCfg.MAX_PAYLOAD_SIZE + 1);
    REQUIRE(f.mOutcomes.size() == 1);
    CHECK(f.mOutcomes.get(big).mReason == DropReason::PayloadTooLarge);
    CHECK(f.mOutcomes.get(big).mAttempts == 0);

    auto unknown = f.send(7);
    REQUIRE(f.mOutcomes.size() == 2);
    CHECK(f.mOutcomes.get(unknown).mReason == DropReason::UnknownDestination);
    CHECK(f.listener().getStats().handshakesAttempted == 0);
}

TEST_CASE("transient failures are retried", "[retry]")
{
    CoordinatorFixture f(getTestConfig());

    SECTION("open refused once")
    {
        f.listener().refuseNextStreamOpens(1);
        auto id = f.send();
        REQUIRE(f.crankUntilOutcomes(1));
        auto const& o = f.mOutcomes.get(id);
        CHECK(o.mState == RequestState::Succeeded);
        CHECK(o.mAttempts == 2);
        // The refusal degraded the connection without evicting it.
        CHECK(f.mEvictions.empty());
        CHECK(f.listener().getStats().handshakesAccepted == 1);
    }

    SECTION("write failure moves to a fresh connection")
    {
        f.listener().failNextWrites(1);
        auto id = f.send();
        REQUIRE(f.crankUntilOutcomes(1));
        auto const& o = f.mOutcomes.get(id);
        CHECK(o.mState == RequestState::Succeeded);
        CHECK(o.mAttempts == 2);
        REQUIRE(f.mEvictions.size() == 1);
        CHECK(f.mEvictions[0].mReason == EvictionReason::WriteFailure);
        CHECK(f.listener().getStats().handshakesAccepted == 2);
    }

    SECTION("timeout")
    {
        f.listener().setStreamDelay(f.mCfg.STREAM_TIMEOUT_MS * 2);
        auto id = f.send();
        testutil::crankUntil(
            f.mClock,
            [&]() { return f.mCoordinator->getRetryingCount() == 1; },
            std::chrono::seconds(1));
        f.listener().setStreamDelay(std::chrono::milliseconds(0));
        REQUIRE(f.crankUntilOutcomes(1));
        CHECK(f.mOutcomes.get(id).mState == RequestState::Succeeded);
        CHECK(f.mOutcomes.get(id).mAttempts == 2);
    }

    CHECK(f.mMetrics->forDestination(0).mRequestRetried.count() == 1);
    CHECK(f.mAdmission->getInFlight(0) == 0);
}

TEST_CASE("retries are bounded", "[retry]")
{
    auto cfg = getTestConfig();
    cfg.MAX_RETRY_ATTEMPTS = 4;
    CoordinatorFixture f(cfg);

    f.listener().refuseNextStreamOpens(1000);
    auto start = f.mClock.now();
    auto id = f.send();
    REQUIRE(f.crankUntilOutcomes(1));

    auto const& o = f.mOutcomes.get(id);
    CHECK(o.mState == RequestState::Dropped);
    CHECK(o.mReason == DropReason::RetriesExhausted);
    CHECK(o.mAttempts == 4);
    CHECK(f.listener().getStats().streamsRefused == 4);
    CHECK(f.mMetrics->forDestination(0).mRequestRetried.count() == 3);
    CHECK(f.droppedCount(DropReason::RetriesExhausted) == 1);

    // Backoff doubles between attempts: 10 + 20 + 40 ms at least.
    CHECK(f.mClock.now() - start >= std::chrono::milliseconds(70));

    // Three refusals in a row hit the error threshold.
    REQUIRE(!f.mEvictions.empty());
    CHECK(f.mEvictions[0].mReason == EvictionReason::ErrorThreshold);
    CHECK(f.mAdmission->getInFlight(0) == 0);
}

TEST_CASE("handshake failures are retried then dropped", "[retry]")
{
    CoordinatorFixture f(getTestConfig());
    f.listener().setRefuseHandshakes(true);
    auto id = f.send();
    REQUIRE(f.crankUntilOutcomes(1));
    CHECK(f.mOutcomes.get(id).mReason == DropReason::RetriesExhausted);
    CHECK(f.mOutcomes.get(id).mAttempts == f.mCfg.MAX_RETRY_ATTEMPTS);
    CHECK(f.listener().getStats().handshakesAttempted ==
          f.mCfg.MAX_RETRY_ATTEMPTS);
}

TEST_CASE("saturated destination queues with oldest-drop", "[retry]")
{
    auto cfg = getTestConfig(2);
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 2;
    cfg.INBOUND_QUEUE_CAPACITY = 3;
    CoordinatorFixture f(cfg);
    REQUIRE(f.mAdmission->getQuota(0) == 2);
    f.listener().setCorked(true);

    SECTION("five requests fit in quota plus queue")
    {
        for (int i = 0; i < 5; ++i)
        {
            f.send();
        }
        CHECK(f.mAdmission->getInFlight(0) == 2);
        CHECK(f.mCoordinator->getActiveCount() == 2);
        CHECK(f.mCoordinator->getQueueDepth(0) == 3);
        CHECK(f.mOutcomes.size() == 0);

        // Another destination is not affected.
        f.send(1);
        CHECK(f.mAdmission->getInFlight(1) == 1);
        CHECK(f.mCoordinator->getQueueDepth(1) == 0);

        f.listener().setCorked(false);
        REQUIRE(f.crankUntilOutcomes(6));
        CHECK(f.mOutcomes.count(RequestState::Succeeded) == 6);
        CHECK(f.mCoordinator->getQueueDepth(0) == 0);
        auto& m = f.mMetrics->forDestination(0);
        CHECK(m.mRequestQueued.count() == 3);
        CHECK(m.mRequestSucceeded.count() + m.mRequestDropped.count() == 5);
    }

    SECTION("queue overflow drops the oldest")
    {
        std::vector<uint64_t> ids;
        for (int i = 0; i < 7; ++i)
        {
            ids.emplace_back(f.send());
        }
        // 2 in flight, 3 queued, the two oldest queued ones shed.
        CHECK(f.mCoordinator->getQueueDepth(0) == 3);
        REQUIRE(f.mOutcomes.size() == 2);
        CHECK(f.mOutcomes.get(ids[2]).mReason == DropReason::QueueOverflow);
        CHECK(f.mOutcomes.get(ids[3]).mReason == DropReason::QueueOverflow);
        CHECK(f.mOutcomes.get(ids[2]).mAttempts == 0);

        f.listener().setCorked(false);
        REQUIRE(f.crankUntilOutcomes(7));
        CHECK(f.mOutcomes.count(RequestState::Succeeded) == 5);
        CHECK(f.mOutcomes.count(DropReason::QueueOverflow) == 2);
        CHECK(f.droppedCount(DropReason::QueueOverflow) == 2);
        CHECK(f.listener().getStats().maxConcurrentStreams <= 2);
    }
}

TEST_CASE("saturated destination drops when queueing is off", "[retry]")
{
    auto cfg = getTestConfig();
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 2;
    cfg.QUEUE_ON_SATURATION = false;
    CoordinatorFixture f(cfg);
    f.listener().setCorked(true);

    f.send();
    f.send();
    auto third = f.send();
    REQUIRE(f.mOutcomes.size() == 1);
    CHECK(f.mOutcomes.get(third).mReason == DropReason::DestinationSaturated);
    CHECK(f.mCoordinator->getQueueDepth(0) == 0);
    CHECK(f.mMetrics->forDestination(0).mRequestRejected.count() == 1);

    f.listener().setCorked(false);
    REQUIRE(f.crankUntilOutcomes(3));
    CHECK(f.mOutcomes.count(RequestState::Succeeded) == 2);
}

TEST_CASE("every request gets exactly one outcome", "[retry]")
{
    auto cfg = getTestConfig(2);
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 4;
    cfg.INBOUND_QUEUE_CAPACITY = 10;
    CoordinatorFixture f(cfg);
    f.listener(0).refuseNextStreamOpens(5);
    f.listener(0).failNextWrites(3);
    f.listener(1).setStreamDelay(std::chrono::milliseconds(20));

    size_t const n = 60;
    for (size_t i = 0; i < n; ++i)
    {
        f.send(i % 2);
    }
    REQUIRE(f.crankUntilOutcomes(n));
    testutil::crankSome(f.mClock);

    CHECK(f.mOutcomes.size() == n);
    CHECK(f.mOutcomes.calls() == n);
    CHECK(f.mOutcomes.count(RequestState::Succeeded) +
              f.mOutcomes.count(RequestState::Dropped) ==
          n);
    for (auto const& o : f.mOutcomes.all())
    {
        if (o.mState == RequestState::Dropped)
        {
            CHECK(o.mReason);
        }
        CHECK(o.mAttempts <= cfg.MAX_RETRY_ATTEMPTS);
    }
    for (DestinationIndex d = 0; d < 2; ++d)
    {
        CHECK(f.mAdmission->getInFlight(d) == 0);
        CHECK(f.mCoordinator->getQueueDepth(d) == 0);
        auto& m = f.mMetrics->forDestination(d);
        CHECK(m.mRequestSucceeded.count() + m.mRequestDropped.count() ==
              n / 2);
    }
    CHECK(f.mCoordinator->getActiveCount() == 0);
    CHECK(f.mCoordinator->getRetryingCount() == 0);
}

TEST_CASE("coordinator shutdown", "[retry][shutdown]")
{
    auto cfg = getTestConfig();
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 2;
    CoordinatorFixture f(cfg);
    f.listener().setStreamDelay(std::chrono::milliseconds(50));

    auto a = f.send();
    auto b = f.send();
    auto queued1 = f.send();
    auto queued2 = f.send();
    REQUIRE(f.mCoordinator->getQueueDepth(0) == 2);

    bool drained = false;
    f.mCoordinator->shutdown([&]() { drained = true; });
    CHECK(f.mCoordinator->isShuttingDown());

    // Queued requests are dropped right away, in-flight ones continue.
    REQUIRE(f.mOutcomes.size() == 2);
    CHECK(f.mOutcomes.get(queued1).mReason == DropReason::ShuttingDown);
    CHECK(f.mOutcomes.get(queued2).mReason == DropReason::ShuttingDown);
    CHECK(!drained);

    auto late = f.send();
    CHECK(f.mOutcomes.get(late).mReason == DropReason::ShuttingDown);

    REQUIRE(testutil::crankUntil(
        f.mClock, [&]() { return drained; }, std::chrono::seconds(1)));
    CHECK(f.mOutcomes.get(a).mState == RequestState::Succeeded);
    CHECK(f.mOutcomes.get(b).mState == RequestState::Succeeded);
    CHECK(f.mOutcomes.calls() == 5);
}

TEST_CASE("shutdown drops requests waiting to retry", "[retry][shutdown]")
{
    auto cfg = getTestConfig();
    cfg.RETRY_BACKOFF_BASE_MS = std::chrono::milliseconds(100);
    CoordinatorFixture f(cfg);
    f.listener().refuseNextStreamOpens(1);

    auto id = f.send();
    REQUIRE(testutil::crankUntil(
        f.mClock, [&]() { return f.mCoordinator->getRetryingCount() == 1; },
        std::chrono::seconds(1)));

    bool drained = false;
    f.mCoordinator->shutdown([&]() { drained = true; });
    CHECK(drained);
    REQUIRE(f.mOutcomes.size() == 1);
    CHECK(f.mOutcomes.get(id).mReason == DropReason::ShuttingDown);
    CHECK(f.mCoordinator->getRetryingCount() == 0);

    // The cancelled backoff never fires a second attempt.
    testutil::crankFor(f.mClock, std::chrono::milliseconds(500));
    CHECK(f.mOutcomes.calls() == 1);
    CHECK(f.listener().getStats().streamsOpened == 0);
}

TEST_CASE("dropping in-flight requests at the deadline", "[retry][shutdown]")
{
    CoordinatorFixture f(getTestConfig());
    f.listener().setCorked(true);

    f.send();
    f.send();
    REQUIRE(testutil::crankUntil(
        f.mClock, [&]() { return f.listener().getStats().streamsOpened == 2; },
        std::chrono::seconds(1)));

    bool drained = false;
    f.mCoordinator->shutdown([&]() { drained = true; });
    CHECK(!drained);
    f.mCoordinator->dropAllActive();
    CHECK(drained);
    CHECK(f.mOutcomes.count(DropReason::ShuttingDown) == 2);

    // Late transport callbacks only hand back resources.
    f.mPool->closeAll(EvictionReason::Shutdown);
    testutil::crankSome(f.mClock);
    CHECK(f.mOutcomes.calls() == 2);
    CHECK(f.mAdmission->getInFlight(0) == 0);
}
