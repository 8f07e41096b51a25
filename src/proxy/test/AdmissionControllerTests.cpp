// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "proxy/AdmissionController.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/test.h"
#include "util/Timer.h"

#include <atomic>
#include <autocheck/autocheck.hpp>
#include <thread>
#include <vector>

using namespace tpuproxy;

TEST_CASE("stream quota follows stake", "[admission]")
{
    Config cfg;
    cfg.TOTAL_STAKED_CONCURRENT_STREAMS = 100000;
    cfg.MIN_STAKED_CONCURRENT_STREAMS = 128;
    cfg.MAX_STAKED_CONCURRENT_STREAMS = 512;
    cfg.UNSTAKED_CONCURRENT_STREAMS = 64;
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 0;

    auto withStake = [](uint64_t stake) {
        return Destination::fromAddress("127.0.0.1:8000", stake);
    };

    SECTION("proportional share")
    {
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(3),
                                                      1000) == 300);
    }
    SECTION("clamped to the staked minimum")
    {
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(1),
                                                      1000) == 128);
    }
    SECTION("clamped to the staked maximum")
    {
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(900),
                                                      1000) == 512);
    }
    SECTION("unstaked")
    {
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(0),
                                                      1000) == 64);
        // Nobody is staked at all.
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(5), 0) ==
              64);
    }
    SECTION("lamport-scale stakes do not overflow")
    {
        uint64_t stake = 4000000000000000000ULL;
        CHECK(AdmissionController::computeStreamQuota(
                  cfg, withStake(stake), stake * 4) == 512);
        CHECK(AdmissionController::computeStreamQuota(
                  cfg, withStake(stake / 400), stake) == 250);
    }
    SECTION("explicit cap")
    {
        cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 16;
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(3),
                                                      1000) == 16);
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(0),
                                                      1000) == 16);
        cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 1000;
        CHECK(AdmissionController::computeStreamQuota(cfg, withStake(3),
                                                      1000) == 300);
    }
    SECTION("always within bounds")
    {
        autocheck::check<uint32_t, uint32_t>(
            [&](uint32_t stake, uint32_t rest) {
                auto q = AdmissionController::computeStreamQuota(
                    cfg, withStake(stake), uint64_t(stake) + rest);
                bool ok = stake == 0 ? q == 64 : (q >= 128 && q <= 512);
                CHECK(ok);
                return ok;
            },
            100);
    }
}

TEST_CASE("stream admission", "[admission]")
{
    VirtualClock clock;
    auto cfg = getTestConfig(2);
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 3;
    AdmissionController ac(clock, cfg);

    REQUIRE(ac.getDestinationCount() == 2);
    REQUIRE(ac.getQuota(0) == 3);

    CHECK(ac.tryAdmit(0));
    CHECK(ac.tryAdmit(0));
    CHECK(ac.tryAdmit(0));
    CHECK(!ac.tryAdmit(0));
    CHECK(ac.getInFlight(0) == 3);

    // Destinations are independent.
    CHECK(ac.tryAdmit(1));
    CHECK(ac.getInFlight(1) == 1);

    ac.release(0);
    CHECK(ac.getInFlight(0) == 2);
    CHECK(ac.tryAdmit(0));
    CHECK(!ac.tryAdmit(0));
}

TEST_CASE("random admit and release sequences respect the quota",
          "[admission]")
{
    VirtualClock clock;
    auto cfg = getTestConfig(3);
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 4;
    autocheck::generator<std::vector<uint8_t>> ops;

    for (int s = 0; s < 200; s++)
    {
        AdmissionController ac(clock, cfg);
        std::vector<uint32_t> model(ac.getDestinationCount(), 0);
        for (auto op : ops(s))
        {
            DestinationIndex dest = (op >> 1) % model.size();
            if ((op & 1) == 0)
            {
                bool expected = model[dest] < ac.getQuota(dest);
                REQUIRE(ac.tryAdmit(dest) == expected);
                if (expected)
                {
                    ++model[dest];
                }
            }
            else if (model[dest] > 0)
            {
                ac.release(dest);
                --model[dest];
            }
            for (DestinationIndex d = 0; d < model.size(); ++d)
            {
                REQUIRE(ac.getInFlight(d) == model[d]);
                REQUIRE(ac.getInFlight(d) <= ac.getQuota(d));
            }
        }
    }
}

TEST_CASE("concurrent stream admission never exceeds the quota",
          "[admission]")
{
    VirtualClock clock;
    auto cfg = getTestConfig(1);
    cfg.MAX_CONCURRENT_STREAMS_PER_DESTINATION = 16;
    AdmissionController ac(clock, cfg);

    std::atomic<uint32_t> admitted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i)
            {
                if (ac.tryAdmit(0))
                {
                    ++admitted;
                }
            }
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }
    CHECK(admitted == 16);
    CHECK(ac.getInFlight(0) == 16);

    // Release and re-admit from many threads; the count stays balanced.
    threads.clear();
    for (int t = 0; t < 8; ++t)
    {
        threads.emplace_back([&]() {
            ac.release(0);
            while (!ac.tryAdmit(0))
            {
                std::this_thread::yield();
            }
            ac.release(0);
        });
    }
    for (auto& t : threads)
    {
        t.join();
    }
    CHECK(ac.getInFlight(0) == 8);
}

TEST_CASE("connection admission", "[admission]")
{
    VirtualClock clock;
    auto cfg = getTestConfig(1);
    cfg.MAX_CONNECTIONS_PER_DESTINATION = 2;
    cfg.MAX_CONNECTION_ATTEMPTS_PER_MINUTE = 3;
    AdmissionController ac(clock, cfg);
    using CA = AdmissionController::ConnectionAdmission;

    SECTION("concurrent connection cap")
    {
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        CHECK(ac.tryAdmitConnection(0) == CA::TooManyConnections);
        CHECK(ac.getOpenConnections(0) == 2);
        ac.connectionClosed(0);
        CHECK(ac.getOpenConnections(0) == 1);
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
    }

    SECTION("attempt rate window")
    {
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        ac.connectionClosed(0);
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        ac.connectionClosed(0);
        testutil::advanceTime(clock, std::chrono::seconds(30));
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        ac.connectionClosed(0);

        // Three attempts in the last minute, even though none is open.
        CHECK(ac.getOpenConnections(0) == 0);
        CHECK(ac.tryAdmitConnection(0) == CA::RateLimited);

        // The first two age out of the window.
        testutil::advanceTime(clock, std::chrono::seconds(31));
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        CHECK(ac.tryAdmitConnection(0) == CA::Admitted);
        CHECK(ac.tryAdmitConnection(0) == CA::TooManyConnections);
        ac.connectionClosed(0);
        CHECK(ac.tryAdmitConnection(0) == CA::RateLimited);
    }
}
