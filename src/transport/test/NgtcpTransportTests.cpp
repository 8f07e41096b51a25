// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "crypto/IdentityProvider.h"
#include "crypto/SecretKey.h"
#include "main/Config.h"
#include "test/Catch2.h"
#include "test/TestUtils.h"
#include "test/test.h"
#include "transport/NgtcpConnection.h"
#include "transport/NgtcpConnector.h"
#include "transport/StreamSendBuffer.h"
#include "util/Timer.h"
#include "util/asio.h"

#include <algorithm>
#include <optional>

using namespace tpuproxy;

namespace
{
// A UDP socket that never answers, so a handshake against it can only time
// out.
struct SilentPeer
{
    asio::ip::udp::socket mSocket;

    explicit SilentPeer(VirtualClock& clock)
        : mSocket(clock.getIOContext(),
                  asio::ip::udp::endpoint(asio::ip::make_address("127.0.0.1"),
                                          0))
    {
    }

    asio::ip::udp::endpoint
    endpoint() const
    {
        return mSocket.local_endpoint();
    }
};
}

TEST_CASE("stream bytes outlive the write until acknowledged", "[transport]")
{
    StreamSendBuffer buffer;
    auto payload = testutil::makePayload(1000, 0x5a);
    buffer.add(4, payload);
    REQUIRE(buffer.retainedBytes() == 1000);

    SECTION("fully written but unacknowledged bytes stay readable")
    {
        auto first = buffer.unsent(4);
        REQUIRE(first.second == 1000);
        CHECK(!buffer.markSent(4, 600));
        auto rest = buffer.unsent(4);
        CHECK(rest.second == 400);
        CHECK(rest.first == first.first + 600);
        CHECK(buffer.markSent(4, 400));
        CHECK(buffer.unsent(4).second == 0);

        // The writer is done but the stack may retransmit: memory stays.
        REQUIRE(buffer.contains(4));
        CHECK(std::equal(payload.begin(), payload.end(), first.first));

        buffer.markAcked(4, 600);
        CHECK(buffer.contains(4));
        CHECK(std::equal(payload.begin(), payload.end(), first.first));
        buffer.markAcked(4, 400);
        CHECK(!buffer.contains(4));
        CHECK(buffer.retainedBytes() == 0);
    }

    SECTION("closing a stream releases it whatever was acknowledged")
    {
        CHECK(buffer.markSent(4, 1000));
        buffer.markAcked(4, 10);
        buffer.release(4);
        CHECK(!buffer.contains(4));
        CHECK(buffer.size() == 0);
    }

    SECTION("streams are tracked independently")
    {
        buffer.add(8, testutil::makePayload(10));
        CHECK(buffer.size() == 2);
        buffer.markAcked(8, 10);
        CHECK(buffer.size() == 1);
        CHECK(buffer.contains(4));
        CHECK(buffer.retainedBytes() == 1000);
    }

    SECTION("unknown streams are ignored")
    {
        CHECK(buffer.unsent(99).first == nullptr);
        CHECK(!buffer.markSent(99, 1));
        buffer.markAcked(99, 1);
        buffer.release(99);
        CHECK(buffer.size() == 1);
    }
}

TEST_CASE("ngtcp2 handshake against a silent peer", "[transport]")
{
    VirtualClock clock;
    auto cfg = getTestConfig();
    IdentityProvider identity(SecretKey::pseudoRandomForTestingFromSeed(7),
                              cfg.CERTIFICATE_COMMON_NAME,
                              std::chrono::system_clock::now());
    SilentPeer peer(clock);

    SECTION("connection reports the timeout once")
    {
        auto conn = std::make_shared<NgtcpConnection>(clock, cfg, identity,
                                                      "silent");
        size_t calls = 0;
        std::string error;
        auto start = clock.now();
        conn->start(peer.endpoint(), cfg.HANDSHAKE_TIMEOUT_MS,
                    [&](std::string const& e) {
                        ++calls;
                        error = e;
                    });

        std::optional<StreamResult> early;
        conn->sendUniStream(testutil::makePayload(64), cfg.STREAM_TIMEOUT_MS,
                            [&early](StreamResult r) { early = r; });
        CHECK(!early);

        REQUIRE(testutil::crankUntil(
            clock, [&]() { return calls > 0 && early.has_value(); },
            std::chrono::seconds(5)));
        CHECK(*early == StreamResult::ConnectionClosed);
        CHECK(error == "handshake timed out");
        CHECK(clock.now() - start >= cfg.HANDSHAKE_TIMEOUT_MS);
        CHECK(conn->isClosed());
        CHECK(conn->getRetainedStreamBytes() == 0);

        testutil::crankFor(clock, std::chrono::seconds(1));
        CHECK(calls == 1);
    }

    SECTION("connector deadline covers resolution and handshake")
    {
        NgtcpConnector connector(clock, cfg, identity);
        auto destination = Destination::fromAddress(
            "127.0.0.1:" + std::to_string(peer.endpoint().port()));
        size_t calls = 0;
        QuicConnection::pointer conn;
        std::string error;
        auto start = clock.now();
        connector.connect(destination, cfg.HANDSHAKE_TIMEOUT_MS,
                          [&](QuicConnection::pointer c, std::string const& e) {
                              ++calls;
                              conn = c;
                              error = e;
                          });
        REQUIRE(testutil::crankUntil(
            clock, [&]() { return calls > 0; }, std::chrono::seconds(5)));
        CHECK(!conn);
        CHECK(error == "handshake timed out");
        CHECK(clock.now() - start <=
              cfg.HANDSHAKE_TIMEOUT_MS + std::chrono::milliseconds(50));

        testutil::crankFor(clock, std::chrono::seconds(1));
        CHECK(calls == 1);
    }

    SECTION("destroying the connector abandons pending attempts silently")
    {
        size_t calls = 0;
        {
            NgtcpConnector connector(clock, cfg, identity);
            connector.connect(
                Destination::fromAddress(
                    "127.0.0.1:" + std::to_string(peer.endpoint().port())),
                cfg.HANDSHAKE_TIMEOUT_MS,
                [&calls](QuicConnection::pointer, std::string const&) {
                    ++calls;
                });
        }
        testutil::crankFor(clock, std::chrono::seconds(1));
        CHECK(calls == 0);
    }
}
