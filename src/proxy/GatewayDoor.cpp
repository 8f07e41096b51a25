// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/GatewayDoor.h"
#include "main/Application.h"
#include "main/Config.h"
#include "proxy/InboundGateway.h"
#include "util/GlobalChecks.h"
#include "util/Logging.h"
#include "util/Timer.h"
#include <algorithm>
#include <memory>

namespace tpuproxy
{
constexpr int const LISTEN_QUEUE_LIMIT = 100;

using asio::ip::tcp;
using namespace std;

static std::string
remoteString(GatewayClient::SocketType const& socket)
{
    asio::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec)
    {
        return "unknown";
    }
    return fmt::format(FMT_STRING("{}:{}"), ep.address().to_string(),
                       ep.port());
}

GatewayClient::GatewayClient(Application& app, InboundGateway& gateway,
                             shared_ptr<SocketType> socket)
    : mApp(app)
    , mGateway(gateway)
    , mSocket(std::move(socket))
    , mRemote(remoteString(*mSocket))
{
}

void
GatewayClient::startRead()
{
    releaseAssert(threadIsMain());
    if (mClosed)
    {
        return;
    }
    auto self = shared_from_this();
    asio::async_read(*mSocket, asio::buffer(mHeader),
                     [self](asio::error_code ec, std::size_t length) {
                         self->readHeaderHandler(ec, length);
                     });
}

void
GatewayClient::readHeaderHandler(asio::error_code const& ec, size_t length)
{
    if (mClosed)
    {
        return;
    }
    if (ec)
    {
        close(ec == asio::error::eof ? "client disconnected" : ec.message());
        return;
    }
    releaseAssert(length == HDRSZ);

    size_t bodyLength = static_cast<size_t>(mHeader[0]);
    bodyLength <<= 8;
    bodyLength |= mHeader[1];
    bodyLength <<= 8;
    bodyLength |= mHeader[2];
    bodyLength <<= 8;
    bodyLength |= mHeader[3];
    mIncomingDestination =
        static_cast<uint16_t>((static_cast<uint16_t>(mHeader[4]) << 8) |
                              mHeader[5]);

    if (bodyLength > mApp.getConfig().MAX_PAYLOAD_SIZE)
    {
        CLOG_WARNING(Gateway, "Client {} sent a {}-byte frame, limit is {}",
                     mRemote, bodyLength, mApp.getConfig().MAX_PAYLOAD_SIZE);
        close("oversized frame");
        return;
    }

    mBody.resize(bodyLength);
    if (bodyLength == 0)
    {
        submitFrame();
        startRead();
        return;
    }

    auto self = shared_from_this();
    asio::async_read(*mSocket, asio::buffer(mBody),
                     [self](asio::error_code ec, std::size_t length) {
                         self->readBodyHandler(ec, length);
                     });
}

void
GatewayClient::readBodyHandler(asio::error_code const& ec, size_t length)
{
    if (mClosed)
    {
        return;
    }
    if (ec)
    {
        close(ec == asio::error::eof ? "client disconnected mid-frame"
                                     : ec.message());
        return;
    }
    releaseAssert(length == mBody.size());
    submitFrame();
    startRead();
}

void
GatewayClient::submitFrame()
{
    ++mFramesReceived;
    auto res = mGateway.submit(std::move(mBody), mIncomingDestination);
    mBody.clear();
    if (res != SubmitResult::Accepted)
    {
        CLOG_DEBUG(Gateway, "Frame {} from {} for destination {}: {}",
                   mFramesReceived, mRemote, mIncomingDestination,
                   toString(res));
    }
}

void
GatewayClient::close(std::string const& reason)
{
    if (mClosed)
    {
        return;
    }
    mClosed = true;
    CLOG_DEBUG(Gateway, "Closing client {} after {} frame(s): {}", mRemote,
               mFramesReceived, reason);
    asio::error_code ec;
    mSocket->shutdown(tcp::socket::shutdown_both, ec);
    mSocket->close(ec);
    if (ec)
    {
        CLOG_WARNING(Gateway, "GatewayClient: close socket failed: {}",
                     ec.message());
    }
}

GatewayDoor::GatewayDoor(Application& app, InboundGateway& gateway)
    : mApp(app), mGateway(gateway), mAcceptor(mApp.getClock().getIOContext())
{
}

GatewayDoor::~GatewayDoor()
{
    close();
}

void
GatewayDoor::start()
{
    releaseAssert(threadIsMain());

    auto const& cfg = mApp.getConfig();
    tcp::endpoint endpoint(asio::ip::make_address(cfg.GATEWAY_ADDRESS),
                           cfg.GATEWAY_PORT);
    mAcceptor.open(endpoint.protocol());
    mAcceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    mAcceptor.bind(endpoint);
    mAcceptor.listen(LISTEN_QUEUE_LIMIT);
    CLOG_INFO(Gateway, "Gateway listening on {}:{}",
              endpoint.address().to_string(), getLocalPort());
    acceptNextClient();
}

void
GatewayDoor::close()
{
    mClosed = true;
    if (mAcceptor.is_open())
    {
        asio::error_code ec;
        // ignore errors when closing
        mAcceptor.close(ec);
    }
    for (auto const& weak : mClients)
    {
        if (auto client = weak.lock())
        {
            client->close("gateway closing");
        }
    }
    mClients.clear();
}

void
GatewayDoor::acceptNextClient()
{
    if (mClosed)
    {
        return;
    }

    CLOG_TRACE(Gateway, "GatewayDoor acceptNextClient()");
    auto sock =
        make_shared<GatewayClient::SocketType>(mApp.getClock().getIOContext());
    mAcceptor.async_accept(*sock, [this, sock](asio::error_code const& ec) {
        releaseAssert(threadIsMain());
        if (ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            CLOG_DEBUG(Gateway, "GatewayDoor accept error: {}", ec.message());
            this->acceptNextClient();
        }
        else
        {
            this->handleKnock(sock);
        }
    });
}

void
GatewayDoor::handleKnock(shared_ptr<GatewayClient::SocketType> socket)
{
    releaseAssert(threadIsMain());

    mClients.erase(std::remove_if(mClients.begin(), mClients.end(),
                                  [](std::weak_ptr<GatewayClient> const& w) {
                                      auto c = w.lock();
                                      return !c || c->isClosed();
                                  }),
                   mClients.end());

    asio::error_code ec;
    socket->set_option(tcp::no_delay(true), ec);
    auto client = make_shared<GatewayClient>(mApp, mGateway, socket);
    CLOG_DEBUG(Gateway, "Accepted gateway client");
    mClients.emplace_back(client);
    client->startRead();
    acceptNextClient();
}

unsigned short
GatewayDoor::getLocalPort() const
{
    asio::error_code ec;
    auto ep = mAcceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

size_t
GatewayDoor::getClientCount() const
{
    return std::count_if(mClients.begin(), mClients.end(),
                         [](std::weak_ptr<GatewayClient> const& w) {
                             auto c = w.lock();
                             return c && !c->isClosed();
                         });
}
}
