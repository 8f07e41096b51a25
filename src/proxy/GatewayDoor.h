#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/asio.h"
#include "util/types.h"
#include <array>
#include <memory>
#include <vector>

/*
listens for front-end connections on GATEWAY_ADDRESS:GATEWAY_PORT.
Every frame read from a client is passed to the InboundGateway.

Frame layout, all integers big-endian:
  4 bytes  payload length
  2 bytes  destination index
  N bytes  transaction payload
Nothing is ever written back to the client.
*/

namespace tpuproxy
{
class Application;
class InboundGateway;

class GatewayClient : public std::enable_shared_from_this<GatewayClient>
{
  public:
    typedef asio::ip::tcp::socket SocketType;
    static constexpr size_t HDRSZ = 6;

  private:
    Application& mApp;
    InboundGateway& mGateway;
    std::shared_ptr<SocketType> mSocket;
    std::string const mRemote;

    std::array<uint8_t, HDRSZ> mHeader;
    Blob mBody;
    uint16_t mIncomingDestination{0};
    uint64_t mFramesReceived{0};
    bool mClosed{false};

    void readHeaderHandler(asio::error_code const& ec, size_t length);
    void readBodyHandler(asio::error_code const& ec, size_t length);
    void submitFrame();

  public:
    typedef std::shared_ptr<GatewayClient> pointer;

    GatewayClient(Application& app, InboundGateway& gateway,
                  std::shared_ptr<SocketType> socket);

    void startRead();
    void close(std::string const& reason);

    uint64_t
    getFramesReceived() const
    {
        return mFramesReceived;
    }
    bool
    isClosed() const
    {
        return mClosed;
    }
};

class GatewayDoor
{
  protected:
    Application& mApp;
    InboundGateway& mGateway;
    asio::ip::tcp::acceptor mAcceptor;
    std::vector<std::weak_ptr<GatewayClient>> mClients;
    bool mClosed{false};

    virtual void acceptNextClient();
    virtual void
    handleKnock(std::shared_ptr<GatewayClient::SocketType> pSocket);

  public:
    typedef std::shared_ptr<GatewayDoor> pointer;

    GatewayDoor(Application& app, InboundGateway& gateway);
    virtual ~GatewayDoor();

    void start();
    // Stops accepting and closes every client connection.
    void close();

    // Port actually bound; differs from GATEWAY_PORT only when that is 0.
    unsigned short getLocalPort() const;
    size_t getClientCount() const;
};
}
