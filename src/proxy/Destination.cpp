// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"

#include <cctype>
#include <fmt/format.h>
#include <stdexcept>

namespace tpuproxy
{

std::string
Destination::toString() const
{
    if (mHost.find(':') != std::string::npos)
    {
        return fmt::format(FMT_STRING("[{}]:{}"), mHost, mPort);
    }
    return fmt::format(FMT_STRING("{}:{}"), mHost, mPort);
}

Destination
Destination::fromAddress(std::string const& address, uint64_t stake)
{
    auto bad = [&]() {
        return std::invalid_argument(
            fmt::format(FMT_STRING("invalid destination address '{}'"),
                        address));
    };

    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 ||
        colon + 1 == address.size())
    {
        throw bad();
    }
    std::string host = address.substr(0, colon);
    std::string portStr = address.substr(colon + 1);
    if (host.front() == '[')
    {
        if (host.size() < 3 || host.back() != ']')
        {
            throw bad();
        }
        host = host.substr(1, host.size() - 2);
    }
    else if (host.find(':') != std::string::npos)
    {
        // Bare IPv6 without brackets is ambiguous.
        throw bad();
    }
    if (portStr.size() > 5)
    {
        throw bad();
    }
    unsigned long port = 0;
    for (char c : portStr)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
        {
            throw bad();
        }
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535)
    {
        throw bad();
    }

    Destination d;
    d.mHost = host;
    d.mPort = static_cast<unsigned short>(port);
    d.mStake = stake;
    d.mName = d.toString();
    return d;
}
}
