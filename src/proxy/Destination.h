#pragma once

// Copyright 2024 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <cstdint>
#include <string>
#include <vector>

namespace tpuproxy
{

// A validator's transaction-ingestion endpoint and its stake weight. Set at
// configuration time and read-only afterwards; destinations are referred to
// by their index in Config::DESTINATIONS.
struct Destination
{
    std::string mName;
    std::string mHost;
    unsigned short mPort{0};
    uint64_t mStake{0};

    std::string toString() const;

    // Parses "host:port" or "[v6addr]:port". Throws std::invalid_argument.
    static Destination fromAddress(std::string const& address,
                                   uint64_t stake = 0);
};

typedef size_t DestinationIndex;
}
