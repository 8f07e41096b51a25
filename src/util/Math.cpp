// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Math.h"
#include "util/GlobalChecks.h"
#include <algorithm>

namespace tpuproxy
{

tpuproxy_default_random_engine gRandomEngine;

VirtualClock::duration
exponentialBackoff(uint32_t n, std::chrono::milliseconds base,
                   std::chrono::milliseconds max)
{
    releaseAssert(n >= 1);
    // Past 2^31 the cap is reached for any positive base anyway.
    uint32_t const shift = std::min<uint32_t>(n - 1, 31);
    auto const factor = static_cast<uint64_t>(1) << shift;
    auto const baseMs = static_cast<uint64_t>(base.count());
    auto const maxMs = static_cast<uint64_t>(max.count());
    uint64_t delayMs = maxMs;
    if (baseMs == 0)
    {
        delayMs = 0;
    }
    else if (factor <= maxMs / baseMs)
    {
        delayMs = std::min(baseMs * factor, maxMs);
    }
    return std::chrono::milliseconds(delayMs);
}

#ifdef BUILD_TESTS
void
reinitializeAllGlobalStateWithSeed(unsigned int seed)
{
    gRandomEngine.seed(seed);
}
#endif
}
