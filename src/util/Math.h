#pragma once

// Copyright 2015 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Timer.h"
#include <cstdint>
#include <random>

namespace tpuproxy
{
// Delay before retry attempt `n` (1-based): base * 2^(n-1), capped at `max`.
VirtualClock::duration exponentialBackoff(uint32_t n,
                                          std::chrono::milliseconds base,
                                          std::chrono::milliseconds max);

typedef std::minstd_rand tpuproxy_default_random_engine;

extern tpuproxy_default_random_engine gRandomEngine;

template <typename T>
T
rand_uniform(T lo, T hi, tpuproxy_default_random_engine& engine)
{
    return std::uniform_int_distribution<T>(lo, hi)(engine);
}

template <typename T>
T
rand_uniform(T lo, T hi)
{
    return rand_uniform<T>(lo, hi, gRandomEngine);
}

#ifdef BUILD_TESTS
// Resets the process-global pseudo random state from a seed, so that each
// unit test sees the same sequence for a given --rng-seed.
void reinitializeAllGlobalStateWithSeed(unsigned int seed);
#endif
}
