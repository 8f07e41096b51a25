// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/GlobalChecks.h"

#include <cstdio>
#include <cstdlib>
#include <thread>

namespace tpuproxy
{
static std::thread::id const sMainThread = std::this_thread::get_id();

bool
threadIsMain()
{
    return sMainThread == std::this_thread::get_id();
}

void
printAssertFailureAndAbort(char const* expr, char const* file, int line)
{
    std::fprintf(stderr, "assertion failed: %s at %s:%d\n", expr, file, line);
    std::fflush(stderr);
    std::abort();
}
}
