// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#pragma once

namespace tpuproxy
{
// The main thread is whichever thread cranks the VirtualClock; it is recorded
// when the process starts.
bool threadIsMain();

[[noreturn]] void printAssertFailureAndAbort(char const* expr,
                                             char const* file, int line);

// Like `assert()` but not sensitive to NDEBUG: admission counters and pool
// accounting are checked in release builds too.
#define releaseAssert(e) \
    (static_cast<bool>(e) \
         ? void(0) \
         : tpuproxy::printAssertFailureAndAbort(#e, __FILE__, __LINE__))
}
