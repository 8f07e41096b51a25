#pragma once

// Copyright 2020 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

// Included before spdlog.h. spdlog is used header-only against the system
// fmt, so only settings that do not change the layout of spdlog types are
// tweaked here.

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#ifndef SPDLOG_NO_THREAD_ID
#define SPDLOG_NO_THREAD_ID
#endif
#ifndef SPDLOG_PREVENT_CHILD_FD
#define SPDLOG_PREVENT_CHILD_FD
#endif
#define SPDLOG_LEVEL_NAMES \
    { \
        "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "FATAL", "OFF" \
    }
#define SPDLOG_SHORT_LEVEL_NAMES \
    { \
        "T", "D", "I", "W", "E", "F", "O" \
    }
#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
