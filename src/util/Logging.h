#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

// Must include this _before_ spdlog.h
#include "util/SpdlogTweaks.h"

#include <spdlog/spdlog.h>

// Each CLOG_* macro formats its arguments only when the partition logger
// would emit at that level.
#define LOG_CHECK(logger, level, action) \
    do \
    { \
        auto lg = (logger); \
        if (lg->should_log(level)) \
        { \
            action; \
        } \
    } while (false)

#define CLOG_TRACE(partition, f, ...) \
    LOG_CHECK(tpuproxy::Logging::get##partition##LogPtr(), \
              spdlog::level::trace, \
              SPDLOG_LOGGER_TRACE(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_DEBUG(partition, f, ...) \
    LOG_CHECK(tpuproxy::Logging::get##partition##LogPtr(), \
              spdlog::level::debug, \
              SPDLOG_LOGGER_DEBUG(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_INFO(partition, f, ...) \
    LOG_CHECK(tpuproxy::Logging::get##partition##LogPtr(), \
              spdlog::level::info, \
              SPDLOG_LOGGER_INFO(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_WARNING(partition, f, ...) \
    LOG_CHECK(tpuproxy::Logging::get##partition##LogPtr(), \
              spdlog::level::warn, \
              SPDLOG_LOGGER_WARN(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_ERROR(partition, f, ...) \
    LOG_CHECK(tpuproxy::Logging::get##partition##LogPtr(), spdlog::level::err, \
              SPDLOG_LOGGER_ERROR(lg, FMT_STRING(f), ##__VA_ARGS__))

#define CLOG_FATAL(partition, f, ...) \
    LOG_CHECK(tpuproxy::Logging::get##partition##LogPtr(), \
              spdlog::level::critical, \
              SPDLOG_LOGGER_CRITICAL(lg, FMT_STRING(f), ##__VA_ARGS__))

namespace tpuproxy
{
typedef std::shared_ptr<spdlog::logger> LogPtr;

enum class LogLevel
{
    LVL_FATAL = 0,
    LVL_ERROR = 1,
    LVL_WARNING = 2,
    LVL_INFO = 3,
    LVL_DEBUG = 4,
    LVL_TRACE = 5
};

/**
 * One spdlog logger per partition (see LogPartitions.def), all writing to
 * the console and, once setLoggingToFile() is called, to a log file. Every
 * setter rebuilds the loggers, so settings may be changed at any time from
 * the main thread; logging itself is thread-safe.
 */
class Logging
{
    static std::recursive_mutex mLogMutex;
    static bool mInitialized;
    static bool mColor;
    static LogLevel mGlobalLogLevel;
    static std::map<std::string, LogLevel> mPartitionLogLevels;
    static std::string mPattern;
    static std::string mFilename;

#define LOG_PARTITION(name) static LogPtr name##LogPtr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION

    static void deinit();

  public:
    static void init();
    static void setFmt(std::string const& identity, bool timestamps = true);
    // `filename` may contain "{datetime}". Throws std::runtime_error, and
    // keeps logging to the console only, when the file cannot be opened.
    static void setLoggingToFile(std::string const& filename);
    static void setLoggingColor(bool color);
    // A null `partition` sets every partition; an unknown one throws
    // std::invalid_argument.
    static void setLogLevel(LogLevel level, char const* partition);

    // Unrecognized names map to LVL_INFO.
    static LogLevel getLLfromString(std::string const& levelName);
    // Canonical spelling of a partition name, matched case-insensitively.
    // Throws std::invalid_argument for names not in LogPartitions.def.
    static std::string normalizePartition(std::string const& partition);

#define LOG_PARTITION(name) static LogPtr get##name##LogPtr();
#include "util/LogPartitions.def"
#undef LOG_PARTITION
};
}
