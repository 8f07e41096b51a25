// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "util/Logging.h"
#include "util/Timer.h"
#include "util/types.h"

#include <chrono>
#include <fmt/chrono.h>
#include <fstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <stdexcept>
#include <vector>

namespace tpuproxy
{

std::recursive_mutex Logging::mLogMutex;
bool Logging::mInitialized = false;
bool Logging::mColor = false;
LogLevel Logging::mGlobalLogLevel = LogLevel::LVL_INFO;
std::map<std::string, LogLevel> Logging::mPartitionLogLevels;
std::string Logging::mPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%n %l%$] %v";
std::string Logging::mFilename;

static spdlog::level::level_enum
toSpdlogLevel(LogLevel level)
{
    switch (level)
    {
    case LogLevel::LVL_FATAL:
        return spdlog::level::critical;
    case LogLevel::LVL_ERROR:
        return spdlog::level::err;
    case LogLevel::LVL_WARNING:
        return spdlog::level::warn;
    case LogLevel::LVL_INFO:
        return spdlog::level::info;
    case LogLevel::LVL_DEBUG:
        return spdlog::level::debug;
    case LogLevel::LVL_TRACE:
        return spdlog::level::trace;
    }
    return spdlog::level::info;
}

// Expands "{datetime}" and makes sure the file can be written. spdlog then
// opens it in append mode, which keeps working when an external logrotate
// truncates the file underneath us.
static std::string
openLogFile(std::string const& pattern)
{
    VirtualClock clock(VirtualClock::REAL_TIME);
    std::time_t now = VirtualClock::to_time_t(clock.system_now());
    auto filename = fmt::format(fmt::runtime(pattern),
                                fmt::arg("datetime", fmt::localtime(now)));
    std::ofstream out(filename, std::ios_base::out | std::ios_base::app);
    if (out.fail())
    {
        throw std::runtime_error(fmt::format(
            FMT_STRING("Could not open log file {}, check access rights"),
            filename));
    }
    return filename;
}

void
Logging::init()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (mInitialized)
    {
        return;
    }

    using namespace spdlog::sinks;
    std::vector<spdlog::sink_ptr> sinks;
    if (mColor)
    {
        sinks.emplace_back(std::make_shared<stdout_color_sink_mt>());
    }
    else
    {
        sinks.emplace_back(std::make_shared<stdout_sink_mt>());
    }
    if (!mFilename.empty())
    {
        sinks.emplace_back(std::make_shared<basic_file_sink_mt>(
            openLogFile(mFilename), /*truncate=*/false));
    }

    auto registerLogger = [&sinks](std::string const& name) {
        auto logger =
            std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        spdlog::register_logger(logger);
        return logger;
    };
    spdlog::set_default_logger(registerLogger("default"));
#define LOG_PARTITION(name) registerLogger(#name);
#include "util/LogPartitions.def"
#undef LOG_PARTITION

    spdlog::set_pattern(mPattern);
    spdlog::set_level(toSpdlogLevel(mGlobalLogLevel));
    for (auto const& kv : mPartitionLogLevels)
    {
        spdlog::get(kv.first)->set_level(toSpdlogLevel(kv.second));
    }
    spdlog::flush_every(std::chrono::seconds(1));
    spdlog::flush_on(spdlog::level::err);
    mInitialized = true;
}

void
Logging::deinit()
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (!mInitialized)
    {
        return;
    }
#define LOG_PARTITION(name) name##LogPtr = nullptr;
#include "util/LogPartitions.def"
#undef LOG_PARTITION
    spdlog::drop_all();
    mInitialized = false;
}

void
Logging::setFmt(std::string const& identity, bool timestamps)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mPattern = fmt::format(FMT_STRING("{}{} [%^%n %l%$] %v"),
                           timestamps ? "%Y-%m-%dT%H:%M:%S.%e " : "",
                           identity);
    init();
    spdlog::set_pattern(mPattern);
}

void
Logging::setLoggingToFile(std::string const& filename)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    mFilename = filename;
    deinit();
    try
    {
        init();
    }
    catch (std::runtime_error const&)
    {
        mFilename.clear();
        deinit();
        init();
        throw;
    }
}

void
Logging::setLoggingColor(bool color)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    if (mInitialized && mColor == color)
    {
        return;
    }
    mColor = color;
    deinit();
    init();
}

void
Logging::setLogLevel(LogLevel level, char const* partition)
{
    std::lock_guard<std::recursive_mutex> guard(mLogMutex);
    init();
    if (partition)
    {
        auto name = normalizePartition(partition);
        mPartitionLogLevels[name] = level;
        spdlog::get(name)->set_level(toSpdlogLevel(level));
    }
    else
    {
        mGlobalLogLevel = level;
        mPartitionLogLevels.clear();
        spdlog::set_level(toSpdlogLevel(level));
    }
}

LogLevel
Logging::getLLfromString(std::string const& levelName)
{
    static std::map<std::string, LogLevel> const names = {
        {"fatal", LogLevel::LVL_FATAL}, {"error", LogLevel::LVL_ERROR},
        {"warning", LogLevel::LVL_WARNING}, {"info", LogLevel::LVL_INFO},
        {"debug", LogLevel::LVL_DEBUG}, {"trace", LogLevel::LVL_TRACE}};
    for (auto const& kv : names)
    {
        if (iequals(levelName, kv.first))
        {
            return kv.second;
        }
    }
    return LogLevel::LVL_INFO;
}

std::string
Logging::normalizePartition(std::string const& partition)
{
    static char const* const names[] = {
#define LOG_PARTITION(name) #name,
#include "util/LogPartitions.def"
#undef LOG_PARTITION
    };
    for (auto name : names)
    {
        if (iequals(partition, name))
        {
            return name;
        }
    }
    throw std::invalid_argument(
        fmt::format(FMT_STRING("unknown log partition '{}'"), partition));
}

// Loggers are looked up lazily so that code running before main() finishes
// its setup (or in a test binary) never dereferences an unregistered logger.
#define LOG_PARTITION(name) \
    LogPtr Logging::name##LogPtr = nullptr; \
    LogPtr Logging::get##name##LogPtr() \
    { \
        std::lock_guard<std::recursive_mutex> guard(mLogMutex); \
        if (!name##LogPtr) \
        { \
            init(); \
            name##LogPtr = spdlog::get(#name); \
        } \
        return name##LogPtr; \
    }
#include "util/LogPartitions.def"
#undef LOG_PARTITION
}
