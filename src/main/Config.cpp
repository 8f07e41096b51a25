// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "main/Config.h"
#include "proxy/AdmissionController.h"
#include "util/Logging.h"

#include <cpptoml.h>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace tpuproxy
{
const std::string Config::STDIN_SPECIAL_NAME = "stdin";

Config::Config()
{
    MAX_CONCURRENT_STREAMS_PER_DESTINATION = 0;
    TOTAL_STAKED_CONCURRENT_STREAMS = 100000;
    MIN_STAKED_CONCURRENT_STREAMS = 128;
    MAX_STAKED_CONCURRENT_STREAMS = 512;
    UNSTAKED_CONCURRENT_STREAMS = 128;

    MAX_STREAMS_PER_CONNECTION = 128;
    MAX_CONNECTIONS_PER_DESTINATION = 2;
    MAX_CONNECTION_ATTEMPTS_PER_MINUTE = 8;
    CONNECTION_IDLE_TIMEOUT_MS = std::chrono::milliseconds(30000);
    IDLE_SWEEP_INTERVAL_MS = std::chrono::milliseconds(1000);
    HANDSHAKE_TIMEOUT_MS = std::chrono::milliseconds(2000);
    STREAM_TIMEOUT_MS = std::chrono::milliseconds(1000);
    CONNECTION_ERROR_THRESHOLD = 3;

    MAX_RETRY_ATTEMPTS = 3;
    RETRY_BACKOFF_BASE_MS = std::chrono::milliseconds(50);
    RETRY_BACKOFF_MAX_MS = std::chrono::milliseconds(1000);
    QUEUE_ON_SATURATION = true;
    INBOUND_QUEUE_CAPACITY = 1024;
    // One network packet worth of transaction data.
    MAX_PAYLOAD_SIZE = 1232;
    SHUTDOWN_GRACE_PERIOD_MS = std::chrono::milliseconds(2000);

    QUIC_ALPN = "solana-tpu";
    CERTIFICATE_COMMON_NAME = "tpu-forward-proxy";

    GATEWAY_PORT = 0;
    GATEWAY_ADDRESS = "127.0.0.1";

    LOG_COLOR = false;
}

namespace
{

using ConfigItem = std::pair<std::string, std::shared_ptr<cpptoml::base>>;

bool
readBool(ConfigItem const& item)
{
    if (!item.second->as<bool>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<bool>()->get();
}

std::string
readString(ConfigItem const& item)
{
    if (!item.second->as<std::string>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return item.second->as<std::string>()->get();
}

template <typename T>
std::enable_if_t<std::is_unsigned_v<T>, T>
castInt(int64_t v, std::string const& name, T min, T max)
{
    if (v < 0)
    {
        throw std::invalid_argument(fmt::format(FMT_STRING("bad '{}'"), name));
    }
    else
    {
        if (static_cast<uint64_t>(v) < min || static_cast<uint64_t>(v) > max)
        {
            throw std::invalid_argument(
                fmt::format(FMT_STRING("bad '{}'"), name));
        }
    }
    return static_cast<T>(v);
}

template <typename T>
T
readInt(ConfigItem const& item, T min = std::numeric_limits<T>::min(),
        T max = std::numeric_limits<T>::max())
{
    if (!item.second->as<int64_t>())
    {
        throw std::invalid_argument(
            fmt::format(FMT_STRING("invalid '{}'"), item.first));
    }
    return castInt<T>(item.second->as<int64_t>()->get(), item.first, min, max);
}

std::chrono::milliseconds
readMillis(ConfigItem const& item, uint32_t min = 0)
{
    return std::chrono::milliseconds(readInt<uint32_t>(item, min));
}
}

std::vector<Destination>
Config::parseDestinations(std::shared_ptr<cpptoml::base> destinations)
{
    std::vector<Destination> res;

    auto tarr = destinations->as_table_array();
    if (!tarr)
    {
        throw std::invalid_argument("malformed DESTINATIONS");
    }
    std::set<std::string> names;
    for (auto const& destRaw : *tarr)
    {
        auto dest = destRaw->as_table();
        if (!dest)
        {
            throw std::invalid_argument("malformed DESTINATIONS");
        }
        std::string name, address;
        uint64_t stake = 0;
        for (auto const& f : *dest)
        {
            if (f.first == "NAME")
            {
                name = readString(f);
            }
            else if (f.first == "ADDRESS")
            {
                address = readString(f);
            }
            else if (f.first == "STAKE")
            {
                stake = readInt<uint64_t>(f);
            }
            else
            {
                throw std::invalid_argument(fmt::format(
                    FMT_STRING(
                        "malformed DESTINATIONS entry, unknown element '{}'"),
                    f.first));
            }
        }
        if (address.empty())
        {
            throw std::invalid_argument(
                "malformed DESTINATIONS entry: missing 'ADDRESS'");
        }
        auto d = Destination::fromAddress(address, stake);
        if (!name.empty())
        {
            d.mName = name;
        }
        if (!names.insert(d.mName).second)
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("duplicate DESTINATIONS entry '{}'"), d.mName));
        }
        res.emplace_back(d);
    }
    return res;
}

void
Config::load(std::string const& filename)
{
    CLOG_DEBUG(Main, "Loading config from: {}", filename);
    try
    {
        if (filename == Config::STDIN_SPECIAL_NAME)
        {
            load(std::cin);
        }
        else
        {
            std::ifstream ifs(filename);
            if (!ifs)
            {
                throw std::runtime_error(fmt::format(
                    FMT_STRING("Error opening file '{}'"), filename));
            }
            ifs.exceptions(std::ios::badbit);
            load(ifs);
        }
    }
    catch (std::exception const& ex)
    {
        std::string err("Failed to parse '");
        err += filename;
        err += "' :";
        err += ex.what();
        throw std::invalid_argument(err);
    }
}

void
Config::load(std::istream& in)
{
    std::shared_ptr<cpptoml::table> t;
    cpptoml::parser p(in);
    t = p.parse();
    processConfig(t);
}

void
Config::processConfig(std::shared_ptr<cpptoml::table> t)
{
    if (!t)
    {
        throw std::runtime_error("Could not parse toml");
    }

    for (auto& item : *t)
    {
        CLOG_DEBUG(Main, "Config item: {}", item.first);

        std::map<std::string, std::function<void()>> confProcessor = {
            {"DESTINATIONS",
             [&]() { DESTINATIONS = parseDestinations(item.second); }},
            {"MAX_CONCURRENT_STREAMS_PER_DESTINATION",
             [&]() {
                 MAX_CONCURRENT_STREAMS_PER_DESTINATION =
                     readInt<uint32_t>(item);
             }},
            {"TOTAL_STAKED_CONCURRENT_STREAMS",
             [&]() {
                 TOTAL_STAKED_CONCURRENT_STREAMS = readInt<uint32_t>(item, 1);
             }},
            {"MIN_STAKED_CONCURRENT_STREAMS",
             [&]() {
                 MIN_STAKED_CONCURRENT_STREAMS = readInt<uint32_t>(item, 1);
             }},
            {"MAX_STAKED_CONCURRENT_STREAMS",
             [&]() {
                 MAX_STAKED_CONCURRENT_STREAMS = readInt<uint32_t>(item, 1);
             }},
            {"UNSTAKED_CONCURRENT_STREAMS",
             [&]() {
                 UNSTAKED_CONCURRENT_STREAMS = readInt<uint32_t>(item, 1);
             }},
            {"MAX_STREAMS_PER_CONNECTION",
             [&]() { MAX_STREAMS_PER_CONNECTION = readInt<uint32_t>(item, 1); }},
            {"MAX_CONNECTIONS_PER_DESTINATION",
             [&]() {
                 MAX_CONNECTIONS_PER_DESTINATION = readInt<uint32_t>(item, 1);
             }},
            {"MAX_CONNECTION_ATTEMPTS_PER_MINUTE",
             [&]() {
                 MAX_CONNECTION_ATTEMPTS_PER_MINUTE =
                     readInt<uint32_t>(item, 1);
             }},
            {"CONNECTION_IDLE_TIMEOUT_MS",
             [&]() { CONNECTION_IDLE_TIMEOUT_MS = readMillis(item, 1); }},
            {"IDLE_SWEEP_INTERVAL_MS",
             [&]() { IDLE_SWEEP_INTERVAL_MS = readMillis(item, 1); }},
            {"HANDSHAKE_TIMEOUT_MS",
             [&]() { HANDSHAKE_TIMEOUT_MS = readMillis(item, 1); }},
            {"STREAM_TIMEOUT_MS",
             [&]() { STREAM_TIMEOUT_MS = readMillis(item, 1); }},
            {"CONNECTION_ERROR_THRESHOLD",
             [&]() { CONNECTION_ERROR_THRESHOLD = readInt<uint32_t>(item, 1); }},
            {"MAX_RETRY_ATTEMPTS",
             [&]() { MAX_RETRY_ATTEMPTS = readInt<uint32_t>(item, 1); }},
            {"RETRY_BACKOFF_BASE_MS",
             [&]() { RETRY_BACKOFF_BASE_MS = readMillis(item); }},
            {"RETRY_BACKOFF_MAX_MS",
             [&]() { RETRY_BACKOFF_MAX_MS = readMillis(item); }},
            {"QUEUE_ON_SATURATION",
             [&]() { QUEUE_ON_SATURATION = readBool(item); }},
            {"INBOUND_QUEUE_CAPACITY",
             [&]() { INBOUND_QUEUE_CAPACITY = readInt<uint32_t>(item); }},
            {"MAX_PAYLOAD_SIZE",
             [&]() { MAX_PAYLOAD_SIZE = readInt<uint32_t>(item, 1); }},
            {"SHUTDOWN_GRACE_PERIOD_MS",
             [&]() { SHUTDOWN_GRACE_PERIOD_MS = readMillis(item); }},
            {"QUIC_ALPN", [&]() { QUIC_ALPN = readString(item); }},
            {"CERTIFICATE_COMMON_NAME",
             [&]() { CERTIFICATE_COMMON_NAME = readString(item); }},
            {"IDENTITY_KEYPAIR_FILE",
             [&]() { IDENTITY_KEYPAIR_FILE = readString(item); }},
            {"GATEWAY_PORT",
             [&]() { GATEWAY_PORT = readInt<unsigned short>(item); }},
            {"GATEWAY_ADDRESS", [&]() { GATEWAY_ADDRESS = readString(item); }},
            {"LOG_FILE_PATH", [&]() { LOG_FILE_PATH = readString(item); }},
            {"LOG_COLOR", [&]() { LOG_COLOR = readBool(item); }}};

        auto it = confProcessor.find(item.first);
        if (it != confProcessor.end())
        {
            it->second();
        }
        else
        {
            std::string err("Unknown configuration entry: '");
            err += item.first;
            err += "'";
            throw std::invalid_argument(err);
        }
    }

    validate();
}

void
Config::validate() const
{
    if (DESTINATIONS.empty())
    {
        throw std::invalid_argument(
            "Invalid configuration: at least one DESTINATIONS entry is "
            "required");
    }
    if (MIN_STAKED_CONCURRENT_STREAMS > MAX_STAKED_CONCURRENT_STREAMS)
    {
        throw std::invalid_argument(
            "Invalid configuration: MIN_STAKED_CONCURRENT_STREAMS can't be "
            "greater than MAX_STAKED_CONCURRENT_STREAMS");
    }
    if (MAX_RETRY_ATTEMPTS == 0)
    {
        throw std::invalid_argument(
            "Invalid configuration: MAX_RETRY_ATTEMPTS must be at least 1");
    }
    if (RETRY_BACKOFF_BASE_MS > RETRY_BACKOFF_MAX_MS)
    {
        throw std::invalid_argument(
            "Invalid configuration: RETRY_BACKOFF_BASE_MS can't be greater "
            "than RETRY_BACKOFF_MAX_MS");
    }
    if (MAX_PAYLOAD_SIZE == 0 || MAX_STREAMS_PER_CONNECTION == 0 ||
        MAX_CONNECTIONS_PER_DESTINATION == 0)
    {
        throw std::invalid_argument(
            "Invalid configuration: MAX_PAYLOAD_SIZE, "
            "MAX_STREAMS_PER_CONNECTION and MAX_CONNECTIONS_PER_DESTINATION "
            "must be positive");
    }
    if (QUIC_ALPN.empty() || QUIC_ALPN.size() > 255)
    {
        throw std::invalid_argument(
            "Invalid configuration: QUIC_ALPN must be 1 to 255 bytes");
    }
    if (MAX_CONNECTION_ATTEMPTS_PER_MINUTE == 0)
    {
        throw std::invalid_argument(
            "Invalid configuration: MAX_CONNECTION_ATTEMPTS_PER_MINUTE must "
            "be at least 1");
    }
    // A destination with no stream quota would never be forwarded to.
    auto stake = totalStake();
    for (auto const& d : DESTINATIONS)
    {
        if (AdmissionController::computeStreamQuota(*this, d, stake) == 0)
        {
            throw std::invalid_argument(fmt::format(
                FMT_STRING("Invalid configuration: destination '{}' ({}) "
                           "gets a concurrent stream quota of 0"),
                d.mName, d.toString()));
        }
    }
}

uint64_t
Config::totalStake() const
{
    uint64_t total = 0;
    for (auto const& d : DESTINATIONS)
    {
        total += d.mStake;
    }
    return total;
}
}
