#pragma once

// Copyright 2014 Stellar Development Foundation and contributors. Licensed
// under the Apache License, Version 2.0. See the COPYING file at the root
// of this distribution or at http://www.apache.org/licenses/LICENSE-2.0

#include "proxy/Destination.h"

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace cpptoml
{
class table;
class base;
}

namespace tpuproxy
{

/**
 * Every tunable of the proxy. Loaded from a TOML file by Config::load (or
 * filled in directly by tests) and consumed read-only by the rest of the
 * program; member names match the configuration keys.
 */
class Config
{
    void processConfig(std::shared_ptr<cpptoml::table>);
    std::vector<Destination>
    parseDestinations(std::shared_ptr<cpptoml::base> destinations);

  public:
    static const std::string STDIN_SPECIAL_NAME;

    // Validators the proxy forwards to, addressed by index.
    std::vector<Destination> DESTINATIONS;

    // Admission quotas. The stake-derived quota of a destination mirrors the
    // limit a validator applies to a sender of that stake:
    // clamp(TOTAL * stake / totalStake, MIN, MAX) when stake > 0, UNSTAKED
    // otherwise; MAX_CONCURRENT_STREAMS_PER_DESTINATION caps it when set.
    uint32_t MAX_CONCURRENT_STREAMS_PER_DESTINATION;
    uint32_t TOTAL_STAKED_CONCURRENT_STREAMS;
    uint32_t MIN_STAKED_CONCURRENT_STREAMS;
    uint32_t MAX_STAKED_CONCURRENT_STREAMS;
    uint32_t UNSTAKED_CONCURRENT_STREAMS;

    // Connection pool.
    uint32_t MAX_STREAMS_PER_CONNECTION;
    uint32_t MAX_CONNECTIONS_PER_DESTINATION;
    uint32_t MAX_CONNECTION_ATTEMPTS_PER_MINUTE;
    std::chrono::milliseconds CONNECTION_IDLE_TIMEOUT_MS;
    std::chrono::milliseconds IDLE_SWEEP_INTERVAL_MS;
    std::chrono::milliseconds HANDSHAKE_TIMEOUT_MS;
    std::chrono::milliseconds STREAM_TIMEOUT_MS;
    uint32_t CONNECTION_ERROR_THRESHOLD;

    // Retry and backpressure.
    uint32_t MAX_RETRY_ATTEMPTS;
    std::chrono::milliseconds RETRY_BACKOFF_BASE_MS;
    std::chrono::milliseconds RETRY_BACKOFF_MAX_MS;
    bool QUEUE_ON_SATURATION;
    uint32_t INBOUND_QUEUE_CAPACITY;
    uint32_t MAX_PAYLOAD_SIZE;
    std::chrono::milliseconds SHUTDOWN_GRACE_PERIOD_MS;

    // Transport identity.
    std::string QUIC_ALPN;
    std::string CERTIFICATE_COMMON_NAME;
    std::string IDENTITY_KEYPAIR_FILE;

    // Local gateway listener; 0 disables it.
    unsigned short GATEWAY_PORT;
    std::string GATEWAY_ADDRESS;

    std::string LOG_FILE_PATH;
    bool LOG_COLOR;

    Config();

    void load(std::string const& filename);
    void load(std::istream& in);

    // Throws std::invalid_argument when the combination of values cannot
    // work, e.g. no destinations or a zero retry budget.
    void validate() const;

    uint64_t totalStake() const;
};
}
