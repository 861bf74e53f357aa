#pragma once

/**
 * @file config_types.hpp
 * @brief Configuration types for poolhub
 *
 * Defines configuration structures that can be loaded from
 * YAML (default) or JSON files.
 */

#include <poolhub/common/error.hpp>
#include <poolhub/core/coordinator/redis_coordinator.hpp>
#include <poolhub/core/memory/pressure_monitor.hpp>
#include <poolhub/core/pool/pool_types.hpp>

#include <chrono>
#include <map>
#include <string>
#include <string_view>

namespace poolhub::core::config {

// ============================================================================
// CONFIGURATION FORMAT
// ============================================================================

/**
 * @brief Supported configuration file formats
 */
enum class ConfigFormat : uint8_t {
    AUTO,  ///< Auto-detect from file extension
    YAML,  ///< YAML format (default)
    JSON   ///< JSON format
};

// ============================================================================
// LOGGING
// ============================================================================

struct LoggingConfig {
    std::string level  = "info";     ///< trace, debug, info, warn, error, off
    std::string output = "console";  ///< console, file, both
    std::string file_path;
    uint32_t max_file_size_mb = 10;
    uint32_t max_files        = 5;
    bool include_timestamp    = true;
    bool include_thread_id    = false;

    /// Per-category overrides, e.g. {"coordinator": "debug"}
    std::map<std::string, std::string> categories;
};

// ============================================================================
// POOLS
// ============================================================================

/**
 * @brief Pool settings, one entry per kind
 *
 * Each kind's settings are the defaults overlaid with the keys given for
 * that kind, so entries in @ref kinds are always complete.
 */
struct PoolsConfig {
    pool::PoolConfig defaults;
    std::map<std::string, pool::PoolConfig> kinds;
};

// ============================================================================
// COORDINATOR
// ============================================================================

enum class CoordinatorBackendType : uint8_t {
    NONE,    ///< Standalone, no coordination
    REDIS,   ///< Shared Redis server
    MEMORY   ///< Process-local, for single-host setups and tests
};

constexpr std::string_view backend_type_name(CoordinatorBackendType type) noexcept {
    switch (type) {
        case CoordinatorBackendType::NONE:
            return "none";
        case CoordinatorBackendType::REDIS:
            return "redis";
        case CoordinatorBackendType::MEMORY:
            return "memory";
        default:
            return "unknown";
    }
}

struct CoordinatorConfig {
    CoordinatorBackendType backend = CoordinatorBackendType::NONE;
    coordinator::RedisEndpoint endpoint;
    std::string key_prefix = "poolhub";
    std::chrono::milliseconds reconnect_backoff{5000};

    std::chrono::seconds heartbeat_ttl{60};
    bool leader_election = true;
    std::chrono::seconds leader_ttl{30};
    std::chrono::milliseconds sync_interval{5000};
    std::chrono::seconds rebalance_interval{60};
};

// ============================================================================
// APPLICATION
// ============================================================================

/**
 * @brief Complete configuration of one poolhub instance
 */
struct ApplicationConfig {
    std::string instance_id;  ///< Empty: generated at startup
    std::chrono::milliseconds tick_interval{1000};

    LoggingConfig logging;
    PoolsConfig pools;
    memory::MonitorConfig memory;
    CoordinatorConfig coordinator;
};

}  // namespace poolhub::core::config
