#pragma once

/**
 * @file instance_record.hpp
 * @brief Per-instance liveness record shared through the coordinator
 *
 * Records are JSON objects on the wire:
 *
 * {"id": ..., "hostname": ..., "pid": ..., "startedAt": ..., "lastSeen": ...,
 *  "poolSizes": {kind: n}, "inUse": {kind: n},
 *  "health": {"score": ..., "memoryUsage": ..., "poolHealthy": ...},
 *  "capabilities": {"memoryLimit": ..., "cpuCores": ...}}
 *
 * Timestamps are unix seconds.
 */

#include <poolhub/common/error.hpp>

#include <json/json.h>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace poolhub::core::coordinator {

struct InstanceHealth {
    double score        = 1.0;
    double memory_usage = 0.0;  ///< Ratio of the memory limit, 0 when unknown
    bool pool_healthy   = true;
};

struct InstanceCapabilities {
    uint64_t memory_limit = 0;  ///< Bytes, 0 when unknown
    uint32_t cpu_cores    = 1;
};

struct InstanceRecord {
    std::string id;
    std::string hostname;
    int64_t pid        = 0;
    int64_t started_at = 0;
    int64_t last_seen  = 0;

    std::map<std::string, uint64_t> pool_sizes;
    std::map<std::string, uint64_t> in_use;

    InstanceHealth health;
    InstanceCapabilities capabilities;

    uint64_t pool_size(const std::string& kind) const {
        auto it = pool_sizes.find(kind);
        return it != pool_sizes.end() ? it->second : 0;
    }

    Json::Value to_json() const;
    static common::Result<InstanceRecord> from_json(const Json::Value& node);

    std::string serialize() const;
    static common::Result<InstanceRecord> parse(std::string_view text);
};

// ============================================================================
// JSON HELPERS
// ============================================================================

/// Compact single-line encoding
std::string encode_json(const Json::Value& value);

common::Result<Json::Value> decode_json(std::string_view text);

/// Current wall-clock time in unix seconds
int64_t unix_now() noexcept;

}  // namespace poolhub::core::coordinator
