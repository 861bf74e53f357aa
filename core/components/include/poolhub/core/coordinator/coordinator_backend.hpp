#pragma once

/**
 * @file coordinator_backend.hpp
 * @brief Cross-instance coordination capability
 *
 * A CoordinatorBackend gives instances a shared view of each other and a
 * minimal advisory leadership lease. Every operation fails soft: when the
 * backend is unreachable it returns false, nullopt, 0 or an empty list and
 * never throws. Callers treat "no coordinator" as a standalone instance.
 *
 * Key layout (relative to the backend's namespace):
 * - instance:{id}            JSON InstanceRecord, heartbeat TTL
 * - queue:{key}              list of JSON items, FIFO
 * - leader                   holder instance id, caller TTL
 * - global:{kind}:pool_size  integer counter, 300s TTL
 */

#include <poolhub/core/coordinator/instance_record.hpp>

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace poolhub::core::coordinator {

constexpr std::chrono::seconds INSTANCE_TTL{60};
constexpr std::chrono::seconds GLOBAL_COUNTER_TTL{300};

namespace keys {

constexpr std::string_view INSTANCE_PREFIX = "instance:";
constexpr std::string_view QUEUE_PREFIX    = "queue:";
constexpr std::string_view LEADER          = "leader";
constexpr std::string_view GLOBAL_PREFIX   = "global:";

inline std::string instance(std::string_view id) {
    return std::string(INSTANCE_PREFIX).append(id);
}

inline std::string queue(std::string_view key) {
    return std::string(QUEUE_PREFIX).append(key);
}

inline std::string global_pool_size(std::string_view kind) {
    return std::string(GLOBAL_PREFIX).append(kind).append(":pool_size");
}

}  // namespace keys

class CoordinatorBackend {
public:
    virtual ~CoordinatorBackend() = default;

    virtual std::string_view name() const noexcept = 0;

    /**
     * @brief Liveness check, may attempt a reconnect
     */
    virtual bool is_connected() = 0;

    // ========================================================================
    // INSTANCES
    // ========================================================================

    /**
     * @brief Upsert this instance's record with a TTL
     *
     * The backend stamps last_seen with its own clock. A record that is not
     * refreshed within @p ttl silently drops out of get_active_instances().
     */
    virtual bool register_instance(const InstanceRecord& record,
                                   std::chrono::seconds ttl = INSTANCE_TTL) = 0;

    virtual bool update_instance(const InstanceRecord& record,
                                 std::chrono::seconds ttl = INSTANCE_TTL) {
        return register_instance(record, ttl);
    }

    /// Best-effort removal, false if the record was already gone
    virtual bool unregister_instance(const std::string& instance_id) = 0;

    /// Point-in-time, possibly stale enumeration
    virtual std::vector<InstanceRecord> get_active_instances() = 0;

    // ========================================================================
    // LEADERSHIP
    // ========================================================================

    /**
     * @brief Set-if-absent on the leader key
     *
     * Re-acquisition by the current holder succeeds and refreshes the TTL.
     * Returns false while another instance holds a live lease.
     */
    virtual bool acquire_leadership(const std::string& instance_id, std::chrono::seconds ttl) = 0;

    /// Compare-and-delete: only the current holder can release
    virtual bool release_leadership(const std::string& instance_id) = 0;

    virtual std::optional<std::string> get_current_leader() = 0;

    // ========================================================================
    // QUEUES
    // ========================================================================

    virtual bool push(const std::string& key, const Json::Value& item) = 0;

    /**
     * @brief Pop the oldest item
     * @param timeout Zero for a non-blocking pop, otherwise the maximum wait.
     *                Blocking pops belong on background workers only.
     */
    virtual std::optional<Json::Value> pop(const std::string& key,
                                           std::chrono::seconds timeout = std::chrono::seconds(0)) = 0;

    virtual size_t get_queue_length(const std::string& key) = 0;

    // ========================================================================
    // KEY/VALUE
    // ========================================================================

    virtual std::optional<std::string> get(const std::string& key) = 0;

    /// A zero @p ttl stores the value without expiry
    virtual bool set(const std::string& key, const std::string& value,
                     std::chrono::seconds ttl = std::chrono::seconds(0)) = 0;

    virtual bool remove(const std::string& key) = 0;

    // ========================================================================
    // GLOBAL COUNTERS
    // ========================================================================

    virtual int64_t get_global_counter(const std::string& kind) = 0;

    /**
     * @brief Add @p delta to the kind's global pool size and refresh its TTL
     */
    virtual bool adjust_global_counter(const std::string& kind, int64_t delta) = 0;
};

}  // namespace poolhub::core::coordinator
