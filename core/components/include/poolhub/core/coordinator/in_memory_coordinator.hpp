#pragma once

/**
 * @file in_memory_coordinator.hpp
 * @brief Process-local coordinator with TTL semantics
 *
 * Several orchestrators in one process can share an instance to coordinate
 * as if they were separate hosts. Values, lists and counters follow the same
 * expiry rules as the Redis backend. The clock is injectable so lease and
 * heartbeat expiry can be driven deterministically.
 */

#include <poolhub/core/coordinator/coordinator_backend.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <unordered_map>

namespace poolhub::core::coordinator {

class InMemoryCoordinator : public CoordinatorBackend {
public:
    using TimeSource = std::function<std::chrono::system_clock::time_point()>;

    explicit InMemoryCoordinator(TimeSource clock = {});
    ~InMemoryCoordinator() override;

    InMemoryCoordinator(const InMemoryCoordinator&)            = delete;
    InMemoryCoordinator& operator=(const InMemoryCoordinator&) = delete;

    std::string_view name() const noexcept override { return "memory"; }

    bool is_connected() override;

    bool register_instance(const InstanceRecord& record,
                           std::chrono::seconds ttl = INSTANCE_TTL) override;
    bool unregister_instance(const std::string& instance_id) override;
    std::vector<InstanceRecord> get_active_instances() override;

    bool acquire_leadership(const std::string& instance_id, std::chrono::seconds ttl) override;
    bool release_leadership(const std::string& instance_id) override;
    std::optional<std::string> get_current_leader() override;

    bool push(const std::string& key, const Json::Value& item) override;
    std::optional<Json::Value> pop(const std::string& key,
                                   std::chrono::seconds timeout = std::chrono::seconds(0)) override;
    size_t get_queue_length(const std::string& key) override;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value,
             std::chrono::seconds ttl = std::chrono::seconds(0)) override;
    bool remove(const std::string& key) override;

    int64_t get_global_counter(const std::string& kind) override;
    bool adjust_global_counter(const std::string& kind, int64_t delta) override;

    /**
     * @brief Simulate an outage: while unavailable every call fails soft
     */
    void set_available(bool available);

    /// Live (unexpired) keys, excluding lists
    size_t key_count();

private:
    struct Entry {
        std::string value;
        std::optional<std::chrono::system_clock::time_point> expires_at;
    };

    std::chrono::system_clock::time_point now() const { return clock_(); }
    const Entry* find_live_locked(const std::string& key);
    void put_locked(const std::string& key, std::string value, std::chrono::seconds ttl);

    TimeSource clock_;
    std::atomic<bool> available_{true};

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::unordered_map<std::string, Entry> values_;
    std::unordered_map<std::string, std::deque<std::string>> queues_;
};

}  // namespace poolhub::core::coordinator
