#pragma once

/**
 * @file redis_coordinator.hpp
 * @brief CoordinatorBackend over a Redis server (hiredis)
 *
 * All keys live under "<key_prefix>:". Operations share one hiredis context
 * and are serialized; a blocking pop holds the context for its whole wait.
 *
 * Failure model:
 * - A failed connect or a command that times out starts a backoff window
 *   during which operations fail immediately instead of dialing again.
 * - A connection that breaks mid-command (reset, EOF) is reopened once and
 *   the command retried before the operation gives up.
 * - Unavailability is logged at WARN once per outage; the first command
 *   that succeeds afterwards logs the recovery and re-arms the warning.
 */

#include <poolhub/core/coordinator/coordinator_backend.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

struct redisContext;
struct redisReply;

namespace poolhub::core::coordinator {

struct RedisEndpoint {
    std::string host = "127.0.0.1";
    uint16_t port    = 6379;
    std::chrono::milliseconds timeout{2000};  ///< connect and per-command timeout
    std::string password;                     ///< AUTH is sent when non-empty
    uint32_t database = 0;                    ///< SELECT is sent when non-zero

    std::string address() const { return host + ":" + std::to_string(port); }
};

struct RedisCoordinatorConfig {
    RedisEndpoint endpoint;
    std::string key_prefix = "poolhub";
    std::chrono::milliseconds reconnect_backoff{5000};
};

class RedisCoordinator : public CoordinatorBackend {
public:
    /**
     * @brief Create the backend and attempt a first connection
     *
     * Construction never fails: an unreachable server leaves the backend
     * disconnected until a later operation reconnects.
     */
    explicit RedisCoordinator(RedisCoordinatorConfig config);
    ~RedisCoordinator() override;

    RedisCoordinator(const RedisCoordinator&)            = delete;
    RedisCoordinator& operator=(const RedisCoordinator&) = delete;

    std::string_view name() const noexcept override { return "redis"; }

    /// PING round trip
    bool is_connected() override;

    bool register_instance(const InstanceRecord& record,
                           std::chrono::seconds ttl = INSTANCE_TTL) override;
    bool unregister_instance(const std::string& instance_id) override;
    std::vector<InstanceRecord> get_active_instances() override;

    /// SET NX EX for a free lease, owner-checked EXPIRE script for renewal
    bool acquire_leadership(const std::string& instance_id, std::chrono::seconds ttl) override;
    /// Owner-checked DEL script
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

    /// Full server-side key for a backend-relative key
    std::string prefixed(std::string_view key) const;

    const RedisCoordinatorConfig& config() const noexcept { return config_; }

private:
    using ReplyPtr = std::unique_ptr<redisReply, void (*)(void*)>;

    bool ensure_connected_locked();
    void disconnect_locked() noexcept;
    ReplyPtr send_locked(const std::vector<std::string>& args,
                         std::chrono::milliseconds extra_wait);
    ReplyPtr execute_locked(const std::vector<std::string>& args,
                            std::chrono::milliseconds extra_wait = std::chrono::milliseconds(0));
    void mark_unavailable_locked(const std::string& reason);

    RedisCoordinatorConfig config_;

    std::mutex mutex_;
    redisContext* context_ = nullptr;
    bool warned_           = false;
    bool link_up_          = false;
    std::optional<std::chrono::steady_clock::time_point> retry_after_;
};

}  // namespace poolhub::core::coordinator
