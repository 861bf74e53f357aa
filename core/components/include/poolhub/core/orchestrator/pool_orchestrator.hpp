#pragma once

/**
 * @file pool_orchestrator.hpp
 * @brief Composition of local pools, memory monitor and coordinator
 *
 * The PoolOrchestrator provides:
 * - Borrow/return routed to the LocalPool of a kind
 * - Pool-wide resize driven by memory pressure
 * - A periodic tick: memory check, then coordinator sync
 * - Advisory leadership with global counter publishing and soft rebalancing
 *
 * Borrow and return never touch the coordinator. All coordinator traffic
 * happens in tick(), on the caller's thread or the background tick thread.
 */

#include <poolhub/common/error.hpp>
#include <poolhub/core/config/config_types.hpp>
#include <poolhub/core/coordinator/coordinator_backend.hpp>
#include <poolhub/core/memory/pressure_monitor.hpp>
#include <poolhub/core/pool/local_pool.hpp>

#include <yaml-cpp/yaml.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace poolhub::core {

using OrchestratorConfig = config::ApplicationConfig;

/**
 * @brief Leadership-dependent maintenance state
 */
enum class LeadershipState : uint8_t {
    NOT_LEADER,
    LEADER
};

constexpr std::string_view leadership_state_name(LeadershipState state) noexcept {
    switch (state) {
        case LeadershipState::NOT_LEADER:
            return "not_leader";
        case LeadershipState::LEADER:
            return "leader";
        default:
            return "unknown";
    }
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

struct OrchestratorMetrics {
    uint64_t pool_adjustments  = 0;
    uint64_t sync_operations   = 0;
    uint64_t leader_elections  = 0;
    uint64_t leadership_losses = 0;
    uint64_t pruned_instances  = 0;
    uint64_t ticks             = 0;
};

/**
 * @brief Coordinator view as of the last sync
 */
struct CoordinatorStatus {
    std::string backend;
    bool connected = false;
    std::optional<std::string> leader;
    size_t active_instances = 0;
};

struct OrchestratorStats {
    std::string instance_id;
    bool is_leader = false;

    std::map<std::string, pool::PoolStats> pools;
    memory::MemoryPressureState memory;
    memory::MonitorMetrics memory_metrics;
    CoordinatorStatus coordinator;

    size_t known_instances = 0;
    OrchestratorMetrics metrics;
    coordinator::InstanceHealth health;

    /// Capacity share per instance id, set by the leader's last rebalance
    std::map<std::string, double> distribution;
    /// Advisory per-kind size for this instance, never applied automatically
    std::map<std::string, size_t> recommended_sizes;
};

// ============================================================================
// ORCHESTRATOR
// ============================================================================

class PoolOrchestrator {
public:
    /// Unix seconds, used to judge peer staleness
    using WallClock = std::function<int64_t()>;

    /**
     * @param config Instance configuration
     * @param backend Shared backend, a NoOpCoordinator when null
     * @param sampler Memory source for the monitor, process memory when null
     */
    explicit PoolOrchestrator(OrchestratorConfig config,
                              std::shared_ptr<coordinator::CoordinatorBackend> backend = nullptr,
                              std::unique_ptr<memory::MemorySampler> sampler = nullptr);
    ~PoolOrchestrator();

    PoolOrchestrator(const PoolOrchestrator&)            = delete;
    PoolOrchestrator& operator=(const PoolOrchestrator&) = delete;

    // ========================================================================
    // KINDS
    // ========================================================================

    /**
     * @brief Create and warm up the pool for a kind
     * @param config Pool policy, the configured one for the kind when unset
     * @return ALREADY_EXISTS, CONFIG_INVALID_VALUE or FACTORY_ERROR on failure
     */
    common::Result<void> register_kind(const std::string& kind,
                                       std::shared_ptr<pool::PoolSlotFactory> factory,
                                       std::optional<pool::PoolConfig> config = std::nullopt);

    bool has_kind(const std::string& kind) const;
    std::vector<std::string> kinds() const;

    // ========================================================================
    // REQUEST PATH
    // ========================================================================

    /**
     * @brief Borrow from the kind's pool
     * @return UNKNOWN_KIND for unregistered kinds, otherwise LocalPool::borrow()
     */
    common::Result<pool::PooledObject> borrow(const std::string& kind);

    common::Result<void> return_object(const std::string& kind, const pool::PooledObject& object);

    // ========================================================================
    // MAINTENANCE
    // ========================================================================

    /**
     * @brief Apply LocalPool::resize(factor) to every kind
     */
    common::Result<void> resize_all(double factor);

    /**
     * @brief Memory check followed by coordinator sync
     *
     * Never throws. With the coordinator down it only does local work.
     */
    void tick();

    /**
     * @brief Run tick() every tick_interval on a background thread
     */
    common::Result<void> start();
    void stop();
    bool is_running() const noexcept { return running_.load(); }

    /**
     * @brief Unregister, release leadership, stop ticking, destroy pools
     *
     * Idempotent. Called by the destructor.
     */
    void shutdown();

    // ========================================================================
    // OBSERVABILITY
    // ========================================================================

    OrchestratorStats get_stats() const;

    /// get_stats() as a YAML tree
    YAML::Node get_status() const;

    const std::string& instance_id() const noexcept { return instance_id_; }
    LeadershipState leadership_state() const;
    bool is_leader() const { return leadership_state() == LeadershipState::LEADER; }
    OrchestratorMetrics metrics() const;

    memory::MemoryPressureMonitor& monitor() noexcept { return *monitor_; }
    coordinator::CoordinatorBackend& coordinator_backend() noexcept { return *coordinator_; }

    void set_wall_clock(WallClock clock);

    /**
     * @brief Generate "<hostname>_inst<16 hex>_<pid>"
     */
    static std::string generate_instance_id();

private:
    pool::LocalPool* find_pool(const std::string& kind) const;

    // Helpers below expect sync_mutex_ to be held
    void sync_with_coordinator_locked();
    coordinator::InstanceRecord build_record_locked();
    void update_health_locked();
    void update_leadership_locked();
    void step_down_locked();
    void refresh_instances_locked();
    void publish_global_counters_locked();
    void rebalance_locked();

    void tick_loop();

    OrchestratorConfig config_;
    std::string instance_id_;
    std::string hostname_;
    int64_t pid_        = 0;
    int64_t started_at_ = 0;

    std::shared_ptr<coordinator::CoordinatorBackend> coordinator_;
    std::unique_ptr<memory::MemoryPressureMonitor> monitor_;

    mutable std::shared_mutex pools_mutex_;
    std::map<std::string, std::unique_ptr<pool::LocalPool>> pools_;

    mutable std::mutex sync_mutex_;
    WallClock wall_clock_;
    LeadershipState leadership_ = LeadershipState::NOT_LEADER;
    bool registered_            = false;
    bool shut_down_             = false;
    std::optional<pool::Clock::time_point> last_sync_;
    std::optional<pool::Clock::time_point> last_rebalance_;
    std::map<std::string, coordinator::InstanceRecord> known_instances_;
    CoordinatorStatus coordinator_status_;
    coordinator::InstanceHealth health_;
    std::map<std::string, double> distribution_;
    std::map<std::string, size_t> recommended_sizes_;

    std::atomic<uint64_t> pool_adjustments_{0};
    std::atomic<uint64_t> sync_operations_{0};
    std::atomic<uint64_t> leader_elections_{0};
    std::atomic<uint64_t> leadership_losses_{0};
    std::atomic<uint64_t> pruned_instances_{0};
    std::atomic<uint64_t> ticks_{0};

    std::atomic<bool> running_{false};
    std::thread tick_thread_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

// ============================================================================
// FACTORY
// ============================================================================

/**
 * @brief Builds orchestrators and coordinator backends from configuration
 */
class OrchestratorFactory {
public:
    /**
     * @brief Backend for config.backend: NoOp, Redis or in-memory
     */
    static std::shared_ptr<coordinator::CoordinatorBackend> create_coordinator(
        const config::CoordinatorConfig& config);

    /**
     * @brief Orchestrator with the configured coordinator backend
     */
    static std::unique_ptr<PoolOrchestrator> create(const OrchestratorConfig& config);
};

}  // namespace poolhub::core
