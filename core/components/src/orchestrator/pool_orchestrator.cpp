/**
 * @file pool_orchestrator.cpp
 * @brief PoolOrchestrator implementation
 */

#include "poolhub/core/orchestrator/pool_orchestrator.hpp"

#include <poolhub/common/debug.hpp>
#include <poolhub/common/platform.hpp>
#include <poolhub/core/coordinator/in_memory_coordinator.hpp>
#include <poolhub/core/coordinator/noop_coordinator.hpp>
#include <poolhub/core/coordinator/redis_coordinator.hpp>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace poolhub::core {

using namespace common::debug;
using common::ErrorCode;

namespace {
constexpr std::string_view LOG_CAT       = category::LIFECYCLE;
constexpr std::string_view LOG_CAT_COORD = category::COORDINATOR;

/// Memory that counts as one unit of rebalancing capacity
constexpr double CAPACITY_UNIT_BYTES = 128.0 * 1024.0 * 1024.0;
constexpr double MIN_CAPACITY        = 0.1;

bool interval_elapsed(const std::optional<pool::Clock::time_point>& last,
                      pool::Clock::time_point now, pool::Clock::duration interval) {
    return !last || now - *last >= interval;
}
}  // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

PoolOrchestrator::PoolOrchestrator(OrchestratorConfig config,
                                   std::shared_ptr<coordinator::CoordinatorBackend> backend,
                                   std::unique_ptr<memory::MemorySampler> sampler)
    : config_(std::move(config)), coordinator_(std::move(backend)) {
    if (!coordinator_) {
        coordinator_ = std::make_shared<coordinator::NoOpCoordinator>();
    }

    instance_id_ = config_.instance_id.empty() ? generate_instance_id() : config_.instance_id;
    hostname_    = common::platform::get_hostname();
    pid_         = static_cast<int64_t>(common::platform::get_process_id());
    started_at_  = coordinator::unix_now();
    wall_clock_  = []() { return coordinator::unix_now(); };

    coordinator_status_.backend = std::string(coordinator_->name());

    monitor_ = std::make_unique<memory::MemoryPressureMonitor>(config_.memory, std::move(sampler));
    monitor_->set_resize_callback(
        [this](double factor, memory::PressureTier from, memory::PressureTier to) {
            auto result = resize_all(factor);
            if (result.is_error()) {
                POOLHUB_LOG_WARN(LOG_CAT, "Resize on " << memory::tier_name(from) << " -> "
                                                       << memory::tier_name(to)
                                                       << " failed: " << result.message());
            }
        });

    POOLHUB_LOG_INFO(LOG_CAT, "Orchestrator " << instance_id_ << " created (coordinator: "
                                              << coordinator_->name() << ")");
}

PoolOrchestrator::~PoolOrchestrator() {
    shutdown();
}

std::string PoolOrchestrator::generate_instance_id() {
    std::random_device device;
    std::mt19937_64 generator(
        (static_cast<uint64_t>(device()) << 32) ^ static_cast<uint64_t>(device()) ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));

    std::ostringstream id;
    id << common::platform::get_hostname() << "_inst" << std::hex << std::setw(16)
       << std::setfill('0') << generator() << std::dec << "_"
       << common::platform::get_process_id();
    return id.str();
}

void PoolOrchestrator::set_wall_clock(WallClock clock) {
    std::lock_guard<std::mutex> lock(sync_mutex_);
    if (clock) {
        wall_clock_ = std::move(clock);
    }
}

// ============================================================================
// KINDS
// ============================================================================

common::Result<void> PoolOrchestrator::register_kind(const std::string& kind,
                                                     std::shared_ptr<pool::PoolSlotFactory> factory,
                                                     std::optional<pool::PoolConfig> config) {
    if (kind.empty() || !factory) {
        return common::err(ErrorCode::INVALID_ARGUMENT, "kind name and factory are required");
    }

    pool::PoolConfig pool_config;
    if (config) {
        pool_config = *config;
    } else {
        auto it     = config_.pools.kinds.find(kind);
        pool_config = it != config_.pools.kinds.end() ? it->second : config_.pools.defaults;
    }

    if (auto valid = pool_config.validate(); valid.is_error()) {
        auto error = valid.error();
        error.with_context("kind", kind);
        return common::err(std::move(error));
    }

    std::unique_lock<std::shared_mutex> lock(pools_mutex_);
    if (pools_.count(kind) > 0) {
        return common::err(ErrorCode::ALREADY_EXISTS, "kind already registered: " + kind);
    }

    auto local = std::make_unique<pool::LocalPool>(kind, pool_config, std::move(factory));
    POOLHUB_TRY(local->warm_up());

    POOLHUB_LOG_INFO(LOG_CAT, "Registered kind '" << kind << "' (initial " << pool_config.initial_size
                                                  << ", max " << pool_config.max_size
                                                  << ", emergency " << pool_config.emergency_limit
                                                  << ")");
    pools_.emplace(kind, std::move(local));
    return common::ok();
}

bool PoolOrchestrator::has_kind(const std::string& kind) const {
    return find_pool(kind) != nullptr;
}

std::vector<std::string> PoolOrchestrator::kinds() const {
    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    std::vector<std::string> names;
    names.reserve(pools_.size());
    for (const auto& [name, local] : pools_) {
        names.push_back(name);
    }
    return names;
}

pool::LocalPool* PoolOrchestrator::find_pool(const std::string& kind) const {
    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    auto it = pools_.find(kind);
    return it != pools_.end() ? it->second.get() : nullptr;
}

// ============================================================================
// REQUEST PATH
// ============================================================================

common::Result<pool::PooledObject> PoolOrchestrator::borrow(const std::string& kind) {
    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    auto it = pools_.find(kind);
    if (POOLHUB_UNLIKELY(it == pools_.end())) {
        return common::err<pool::PooledObject>(ErrorCode::UNKNOWN_KIND, "unknown kind: " + kind);
    }
    return it->second->borrow();
}

common::Result<void> PoolOrchestrator::return_object(const std::string& kind,
                                                     const pool::PooledObject& object) {
    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    auto it = pools_.find(kind);
    if (POOLHUB_UNLIKELY(it == pools_.end())) {
        return common::err(ErrorCode::UNKNOWN_KIND, "unknown kind: " + kind);
    }
    return it->second->return_object(object);
}

// ============================================================================
// MAINTENANCE
// ============================================================================

common::Result<void> PoolOrchestrator::resize_all(double factor) {
    if (!(factor > 0.0)) {
        return common::err(ErrorCode::INVALID_ARGUMENT, "resize factor must be positive");
    }

    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    common::Result<void> outcome;
    for (const auto& [kind, local] : pools_) {
        auto result = local->resize(factor, true);
        if (result.is_error()) {
            POOLHUB_LOG_WARN(LOG_CAT, "Resize of '" << kind << "' failed: " << result.message());
            outcome = std::move(result);
        }
    }
    pool_adjustments_.fetch_add(1);

    POOLHUB_LOG_DEBUG(LOG_CAT, "Resized " << pools_.size() << " pools by factor " << factor);
    return outcome;
}

void PoolOrchestrator::tick() {
    POOLHUB_SPAN_CAT("PoolOrchestrator::tick", LOG_CAT);

    {
        std::lock_guard<std::mutex> lock(sync_mutex_);
        if (shut_down_) {
            return;
        }
    }
    ticks_.fetch_add(1);

    try {
        if (config_.memory.enabled) {
            monitor_->check();
        }

        std::lock_guard<std::mutex> lock(sync_mutex_);
        if (shut_down_) {
            return;
        }
        update_health_locked();
        sync_with_coordinator_locked();
    } catch (const std::exception& e) {
        POOLHUB_LOG_ERROR(LOG_CAT, "Tick failed: " << e.what());
    }
}

void PoolOrchestrator::update_health_locked() {
    auto sample = monitor_->state().last_sample;
    double usage = sample.ratio();

    bool emergencies = false;
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        for (const auto& [kind, local] : pools_) {
            if (local->stats().emergency_activations > 0) {
                emergencies = true;
                break;
            }
        }
    }

    double score = 1.0;
    if (usage > 0.8) {
        score *= 0.5;
    } else if (usage > 0.6) {
        score *= 0.8;
    }
    if (emergencies) {
        score *= 0.7;
    }

    health_.score        = score;
    health_.memory_usage = usage;
    health_.pool_healthy = score > 0.5;
}

coordinator::InstanceRecord PoolOrchestrator::build_record_locked() {
    coordinator::InstanceRecord record;
    record.id         = instance_id_;
    record.hostname   = hostname_;
    record.pid        = pid_;
    record.started_at = started_at_;
    record.last_seen  = wall_clock_();
    record.health     = health_;

    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        for (const auto& [kind, local] : pools_) {
            auto stats              = local->stats();
            record.pool_sizes[kind] = stats.current_size;
            record.in_use[kind]     = stats.in_use;
        }
    }

    auto sample = monitor_->state().last_sample;
    record.capabilities.memory_limit =
        sample.has_limit() ? *sample.limit_bytes : config_.memory.memory_limit_bytes;
    record.capabilities.cpu_cores = common::platform::get_cpu_count();
    return record;
}

void PoolOrchestrator::sync_with_coordinator_locked() {
    auto now = pool::Clock::now();
    if (!interval_elapsed(last_sync_, now, config_.coordinator.sync_interval)) {
        return;
    }
    last_sync_ = now;
    sync_operations_.fetch_add(1);

    bool connected                = coordinator_->is_connected();
    coordinator_status_.connected = connected;

    // A backend that failed the liveness check is not dialed again this tick
    if (!connected) {
        coordinator_status_.leader.reset();
        if (leadership_ == LeadershipState::LEADER) {
            step_down_locked();
        }
        return;
    }

    auto record   = build_record_locked();
    auto ttl      = config_.coordinator.heartbeat_ttl;
    bool heartbeat = registered_ ? coordinator_->update_instance(record, ttl)
                                 : coordinator_->register_instance(record, ttl);
    if (heartbeat && !registered_) {
        POOLHUB_LOG_INFO(LOG_CAT_COORD, "Instance " << instance_id_ << " registered with "
                                                    << coordinator_->name());
    }
    registered_ = registered_ || heartbeat;

    update_leadership_locked();

    coordinator_status_.leader = coordinator_->get_current_leader();
    refresh_instances_locked();

    if (leadership_ == LeadershipState::LEADER) {
        publish_global_counters_locked();
        if (interval_elapsed(last_rebalance_, now, config_.coordinator.rebalance_interval)) {
            last_rebalance_ = now;
            rebalance_locked();
        }
    }
}

void PoolOrchestrator::update_leadership_locked() {
    bool held = config_.coordinator.leader_election &&
                coordinator_->acquire_leadership(instance_id_, config_.coordinator.leader_ttl);

    if (held && leadership_ == LeadershipState::NOT_LEADER) {
        leadership_ = LeadershipState::LEADER;
        leader_elections_.fetch_add(1);
        last_rebalance_.reset();
        POOLHUB_LOG_INFO(LOG_CAT_COORD, "Leadership acquired by " << instance_id_);
    } else if (!held && leadership_ == LeadershipState::LEADER) {
        step_down_locked();
    }
}

void PoolOrchestrator::step_down_locked() {
    leadership_ = LeadershipState::NOT_LEADER;
    leadership_losses_.fetch_add(1);
    distribution_.clear();
    recommended_sizes_.clear();
    POOLHUB_LOG_WARN(LOG_CAT_COORD, "Leadership lost by " << instance_id_);
}

void PoolOrchestrator::refresh_instances_locked() {
    auto now      = wall_clock_();
    auto max_age  = static_cast<int64_t>(config_.coordinator.heartbeat_ttl.count());
    size_t stale  = 0;

    std::map<std::string, coordinator::InstanceRecord> fresh;
    for (auto& record : coordinator_->get_active_instances()) {
        if (now - record.last_seen > max_age) {
            ++stale;
            continue;
        }
        auto id = record.id;
        fresh.emplace(std::move(id), std::move(record));
    }

    size_t pruned = 0;
    for (const auto& [id, record] : known_instances_) {
        if (fresh.count(id) == 0) {
            ++pruned;
            POOLHUB_LOG_DEBUG(LOG_CAT_COORD, "Pruned instance " << id << " (last seen "
                                                                << now - record.last_seen
                                                                << "s ago)");
        }
    }
    if (pruned > 0) {
        pruned_instances_.fetch_add(pruned);
    }
    if (stale > 0) {
        POOLHUB_LOG_DEBUG(LOG_CAT_COORD, "Ignored " << stale << " stale instance records");
    }

    known_instances_                     = std::move(fresh);
    coordinator_status_.active_instances = known_instances_.size();
}

void PoolOrchestrator::publish_global_counters_locked() {
    std::map<std::string, int64_t> totals;
    for (const auto& [id, record] : known_instances_) {
        for (const auto& [kind, size] : record.pool_sizes) {
            totals[kind] += static_cast<int64_t>(size);
        }
    }
    for (const auto& kind : kinds()) {
        totals.try_emplace(kind, 0);
    }

    for (const auto& [kind, total] : totals) {
        auto current = coordinator_->get_global_counter(kind);
        if (!coordinator_->adjust_global_counter(kind, total - current)) {
            POOLHUB_LOG_DEBUG(LOG_CAT_COORD, "Global counter publish for '" << kind << "' failed");
            return;
        }
    }
}

void PoolOrchestrator::rebalance_locked() {
    if (known_instances_.empty()) {
        return;
    }

    std::map<std::string, double> capacity;
    double total_capacity = 0.0;
    for (const auto& [id, record] : known_instances_) {
        double units = static_cast<double>(record.capabilities.memory_limit) / CAPACITY_UNIT_BYTES *
                       static_cast<double>(record.capabilities.cpu_cores) * record.health.score;
        capacity[id] = std::max(MIN_CAPACITY, units);
        total_capacity += capacity[id];
    }

    distribution_.clear();
    for (const auto& [id, units] : capacity) {
        distribution_[id] = units / total_capacity;
    }

    recommended_sizes_.clear();
    auto self = distribution_.find(instance_id_);
    if (self == distribution_.end()) {
        return;
    }

    std::shared_lock<std::shared_mutex> lock(pools_mutex_);
    for (const auto& [kind, local] : pools_) {
        uint64_t global_total = 0;
        for (const auto& [id, record] : known_instances_) {
            global_total += record.pool_size(kind);
        }

        auto config = local->config();
        auto target = static_cast<size_t>(
            std::llround(static_cast<double>(global_total) * self->second));
        recommended_sizes_[kind] = std::clamp(target, config.min_size, config.max_size);

        POOLHUB_LOG_INFO(LOG_CAT_COORD, "Rebalance '" << kind << "': global " << global_total
                                                      << ", share " << self->second
                                                      << ", recommended "
                                                      << recommended_sizes_[kind]);
    }
}

// ============================================================================
// LIFECYCLE
// ============================================================================

common::Result<void> PoolOrchestrator::start() {
    POOLHUB_SPAN_CAT("PoolOrchestrator::start", LOG_CAT);

    {
        std::lock_guard<std::mutex> lock(sync_mutex_);
        if (shut_down_) {
            return common::err(ErrorCode::INVALID_STATE, "Orchestrator is shut down");
        }
    }
    if (POOLHUB_UNLIKELY(running_.exchange(true))) {
        POOLHUB_LOG_WARN(LOG_CAT, "Orchestrator is already running");
        return common::err(ErrorCode::INVALID_STATE, "Orchestrator is already running");
    }

    tick_thread_ = std::thread(&PoolOrchestrator::tick_loop, this);
    POOLHUB_LOG_INFO(LOG_CAT, "Ticking every " << config_.tick_interval.count() << " ms");
    return common::ok();
}

void PoolOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (tick_thread_.joinable()) {
        tick_thread_.join();
        POOLHUB_LOG_DEBUG(LOG_CAT, "Tick thread stopped");
    }
}

void PoolOrchestrator::tick_loop() {
    while (running_.load()) {
        tick();

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait_for(lock, config_.tick_interval, [this]() { return !running_.load(); });
    }
}

void PoolOrchestrator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(sync_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;

        if (registered_ && !coordinator_->unregister_instance(instance_id_)) {
            POOLHUB_LOG_DEBUG(LOG_CAT_COORD, "Instance record of " << instance_id_
                                                                   << " already gone");
        }
        registered_ = false;

        if (leadership_ == LeadershipState::LEADER) {
            if (coordinator_->release_leadership(instance_id_)) {
                POOLHUB_LOG_INFO(LOG_CAT_COORD, "Leadership released by " << instance_id_);
            } else {
                POOLHUB_LOG_DEBUG(LOG_CAT_COORD, "Lease of " << instance_id_ << " already lapsed");
            }
            leadership_ = LeadershipState::NOT_LEADER;
        }
    }

    stop();

    {
        std::unique_lock<std::shared_mutex> lock(pools_mutex_);
        for (auto& [kind, local] : pools_) {
            local->drain();
        }
        pools_.clear();
    }
    monitor_->shutdown();

    POOLHUB_LOG_INFO(LOG_CAT, "Orchestrator " << instance_id_ << " shut down");
}

// ============================================================================
// OBSERVABILITY
// ============================================================================

LeadershipState PoolOrchestrator::leadership_state() const {
    std::lock_guard<std::mutex> lock(sync_mutex_);
    return leadership_;
}

OrchestratorMetrics PoolOrchestrator::metrics() const {
    OrchestratorMetrics snapshot;
    snapshot.pool_adjustments  = pool_adjustments_.load();
    snapshot.sync_operations   = sync_operations_.load();
    snapshot.leader_elections  = leader_elections_.load();
    snapshot.leadership_losses = leadership_losses_.load();
    snapshot.pruned_instances  = pruned_instances_.load();
    snapshot.ticks             = ticks_.load();
    return snapshot;
}

OrchestratorStats PoolOrchestrator::get_stats() const {
    OrchestratorStats stats;
    stats.instance_id = instance_id_;
    {
        std::shared_lock<std::shared_mutex> lock(pools_mutex_);
        for (const auto& [kind, local] : pools_) {
            stats.pools.emplace(kind, local->stats());
        }
    }

    stats.memory         = monitor_->state();
    stats.memory_metrics = monitor_->metrics();
    stats.metrics        = metrics();

    std::lock_guard<std::mutex> lock(sync_mutex_);
    stats.is_leader         = leadership_ == LeadershipState::LEADER;
    stats.coordinator       = coordinator_status_;
    stats.known_instances   = known_instances_.size();
    stats.health            = health_;
    stats.distribution      = distribution_;
    stats.recommended_sizes = recommended_sizes_;
    return stats;
}

YAML::Node PoolOrchestrator::get_status() const {
    auto stats = get_stats();

    YAML::Node status;
    status["instanceId"]     = stats.instance_id;
    status["isLeader"]       = stats.is_leader;
    status["knownInstances"] = stats.known_instances;

    YAML::Node pools(YAML::NodeType::Map);
    for (const auto& [kind, p] : stats.pools) {
        YAML::Node node;
        node["currentSize"]          = p.current_size;
        node["inUse"]                = p.in_use;
        node["free"]                 = p.free;
        node["overflowOutstanding"]  = p.overflow_outstanding;
        node["peakInUse"]            = p.peak_in_use;
        node["maxSize"]              = p.max_size;
        node["emergencyLimit"]       = p.emergency_limit;
        node["utilization"]          = p.utilization();
        node["borrowed"]             = p.borrowed;
        node["returned"]             = p.returned;
        node["created"]              = p.created;
        node["destroyed"]            = p.destroyed;
        node["expanded"]             = p.expanded;
        node["shrunk"]               = p.shrunk;
        node["overflowCreated"]      = p.overflow_created;
        node["emergencyActivations"] = p.emergency_activations;
        node["exhausted"]            = p.exhausted;
        node["factoryErrors"]        = p.factory_errors;
        pools[kind]                  = node;
    }
    status["pools"] = pools;

    YAML::Node mem;
    mem["tier"]               = std::string(memory::tier_name(stats.memory.tier));
    mem["emergencyMode"]      = stats.memory.emergency_mode;
    mem["limitKnown"]         = stats.memory.limit_known;
    mem["currentBytes"]       = stats.memory.last_sample.current_bytes;
    mem["peakBytes"]          = stats.memory.last_sample.peak_bytes;
    mem["usagePercent"]       = stats.memory_metrics.usage_percent;
    mem["checks"]             = stats.memory_metrics.checks;
    mem["tierChanges"]        = stats.memory_metrics.tier_changes;
    mem["gcRuns"]             = stats.memory_metrics.gc_runs;
    mem["forcedGcRuns"]       = stats.memory_metrics.forced_gc_runs;
    mem["gcReclaimedObjects"] = stats.memory_metrics.gc_reclaimed_objects;
    mem["avgGcDurationMs"]    = stats.memory_metrics.avg_gc_duration_ms;
    mem["historySize"]        = stats.memory.history.size();
    status["memory"]          = mem;

    YAML::Node coord;
    coord["backend"]         = stats.coordinator.backend;
    coord["connected"]       = stats.coordinator.connected;
    coord["activeInstances"] = stats.coordinator.active_instances;
    if (stats.coordinator.leader) {
        coord["leader"] = *stats.coordinator.leader;
    } else {
        coord["leader"] = YAML::Node(YAML::NodeType::Null);
    }
    status["coordinator"] = coord;

    YAML::Node metrics;
    metrics["poolAdjustments"]  = stats.metrics.pool_adjustments;
    metrics["syncOperations"]   = stats.metrics.sync_operations;
    metrics["leaderElections"]  = stats.metrics.leader_elections;
    metrics["leadershipLosses"] = stats.metrics.leadership_losses;
    metrics["prunedInstances"]  = stats.metrics.pruned_instances;
    metrics["ticks"]            = stats.metrics.ticks;
    status["metrics"]           = metrics;

    YAML::Node health;
    health["score"]       = stats.health.score;
    health["memoryUsage"] = stats.health.memory_usage;
    health["poolHealthy"] = stats.health.pool_healthy;
    status["health"]      = health;

    YAML::Node distribution(YAML::NodeType::Map);
    for (const auto& [id, share] : stats.distribution) {
        distribution[id] = share;
    }
    status["distribution"] = distribution;

    YAML::Node recommended(YAML::NodeType::Map);
    for (const auto& [kind, size] : stats.recommended_sizes) {
        recommended[kind] = size;
    }
    status["recommendedSizes"] = recommended;
    return status;
}

// ============================================================================
// FACTORY
// ============================================================================

std::shared_ptr<coordinator::CoordinatorBackend> OrchestratorFactory::create_coordinator(
    const config::CoordinatorConfig& config) {
    switch (config.backend) {
        case config::CoordinatorBackendType::REDIS: {
            coordinator::RedisCoordinatorConfig redis;
            redis.endpoint          = config.endpoint;
            redis.key_prefix        = config.key_prefix;
            redis.reconnect_backoff = config.reconnect_backoff;
            return std::make_shared<coordinator::RedisCoordinator>(std::move(redis));
        }
        case config::CoordinatorBackendType::MEMORY:
            return std::make_shared<coordinator::InMemoryCoordinator>();
        case config::CoordinatorBackendType::NONE:
        default:
            return std::make_shared<coordinator::NoOpCoordinator>();
    }
}

std::unique_ptr<PoolOrchestrator> OrchestratorFactory::create(const OrchestratorConfig& config) {
    return std::make_unique<PoolOrchestrator>(config, create_coordinator(config.coordinator));
}

}  // namespace poolhub::core
