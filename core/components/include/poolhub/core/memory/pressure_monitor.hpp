#pragma once

/**
 * @file pressure_monitor.hpp
 * @brief Memory pressure classification and pool-wide adjustment
 *
 * The MemoryPressureMonitor provides:
 * - Rate-limited sampling into a bounded history
 * - Tier classification (LOW, MEDIUM, HIGH, CRITICAL)
 * - One resize directive per tier transition
 * - Forced GC and cache clearing on entering CRITICAL
 * - Tier-dependent periodic GC cadence
 * - Weak tracking of long-lived objects as a leak detector
 */

#include <poolhub/common/error.hpp>
#include <poolhub/core/memory/memory_sampler.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace poolhub::core::memory {

// ============================================================================
// TIERS AND POLICY
// ============================================================================

/**
 * @brief Memory pressure tiers, ordered by severity
 */
enum class PressureTier : uint8_t {
    LOW      = 0,
    MEDIUM   = 1,
    HIGH     = 2,
    CRITICAL = 3
};

constexpr std::string_view tier_name(PressureTier tier) noexcept {
    switch (tier) {
        case PressureTier::LOW:
            return "low";
        case PressureTier::MEDIUM:
            return "medium";
        case PressureTier::HIGH:
            return "high";
        case PressureTier::CRITICAL:
            return "critical";
        default:
            return "unknown";
    }
}

/**
 * @brief Periodic GC cadence policy
 */
enum class GcStrategy : uint8_t {
    ADAPTIVE,      ///< 10s / 30s / 60s for HIGH / MEDIUM / LOW
    CONSERVATIVE,  ///< Adaptive intervals doubled
    AGGRESSIVE,    ///< Adaptive intervals halved
    DISABLED       ///< No periodic GC; entering CRITICAL still forces one
};

constexpr std::string_view gc_strategy_name(GcStrategy strategy) noexcept {
    switch (strategy) {
        case GcStrategy::ADAPTIVE:
            return "adaptive";
        case GcStrategy::CONSERVATIVE:
            return "conservative";
        case GcStrategy::AGGRESSIVE:
            return "aggressive";
        case GcStrategy::DISABLED:
            return "disabled";
        default:
            return "unknown";
    }
}

/**
 * @brief Usage ratios at which each tier starts
 */
struct TierRatios {
    double medium   = 0.5;
    double high     = 0.7;
    double critical = 0.9;

    PressureTier classify(double ratio) const noexcept {
        if (ratio >= critical)
            return PressureTier::CRITICAL;
        if (ratio >= high)
            return PressureTier::HIGH;
        if (ratio >= medium)
            return PressureTier::MEDIUM;
        return PressureTier::LOW;
    }
};

/**
 * @brief Pool resize factor applied when a tier is entered
 */
struct TierFactors {
    double low      = 1.2;
    double medium   = 1.0;
    double high     = 0.7;
    double critical = 0.5;

    double for_tier(PressureTier tier) const noexcept {
        switch (tier) {
            case PressureTier::LOW:
                return low;
            case PressureTier::MEDIUM:
                return medium;
            case PressureTier::HIGH:
                return high;
            case PressureTier::CRITICAL:
                return critical;
            default:
                return 1.0;
        }
    }
};

struct MonitorConfig {
    bool enabled = true;

    uint64_t memory_limit_bytes = 0;     ///< 0 means detect
    bool detect_cgroup_limit    = true;  ///< false with limit 0 keeps the monitor at LOW

    std::chrono::milliseconds check_interval{5000};
    TierRatios ratios;
    TierFactors factors;
    GcStrategy gc_strategy = GcStrategy::ADAPTIVE;
    size_t history_size    = 100;

    std::unordered_map<std::string, std::chrono::seconds> tracked_lifetimes{
        {"request", std::chrono::seconds(300)},
        {"response", std::chrono::seconds(300)},
        {"buffer", std::chrono::seconds(60)}};
    std::chrono::seconds default_tracked_lifetime{300};

    common::Result<void> validate() const;
};

// ============================================================================
// SNAPSHOTS
// ============================================================================

struct MonitorMetrics {
    uint64_t checks               = 0;
    uint64_t tier_changes         = 0;
    uint64_t resize_directives    = 0;
    uint64_t gc_runs              = 0;  ///< Periodic and forced
    uint64_t forced_gc_runs       = 0;
    uint64_t gc_reclaimed_objects = 0;
    double avg_gc_duration_ms     = 0.0;
    double usage_percent          = 0.0;
};

struct MemoryPressureState {
    PressureTier tier = PressureTier::LOW;
    std::optional<Clock::time_point> last_tier_change_at;
    std::optional<Clock::time_point> last_gc_at;
    std::vector<MemorySample> history;
    bool emergency_mode = false;  ///< tier == CRITICAL
    bool limit_known    = false;
    MemorySample last_sample;
};

struct GcReport {
    bool forced      = false;
    size_t reclaimed = 0;
    std::chrono::microseconds duration{0};
};

// ============================================================================
// MONITOR
// ============================================================================

class MemoryPressureMonitor {
public:
    using ResizeCallback = std::function<void(double factor, PressureTier from, PressureTier to)>;
    using CacheClearCallback = std::function<void()>;
    using GcHook             = std::function<size_t()>;  ///< Returns reclaimed object count
    using TimeSource         = std::function<Clock::time_point()>;

    /**
     * @param config Monitor policy
     * @param sampler Memory source, a ProcessMemorySampler when null
     * @param clock Time source for rate limiting and GC cadence
     */
    explicit MemoryPressureMonitor(MonitorConfig config,
                                   std::unique_ptr<MemorySampler> sampler = nullptr,
                                   TimeSource clock = {});
    ~MemoryPressureMonitor();

    MemoryPressureMonitor(const MemoryPressureMonitor&)            = delete;
    MemoryPressureMonitor& operator=(const MemoryPressureMonitor&) = delete;

    // ========================================================================
    // CALLBACKS
    // ========================================================================

    void set_resize_callback(ResizeCallback callback);
    void add_cache_clear_callback(CacheClearCallback callback);
    void add_gc_hook(GcHook hook);

    // ========================================================================
    // OPERATIONS
    // ========================================================================

    /**
     * @brief Sample memory and react to tier changes
     * @param force Ignore the check interval
     * @return true if a sample was taken, false when rate-limited
     */
    bool check(bool force = false);

    /**
     * @brief Whether the periodic GC cadence for the current tier is due
     */
    bool should_run_gc() const;

    /**
     * @brief Run one GC pass: sweep tracked objects, run hooks, trim the heap
     */
    GcReport run_gc(bool forced = false);

    /**
     * @brief Watch an object without extending its lifetime
     */
    void track_object(std::string kind, const std::shared_ptr<void>& object);

    /**
     * @brief Drop tracked entries that were collected or outlived their kind's lifetime
     * @return Number of entries dropped
     */
    size_t sweep_tracked();

    size_t tracked_count() const;

    PressureTier tier() const;
    MemoryPressureState state() const;
    MonitorMetrics metrics() const;
    const MonitorConfig& config() const noexcept { return config_; }

    /**
     * @brief Drop tracked objects, callbacks and hooks
     */
    void shutdown();

private:
    struct TrackedEntry {
        std::string kind;
        std::weak_ptr<void> ref;
        Clock::time_point registered_at;
        std::chrono::seconds lifetime;
    };

    void handle_pressure_change(PressureTier from, PressureTier to);
    std::chrono::milliseconds gc_interval_locked() const;

    MonitorConfig config_;
    std::unique_ptr<MemorySampler> sampler_;
    TimeSource clock_;
    Clock::time_point started_at_;

    mutable std::mutex mutex_;
    PressureTier tier_ = PressureTier::LOW;
    bool limit_known_  = false;
    std::optional<Clock::time_point> last_check_;
    std::optional<Clock::time_point> last_tier_change_;
    std::optional<Clock::time_point> last_gc_;
    std::deque<MemorySample> history_;
    std::vector<TrackedEntry> tracked_;
    MonitorMetrics metrics_;
    double total_gc_ms_ = 0.0;

    ResizeCallback resize_callback_;
    std::vector<CacheClearCallback> cache_clear_callbacks_;
    std::vector<GcHook> gc_hooks_;
};

}  // namespace poolhub::core::memory
