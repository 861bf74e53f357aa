#include "poolhub/core/memory/pressure_monitor.hpp"

#include <poolhub/common/debug.hpp>
#include <poolhub/common/platform.hpp>

#include <algorithm>
#include <exception>

namespace poolhub::core::memory {

using namespace common::debug;
using common::ErrorCode;

namespace {
constexpr std::string_view LOG_CAT = category::MEMORY;

constexpr auto GC_INTERVAL_HIGH   = std::chrono::milliseconds(10000);
constexpr auto GC_INTERVAL_MEDIUM = std::chrono::milliseconds(30000);
constexpr auto GC_INTERVAL_LOW    = std::chrono::milliseconds(60000);

double to_mib(uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}
}  // anonymous namespace

// ============================================================================
// MonitorConfig
// ============================================================================

common::Result<void> MonitorConfig::validate() const {
    const auto& r = ratios;
    if (!(r.medium > 0.0 && r.medium < r.high && r.high < r.critical && r.critical <= 1.0)) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "memory.tier_ratios must be strictly increasing within (0, 1]");
    }
    const auto& f = factors;
    if (!(f.low > 0.0 && f.medium > 0.0 && f.high > 0.0 && f.critical > 0.0)) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "memory.adjustment_factors must be positive");
    }
    if (history_size == 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "memory.history_size must be positive");
    }
    if (check_interval.count() < 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "memory.check_interval_ms must not be negative");
    }
    return common::ok();
}

// ============================================================================
// MemoryPressureMonitor
// ============================================================================

MemoryPressureMonitor::MemoryPressureMonitor(MonitorConfig config,
                                             std::unique_ptr<MemorySampler> sampler,
                                             TimeSource clock)
    : config_(std::move(config)), sampler_(std::move(sampler)), clock_(std::move(clock)) {
    if (!sampler_) {
        sampler_ = std::make_unique<ProcessMemorySampler>(config_.memory_limit_bytes,
                                                          config_.detect_cgroup_limit);
    }
    if (!clock_) {
        clock_ = []() { return Clock::now(); };
    }
    started_at_ = clock_();
}

MemoryPressureMonitor::~MemoryPressureMonitor() = default;

void MemoryPressureMonitor::set_resize_callback(ResizeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    resize_callback_ = std::move(callback);
}

void MemoryPressureMonitor::add_cache_clear_callback(CacheClearCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_clear_callbacks_.push_back(std::move(callback));
}

void MemoryPressureMonitor::add_gc_hook(GcHook hook) {
    std::lock_guard<std::mutex> lock(mutex_);
    gc_hooks_.push_back(std::move(hook));
}

bool MemoryPressureMonitor::check(bool force) {
    auto now = clock_();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!force && last_check_ && now - *last_check_ < config_.check_interval) {
            return false;
        }
        last_check_ = now;
    }

    MemorySample sample;
    try {
        sample = sampler_->sample();
    } catch (const std::exception& e) {
        POOLHUB_LOG_WARN(LOG_CAT, "Memory sampling failed, treating limit as unknown: " << e.what());
        sample = MemorySample{};
    }
    sample.taken_at = now;

    PressureTier from = PressureTier::LOW;
    PressureTier to   = PressureTier::LOW;
    bool changed      = false;
    bool directive    = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.checks++;

        history_.push_back(sample);
        while (history_.size() > config_.history_size) {
            history_.pop_front();
        }

        bool limit_known = sample.has_limit();
        if (limit_known != limit_known_ || metrics_.checks == 1) {
            if (limit_known) {
                POOLHUB_LOG_INFO(LOG_CAT, "Memory limit detected: " << to_mib(*sample.limit_bytes)
                                                                    << " MiB");
            } else {
                POOLHUB_LOG_WARN(LOG_CAT, "Memory limit unknown, pressure resizing disabled");
            }
            limit_known_ = limit_known;
        }

        metrics_.usage_percent = sample.ratio() * 100.0;

        from = tier_;
        to   = limit_known ? config_.ratios.classify(sample.ratio()) : PressureTier::LOW;
        if (to != from) {
            changed           = true;
            directive         = limit_known;
            tier_             = to;
            last_tier_change_ = now;
            metrics_.tier_changes++;
        }
    }

    if (directive) {
        handle_pressure_change(from, to);
    }

    bool forced = directive && to == PressureTier::CRITICAL;
    if (!forced && should_run_gc()) {
        run_gc(false);
    }

    if (changed && !directive) {
        POOLHUB_LOG_INFO(LOG_CAT, "Memory tier reset to " << tier_name(to));
    }
    return true;
}

void MemoryPressureMonitor::handle_pressure_change(PressureTier from, PressureTier to) {
    double factor = config_.factors.for_tier(to);

    if (to == PressureTier::CRITICAL) {
        POOLHUB_LOG_WARN(LOG_CAT, "Memory pressure entering critical (from "
                                      << tier_name(from) << "), resize x" << factor);
    } else if (from == PressureTier::CRITICAL) {
        POOLHUB_LOG_INFO(LOG_CAT, "Memory pressure leaving critical (now " << tier_name(to)
                                                                           << "), resize x"
                                                                           << factor);
    } else {
        POOLHUB_LOG_INFO(LOG_CAT, "Memory pressure " << tier_name(from) << " -> " << tier_name(to)
                                                     << ", resize x" << factor);
    }

    ResizeCallback resize;
    std::vector<CacheClearCallback> cache_clear;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.resize_directives++;
        resize = resize_callback_;
        if (to == PressureTier::CRITICAL) {
            cache_clear = cache_clear_callbacks_;
        }
    }

    if (resize) {
        resize(factor, from, to);
    }

    if (to == PressureTier::CRITICAL) {
        for (auto& callback : cache_clear) {
            try {
                callback();
            } catch (const std::exception& e) {
                POOLHUB_LOG_WARN(LOG_CAT, "Cache clear callback failed: " << e.what());
            }
        }
        run_gc(true);
    }
}

bool MemoryPressureMonitor::should_run_gc() const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (config_.gc_strategy == GcStrategy::DISABLED) {
        return false;
    }
    if (tier_ == PressureTier::CRITICAL) {
        return true;
    }

    auto since = last_gc_.value_or(started_at_);
    return clock_() - since >= gc_interval_locked();
}

std::chrono::milliseconds MemoryPressureMonitor::gc_interval_locked() const {
    std::chrono::milliseconds base = GC_INTERVAL_LOW;
    switch (tier_) {
        case PressureTier::HIGH:
            base = GC_INTERVAL_HIGH;
            break;
        case PressureTier::MEDIUM:
            base = GC_INTERVAL_MEDIUM;
            break;
        default:
            break;
    }

    switch (config_.gc_strategy) {
        case GcStrategy::CONSERVATIVE:
            return base * 2;
        case GcStrategy::AGGRESSIVE:
            return base / 2;
        default:
            return base;
    }
}

GcReport MemoryPressureMonitor::run_gc(bool forced) {
    POOLHUB_SPAN_CAT("MemoryPressureMonitor::run_gc", LOG_CAT);

    auto started = std::chrono::steady_clock::now();

    GcReport report;
    report.forced    = forced;
    report.reclaimed = sweep_tracked();

    std::vector<GcHook> hooks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        hooks = gc_hooks_;
    }
    for (auto& hook : hooks) {
        try {
            report.reclaimed += hook();
        } catch (const std::exception& e) {
            POOLHUB_LOG_WARN(LOG_CAT, "GC hook failed: " << e.what());
        }
    }

    bool trimmed    = common::platform::release_free_memory();
    report.duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.gc_runs++;
        if (forced) {
            metrics_.forced_gc_runs++;
        }
        metrics_.gc_reclaimed_objects += report.reclaimed;
        total_gc_ms_ += static_cast<double>(report.duration.count()) / 1000.0;
        metrics_.avg_gc_duration_ms = total_gc_ms_ / static_cast<double>(metrics_.gc_runs);
        last_gc_                    = clock_();
    }

    if (forced) {
        POOLHUB_LOG_INFO(LOG_CAT, "Forced GC pass reclaimed " << report.reclaimed << " objects in "
                                                              << report.duration.count() << "us"
                                                              << (trimmed ? " (heap trimmed)" : ""));
    } else {
        POOLHUB_LOG_DEBUG(LOG_CAT, "GC pass reclaimed " << report.reclaimed << " objects in "
                                                        << report.duration.count() << "us");
    }
    return report;
}

void MemoryPressureMonitor::track_object(std::string kind, const std::shared_ptr<void>& object) {
    if (!object) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it       = config_.tracked_lifetimes.find(kind);
    auto lifetime = it != config_.tracked_lifetimes.end() ? it->second
                                                          : config_.default_tracked_lifetime;

    TrackedEntry entry;
    entry.kind          = std::move(kind);
    entry.ref           = object;
    entry.registered_at = clock_();
    entry.lifetime      = lifetime;
    tracked_.push_back(std::move(entry));
}

size_t MemoryPressureMonitor::sweep_tracked() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now    = clock_();
    auto before = tracked_.size();

    tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                  [now](const TrackedEntry& entry) {
                                      return entry.ref.expired() ||
                                             now - entry.registered_at > entry.lifetime;
                                  }),
                   tracked_.end());

    size_t dropped = before - tracked_.size();
    if (dropped > 0) {
        POOLHUB_LOG_TRACE(LOG_CAT, "Swept " << dropped << " tracked objects, "
                                            << tracked_.size() << " remain");
    }
    return dropped;
}

size_t MemoryPressureMonitor::tracked_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracked_.size();
}

PressureTier MemoryPressureMonitor::tier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tier_;
}

MemoryPressureState MemoryPressureMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    MemoryPressureState state;
    state.tier                = tier_;
    state.last_tier_change_at = last_tier_change_;
    state.last_gc_at          = last_gc_;
    state.history.assign(history_.begin(), history_.end());
    state.emergency_mode = tier_ == PressureTier::CRITICAL;
    state.limit_known    = limit_known_;
    if (!history_.empty()) {
        state.last_sample = history_.back();
    }
    return state;
}

MonitorMetrics MemoryPressureMonitor::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

void MemoryPressureMonitor::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = tracked_.size();
    tracked_.clear();
    resize_callback_ = nullptr;
    cache_clear_callbacks_.clear();
    gc_hooks_.clear();
    POOLHUB_LOG_DEBUG(LOG_CAT, "Memory monitor shut down, dropped " << dropped
                                                                    << " tracked objects");
}

}  // namespace poolhub::core::memory
