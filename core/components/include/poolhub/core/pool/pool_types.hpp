#pragma once

/**
 * @file pool_types.hpp
 * @brief Value types shared by the local object pool
 *
 * - PoolConfig: sizing and scaling policy for one object kind
 * - PoolStats: copy-on-read counter snapshot
 * - PooledObject: handle given to a borrower
 */

#include <poolhub/common/error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace poolhub::core::pool {

using Clock = std::chrono::steady_clock;

/**
 * @brief Lifecycle state of a pooled slot
 */
enum class SlotState : uint8_t {
    FREE,     ///< Owned by the pool, ready to borrow
    IN_USE,   ///< Owned exclusively by a borrower
    OVERFLOW  ///< One-off object outside the pool capacity
};

constexpr std::string_view slot_state_name(SlotState state) noexcept {
    switch (state) {
        case SlotState::FREE:
            return "free";
        case SlotState::IN_USE:
            return "in_use";
        case SlotState::OVERFLOW:
            return "overflow";
        default:
            return "unknown";
    }
}

/**
 * @brief Sizing and scaling policy for one object kind
 *
 * Invariant: min_size <= initial_size <= max_size <= emergency_limit
 */
struct PoolConfig {
    size_t initial_size    = 10;
    size_t max_size        = 100;
    size_t emergency_limit = 200;  ///< Cap on current_size + outstanding overflow objects
    size_t min_size        = 1;    ///< Floor for shrinking and resizing

    double scale_threshold = 0.8;  ///< Utilization that allows growth
    double growth_factor   = 1.5;
    std::chrono::milliseconds cooldown{std::chrono::seconds(60)};

    bool auto_shrink        = true;
    double shrink_threshold = 0.2;
    double shrink_factor    = 0.7;

    /// Upper bound for limits scaled by resize(); 0 means twice emergency_limit
    size_t hard_ceiling = 0;

    common::Result<void> validate() const;

    size_t effective_ceiling() const noexcept {
        return hard_ceiling > 0 ? hard_ceiling : emergency_limit * 2;
    }
};

/**
 * @brief Snapshot of pool counters and gauges
 *
 * Invariant: borrowed - returned == in_use + overflow_outstanding
 */
struct PoolStats {
    // Counters
    uint64_t borrowed              = 0;
    uint64_t returned              = 0;
    uint64_t created               = 0;
    uint64_t destroyed             = 0;
    uint64_t expanded              = 0;
    uint64_t shrunk                = 0;
    uint64_t overflow_created      = 0;
    uint64_t emergency_activations = 0;
    uint64_t exhausted             = 0;
    uint64_t factory_errors        = 0;

    // Gauges
    size_t current_size         = 0;
    size_t in_use               = 0;
    size_t free                 = 0;
    size_t overflow_outstanding = 0;
    size_t peak_in_use          = 0;
    size_t max_size             = 0;
    size_t emergency_limit      = 0;

    /// Fraction of pool slots currently borrowed
    double utilization() const noexcept {
        return current_size > 0 ? static_cast<double>(in_use) / current_size : 0.0;
    }

    uint64_t outstanding() const noexcept { return borrowed - returned; }
};

/**
 * @brief Handle to a borrowed resource
 *
 * Copies refer to the same slot. Only one copy may be returned.
 */
struct PooledObject {
    uint64_t id    = 0;
    uint64_t lease = 0;  ///< Bumped each time the slot is lent; stale copies no longer match
    std::string kind;
    std::shared_ptr<void> resource;
    SlotState state = SlotState::FREE;
    Clock::time_point created_at;
    Clock::time_point last_used_at;

    template <typename T>
    T* as() const noexcept {
        return static_cast<T*>(resource.get());
    }

    bool is_overflow() const noexcept { return state == SlotState::OVERFLOW; }

    explicit operator bool() const noexcept { return id != 0 && resource != nullptr; }
};

}  // namespace poolhub::core::pool
