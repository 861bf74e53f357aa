#pragma once

/**
 * @file local_pool.hpp
 * @brief Bounded in-process pool for one object kind
 *
 * The LocalPool provides:
 * - Borrow/return with slot identity checks
 * - Growth by a factor when utilization crosses the scale threshold
 * - Overflow objects up to the emergency limit
 * - Auto-shrink of idle capacity on return
 * - Factor-based resize driven by memory pressure
 *
 * All mutations are serialized by one mutex. Borrow never blocks waiting for
 * capacity: it fails fast with POOL_EXHAUSTED.
 */

#include <poolhub/common/error.hpp>
#include <poolhub/core/pool/pool_types.hpp>
#include <poolhub/core/pool/slot_factory.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace poolhub::core::pool {

class LocalPool {
public:
    LocalPool(std::string kind, PoolConfig config, std::shared_ptr<PoolSlotFactory> factory);
    ~LocalPool();

    LocalPool(const LocalPool&)            = delete;
    LocalPool& operator=(const LocalPool&) = delete;

    const std::string& kind() const noexcept { return kind_; }

    /**
     * @brief Pre-create slots up to initial_size
     *
     * On factory failure every slot created by this call is destroyed and
     * FACTORY_ERROR is returned.
     */
    common::Result<void> warm_up();

    /**
     * @brief Borrow an object
     * @return Handle in state IN_USE or OVERFLOW, POOL_EXHAUSTED when the
     *         emergency limit is reached, FACTORY_ERROR when construction fails
     */
    common::Result<PooledObject> borrow();

    /**
     * @brief Give a borrowed object back
     *
     * Overflow objects are discarded. Pool objects are reset and become FREE.
     * Unknown, foreign or already returned handles yield INVALID_ARGUMENT.
     */
    common::Result<void> return_object(const PooledObject& object);

    /**
     * @brief Scale current_size by factor
     * @param factor Multiplier applied to current_size
     * @param scale_limits Also scale max_size and emergency_limit
     *
     * The result is clamped to [min_size, max_size]. Shrinking only destroys
     * FREE slots. Resetting the cooldown is the caller's concern: resize()
     * always runs and records the resize time.
     */
    common::Result<void> resize(double factor, bool scale_limits = false);

    /**
     * @brief Destroy all FREE slots, leaving borrowed ones tracked
     * @return Number of slots destroyed
     */
    size_t drain();

    PoolStats stats() const;
    PoolConfig config() const;
    size_t current_size() const;

private:
    struct Slot {
        std::shared_ptr<void> resource;
        SlotState state = SlotState::FREE;
        uint64_t lease  = 0;
        Clock::time_point created_at;
        Clock::time_point last_used_at;
    };

    // All helpers below expect mutex_ to be held
    common::Result<uint64_t> create_slot_locked();
    common::Result<std::shared_ptr<void>> construct_locked();
    void destroy_slot_locked(uint64_t id);
    common::Result<void> grow_to_locked(size_t target);
    size_t shrink_to_locked(size_t target);
    PooledObject lend_locked(uint64_t id);
    bool cooldown_elapsed_locked(Clock::time_point now) const;
    void maybe_auto_shrink_locked();
    void update_peak_locked();

    const std::string kind_;
    const PoolConfig base_config_;
    PoolConfig config_;
    std::shared_ptr<PoolSlotFactory> factory_;

    mutable std::mutex mutex_;
    std::unordered_map<uint64_t, Slot> slots_;
    std::vector<uint64_t> free_list_;
    std::unordered_set<uint64_t> overflow_ids_;
    size_t in_use_ = 0;
    uint64_t next_id_ = 1;
    std::optional<Clock::time_point> last_resize_;

    PoolStats stats_;
};

}  // namespace poolhub::core::pool
