#include "poolhub/core/pool/local_pool.hpp"

#include <poolhub/common/debug.hpp>

#include <algorithm>
#include <cmath>
#include <exception>

namespace poolhub::core::pool {

using namespace common::debug;
using common::ErrorCode;

namespace {
constexpr std::string_view LOG_CAT = category::POOL;

size_t scaled(size_t value, double factor) {
    return static_cast<size_t>(std::llround(static_cast<double>(value) * factor));
}
}  // anonymous namespace

// ============================================================================
// PoolConfig
// ============================================================================

common::Result<void> PoolConfig::validate() const {
    if (max_size == 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "max_size must be positive");
    }
    if (initial_size > max_size) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "initial_size exceeds max_size");
    }
    if (max_size > emergency_limit) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "max_size exceeds emergency_limit");
    }
    if (min_size > max_size) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "min_size exceeds max_size");
    }
    if (!(scale_threshold > 0.0 && scale_threshold <= 1.0)) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "scale_threshold must be in (0, 1]");
    }
    if (!(growth_factor > 1.0)) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "growth_factor must be > 1");
    }
    if (!(shrink_factor > 0.0 && shrink_factor < 1.0)) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "shrink_factor must be in (0, 1)");
    }
    if (shrink_threshold < 0.0 || shrink_threshold >= 1.0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "shrink_threshold must be in [0, 1)");
    }
    if (cooldown.count() < 0) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE, "cooldown must not be negative");
    }
    if (hard_ceiling != 0 && hard_ceiling < emergency_limit) {
        return common::err(ErrorCode::CONFIG_INVALID_VALUE,
                           "hard_ceiling below emergency_limit");
    }
    return common::ok();
}

// ============================================================================
// LocalPool
// ============================================================================

LocalPool::LocalPool(std::string kind, PoolConfig config,
                     std::shared_ptr<PoolSlotFactory> factory)
    : kind_(std::move(kind)), base_config_(config), config_(config),
      factory_(std::move(factory)) {
    POOLHUB_LOG_DEBUG(LOG_CAT, "Pool '" << kind_ << "' created (initial=" << config_.initial_size
                                        << " max=" << config_.max_size
                                        << " emergency=" << config_.emergency_limit << ")");
}

LocalPool::~LocalPool() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_use_ > 0 || !overflow_ids_.empty()) {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Pool '" << kind_ << "' destroyed with " << in_use_
                                            << " borrowed and " << overflow_ids_.size()
                                            << " overflow objects outstanding");
    }
}

common::Result<void> LocalPool::warm_up() {
    POOLHUB_SPAN_CAT("LocalPool::warm_up", LOG_CAT);

    std::lock_guard<std::mutex> lock(mutex_);
    size_t before = slots_.size();
    if (before >= config_.initial_size) {
        return common::ok();
    }

    auto result = grow_to_locked(config_.initial_size);
    if (result.is_error()) {
        POOLHUB_LOG_ERROR(LOG_CAT, "Pool '" << kind_ << "' warm-up failed: " << result.message());
        return result;
    }

    POOLHUB_LOG_DEBUG(LOG_CAT, "Pool '" << kind_ << "' warmed up with "
                                        << (slots_.size() - before) << " slots");
    return common::ok();
}

common::Result<PooledObject> LocalPool::borrow() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!free_list_.empty()) {
        uint64_t id = free_list_.back();
        free_list_.pop_back();
        return lend_locked(id);
    }

    auto now           = Clock::now();
    size_t current     = slots_.size();
    double utilization = current > 0 ? static_cast<double>(in_use_) / current : 1.0;

    bool can_grow = current < config_.max_size && utilization >= config_.scale_threshold &&
                    cooldown_elapsed_locked(now);

    if (can_grow) {
        auto grown =
            static_cast<size_t>(std::ceil(static_cast<double>(current) * config_.growth_factor));
        size_t target = std::min(config_.max_size, std::max(current + 1, grown));

        POOLHUB_TRY(grow_to_locked(target));

        stats_.expanded++;
        last_resize_ = now;
        POOLHUB_LOG_DEBUG(LOG_CAT,
                          "Pool '" << kind_ << "' expanded " << current << " -> " << target);

        uint64_t id = free_list_.back();
        free_list_.pop_back();
        return lend_locked(id);
    }

    if (current + overflow_ids_.size() < config_.emergency_limit) {
        std::shared_ptr<void> resource;
        POOLHUB_TRY_ASSIGN(resource, construct_locked());

        uint64_t id = next_id_++;
        overflow_ids_.insert(id);
        stats_.borrowed++;
        stats_.overflow_created++;
        stats_.emergency_activations++;
        update_peak_locked();

        POOLHUB_LOG_INFO(LOG_CAT, "Pool '" << kind_ << "' created overflow object ("
                                           << overflow_ids_.size() << " outstanding, limit "
                                           << config_.emergency_limit << ")");

        PooledObject object;
        object.id           = id;
        object.kind         = kind_;
        object.resource     = std::move(resource);
        object.state        = SlotState::OVERFLOW;
        object.created_at   = now;
        object.last_used_at = now;
        return object;
    }

    stats_.exhausted++;
    POOLHUB_LOG_WARN(LOG_CAT, "Pool '" << kind_ << "' exhausted (size=" << current
                                       << " overflow=" << overflow_ids_.size()
                                       << " emergency_limit=" << config_.emergency_limit << ")");
    return common::err<PooledObject>(ErrorCode::POOL_EXHAUSTED,
                                     "pool '" + kind_ + "' reached its emergency limit");
}

common::Result<void> LocalPool::return_object(const PooledObject& object) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (object.kind != kind_) {
        return common::err(ErrorCode::INVALID_ARGUMENT,
                           "handle of kind '" + object.kind + "' returned to pool '" + kind_ + "'");
    }

    if (overflow_ids_.erase(object.id) > 0) {
        stats_.returned++;
        POOLHUB_LOG_TRACE(LOG_CAT, "Pool '" << kind_ << "' discarded overflow object " << object.id);
        return common::ok();
    }

    auto it = slots_.find(object.id);
    if (it == slots_.end() || it->second.state != SlotState::IN_USE ||
        it->second.lease != object.lease) {
        return common::err(ErrorCode::INVALID_ARGUMENT,
                           "unknown or already returned handle " + std::to_string(object.id) +
                               " for pool '" + kind_ + "'");
    }

    Slot& slot = it->second;

    PooledObject handle;
    handle.id           = object.id;
    handle.lease        = slot.lease;
    handle.kind         = kind_;
    handle.resource     = slot.resource;
    handle.state        = SlotState::IN_USE;
    handle.created_at   = slot.created_at;
    handle.last_used_at = slot.last_used_at;

    bool reset_ok = true;
    if (factory_) {
        try {
            factory_->reset(handle);
        } catch (const std::exception& e) {
            reset_ok = false;
            POOLHUB_LOG_WARN(LOG_CAT, "Pool '" << kind_ << "' reset failed for slot " << object.id
                                               << ", discarding: " << e.what());
        }
    }

    in_use_--;
    stats_.returned++;

    if (reset_ok) {
        slot.state        = SlotState::FREE;
        slot.last_used_at = Clock::now();
        free_list_.push_back(object.id);
    } else {
        stats_.factory_errors++;
        destroy_slot_locked(object.id);
    }

    maybe_auto_shrink_locked();
    return common::ok();
}

common::Result<void> LocalPool::resize(double factor, bool scale_limits) {
    if (!(factor > 0.0)) {
        return common::err(ErrorCode::INVALID_ARGUMENT, "resize factor must be positive");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (scale_limits) {
        size_t ceiling   = base_config_.effective_ceiling();
        size_t lowest    = std::max<size_t>(config_.min_size, 1);
        config_.max_size = std::clamp(scaled(config_.max_size, factor), lowest, ceiling);
        config_.emergency_limit =
            std::clamp(scaled(config_.emergency_limit, factor), config_.max_size, ceiling);
    }

    size_t current = slots_.size();
    size_t target  = std::clamp(scaled(current, factor), config_.min_size, config_.max_size);

    last_resize_ = Clock::now();
    if (factor < 1.0) {
        stats_.shrunk++;
    }

    if (target > current) {
        POOLHUB_TRY(grow_to_locked(target));
        stats_.expanded++;
        POOLHUB_LOG_DEBUG(LOG_CAT, "Pool '" << kind_ << "' resized x" << factor << ": "
                                            << current << " -> " << target);
    } else if (target < current) {
        size_t removed = shrink_to_locked(target);
        POOLHUB_LOG_DEBUG(LOG_CAT, "Pool '" << kind_ << "' resized x" << factor << ": "
                                            << current << " -> " << slots_.size()
                                            << " (requested " << target << ", removed "
                                            << removed << ")");
    }

    return common::ok();
}

size_t LocalPool::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = free_list_.size();
    for (uint64_t id : free_list_) {
        destroy_slot_locked(id);
    }
    free_list_.clear();
    return count;
}

PoolStats LocalPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolStats snapshot            = stats_;
    snapshot.current_size         = slots_.size();
    snapshot.in_use               = in_use_;
    snapshot.free                 = free_list_.size();
    snapshot.overflow_outstanding = overflow_ids_.size();
    snapshot.max_size             = config_.max_size;
    snapshot.emergency_limit      = config_.emergency_limit;
    return snapshot;
}

PoolConfig LocalPool::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

size_t LocalPool::current_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

// ============================================================================
// Private helpers
// ============================================================================

common::Result<std::shared_ptr<void>> LocalPool::construct_locked() {
    if (!factory_) {
        stats_.factory_errors++;
        return common::err<std::shared_ptr<void>>(ErrorCode::FACTORY_ERROR,
                                                   "no slot factory for kind '" + kind_ + "'");
    }

    try {
        std::shared_ptr<void> resource = factory_->create(kind_);
        if (!resource) {
            stats_.factory_errors++;
            return common::err<std::shared_ptr<void>>(
                ErrorCode::FACTORY_ERROR, "slot factory returned null for kind '" + kind_ + "'");
        }
        return resource;
    } catch (const std::exception& e) {
        stats_.factory_errors++;
        common::Error error(ErrorCode::FACTORY_ERROR,
                            "slot factory failed for kind '" + kind_ + "'",
                            POOLHUB_CURRENT_LOCATION);
        error.with_context("what", e.what());
        return error;
    }
}

common::Result<uint64_t> LocalPool::create_slot_locked() {
    std::shared_ptr<void> resource;
    POOLHUB_TRY_ASSIGN(resource, construct_locked());

    auto now    = Clock::now();
    uint64_t id = next_id_++;

    Slot slot;
    slot.resource     = std::move(resource);
    slot.state        = SlotState::FREE;
    slot.created_at   = now;
    slot.last_used_at = now;
    slots_.emplace(id, std::move(slot));
    return id;
}

void LocalPool::destroy_slot_locked(uint64_t id) {
    if (slots_.erase(id) > 0) {
        stats_.destroyed++;
    }
}

common::Result<void> LocalPool::grow_to_locked(size_t target) {
    std::vector<uint64_t> added;
    while (slots_.size() < target) {
        auto id = create_slot_locked();
        if (id.is_error()) {
            // Roll back this call so counters never see a partial growth
            for (uint64_t created : added) {
                slots_.erase(created);
                free_list_.pop_back();
            }
            return id.error();
        }
        added.push_back(id.value());
        free_list_.push_back(id.value());
    }

    stats_.created += added.size();
    return common::ok();
}

size_t LocalPool::shrink_to_locked(size_t target) {
    size_t removed = 0;
    while (slots_.size() > target && !free_list_.empty()) {
        uint64_t id = free_list_.back();
        free_list_.pop_back();
        destroy_slot_locked(id);
        removed++;
    }
    return removed;
}

PooledObject LocalPool::lend_locked(uint64_t id) {
    Slot& slot        = slots_.at(id);
    slot.state        = SlotState::IN_USE;
    slot.last_used_at = Clock::now();
    slot.lease++;

    in_use_++;
    stats_.borrowed++;
    update_peak_locked();

    PooledObject object;
    object.id           = id;
    object.lease        = slot.lease;
    object.kind         = kind_;
    object.resource     = slot.resource;
    object.state        = SlotState::IN_USE;
    object.created_at   = slot.created_at;
    object.last_used_at = slot.last_used_at;
    return object;
}

bool LocalPool::cooldown_elapsed_locked(Clock::time_point now) const {
    return !last_resize_ || now - *last_resize_ >= config_.cooldown;
}

void LocalPool::maybe_auto_shrink_locked() {
    if (!config_.auto_shrink) {
        return;
    }

    size_t current = slots_.size();
    if (current == 0 || current <= config_.min_size) {
        return;
    }

    double utilization = static_cast<double>(in_use_) / current;
    if (utilization > config_.shrink_threshold) {
        return;
    }

    auto now = Clock::now();
    if (!cooldown_elapsed_locked(now)) {
        return;
    }

    auto shrunk_size =
        static_cast<size_t>(std::floor(static_cast<double>(current) * config_.shrink_factor));
    size_t target  = std::max(config_.min_size, shrunk_size);
    size_t removed = shrink_to_locked(target);
    if (removed == 0) {
        return;
    }

    stats_.shrunk++;
    last_resize_ = now;
    POOLHUB_LOG_DEBUG(LOG_CAT, "Pool '" << kind_ << "' auto-shrunk " << current << " -> "
                                        << slots_.size());
}

void LocalPool::update_peak_locked() {
    size_t outstanding = in_use_ + overflow_ids_.size();
    if (outstanding > stats_.peak_in_use) {
        stats_.peak_in_use = outstanding;
    }
}

}  // namespace poolhub::core::pool
