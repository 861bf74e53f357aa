#include "poolhub/core/coordinator/in_memory_coordinator.hpp"

#include <poolhub/common/debug.hpp>

#include <charconv>

namespace poolhub::core::coordinator {

using namespace common::debug;

namespace {
constexpr std::string_view LOG_CAT = category::COORDINATOR;

int64_t to_unix_seconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

bool parse_counter(const std::string& text, int64_t& out) {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}
}  // anonymous namespace

InMemoryCoordinator::InMemoryCoordinator(TimeSource clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
}

InMemoryCoordinator::~InMemoryCoordinator() {
    set_available(false);
}

void InMemoryCoordinator::set_available(bool available) {
    bool previous = available_.exchange(available);
    if (previous != available) {
        POOLHUB_LOG_INFO(LOG_CAT,
                         "In-memory coordinator " << (available ? "available" : "unavailable"));
    }
    // Wake blocked pops so they observe the outage
    std::lock_guard<std::mutex> lock(mutex_);
    queue_cv_.notify_all();
}

bool InMemoryCoordinator::is_connected() {
    return available_.load();
}

const InMemoryCoordinator::Entry* InMemoryCoordinator::find_live_locked(const std::string& key) {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return nullptr;
    }
    if (it->second.expires_at && *it->second.expires_at <= now()) {
        values_.erase(it);
        return nullptr;
    }
    return &it->second;
}

void InMemoryCoordinator::put_locked(const std::string& key, std::string value,
                                     std::chrono::seconds ttl) {
    Entry entry;
    entry.value = std::move(value);
    if (ttl.count() > 0) {
        entry.expires_at = now() + ttl;
    }
    values_[key] = std::move(entry);
}

size_t InMemoryCoordinator::key_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();
    for (auto it = values_.begin(); it != values_.end();) {
        if (it->second.expires_at && *it->second.expires_at <= current) {
            it = values_.erase(it);
        } else {
            ++it;
        }
    }
    return values_.size();
}

// ============================================================================
// INSTANCES
// ============================================================================

bool InMemoryCoordinator::register_instance(const InstanceRecord& record,
                                            std::chrono::seconds ttl) {
    if (!available_ || record.id.empty() || ttl.count() <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    InstanceRecord stamped = record;
    stamped.last_seen      = to_unix_seconds(now());
    put_locked(keys::instance(record.id), stamped.serialize(), ttl);
    return true;
}

bool InMemoryCoordinator::unregister_instance(const std::string& instance_id) {
    if (!available_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto key = keys::instance(instance_id);
    if (!find_live_locked(key)) {
        return false;
    }
    values_.erase(key);
    return true;
}

std::vector<InstanceRecord> InMemoryCoordinator::get_active_instances() {
    std::vector<InstanceRecord> instances;
    if (!available_) {
        return instances;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto current = now();
    for (auto it = values_.begin(); it != values_.end();) {
        const auto& [key, entry] = *it;
        if (key.compare(0, keys::INSTANCE_PREFIX.size(), keys::INSTANCE_PREFIX) != 0) {
            ++it;
            continue;
        }
        if (entry.expires_at && *entry.expires_at <= current) {
            it = values_.erase(it);
            continue;
        }

        auto parsed = InstanceRecord::parse(entry.value);
        if (parsed.is_success()) {
            instances.push_back(std::move(parsed).value());
        } else {
            POOLHUB_LOG_DEBUG(LOG_CAT, "Skipping unreadable record " << key << ": "
                                                                      << parsed.message());
        }
        ++it;
    }
    return instances;
}

// ============================================================================
// LEADERSHIP
// ============================================================================

bool InMemoryCoordinator::acquire_leadership(const std::string& instance_id,
                                             std::chrono::seconds ttl) {
    if (!available_ || instance_id.empty() || ttl.count() <= 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key(keys::LEADER);
    const auto* current = find_live_locked(key);
    if (current && current->value != instance_id) {
        return false;
    }
    put_locked(key, instance_id, ttl);
    return true;
}

bool InMemoryCoordinator::release_leadership(const std::string& instance_id) {
    if (!available_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key(keys::LEADER);
    const auto* current = find_live_locked(key);
    if (!current || current->value != instance_id) {
        return false;
    }
    values_.erase(key);
    return true;
}

std::optional<std::string> InMemoryCoordinator::get_current_leader() {
    if (!available_) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto* current = find_live_locked(std::string(keys::LEADER));
    if (!current) {
        return std::nullopt;
    }
    return current->value;
}

// ============================================================================
// QUEUES
// ============================================================================

bool InMemoryCoordinator::push(const std::string& key, const Json::Value& item) {
    if (!available_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        queues_[keys::queue(key)].push_front(encode_json(item));
    }
    queue_cv_.notify_one();
    return true;
}

std::optional<Json::Value> InMemoryCoordinator::pop(const std::string& key,
                                                    std::chrono::seconds timeout) {
    if (!available_) {
        return std::nullopt;
    }

    auto queue_key = keys::queue(key);
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [&]() {
        if (!available_) {
            return true;
        }
        auto it = queues_.find(queue_key);
        return it != queues_.end() && !it->second.empty();
    };

    if (timeout.count() > 0) {
        queue_cv_.wait_for(lock, timeout, ready);
    }
    if (!available_) {
        return std::nullopt;
    }

    auto it = queues_.find(queue_key);
    if (it == queues_.end() || it->second.empty()) {
        return std::nullopt;
    }

    std::string raw = std::move(it->second.back());
    it->second.pop_back();
    if (it->second.empty()) {
        queues_.erase(it);
    }
    lock.unlock();

    auto decoded = decode_json(raw);
    if (decoded.is_error()) {
        POOLHUB_LOG_DEBUG(LOG_CAT, "Dropping unreadable queue item: " << decoded.message());
        return std::nullopt;
    }
    return std::move(decoded).value();
}

size_t InMemoryCoordinator::get_queue_length(const std::string& key) {
    if (!available_) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(keys::queue(key));
    return it != queues_.end() ? it->second.size() : 0;
}

// ============================================================================
// KEY/VALUE
// ============================================================================

std::optional<std::string> InMemoryCoordinator::get(const std::string& key) {
    if (!available_) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entry = find_live_locked(key);
    if (!entry) {
        return std::nullopt;
    }
    return entry->value;
}

bool InMemoryCoordinator::set(const std::string& key, const std::string& value,
                              std::chrono::seconds ttl) {
    if (!available_ || ttl.count() < 0) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    put_locked(key, value, ttl);
    return true;
}

bool InMemoryCoordinator::remove(const std::string& key) {
    if (!available_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!find_live_locked(key)) {
        return false;
    }
    values_.erase(key);
    return true;
}

// ============================================================================
// GLOBAL COUNTERS
// ============================================================================

int64_t InMemoryCoordinator::get_global_counter(const std::string& kind) {
    if (!available_) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto* entry = find_live_locked(keys::global_pool_size(kind));
    int64_t value     = 0;
    if (!entry || !parse_counter(entry->value, value)) {
        return 0;
    }
    return value;
}

bool InMemoryCoordinator::adjust_global_counter(const std::string& kind, int64_t delta) {
    if (!available_) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto key          = keys::global_pool_size(kind);
    const auto* entry = find_live_locked(key);
    int64_t value     = 0;
    if (entry && !parse_counter(entry->value, value)) {
        return false;
    }
    put_locked(key, std::to_string(value + delta), GLOBAL_COUNTER_TTL);
    return true;
}

}  // namespace poolhub::core::coordinator
