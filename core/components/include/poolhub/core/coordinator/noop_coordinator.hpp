#pragma once

/**
 * @file noop_coordinator.hpp
 * @brief Standalone backend: never connected, neutral results everywhere
 */

#include <poolhub/core/coordinator/coordinator_backend.hpp>

namespace poolhub::core::coordinator {

class NoOpCoordinator : public CoordinatorBackend {
public:
    std::string_view name() const noexcept override { return "none"; }

    bool is_connected() override { return false; }

    bool register_instance(const InstanceRecord&, std::chrono::seconds) override { return false; }
    bool unregister_instance(const std::string&) override { return false; }
    std::vector<InstanceRecord> get_active_instances() override { return {}; }

    bool acquire_leadership(const std::string&, std::chrono::seconds) override { return false; }
    bool release_leadership(const std::string&) override { return false; }
    std::optional<std::string> get_current_leader() override { return std::nullopt; }

    bool push(const std::string&, const Json::Value&) override { return false; }
    std::optional<Json::Value> pop(const std::string&, std::chrono::seconds) override {
        return std::nullopt;
    }
    size_t get_queue_length(const std::string&) override { return 0; }

    std::optional<std::string> get(const std::string&) override { return std::nullopt; }
    bool set(const std::string&, const std::string&, std::chrono::seconds) override {
        return false;
    }
    bool remove(const std::string&) override { return false; }

    int64_t get_global_counter(const std::string&) override { return 0; }
    bool adjust_global_counter(const std::string&, int64_t) override { return false; }
};

}  // namespace poolhub::core::coordinator
