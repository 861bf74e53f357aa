#pragma once

/**
 * @file memory_sampler.hpp
 * @brief Process memory introspection used by the pressure monitor
 */

#include <chrono>
#include <cstdint>
#include <optional>

namespace poolhub::core::memory {

using Clock = std::chrono::steady_clock;

/**
 * @brief One memory reading
 */
struct MemorySample {
    uint64_t current_bytes = 0;
    uint64_t peak_bytes    = 0;
    std::optional<uint64_t> limit_bytes;  ///< Unset when no limit can be determined
    Clock::time_point taken_at;

    bool has_limit() const noexcept { return limit_bytes.has_value() && *limit_bytes > 0; }

    /// current / limit, 0 when the limit is unknown
    double ratio() const noexcept {
        return has_limit() ? static_cast<double>(current_bytes) / static_cast<double>(*limit_bytes)
                           : 0.0;
    }
};

/**
 * @brief Source of memory readings
 */
class MemorySampler {
public:
    virtual ~MemorySampler() = default;

    virtual MemorySample sample() = 0;
};

/**
 * @brief Samples the current process
 *
 * Current usage is the resident set size, peak is the maximum RSS. The limit
 * is the configured value, else the cgroup memory limit when detection is
 * enabled, else unset.
 */
class ProcessMemorySampler : public MemorySampler {
public:
    explicit ProcessMemorySampler(uint64_t configured_limit = 0, bool detect_cgroup_limit = true)
        : configured_limit_(configured_limit), detect_cgroup_limit_(detect_cgroup_limit) {}

    MemorySample sample() override;

private:
    uint64_t configured_limit_;
    bool detect_cgroup_limit_;
};

}  // namespace poolhub::core::memory
