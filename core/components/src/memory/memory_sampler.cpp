#include "poolhub/core/memory/memory_sampler.hpp"

#include <poolhub/common/platform.hpp>

namespace poolhub::core::memory {

MemorySample ProcessMemorySampler::sample() {
    MemorySample result;
    result.current_bytes = common::platform::get_process_resident_memory();
    result.peak_bytes    = common::platform::get_process_peak_memory();
    result.taken_at      = Clock::now();

    if (configured_limit_ > 0) {
        result.limit_bytes = configured_limit_;
    } else if (detect_cgroup_limit_) {
        result.limit_bytes = common::platform::get_cgroup_memory_limit();
    }

    return result;
}

}  // namespace poolhub::core::memory
