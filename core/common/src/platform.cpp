#include <poolhub/common/platform.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>

#if defined(POOLHUB_OS_POSIX)
#include <pthread.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <unistd.h>
#endif

#if defined(POOLHUB_HAS_MALLOC_TRIM)
#include <malloc.h>
#endif

namespace poolhub::common::platform {

// ============================================================================
// CPU Count
// ============================================================================

uint32_t get_cpu_count() noexcept {
    unsigned int count = std::thread::hardware_concurrency();
    if (count > 0) {
        return count;
    }

#if defined(POOLHUB_OS_POSIX)
    long nprocs = sysconf(_SC_NPROCESSORS_ONLN);
    return nprocs > 0 ? static_cast<uint32_t>(nprocs) : 1;
#else
    return 1;
#endif
}

// ============================================================================
// Page Size
// ============================================================================

size_t get_page_size() noexcept {
#if defined(POOLHUB_OS_POSIX)
    long page_size = sysconf(_SC_PAGESIZE);
    return page_size > 0 ? static_cast<size_t>(page_size) : 4096;
#else
    return 4096;
#endif
}

// ============================================================================
// Hostname
// ============================================================================

std::string get_hostname() {
#if defined(POOLHUB_OS_POSIX)
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        hostname[sizeof(hostname) - 1] = '\0';
        return std::string(hostname);
    }
    return "localhost";
#else
    return "localhost";
#endif
}

// ============================================================================
// Process and Thread IDs
// ============================================================================

uint64_t get_process_id() noexcept {
#if defined(POOLHUB_OS_POSIX)
    return static_cast<uint64_t>(getpid());
#else
    return 0;
#endif
}

uint64_t get_thread_id() noexcept {
#if defined(POOLHUB_OS_MACOS)
    uint64_t tid;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(POOLHUB_OS_POSIX)
    return static_cast<uint64_t>(pthread_self());
#else
    return 0;
#endif
}

// ============================================================================
// Environment Variables
// ============================================================================

std::string get_env(std::string_view name) {
    std::string name_str(name);
    const char* value = std::getenv(name_str.c_str());
    return value ? std::string(value) : std::string{};
}

bool set_env(std::string_view name, std::string_view value) {
    std::string name_str(name);
    std::string value_str(value);
#if defined(POOLHUB_OS_POSIX)
    return setenv(name_str.c_str(), value_str.c_str(), 1) == 0;
#else
    return false;
#endif
}

// ============================================================================
// Process Memory
// ============================================================================

uint64_t get_process_resident_memory() noexcept {
#if defined(POOLHUB_OS_LINUX)
    // /proc/self/statm: size resident shared text lib data dt (in pages)
    std::ifstream statm("/proc/self/statm");
    if (!statm.is_open()) {
        return 0;
    }
    uint64_t size_pages     = 0;
    uint64_t resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return 0;
    }
    return resident_pages * static_cast<uint64_t>(get_page_size());
#elif defined(POOLHUB_OS_POSIX)
    return get_process_peak_memory();
#else
    return 0;
#endif
}

uint64_t get_process_peak_memory() noexcept {
#if defined(POOLHUB_OS_POSIX)
    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) != 0) {
        return 0;
    }
#if defined(POOLHUB_OS_MACOS)
    return static_cast<uint64_t>(usage.ru_maxrss);  // bytes on macOS
#else
    return static_cast<uint64_t>(usage.ru_maxrss) * 1024;  // kilobytes elsewhere
#endif
#else
    return 0;
#endif
}

namespace {

std::optional<uint64_t> read_limit_file(const char* path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string token;
    if (!(file >> token) || token.empty() || token == "max") {
        return std::nullopt;
    }

    char* end          = nullptr;
    unsigned long long value = std::strtoull(token.c_str(), &end, 10);
    if (end == token.c_str() || value == 0) {
        return std::nullopt;
    }

    // cgroup v1 reports "unlimited" as a huge page-aligned value
    if (value >= (1ULL << 62)) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

}  // anonymous namespace

std::optional<uint64_t> get_cgroup_memory_limit() noexcept {
#if defined(POOLHUB_OS_LINUX)
    try {
        if (auto v2 = read_limit_file("/sys/fs/cgroup/memory.max")) {
            return v2;
        }
        return read_limit_file("/sys/fs/cgroup/memory/memory.limit_in_bytes");
    } catch (const std::exception&) {
        return std::nullopt;
    }
#else
    return std::nullopt;
#endif
}

bool release_free_memory() noexcept {
#if defined(POOLHUB_HAS_MALLOC_TRIM)
    return malloc_trim(0) != 0;
#else
    return false;
#endif
}

}  // namespace poolhub::common::platform
