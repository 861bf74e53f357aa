#pragma once

/**
 * @file platform.hpp
 * @brief Centralized platform detection and OS abstraction
 *
 * This header provides:
 * - Compile-time platform detection
 * - Compiler attributes and branch hints
 * - Runtime environment queries (CPU, host, process)
 * - Process memory introspection used by the pressure monitor
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ============================================================================
// COMPILER DETECTION
// ============================================================================

#if defined(__clang__)
    #define POOLHUB_COMPILER_CLANG 1
    #define POOLHUB_COMPILER_NAME "Clang"
#elif defined(__GNUC__) || defined(__GNUG__)
    #define POOLHUB_COMPILER_GCC 1
    #define POOLHUB_COMPILER_NAME "GCC"
#elif defined(_MSC_VER)
    #define POOLHUB_COMPILER_MSVC 1
    #define POOLHUB_COMPILER_NAME "MSVC"
#else
    #define POOLHUB_COMPILER_UNKNOWN 1
    #define POOLHUB_COMPILER_NAME "Unknown"
#endif

// ============================================================================
// OPERATING SYSTEM DETECTION
// ============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define POOLHUB_OS_WINDOWS 1
    #define POOLHUB_OS_NAME "Windows"
#elif defined(__APPLE__) && defined(__MACH__)
    #define POOLHUB_OS_MACOS 1
    #define POOLHUB_OS_NAME "macOS"
#elif defined(__linux__)
    #define POOLHUB_OS_LINUX 1
    #define POOLHUB_OS_NAME "Linux"
#elif defined(__FreeBSD__)
    #define POOLHUB_OS_FREEBSD 1
    #define POOLHUB_OS_NAME "FreeBSD"
#elif defined(__unix__)
    #define POOLHUB_OS_UNIX 1
    #define POOLHUB_OS_NAME "Unix"
#else
    #define POOLHUB_OS_UNKNOWN 1
    #define POOLHUB_OS_NAME "Unknown"
#endif

// POSIX detection
#if defined(POOLHUB_OS_LINUX) || defined(POOLHUB_OS_MACOS) || defined(POOLHUB_OS_FREEBSD) || \
    defined(POOLHUB_OS_UNIX)
    #define POOLHUB_OS_POSIX 1
#endif

// ============================================================================
// BUILD TYPE DETECTION
// ============================================================================

#if defined(NDEBUG) || defined(POOLHUB_RELEASE)
    #define POOLHUB_BUILD_RELEASE 1
    #define POOLHUB_BUILD_TYPE "Release"
#else
    #define POOLHUB_BUILD_DEBUG 1
    #define POOLHUB_BUILD_TYPE "Debug"
#endif

// ============================================================================
// FEATURE DETECTION
// ============================================================================

#if __cplusplus < 202002L
    #error "poolhub requires C++20"
#endif

// malloc_trim is a glibc extension
#if defined(POOLHUB_OS_LINUX) && defined(__GLIBC__)
    #define POOLHUB_HAS_MALLOC_TRIM 1
#endif

// ============================================================================
// COMPILER ATTRIBUTES AND INTRINSICS
// ============================================================================

// Branch prediction hints
#if defined(POOLHUB_COMPILER_GCC) || defined(POOLHUB_COMPILER_CLANG)
    #define POOLHUB_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define POOLHUB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define POOLHUB_LIKELY(x)   (x)
    #define POOLHUB_UNLIKELY(x) (x)
#endif

// Export/Import for shared libraries
#if defined(POOLHUB_OS_WINDOWS)
    #if defined(POOLHUB_BUILDING_SHARED)
        #define POOLHUB_API __declspec(dllexport)
    #elif defined(POOLHUB_USING_SHARED)
        #define POOLHUB_API __declspec(dllimport)
    #else
        #define POOLHUB_API
    #endif
#elif defined(POOLHUB_COMPILER_GCC) || defined(POOLHUB_COMPILER_CLANG)
    #if defined(POOLHUB_BUILDING_SHARED)
        #define POOLHUB_API __attribute__((visibility("default")))
    #else
        #define POOLHUB_API
    #endif
#else
    #define POOLHUB_API
#endif

#define POOLHUB_THREAD_LOCAL thread_local

// Cache line size (architecture-dependent)
#if defined(__arm__) || defined(_M_ARM)
    #define POOLHUB_CACHE_LINE_SIZE 32
#else
    #define POOLHUB_CACHE_LINE_SIZE 64
#endif

namespace poolhub::common::platform {

// ============================================================================
// Runtime Environment Queries
// ============================================================================

/**
 * @brief Get number of CPU cores
 */
POOLHUB_API uint32_t get_cpu_count() noexcept;

/**
 * @brief Get system page size in bytes
 */
POOLHUB_API size_t get_page_size() noexcept;

/**
 * @brief Get hostname
 */
POOLHUB_API std::string get_hostname();

/**
 * @brief Get current process ID
 */
POOLHUB_API uint64_t get_process_id() noexcept;

/**
 * @brief Get current thread ID
 */
POOLHUB_API uint64_t get_thread_id() noexcept;

/**
 * @brief Get environment variable value
 * @return Empty string if not found
 */
POOLHUB_API std::string get_env(std::string_view name);

/**
 * @brief Set environment variable
 * @return true on success
 */
POOLHUB_API bool set_env(std::string_view name, std::string_view value);

// ============================================================================
// Process Memory
// ============================================================================

/**
 * @brief Resident set size of the current process in bytes
 * @return 0 if the platform cannot report it
 */
POOLHUB_API uint64_t get_process_resident_memory() noexcept;

/**
 * @brief Peak resident set size of the current process in bytes
 */
POOLHUB_API uint64_t get_process_peak_memory() noexcept;

/**
 * @brief Memory limit imposed on the process by its control group
 *
 * Reads cgroup v2 `memory.max` first, then cgroup v1
 * `memory.limit_in_bytes`. Unlimited or unreadable limits yield nullopt.
 */
POOLHUB_API std::optional<uint64_t> get_cgroup_memory_limit() noexcept;

/**
 * @brief Return free heap pages to the operating system
 * @return true if the allocator released memory
 */
POOLHUB_API bool release_free_memory() noexcept;

}  // namespace poolhub::common::platform
