/**
 * @file test_platform.cpp
 * @brief Unit tests for poolhub platform utilities
 *
 * Tests cover:
 * - CPU count and page size
 * - Hostname, process and thread IDs
 * - Environment variables
 * - Process memory and control group limits
 */

#include <poolhub/common/platform.hpp>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace poolhub::common::platform;

// ============================================================================
// Runtime Environment
// ============================================================================

class RuntimeInfoTest : public ::testing::Test {};

TEST_F(RuntimeInfoTest, CpuCountMatchesHardware) {
    uint32_t count = get_cpu_count();
    EXPECT_GE(count, 1u);
    EXPECT_LE(count, 4096u);

    unsigned int hardware = std::thread::hardware_concurrency();
    if (hardware > 0) {
        EXPECT_EQ(count, hardware);
    }
}

TEST_F(RuntimeInfoTest, PageSizeIsPowerOfTwo) {
    size_t page = get_page_size();
    EXPECT_GE(page, 4096u);
    EXPECT_EQ(page & (page - 1), 0u);
}

TEST_F(RuntimeInfoTest, HostnameIsStable) {
    auto hostname = get_hostname();
    EXPECT_FALSE(hostname.empty());
    EXPECT_EQ(hostname, get_hostname());
}

TEST_F(RuntimeInfoTest, ProcessIdIsStable) {
    uint64_t pid = get_process_id();
    EXPECT_GT(pid, 0u);
    EXPECT_EQ(pid, get_process_id());
}

TEST_F(RuntimeInfoTest, ThreadIdsDifferAcrossThreads) {
    uint64_t main_id = get_thread_id();
    EXPECT_EQ(main_id, get_thread_id());

    std::atomic<uint64_t> other_id{0};
    std::thread worker([&other_id]() { other_id = get_thread_id(); });
    worker.join();

    EXPECT_NE(other_id.load(), 0u);
    EXPECT_NE(other_id.load(), main_id);
}

// ============================================================================
// Environment Variables
// ============================================================================

class EnvironmentTest : public ::testing::Test {};

TEST_F(EnvironmentTest, MissingVariableIsEmpty) {
    EXPECT_TRUE(get_env("POOLHUB_TEST_SURELY_UNSET_VARIABLE").empty());
}

TEST_F(EnvironmentTest, SetThenGet) {
    ASSERT_TRUE(set_env("POOLHUB_TEST_INSTANCE", "node-a"));
    EXPECT_EQ(get_env("POOLHUB_TEST_INSTANCE"), "node-a");

    ASSERT_TRUE(set_env("POOLHUB_TEST_INSTANCE", "node-b"));
    EXPECT_EQ(get_env("POOLHUB_TEST_INSTANCE"), "node-b");
}

// ============================================================================
// Process Memory
// ============================================================================

class ProcessMemoryTest : public ::testing::Test {};

TEST_F(ProcessMemoryTest, ResidentMemoryIsReported) {
    uint64_t resident = get_process_resident_memory();
    EXPECT_GT(resident, 0u);
    EXPECT_LT(resident, 1ULL << 40);
}

TEST_F(ProcessMemoryTest, PeakCoversAllocation) {
    std::vector<char> block(32 * 1024 * 1024, 'x');
    uint64_t peak = get_process_peak_memory();
    EXPECT_GE(peak, block.size());
    EXPECT_GE(peak, get_process_resident_memory() / 2);
}

TEST_F(ProcessMemoryTest, CgroupLimitIsPlausibleWhenPresent) {
    auto limit = get_cgroup_memory_limit();
    if (limit) {
        EXPECT_GT(*limit, 0u);
        EXPECT_LT(*limit, 1ULL << 62);
    }
}

TEST_F(ProcessMemoryTest, ReleaseFreeMemoryIsSafe) {
    {
        std::vector<std::vector<char>> blocks;
        for (int i = 0; i < 16; ++i) {
            blocks.emplace_back(256 * 1024, 'y');
        }
    }
    EXPECT_NO_FATAL_FAILURE(release_free_memory());
}
