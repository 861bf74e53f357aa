/**
 * @file test_local_pool.cpp
 * @brief Unit tests for poolhub::core::pool::LocalPool
 *
 * Tests cover:
 * - Borrow/return bookkeeping and slot identity
 * - Growth, overflow and exhaustion
 * - Factory failure rollback
 * - Resize and auto-shrink
 * - Concurrent borrow/return
 */

#include <poolhub/core/pool/local_pool.hpp>

#include <atomic>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace poolhub::core::pool;
using poolhub::common::ErrorCode;

// ============================================================================
// Test Fixtures and Helper Types
// ============================================================================

struct Buffer {
    std::vector<uint8_t> bytes;
};

class CountingFactory : public PoolSlotFactory {
public:
    std::shared_ptr<void> create(std::string_view /*kind*/) override {
        if (fail_after >= 0 && creates >= fail_after) {
            throw std::runtime_error("factory down");
        }
        ++creates;
        return std::make_shared<Buffer>();
    }

    void reset(PooledObject& object) override {
        ++resets;
        if (throw_on_reset) {
            throw std::runtime_error("reset failed");
        }
        object.as<Buffer>()->bytes.clear();
    }

    int creates         = 0;
    int resets          = 0;
    int fail_after      = -1;
    bool throw_on_reset = false;
};

class LocalPoolTest : public ::testing::Test {
protected:
    void SetUp() override { factory_ = std::make_shared<CountingFactory>(); }

    static PoolConfig scenario_config() {
        PoolConfig config;
        config.initial_size    = 2;
        config.max_size        = 4;
        config.emergency_limit = 6;
        config.scale_threshold = 0.8;
        config.growth_factor   = 1.5;
        config.cooldown        = std::chrono::milliseconds(0);
        config.auto_shrink     = false;
        return config;
    }

    std::unique_ptr<LocalPool> make_pool(const PoolConfig& config) {
        auto pool = std::make_unique<LocalPool>("request", config, factory_);
        EXPECT_TRUE(pool->warm_up().is_success());
        return pool;
    }

    static void expect_balanced(const PoolStats& stats) {
        EXPECT_EQ(stats.borrowed - stats.returned, stats.in_use + stats.overflow_outstanding);
        EXPECT_LE(stats.in_use, stats.current_size);
    }

    std::shared_ptr<CountingFactory> factory_;
};

// ============================================================================
// Configuration Tests
// ============================================================================

TEST_F(LocalPoolTest, DefaultConfigIsValid) {
    PoolConfig config;
    EXPECT_TRUE(config.validate().is_success());
    EXPECT_EQ(config.effective_ceiling(), 400u);
}

TEST_F(LocalPoolTest, ConfigRejectsInvertedLimits) {
    PoolConfig config;
    config.initial_size = 50;
    config.max_size     = 10;
    auto result         = config.validate();
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::CONFIG_INVALID_VALUE);

    config              = PoolConfig{};
    config.growth_factor = 1.0;
    EXPECT_TRUE(config.validate().is_error());

    config                 = PoolConfig{};
    config.emergency_limit = 50;
    EXPECT_TRUE(config.validate().is_error());
}

// ============================================================================
// Borrow / Return Tests
// ============================================================================

TEST_F(LocalPoolTest, WarmUpCreatesInitialSlots) {
    auto pool  = make_pool(scenario_config());
    auto stats = pool->stats();

    EXPECT_EQ(stats.current_size, 2u);
    EXPECT_EQ(stats.free, 2u);
    EXPECT_EQ(stats.created, 2u);
    EXPECT_EQ(factory_->creates, 2);
}

TEST_F(LocalPoolTest, BorrowAndReturn) {
    auto pool   = make_pool(scenario_config());
    auto result = pool->borrow();

    ASSERT_TRUE(result.is_success());
    PooledObject object = result.value();
    EXPECT_TRUE(object);
    EXPECT_EQ(object.kind, "request");
    EXPECT_EQ(object.state, SlotState::IN_USE);
    ASSERT_NE(object.as<Buffer>(), nullptr);

    object.as<Buffer>()->bytes.push_back(42);

    EXPECT_TRUE(pool->return_object(object).is_success());
    EXPECT_EQ(factory_->resets, 1);
    EXPECT_TRUE(object.as<Buffer>()->bytes.empty());

    auto stats = pool->stats();
    EXPECT_EQ(stats.borrowed, 1u);
    EXPECT_EQ(stats.returned, 1u);
    EXPECT_EQ(stats.in_use, 0u);
    expect_balanced(stats);
}

TEST_F(LocalPoolTest, ReturnedSlotIsReused) {
    auto pool  = make_pool(scenario_config());
    auto first = pool->borrow().value();
    ASSERT_TRUE(pool->return_object(first).is_success());

    auto second = pool->borrow().value();
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(second.resource.get(), first.resource.get());
    EXPECT_EQ(factory_->creates, 2);
}

TEST_F(LocalPoolTest, DoubleReturnIsRejected) {
    auto pool   = make_pool(scenario_config());
    auto object = pool->borrow().value();

    ASSERT_TRUE(pool->return_object(object).is_success());
    auto again = pool->return_object(object);

    EXPECT_TRUE(again.is_error());
    EXPECT_EQ(again.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(pool->stats().returned, 1u);
}

TEST_F(LocalPoolTest, StaleHandleCannotReturnReusedSlot) {
    auto config            = scenario_config();
    config.initial_size    = 1;
    config.max_size        = 1;
    config.emergency_limit = 1;
    auto pool              = make_pool(config);

    auto first = pool->borrow().value();
    ASSERT_TRUE(pool->return_object(first).is_success());

    auto second = pool->borrow().value();
    ASSERT_EQ(second.id, first.id);
    EXPECT_NE(second.lease, first.lease);

    auto stale = pool->return_object(first);
    EXPECT_EQ(stale.code(), ErrorCode::INVALID_ARGUMENT);

    auto stats = pool->stats();
    EXPECT_EQ(stats.in_use, 1u);
    EXPECT_EQ(stats.free, 0u);
    EXPECT_EQ(stats.returned, 1u);
    EXPECT_EQ(factory_->resets, 1);

    EXPECT_TRUE(pool->return_object(second).is_success());
    expect_balanced(pool->stats());
}

TEST_F(LocalPoolTest, ForeignHandleIsRejected) {
    auto pool   = make_pool(scenario_config());
    auto object = pool->borrow().value();

    PooledObject foreign = object;
    foreign.kind         = "response";
    EXPECT_EQ(pool->return_object(foreign).code(), ErrorCode::INVALID_ARGUMENT);

    PooledObject unknown = object;
    unknown.id           = 9999;
    EXPECT_EQ(pool->return_object(unknown).code(), ErrorCode::INVALID_ARGUMENT);

    auto stats = pool->stats();
    EXPECT_EQ(stats.returned, 0u);
    EXPECT_EQ(stats.in_use, 1u);
}

// ============================================================================
// Growth, Overflow and Exhaustion
// ============================================================================

TEST_F(LocalPoolTest, ExpandOverflowThenExhaust) {
    auto pool = make_pool(scenario_config());
    std::vector<PooledObject> held;

    // Fill the warmed pool
    for (int i = 0; i < 2; ++i) {
        auto r = pool->borrow();
        ASSERT_TRUE(r.is_success());
        EXPECT_EQ(r.value().state, SlotState::IN_USE);
        held.push_back(r.value());
    }

    // 3rd and 4th borrow grow the pool up to max_size
    for (int i = 0; i < 2; ++i) {
        auto r = pool->borrow();
        ASSERT_TRUE(r.is_success());
        EXPECT_EQ(r.value().state, SlotState::IN_USE);
        held.push_back(r.value());
    }
    EXPECT_EQ(pool->stats().current_size, 4u);
    EXPECT_EQ(pool->stats().expanded, 2u);

    // 5th and 6th borrow are overflow objects
    for (int i = 0; i < 2; ++i) {
        auto r = pool->borrow();
        ASSERT_TRUE(r.is_success());
        EXPECT_EQ(r.value().state, SlotState::OVERFLOW);
        EXPECT_TRUE(r.value().is_overflow());
        held.push_back(r.value());
    }

    // 7th borrow fails fast
    auto exhausted = pool->borrow();
    EXPECT_TRUE(exhausted.is_error());
    EXPECT_EQ(exhausted.code(), ErrorCode::POOL_EXHAUSTED);

    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 4u);
    EXPECT_EQ(stats.overflow_created, 2u);
    EXPECT_EQ(stats.emergency_activations, 2u);
    EXPECT_EQ(stats.overflow_outstanding, 2u);
    EXPECT_EQ(stats.exhausted, 1u);
    EXPECT_EQ(stats.borrowed, 6u);
    EXPECT_EQ(stats.peak_in_use, 6u);
    expect_balanced(stats);
}

TEST_F(LocalPoolTest, OverflowReturnIsDiscarded) {
    auto pool = make_pool(scenario_config());
    std::vector<PooledObject> held;
    for (int i = 0; i < 5; ++i) {
        held.push_back(pool->borrow().value());
    }
    ASSERT_TRUE(held.back().is_overflow());

    int resets_before = factory_->resets;
    EXPECT_TRUE(pool->return_object(held.back()).is_success());
    EXPECT_EQ(factory_->resets, resets_before);

    auto stats = pool->stats();
    EXPECT_EQ(stats.overflow_outstanding, 0u);
    EXPECT_EQ(stats.current_size, 4u);
    EXPECT_EQ(stats.returned, 1u);
    expect_balanced(stats);

    // A second return of the same overflow handle is rejected
    EXPECT_EQ(pool->return_object(held.back()).code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(LocalPoolTest, CooldownDeniesGrowthAndOverflows) {
    auto config     = scenario_config();
    config.cooldown = std::chrono::hours(1);
    auto pool       = make_pool(config);

    std::vector<PooledObject> held;
    for (int i = 0; i < 3; ++i) {
        held.push_back(pool->borrow().value());
    }
    EXPECT_EQ(pool->stats().current_size, 3u);

    auto r = pool->borrow();
    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(r.value().state, SlotState::OVERFLOW);
    EXPECT_EQ(pool->stats().current_size, 3u);
    EXPECT_EQ(pool->stats().expanded, 1u);
}

TEST_F(LocalPoolTest, UnwarmedPoolGrowsOnDemand) {
    LocalPool pool("request", scenario_config(), factory_);
    auto r = pool.borrow();

    ASSERT_TRUE(r.is_success());
    EXPECT_EQ(pool.stats().current_size, 1u);
}

// ============================================================================
// Factory Failures
// ============================================================================

TEST_F(LocalPoolTest, WarmUpFailureRollsBack) {
    auto config         = scenario_config();
    config.initial_size = 3;
    factory_->fail_after = 2;

    LocalPool pool("request", config, factory_);
    auto result = pool.warm_up();

    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.code(), ErrorCode::FACTORY_ERROR);
    ASSERT_FALSE(result.error().context().empty());
    EXPECT_EQ(result.error().context().front().second, "factory down");

    auto stats = pool.stats();
    EXPECT_EQ(stats.current_size, 0u);
    EXPECT_EQ(stats.created, 0u);
    EXPECT_EQ(stats.factory_errors, 1u);
}

TEST_F(LocalPoolTest, ExpansionFailureLeavesCountersUntouched) {
    auto pool = make_pool(scenario_config());
    auto a    = pool->borrow().value();
    auto b    = pool->borrow().value();

    factory_->fail_after = factory_->creates;
    auto result          = pool->borrow();

    EXPECT_EQ(result.code(), ErrorCode::FACTORY_ERROR);
    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 2u);
    EXPECT_EQ(stats.expanded, 0u);
    EXPECT_EQ(stats.borrowed, 2u);
    EXPECT_EQ(stats.overflow_created, 0u);
    expect_balanced(stats);
}

TEST_F(LocalPoolTest, NullFactoryReportsFactoryError) {
    LocalPool pool("request", scenario_config(), nullptr);
    EXPECT_EQ(pool.warm_up().code(), ErrorCode::FACTORY_ERROR);
    EXPECT_EQ(pool.borrow().code(), ErrorCode::FACTORY_ERROR);
}

TEST_F(LocalPoolTest, ResetFailureDiscardsSlot) {
    auto pool   = make_pool(scenario_config());
    auto object = pool->borrow().value();

    factory_->throw_on_reset = true;
    EXPECT_TRUE(pool->return_object(object).is_success());

    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 1u);
    EXPECT_EQ(stats.destroyed, 1u);
    EXPECT_EQ(stats.returned, 1u);
    expect_balanced(stats);
}

// ============================================================================
// Resize Tests
// ============================================================================

class LocalPoolResizeTest : public LocalPoolTest {
protected:
    static PoolConfig resize_config() {
        PoolConfig config;
        config.initial_size = 10;
        config.cooldown     = std::chrono::milliseconds(0);
        config.auto_shrink  = false;
        return config;
    }
};

TEST_F(LocalPoolResizeTest, GrowByFactor) {
    auto pool = make_pool(resize_config());
    ASSERT_TRUE(pool->resize(1.2).is_success());

    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 12u);
    EXPECT_EQ(stats.expanded, 1u);
    EXPECT_EQ(stats.shrunk, 0u);
}

TEST_F(LocalPoolResizeTest, NeutralFactorChangesNothing) {
    auto pool = make_pool(resize_config());
    ASSERT_TRUE(pool->resize(1.0).is_success());

    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 10u);
    EXPECT_EQ(stats.expanded, 0u);
    EXPECT_EQ(stats.shrunk, 0u);
}

TEST_F(LocalPoolResizeTest, ShrinkNeverEvictsBorrowedSlots) {
    auto pool = make_pool(resize_config());
    std::vector<PooledObject> held;
    for (int i = 0; i < 8; ++i) {
        held.push_back(pool->borrow().value());
    }

    ASSERT_TRUE(pool->resize(0.5).is_success());

    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 8u);
    EXPECT_EQ(stats.free, 0u);
    EXPECT_EQ(stats.in_use, 8u);
    EXPECT_EQ(stats.shrunk, 1u);

    for (const auto& object : held) {
        EXPECT_TRUE(pool->return_object(object).is_success());
    }
    expect_balanced(pool->stats());
}

TEST_F(LocalPoolResizeTest, ClampedToLimits) {
    auto config     = resize_config();
    config.max_size = 10;
    config.min_size = 4;
    auto pool       = make_pool(config);

    ASSERT_TRUE(pool->resize(2.0).is_success());
    EXPECT_EQ(pool->current_size(), 10u);

    ASSERT_TRUE(pool->resize(0.1).is_success());
    EXPECT_EQ(pool->current_size(), 4u);
}

TEST_F(LocalPoolResizeTest, ScaleLimits) {
    auto pool = make_pool(resize_config());
    ASSERT_TRUE(pool->resize(0.5, true).is_success());

    auto config = pool->config();
    EXPECT_EQ(config.max_size, 50u);
    EXPECT_EQ(config.emergency_limit, 100u);
    EXPECT_EQ(pool->current_size(), 5u);

    ASSERT_TRUE(pool->resize(100.0, true).is_success());
    config = pool->config();
    EXPECT_EQ(config.max_size, 400u);
    EXPECT_EQ(config.emergency_limit, 400u);
}

TEST_F(LocalPoolResizeTest, RejectsNonPositiveFactor) {
    auto pool = make_pool(resize_config());
    EXPECT_EQ(pool->resize(0.0).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(pool->resize(-1.0).code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(LocalPoolResizeTest, AutoShrinkOnIdleReturn) {
    auto config        = resize_config();
    config.auto_shrink = true;
    auto pool          = make_pool(config);

    auto object = pool->borrow().value();
    ASSERT_TRUE(pool->return_object(object).is_success());

    auto stats = pool->stats();
    EXPECT_EQ(stats.current_size, 7u);
    EXPECT_EQ(stats.shrunk, 1u);

    object = pool->borrow().value();
    ASSERT_TRUE(pool->return_object(object).is_success());
    EXPECT_EQ(pool->current_size(), 4u);
}

TEST_F(LocalPoolResizeTest, AutoShrinkRespectsMinSize) {
    auto config        = resize_config();
    config.auto_shrink = true;
    config.min_size    = 9;
    auto pool          = make_pool(config);

    auto object = pool->borrow().value();
    ASSERT_TRUE(pool->return_object(object).is_success());
    EXPECT_EQ(pool->current_size(), 9u);

    object = pool->borrow().value();
    ASSERT_TRUE(pool->return_object(object).is_success());
    EXPECT_EQ(pool->current_size(), 9u);
    EXPECT_EQ(pool->stats().shrunk, 1u);
}

TEST_F(LocalPoolResizeTest, DrainDestroysOnlyFreeSlots) {
    auto pool   = make_pool(resize_config());
    auto object = pool->borrow().value();

    EXPECT_EQ(pool->drain(), 9u);
    EXPECT_EQ(pool->current_size(), 1u);
    EXPECT_TRUE(pool->return_object(object).is_success());
}

// ============================================================================
// Invariants and Concurrency
// ============================================================================

TEST_F(LocalPoolTest, RandomSequenceKeepsInvariant) {
    auto pool = make_pool(scenario_config());
    std::mt19937 rng(1234);
    std::vector<PooledObject> held;

    for (int step = 0; step < 500; ++step) {
        bool do_borrow = held.empty() || (rng() % 2 == 0);
        if (do_borrow) {
            auto r = pool->borrow();
            if (r.is_success()) {
                held.push_back(r.value());
            } else {
                EXPECT_EQ(r.code(), ErrorCode::POOL_EXHAUSTED);
            }
        } else {
            size_t index = rng() % held.size();
            EXPECT_TRUE(pool->return_object(held[index]).is_success());
            held.erase(held.begin() + static_cast<std::ptrdiff_t>(index));
        }

        auto stats = pool->stats();
        expect_balanced(stats);
        EXPECT_EQ(stats.in_use + stats.overflow_outstanding, held.size());
    }
}

TEST_F(LocalPoolTest, ConcurrentBorrowReturn) {
    PoolConfig config;
    config.initial_size    = 4;
    config.max_size        = 16;
    config.emergency_limit = 64;
    config.cooldown        = std::chrono::milliseconds(0);

    auto factory = std::make_shared<TypedSlotFactory<Buffer>>();
    LocalPool pool("buffer", config, factory);
    ASSERT_TRUE(pool.warm_up().is_success());

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&pool, &failures]() {
            for (int i = 0; i < 500; ++i) {
                auto r = pool.borrow();
                if (r.is_error()) {
                    failures++;
                    continue;
                }
                if (pool.return_object(r.value()).is_error()) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    auto stats = pool.stats();
    EXPECT_EQ(stats.borrowed, stats.returned);
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.overflow_outstanding, 0u);
}
