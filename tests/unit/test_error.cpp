/**
 * @file test_error.cpp
 * @brief Unit tests for the poolhub error model
 *
 * Tests cover:
 * - ErrorCode: categories, transient/fatal classification, names
 * - Error: context, cause chains, formatting
 * - Result<T>: void and value results, helpers
 * - POOLHUB_TRY / POOLHUB_TRY_ASSIGN propagation
 */

#include <poolhub/common/error.hpp>

#include <string>
#include <vector>

#include <gtest/gtest.h>

using namespace poolhub::common;

// ============================================================================
// ErrorCode Tests
// ============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, CategoryFromHighByte) {
    EXPECT_EQ(get_category(ErrorCode::INVALID_ARGUMENT), ErrorCategory::GENERAL);
    EXPECT_EQ(get_category(ErrorCode::UNKNOWN_KIND), ErrorCategory::POOL);
    EXPECT_EQ(get_category(ErrorCode::POOL_EXHAUSTED), ErrorCategory::POOL);
    EXPECT_EQ(get_category(ErrorCode::FACTORY_ERROR), ErrorCategory::POOL);
    EXPECT_EQ(get_category(ErrorCode::OUT_OF_MEMORY), ErrorCategory::MEMORY);
    EXPECT_EQ(get_category(ErrorCode::COORDINATOR_UNAVAILABLE), ErrorCategory::COORDINATION);
    EXPECT_EQ(get_category(ErrorCode::CONNECTION_REFUSED), ErrorCategory::COORDINATION);
    EXPECT_EQ(get_category(ErrorCode::CONFIG_PARSE_ERROR), ErrorCategory::CONFIG);
    EXPECT_EQ(get_category(ErrorCode::MALFORMED_DATA), ErrorCategory::SERIALIZATION);
    EXPECT_EQ(get_category(ErrorCode::DESERIALIZE_FAILED), ErrorCategory::SERIALIZATION);
    EXPECT_EQ(get_category(ErrorCode::OS_ERROR), ErrorCategory::PLATFORM);
}

TEST_F(ErrorCodeTest, RetryClassification) {
    EXPECT_TRUE(is_transient(ErrorCode::POOL_EXHAUSTED));
    EXPECT_TRUE(is_transient(ErrorCode::COORDINATOR_UNAVAILABLE));
    EXPECT_TRUE(is_transient(ErrorCode::CONNECTION_TIMEOUT));
    EXPECT_FALSE(is_transient(ErrorCode::UNKNOWN_KIND));
    EXPECT_FALSE(is_transient(ErrorCode::SUCCESS));

    EXPECT_TRUE(is_fatal(ErrorCode::UNKNOWN_KIND));
    EXPECT_TRUE(is_fatal(ErrorCode::OUT_OF_MEMORY));
    EXPECT_FALSE(is_fatal(ErrorCode::POOL_EXHAUSTED));
}

TEST_F(ErrorCodeTest, Names) {
    EXPECT_EQ(error_name(ErrorCode::SUCCESS), "SUCCESS");
    EXPECT_EQ(error_name(ErrorCode::POOL_EXHAUSTED), "POOL_EXHAUSTED");
    EXPECT_EQ(error_name(ErrorCode::UNKNOWN_KIND), "UNKNOWN_KIND");
    EXPECT_EQ(error_name(ErrorCode::CONFIG_INVALID_VALUE), "CONFIG_INVALID_VALUE");
    EXPECT_EQ(category_name(ErrorCategory::POOL), "Pool");
    EXPECT_EQ(category_name(ErrorCategory::COORDINATION), "Coordination");
    EXPECT_EQ(category_name(ErrorCategory::CONFIG), "Configuration");
}

// ============================================================================
// Error Tests
// ============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    Error error;
    EXPECT_TRUE(error.is_success());
    EXPECT_TRUE(static_cast<bool>(error));
    EXPECT_TRUE(error.message().empty());
}

TEST_F(ErrorTest, CodeAndMessage) {
    Error error(ErrorCode::POOL_EXHAUSTED, "pool 'request' at emergency limit");
    EXPECT_TRUE(error.is_error());
    EXPECT_TRUE(error.is_transient());
    EXPECT_EQ(error.category(), ErrorCategory::POOL);
    EXPECT_EQ(error.message(), "pool 'request' at emergency limit");
}

TEST_F(ErrorTest, ToStringFormat) {
    Error error(ErrorCode::UNKNOWN_KIND, "unknown kind: blob");
    auto text = error.to_string();

    EXPECT_NE(text.find("[Pool]"), std::string::npos);
    EXPECT_NE(text.find("UNKNOWN_KIND"), std::string::npos);
    EXPECT_NE(text.find("0x0100"), std::string::npos);
    EXPECT_NE(text.find("unknown kind: blob"), std::string::npos);
}

TEST_F(ErrorTest, LocationIsReported) {
    Error error(ErrorCode::FACTORY_ERROR, std::string("factory threw"),
                SourceLocation("local_pool.cpp", "create_resource", 120));
    EXPECT_TRUE(error.location().is_valid());
    EXPECT_NE(error.to_string().find("local_pool.cpp:120"), std::string::npos);
}

TEST_F(ErrorTest, ContextIsAppended) {
    Error error(ErrorCode::CONFIG_INVALID_VALUE, "max_size must be >= initial_size");
    error.with_context("kind", "request").with_context("file", "agent.yaml");

    ASSERT_EQ(error.context().size(), 2u);
    EXPECT_EQ(error.context()[0].first, "kind");
    auto text = error.to_string();
    EXPECT_NE(text.find("kind: request"), std::string::npos);
    EXPECT_NE(text.find("file: agent.yaml"), std::string::npos);
}

TEST_F(ErrorTest, CauseChainOutlivesOriginal) {
    Error copy;
    {
        Error root(ErrorCode::CONNECTION_REFUSED, "127.0.0.1:6379");
        Error error(ErrorCode::COORDINATOR_UNAVAILABLE, "redis unreachable");
        error.with_cause(root);
        copy = error;
    }

    ASSERT_NE(copy.cause(), nullptr);
    EXPECT_EQ(copy.cause()->code(), ErrorCode::CONNECTION_REFUSED);
    EXPECT_EQ(copy.cause()->message(), "127.0.0.1:6379");

    auto text = copy.to_string();
    EXPECT_NE(text.find("Caused by: [Coordination] CONNECTION_REFUSED"), std::string::npos);
}

TEST_F(ErrorTest, NestedCausesAreAllRendered) {
    Error parse(ErrorCode::MALFORMED_DATA, "unexpected '}'");
    Error record(ErrorCode::DESERIALIZE_FAILED, "instance record");
    record.with_cause(parse);
    Error outer(ErrorCode::COORDINATOR_UNAVAILABLE, "peer listing");
    outer.with_cause(record);

    auto text = outer.to_string();
    auto first  = text.find("Caused by: [Serialization] DESERIALIZE_FAILED");
    auto second = text.find("Caused by: [Serialization] MALFORMED_DATA");
    ASSERT_NE(first, std::string::npos);
    ASSERT_NE(second, std::string::npos);
    EXPECT_LT(first, second);
}

// ============================================================================
// Result Tests
// ============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, VoidResult) {
    Result<void> success = ok();
    EXPECT_TRUE(success.is_success());
    EXPECT_EQ(success.code(), ErrorCode::SUCCESS);

    auto failure = err(ErrorCode::INVALID_STATE, "orchestrator is shut down");
    EXPECT_TRUE(failure.is_error());
    EXPECT_EQ(failure.code(), ErrorCode::INVALID_STATE);
    EXPECT_EQ(failure.message(), "orchestrator is shut down");
}

TEST_F(ResultTest, ValueResult) {
    Result<size_t> size = ok<size_t>(10);
    ASSERT_TRUE(size.is_success());
    EXPECT_EQ(size.value(), 10u);
    EXPECT_EQ(size.code(), ErrorCode::SUCCESS);

    auto missing = err<size_t>(ErrorCode::UNKNOWN_KIND, "unknown kind: blob");
    EXPECT_TRUE(missing.is_error());
    EXPECT_EQ(missing.value_or(0), 0u);
}

TEST_F(ResultTest, FromErrorObject) {
    Error error(ErrorCode::FACTORY_ERROR, "slot factory returned null");
    error.with_context("kind", "request");

    auto result = err<std::string>(error);
    EXPECT_EQ(result.code(), ErrorCode::FACTORY_ERROR);
    ASSERT_EQ(result.error().context().size(), 1u);
}

TEST_F(ResultTest, MapTransformsOnlySuccess) {
    Result<int> size(4);
    auto doubled = size.map([](int value) { return value * 2; });
    EXPECT_EQ(doubled.value(), 8);

    Result<int> failure(ErrorCode::POOL_EXHAUSTED);
    auto mapped = failure.map([](int value) { return value * 2; });
    EXPECT_EQ(mapped.code(), ErrorCode::POOL_EXHAUSTED);
}

TEST_F(ResultTest, CopyAndMove) {
    Result<std::vector<int>> original(std::vector<int>{1, 2, 3});
    Result<std::vector<int>> copy(original);
    EXPECT_EQ(copy.value().size(), 3u);

    Result<std::vector<int>> target(ErrorCode::UNKNOWN_ERROR);
    target = std::move(original);
    ASSERT_TRUE(target.is_success());
    EXPECT_EQ(target.value().size(), 3u);
}

// ============================================================================
// Propagation Macros
// ============================================================================

namespace {

Result<int> parse_size(int raw) {
    if (raw < 0) {
        return err<int>(ErrorCode::CONFIG_INVALID_VALUE, "size must be non-negative");
    }
    return raw;
}

Result<void> check_size(int raw) {
    POOLHUB_TRY(parse_size(raw));
    return ok();
}

Result<int> doubled_size(int raw) {
    int size = 0;
    POOLHUB_TRY_ASSIGN(size, parse_size(raw));
    return size * 2;
}

}  // namespace

TEST_F(ResultTest, TryPropagatesErrors) {
    EXPECT_TRUE(check_size(3).is_success());

    auto failure = check_size(-1);
    EXPECT_EQ(failure.code(), ErrorCode::CONFIG_INVALID_VALUE);
    EXPECT_EQ(failure.message(), "size must be non-negative");
}

TEST_F(ResultTest, TryAssignUnwrapsValue) {
    EXPECT_EQ(doubled_size(5).value(), 10);
    EXPECT_EQ(doubled_size(-5).code(), ErrorCode::CONFIG_INVALID_VALUE);
}
