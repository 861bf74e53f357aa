/**
 * @file test_debug.cpp
 * @brief Unit tests for the poolhub logging system
 *
 * Tests cover:
 * - Level names and parsing
 * - LogFilter global and per-category levels
 * - Shared line format of the text sinks
 * - Logger dispatch to callback sinks
 * - FileSink output and rotation
 * - Span timing and error reporting
 * - init_logging environment override
 */

#include <poolhub/common/debug.hpp>
#include <poolhub/common/platform.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace poolhub::common;
using namespace poolhub::common::debug;

namespace {

struct CapturedRecord {
    LogLevel level;
    std::string category;
    std::string message;
};

}  // namespace

// ============================================================================
// Test Fixture
// ============================================================================

/// Routes the global logger into a vector for the duration of a test
class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.filter().reset();
        logger.set_level(LogLevel::TRACE);

        sink_ = std::make_shared<CallbackSink>([this](const LogRecord& record) {
            std::lock_guard<std::mutex> lock(mutex_);
            records_.push_back(
                {record.level, std::string(record.category), record.message});
        });
        logger.add_sink(sink_);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.filter().reset();
        logger.add_sink(std::make_shared<ConsoleSink>());
    }

    std::vector<CapturedRecord> records() {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    bool contains(std::string_view text) {
        for (const auto& record : records()) {
            if (record.message.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    std::shared_ptr<CallbackSink> sink_;
    std::mutex mutex_;
    std::vector<CapturedRecord> records_;
};

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, NamesAndChars) {
    EXPECT_EQ(level_name(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(level_name(LogLevel::WARN), "WARN");
    EXPECT_EQ(level_name(LogLevel::OFF), "OFF");
    EXPECT_EQ(level_char(LogLevel::ERROR), 'E');
    EXPECT_EQ(level_char(LogLevel::OFF), '?');
}

TEST(LogLevelTest, ParsingIsCaseInsensitive) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::TRACE);
    EXPECT_EQ(parse_log_level("Debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("err"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("critical"), LogLevel::FATAL);
    EXPECT_EQ(parse_log_level("none"), LogLevel::OFF);
    EXPECT_EQ(parse_log_level("verbose"), LogLevel::INFO);
    EXPECT_EQ(parse_log_level(""), LogLevel::INFO);
}

// ============================================================================
// Filter
// ============================================================================

TEST(LogFilterTest, GlobalLevel) {
    LogFilter filter;
    EXPECT_EQ(filter.level(), LogLevel::INFO);
    EXPECT_FALSE(filter.should_log(LogLevel::DEBUG, category::POOL));
    EXPECT_TRUE(filter.should_log(LogLevel::WARN, category::POOL));

    filter.set_level(LogLevel::OFF);
    EXPECT_FALSE(filter.should_log(LogLevel::FATAL, category::POOL));
}

TEST(LogFilterTest, CategoryLevelNarrowsOutput) {
    LogFilter filter;
    filter.set_level(LogLevel::DEBUG);
    filter.set_category_level(category::COORDINATOR, LogLevel::ERROR);

    EXPECT_FALSE(filter.should_log(LogLevel::WARN, category::COORDINATOR));
    EXPECT_TRUE(filter.should_log(LogLevel::ERROR, category::COORDINATOR));
    EXPECT_TRUE(filter.should_log(LogLevel::DEBUG, category::MEMORY));

    filter.reset();
    EXPECT_TRUE(filter.should_log(LogLevel::WARN, category::COORDINATOR));
    EXPECT_FALSE(filter.should_log(LogLevel::DEBUG, category::MEMORY));
}

TEST(LogFilterTest, CategoryLevelWidensOutput) {
    LogFilter filter;
    filter.set_level(LogLevel::WARN);
    filter.set_category_level(category::COORDINATOR, LogLevel::DEBUG);

    EXPECT_TRUE(filter.should_log(LogLevel::DEBUG, category::COORDINATOR));
    EXPECT_FALSE(filter.should_log(LogLevel::TRACE, category::COORDINATOR));
    EXPECT_FALSE(filter.should_log(LogLevel::INFO, category::POOL));
    EXPECT_FALSE(filter.should_log(LogLevel::INFO, {}));
}

// ============================================================================
// Line format
// ============================================================================

TEST(LineFormatTest, FieldsCanBeLeftOut) {
    LogRecord record;
    record.level     = LogLevel::INFO;
    record.category  = category::POOL;
    record.message   = "Pool 'request' resized to 32";
    record.location  = SourceLocation("local_pool.cpp", "resize", 88);
    record.thread_id = 0x2a;

    EXPECT_EQ(format_line(record, LineFormat{false, false, false}),
              "INFO [pool] Pool 'request' resized to 32\n");
    EXPECT_EQ(format_line(record, LineFormat{false, true, true}),
              "INFO [pool] [T:2a] Pool 'request' resized to 32 (local_pool.cpp:88)\n");
}

TEST(LineFormatTest, TimestampLeadsTheLine) {
    LogRecord record;
    record.level     = LogLevel::ERROR;
    record.message   = "boom";
    record.timestamp = std::chrono::system_clock::now();

    auto line = format_line(record, LineFormat{true, false, false});
    // "YYYY-MM-DD HH:MM:SS.mmm "
    ASSERT_GT(line.size(), 24u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[19], '.');
    EXPECT_EQ(line.substr(24), "ERROR boom\n");
}

// ============================================================================
// Logger
// ============================================================================

TEST_F(LoggingTest, MacrosDispatchWithCategory) {
    POOLHUB_LOG_INFO(category::POOL, "Pool '" << "request" << "' warmed up with " << 10);
    POOLHUB_LOG_WARN(category::MEMORY, "Memory pressure high");

    auto captured = records();
    ASSERT_EQ(captured.size(), 2u);
    EXPECT_EQ(captured[0].level, LogLevel::INFO);
    EXPECT_EQ(captured[0].category, "pool");
    EXPECT_EQ(captured[0].message, "Pool 'request' warmed up with 10");
    EXPECT_EQ(captured[1].category, "memory");
}

TEST_F(LoggingTest, DisabledLevelSkipsFormatting) {
    Logger::instance().set_level(LogLevel::WARN);

    int evaluated = 0;
    auto expensive = [&evaluated]() {
        ++evaluated;
        return "details";
    };
    POOLHUB_LOG_DEBUG(category::GENERAL, "Debug " << expensive());
    POOLHUB_LOG_ERROR(category::GENERAL, "Error " << expensive());

    EXPECT_EQ(evaluated, 1);
    ASSERT_EQ(records().size(), 1u);
    EXPECT_EQ(records()[0].message, "Error details");
}

TEST_F(LoggingTest, RemovedSinkStopsReceiving) {
    POOLHUB_LOG_INFO(category::GENERAL, "first");
    Logger::instance().remove_sink(sink_);
    POOLHUB_LOG_INFO(category::GENERAL, "second");

    ASSERT_EQ(records().size(), 1u);
    EXPECT_EQ(records()[0].message, "first");
}

TEST_F(LoggingTest, ConcurrentLoggingKeepsEveryRecord) {
    constexpr int THREADS    = 4;
    constexpr int ITERATIONS = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < ITERATIONS; ++i) {
                POOLHUB_LOG_DEBUG(category::POOL, "thread " << t << " borrow " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(records().size(), static_cast<size_t>(THREADS * ITERATIONS));
}

// ============================================================================
// Span
// ============================================================================

TEST_F(LoggingTest, SpanLogsStartAndCompletion) {
    {
        Span span("PoolOrchestrator::tick", category::LIFECYCLE);
        EXPECT_GE(span.elapsed().count(), 0);
    }

    EXPECT_TRUE(contains("Span started: PoolOrchestrator::tick"));
    EXPECT_TRUE(contains("Span completed: PoolOrchestrator::tick"));
    for (const auto& record : records()) {
        EXPECT_EQ(record.level, LogLevel::TRACE);
        EXPECT_EQ(record.category, "lifecycle");
    }
}

TEST_F(LoggingTest, SpanWithErrorLogsAtErrorLevel) {
    Logger::instance().set_level(LogLevel::INFO);
    {
        Span span("LocalPool::warm_up", category::POOL);
        span.set_error(ErrorCode::FACTORY_ERROR, "factory threw");
    }

    auto captured = records();
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].level, LogLevel::ERROR);
    EXPECT_NE(captured[0].message.find("error=FACTORY_ERROR"), std::string::npos);
    EXPECT_NE(captured[0].message.find("msg=factory threw"), std::string::npos);
}

// ============================================================================
// Initialization
// ============================================================================

TEST_F(LoggingTest, EnvironmentOverridesInitLevel) {
    ASSERT_TRUE(platform::set_env("POOLHUB_LOG_LEVEL", "error"));
    init_logging(LogLevel::DEBUG);
    EXPECT_EQ(Logger::instance().filter().level(), LogLevel::ERROR);

    ASSERT_TRUE(platform::set_env("POOLHUB_LOG_LEVEL", ""));
    init_logging(LogLevel::DEBUG);
    EXPECT_EQ(Logger::instance().filter().level(), LogLevel::DEBUG);
}

TEST_F(LoggingTest, ShutdownDetachesSinks) {
    shutdown_logging();
    POOLHUB_LOG_ERROR(category::GENERAL, "after shutdown");
    EXPECT_TRUE(records().empty());
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("poolhub_file_sink_" + std::to_string(platform::get_process_id()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static LogRecord make_record(std::string message) {
        LogRecord record;
        record.level     = LogLevel::WARN;
        record.category  = category::MEMORY;
        record.message   = std::move(message);
        record.timestamp = std::chrono::system_clock::now();
        return record;
    }

    static std::string read_all(const std::filesystem::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    std::filesystem::path dir_;
};

TEST_F(FileSinkTest, WritesFormattedLines) {
    auto path = dir_ / "agent.log";
    {
        FileSink sink(FileSink::Config{path.string(), 0, 3});
        ASSERT_TRUE(sink.is_ready());
        sink.write(make_record("Memory pressure entering high"));
        sink.flush();
    }

    auto content = read_all(path);
    EXPECT_NE(content.find(" WARN [memory] [T:"), std::string::npos);
    EXPECT_NE(content.find("Memory pressure entering high"), std::string::npos);
}

TEST_F(FileSinkTest, RotatesAtSizeLimit) {
    auto path = dir_ / "agent.log";
    {
        FileSink sink(FileSink::Config{path.string(), 64, 2});
        for (int i = 0; i < 10; ++i) {
            sink.write(make_record("rotation line " + std::to_string(i)));
        }
        sink.flush();
    }

    EXPECT_TRUE(std::filesystem::exists(dir_ / "agent.log.1"));
    EXPECT_TRUE(std::filesystem::exists(dir_ / "agent.log.2"));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "agent.log.3"));
    EXPECT_NE(read_all(dir_ / "agent.log.1").find("rotation line"), std::string::npos);
}

TEST_F(FileSinkTest, MissingDirectoryIsNotReady) {
    FileSink sink(FileSink::Config{(dir_ / "missing" / "agent.log").string(), 0, 1});
    EXPECT_FALSE(sink.is_ready());
    sink.write(make_record("dropped"));
}
