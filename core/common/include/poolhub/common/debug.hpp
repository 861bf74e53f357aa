#pragma once

/**
 * @file debug.hpp
 * @brief Process-wide logging for poolhub
 *
 * Components log through the POOLHUB_LOG_* macros with one of the category
 * names below. The message expression is evaluated only when the level passes
 * the filter for that category.
 */

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace poolhub::common::debug {

// ============================================================================
// LEVELS AND CATEGORIES
// ============================================================================

enum class LogLevel : uint8_t { TRACE, DEBUG, INFO, WARN, ERROR, FATAL, OFF };

namespace detail {
inline constexpr std::array<std::string_view, 7> LEVEL_NAMES = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
}  // namespace detail

constexpr std::string_view level_name(LogLevel level) noexcept {
    auto index = static_cast<size_t>(level);
    return index < detail::LEVEL_NAMES.size() ? detail::LEVEL_NAMES[index] : "UNKNOWN";
}

/// First letter of the level name, '?' for OFF
constexpr char level_char(LogLevel level) noexcept {
    return level < LogLevel::OFF ? level_name(level).front() : '?';
}

/// Case-insensitive; accepts "warning", "err", "critical" and "none" as aliases.
/// Anything unrecognised is INFO.
POOLHUB_API LogLevel parse_log_level(std::string_view name) noexcept;

namespace category {
constexpr std::string_view GENERAL     = "general";
constexpr std::string_view POOL        = "pool";
constexpr std::string_view MEMORY      = "memory";
constexpr std::string_view COORDINATOR = "coordinator";
constexpr std::string_view CONFIG      = "config";
constexpr std::string_view LIFECYCLE   = "lifecycle";
}  // namespace category

// ============================================================================
// RECORDS AND SINKS
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;

    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id = 0;
};

/**
 * @brief Destination for log records
 *
 * The logger serializes calls into its sinks, so write() needs no locking
 * of its own unless the sink is also written to from elsewhere.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;

    /// Sinks that are not ready are skipped
    virtual bool is_ready() const noexcept { return true; }
};

/**
 * @brief Fields rendered into a text log line
 *
 * Lines read "<timestamp> <LEVEL> [<category>] [T:<thread>] <message> (<file>:<line>)"
 * with disabled fields left out.
 */
struct LineFormat {
    bool include_timestamp = true;
    bool include_thread_id = true;
    bool include_location  = false;
};

POOLHUB_API std::string format_line(const LogRecord& record, const LineFormat& format);

/// WARN and above go to stderr, the rest to stdout
class ConsoleSink : public ILogSink {
public:
    using Config = LineFormat;

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

private:
    Config config_;
};

/**
 * @brief Appends to a file and rotates it by size
 *
 * "<path>" rolls to "<path>.1", "<path>.1" to "<path>.2" and so on, keeping at
 * most max_files rolled files. Lines always carry thread id and location.
 * A zero max_file_size disables rotation.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size = 10 * 1024 * 1024;
        uint32_t max_files   = 5;
    };

    explicit FileSink(Config config);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Hands every record to a function; used by tests and embedding hosts
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void write(const LogRecord& record) override { callback_(record); }
    void flush() override {}
    bool is_ready() const noexcept override { return static_cast<bool>(callback_); }

private:
    Callback callback_;
};

// ============================================================================
// FILTER AND LOGGER
// ============================================================================

/**
 * @brief Global level plus per-category overrides
 *
 * A category with its own level ignores the global one, so an override can
 * make a category quieter or more verbose than the rest.
 */
class LogFilter {
public:
    void set_level(LogLevel level) noexcept { global_level_.store(level); }
    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    void set_category_level(std::string_view category, LogLevel level);

    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /// Back to INFO with no overrides
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    std::atomic<bool> has_overrides_{false};
    mutable std::mutex mutex_;
    std::map<std::string, LogLevel, std::less<>> category_levels_;
};

/**
 * @brief Process-wide logger
 *
 * Starts with one default ConsoleSink. Records that pass the filter are
 * stamped and handed to every ready sink under one lock.
 */
class Logger {
public:
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void remove_sink(const std::shared_ptr<ILogSink>& sink);
    void clear_sinks();

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }
    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    bool is_enabled(LogLevel level, std::string_view category) const noexcept {
        return filter_.should_log(level, category);
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation location = POOLHUB_CURRENT_LOCATION);

    void flush();

private:
    Logger();
    ~Logger();

    LogFilter filter_;
    std::mutex sinks_mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
};

// ============================================================================
// SPAN
// ============================================================================

/**
 * @brief Times a scope
 *
 * Logs at TRACE on entry and exit. After set_error() the exit line is logged
 * at ERROR with the code name and message.
 */
class Span {
public:
    Span(std::string_view name, std::string_view category = category::GENERAL,
         SourceLocation location = POOLHUB_CURRENT_LOCATION);
    ~Span();

    Span(const Span&)            = delete;
    Span& operator=(const Span&) = delete;

    void set_error(ErrorCode code, std::string_view message = {});

    std::chrono::nanoseconds elapsed() const noexcept {
        return std::chrono::steady_clock::now() - started_;
    }

private:
    std::string name_;
    std::string_view category_;
    SourceLocation location_;
    std::chrono::steady_clock::time_point started_;
    std::optional<Error> error_;
};

// ============================================================================
// MACROS
// ============================================================================

#define POOLHUB_LOG_IMPL(level, cat, ...)                                                     \
    do {                                                                                      \
        auto& poolhub_logger_ = ::poolhub::common::debug::Logger::instance();                 \
        if (poolhub_logger_.is_enabled(::poolhub::common::debug::LogLevel::level, cat)) {     \
            std::ostringstream poolhub_message_;                                              \
            poolhub_message_ << __VA_ARGS__;                                                  \
            poolhub_logger_.log(::poolhub::common::debug::LogLevel::level, cat,               \
                                std::move(poolhub_message_).str(), POOLHUB_CURRENT_LOCATION); \
        }                                                                                     \
    } while (0)

#define POOLHUB_LOG_TRACE(cat, ...) POOLHUB_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define POOLHUB_LOG_DEBUG(cat, ...) POOLHUB_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define POOLHUB_LOG_INFO(cat, ...)  POOLHUB_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define POOLHUB_LOG_WARN(cat, ...)  POOLHUB_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define POOLHUB_LOG_ERROR(cat, ...) POOLHUB_LOG_IMPL(ERROR, cat, __VA_ARGS__)

#define POOLHUB_CONCAT_INNER(a, b) a##b
#define POOLHUB_CONCAT(a, b)       POOLHUB_CONCAT_INNER(a, b)

#define POOLHUB_SPAN_CAT(name, cat)                                       \
    ::poolhub::common::debug::Span POOLHUB_CONCAT(poolhub_span_, __LINE__)( \
        name, cat, POOLHUB_CURRENT_LOCATION)

// ============================================================================
// SETUP
// ============================================================================

/// Sets the global level; a non-empty POOLHUB_LOG_LEVEL takes precedence
POOLHUB_API void init_logging(LogLevel level = LogLevel::INFO);

/// Flushes and detaches all sinks
POOLHUB_API void shutdown_logging();

}  // namespace poolhub::common::debug
