#pragma once

/**
 * @file error.hpp
 * @brief Error handling system for poolhub
 *
 * Fallible poolhub operations return Result<T>. An Error carries a code from
 * the 0xCCEE taxonomy below, a message, the raising source location, optional
 * key/value context and an optional cause.
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <source_location>

namespace poolhub::common {

// ============================================================================
// ERROR CATEGORIES
// ============================================================================

/**
 * @brief Subsystem an error originates from
 *
 * The category is the high byte of every ErrorCode (0xCCEE).
 */
enum class ErrorCategory : uint8_t {
    GENERAL       = 0x00,
    POOL          = 0x01,  ///< Local pools and slot factories
    MEMORY        = 0x02,  ///< Pressure monitor and process memory
    COORDINATION  = 0x03,  ///< Shared coordinator backends
    CONFIG        = 0x04,
    SERIALIZATION = 0x05,  ///< Instance records, queue items
    PLATFORM      = 0x06,
};

constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:       return "General";
        case ErrorCategory::POOL:          return "Pool";
        case ErrorCategory::MEMORY:        return "Memory";
        case ErrorCategory::COORDINATION:  return "Coordination";
        case ErrorCategory::CONFIG:        return "Configuration";
        case ErrorCategory::SERIALIZATION: return "Serialization";
        case ErrorCategory::PLATFORM:      return "Platform";
        default:                           return "Unknown";
    }
}

// ============================================================================
// ERROR CODES
// ============================================================================

enum class ErrorCode : uint32_t {
    // General
    SUCCESS          = 0x0000,
    UNKNOWN_ERROR    = 0x0001,
    INVALID_ARGUMENT = 0x0002,  ///< Includes foreign, stale and double-returned handles
    INVALID_STATE    = 0x0003,
    ALREADY_EXISTS   = 0x0004,

    // Pool
    UNKNOWN_KIND     = 0x0100,
    POOL_EXHAUSTED   = 0x0101,  ///< Emergency limit reached
    FACTORY_ERROR    = 0x0102,  ///< Slot factory threw or returned null

    // Memory
    OUT_OF_MEMORY    = 0x0200,

    // Coordination
    COORDINATOR_UNAVAILABLE = 0x0300,
    CONNECTION_REFUSED      = 0x0301,
    CONNECTION_TIMEOUT      = 0x0302,

    // Configuration
    CONFIG_INVALID        = 0x0400,
    CONFIG_PARSE_ERROR    = 0x0401,
    CONFIG_FILE_NOT_FOUND = 0x0402,
    CONFIG_INVALID_VALUE  = 0x0403,  ///< Message names the offending key

    // Serialization
    MALFORMED_DATA     = 0x0500,
    DESERIALIZE_FAILED = 0x0501,

    // Platform
    OS_ERROR = 0x0600,
};

constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Worth retrying later: capacity may free up or the backend may return
 */
constexpr bool is_transient(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::POOL_EXHAUSTED:
        case ErrorCode::COORDINATOR_UNAVAILABLE:
        case ErrorCode::CONNECTION_REFUSED:
        case ErrorCode::CONNECTION_TIMEOUT:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Retrying the same call cannot succeed
 */
constexpr bool is_fatal(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OUT_OF_MEMORY:
        case ErrorCode::UNKNOWN_KIND:
            return true;
        default:
            return false;
    }
}

constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:                 return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR:           return "UNKNOWN_ERROR";
        case ErrorCode::INVALID_ARGUMENT:        return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_STATE:           return "INVALID_STATE";
        case ErrorCode::ALREADY_EXISTS:          return "ALREADY_EXISTS";
        case ErrorCode::UNKNOWN_KIND:            return "UNKNOWN_KIND";
        case ErrorCode::POOL_EXHAUSTED:          return "POOL_EXHAUSTED";
        case ErrorCode::FACTORY_ERROR:           return "FACTORY_ERROR";
        case ErrorCode::OUT_OF_MEMORY:           return "OUT_OF_MEMORY";
        case ErrorCode::COORDINATOR_UNAVAILABLE: return "COORDINATOR_UNAVAILABLE";
        case ErrorCode::CONNECTION_REFUSED:      return "CONNECTION_REFUSED";
        case ErrorCode::CONNECTION_TIMEOUT:      return "CONNECTION_TIMEOUT";
        case ErrorCode::CONFIG_INVALID:          return "CONFIG_INVALID";
        case ErrorCode::CONFIG_PARSE_ERROR:      return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_FILE_NOT_FOUND:   return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_INVALID_VALUE:    return "CONFIG_INVALID_VALUE";
        case ErrorCode::MALFORMED_DATA:          return "MALFORMED_DATA";
        case ErrorCode::DESERIALIZE_FAILED:      return "DESERIALIZE_FAILED";
        case ErrorCode::OS_ERROR:                return "OS_ERROR";
        default:                                 return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

struct SourceLocation {
    const char* file     = "";
    const char* function = "";
    uint32_t line        = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_, uint32_t line_) noexcept
        : file(file_), function(func_), line(line_) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc.file_name(), loc.function_name(), loc.line());
    }

    constexpr bool is_valid() const noexcept { return line > 0 && file[0] != '\0'; }
};

#define POOLHUB_CURRENT_LOCATION ::poolhub::common::SourceLocation::current()

// ============================================================================
// ERROR
// ============================================================================

/**
 * @brief Error code with message, location, context and cause
 *
 * The cause is immutable once attached, so copies share it.
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept : code_(code) {}

    Error(ErrorCode code, std::string_view message) : code_(code), message_(message) {}

    Error(ErrorCode code, std::string message, SourceLocation loc)
        : code_(code), message_(std::move(message)), location_(loc) {}

    // Accessors
    ErrorCode code() const noexcept { return code_; }
    ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    const SourceLocation& location() const noexcept { return location_; }
    const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return context_;
    }

    // Status checks
    bool is_success() const noexcept { return poolhub::common::is_success(code_); }
    bool is_error() const noexcept { return !is_success(); }
    bool is_transient() const noexcept { return poolhub::common::is_transient(code_); }
    bool is_fatal() const noexcept { return poolhub::common::is_fatal(code_); }

    explicit operator bool() const noexcept { return is_success(); }

    // Get formatted error string
    std::string to_string() const;

    Error& with_cause(Error cause) {
        cause_ = std::make_shared<const Error>(std::move(cause));
        return *this;
    }

    const Error* cause() const noexcept { return cause_.get(); }

    // Context addition
    Error& with_context(std::string_view key, std::string_view value);

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::shared_ptr<const Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

template<typename T = void>
class Result;

// Specialization for void
template<>
class Result<void> {
public:
    // Success
    Result() noexcept = default;

    // Error from code
    Result(ErrorCode code) noexcept : error_(code) {}

    // Error with message
    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = POOLHUB_CURRENT_LOCATION)
        : error_(code, std::string(message), loc) {}

    // Error from Error object
    Result(Error error) noexcept : error_(std::move(error)) {}

    // Status
    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    // Error access
    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    // Chain errors
    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    Error error_;
};

/**
 * @brief Value or Error
 *
 * value() must only be called on success. A successful Result reports
 * ErrorCode::SUCCESS from code().
 */
template<typename T>
class Result {
public:
    Result(T value) noexcept(std::is_nothrow_move_constructible_v<T>)
        : value_(std::move(value)) {}

    Result(ErrorCode code) noexcept : error_(code) {}

    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = POOLHUB_CURRENT_LOCATION)
        : error_(code, std::string(message), loc) {}

    Result(Error error) noexcept : error_(std::move(error)) {}

    bool is_success() const noexcept { return value_.has_value(); }
    bool is_error() const noexcept { return !value_.has_value(); }
    explicit operator bool() const noexcept { return is_success(); }

    T& value() & noexcept { return *value_; }
    const T& value() const& noexcept { return *value_; }
    T&& value() && noexcept { return std::move(*value_); }

    T value_or(T fallback) const& { return value_ ? *value_ : std::move(fallback); }
    T value_or(T fallback) && { return value_ ? std::move(*value_) : std::move(fallback); }

    ErrorCode code() const noexcept { return value_ ? ErrorCode::SUCCESS : error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        using Mapped = Result<decltype(func(std::declval<const T&>()))>;
        if (value_) {
            return Mapped(func(*value_));
        }
        return Mapped(error_);
    }

private:
    std::optional<T> value_;
    Error error_;
};

// ============================================================================
// HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Create a success Result
 */
template<typename T>
Result<T> ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> ok() {
    return Result<void>();
}

/**
 * @brief Create an error Result
 */
template<typename T = void>
Result<T> err(ErrorCode code,
              std::string_view message = {},
              SourceLocation loc = POOLHUB_CURRENT_LOCATION) {
    return Result<T>(code, message, loc);
}

/**
 * @brief Create an error Result from Error object
 */
template<typename T = void>
Result<T> err(Error error) {
    return Result<T>(std::move(error));
}

// ============================================================================
// ERROR PROPAGATION MACROS
// ============================================================================

/**
 * @brief Return early if result is error
 *
 * Usage: POOLHUB_TRY(some_function_returning_result());
 */
#define POOLHUB_TRY(expr)                                           \
    do {                                                            \
        auto _poolhub_result = (expr);                              \
        if (POOLHUB_UNLIKELY(_poolhub_result.is_error())) {         \
            return ::poolhub::common::Error(_poolhub_result.error()); \
        }                                                           \
    } while (0)

/**
 * @brief Assign value or return error
 *
 * Usage: POOLHUB_TRY_ASSIGN(var, some_function_returning_result());
 */
#define POOLHUB_TRY_ASSIGN(var, expr)                               \
    auto _poolhub_try_##var = (expr);                               \
    if (POOLHUB_UNLIKELY(_poolhub_try_##var.is_error())) {          \
        return ::poolhub::common::Error(_poolhub_try_##var.error()); \
    }                                                               \
    var = std::move(_poolhub_try_##var).value()

}  // namespace poolhub::common
