#include <poolhub/common/debug.hpp>
#include <poolhub/common/platform.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <utility>

namespace poolhub::common::debug {

namespace {

constexpr std::pair<std::string_view, LogLevel> LEVEL_ALIASES[] = {
    {"trace", LogLevel::TRACE}, {"debug", LogLevel::DEBUG},   {"info", LogLevel::INFO},
    {"warn", LogLevel::WARN},   {"warning", LogLevel::WARN},  {"error", LogLevel::ERROR},
    {"err", LogLevel::ERROR},   {"fatal", LogLevel::FATAL},   {"critical", LogLevel::FATAL},
    {"off", LogLevel::OFF},     {"none", LogLevel::OFF},
};

void write_timestamp(std::ostream& out, std::chrono::system_clock::time_point ts) {
    auto seconds = std::chrono::system_clock::to_time_t(ts);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count() %
        1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis << std::setfill(' ');
}

std::string rolled_name(const std::string& path, uint32_t index) {
    return index == 0 ? path : path + "." + std::to_string(index);
}

}  // anonymous namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    auto equals_ignoring_case = [name](std::string_view alias) {
        return alias.size() == name.size() &&
               std::equal(alias.begin(), alias.end(), name.begin(), [](char a, char b) {
                   return a == std::tolower(static_cast<unsigned char>(b));
               });
    };
    for (const auto& [alias, level] : LEVEL_ALIASES) {
        if (equals_ignoring_case(alias)) {
            return level;
        }
    }
    return LogLevel::INFO;
}

std::string format_line(const LogRecord& record, const LineFormat& format) {
    std::ostringstream out;
    if (format.include_timestamp) {
        write_timestamp(out, record.timestamp);
        out << ' ';
    }
    out << level_name(record.level) << ' ';
    if (!record.category.empty()) {
        out << '[' << record.category << "] ";
    }
    if (format.include_thread_id) {
        out << "[T:" << std::hex << record.thread_id << std::dec << "] ";
    }
    out << record.message;
    if (format.include_location && record.location.is_valid()) {
        out << " (" << record.location.file << ':' << record.location.line << ')';
    }
    out << '\n';
    return std::move(out).str();
}

// ============================================================================
// FILTER
// ============================================================================

void LogFilter::set_category_level(std::string_view category, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.insert_or_assign(std::string(category), level);
    has_overrides_.store(true, std::memory_order_release);
}

bool LogFilter::should_log(LogLevel level, std::string_view category) const noexcept {
    if (level == LogLevel::OFF) {
        return false;
    }
    if (!category.empty() && has_overrides_.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = category_levels_.find(category); it != category_levels_.end()) {
            return level >= it->second;
        }
    }
    return level >= global_level_.load(std::memory_order_relaxed);
}

void LogFilter::reset() noexcept {
    global_level_.store(LogLevel::INFO);
    std::lock_guard<std::mutex> lock(mutex_);
    category_levels_.clear();
    has_overrides_.store(false, std::memory_order_release);
}

// ============================================================================
// SINKS
// ============================================================================

ConsoleSink::~ConsoleSink() {
    flush();
}

void ConsoleSink::write(const LogRecord& record) {
    (record.level >= LogLevel::WARN ? std::cerr : std::cout) << format_line(record, config_);
}

void ConsoleSink::flush() {
    std::cout.flush();
    std::cerr.flush();
}

struct FileSink::Impl {
    static constexpr LineFormat FORMAT{true, true, true};

    Config config;
    std::ofstream file;
    size_t written = 0;

    bool open() {
        file.open(config.file_path, std::ios::app);
        if (!file.is_open()) {
            return false;
        }
        file.seekp(0, std::ios::end);
        written = static_cast<size_t>(file.tellp());
        return true;
    }

    // A rename that fails leaves the current file growing; the counter
    // restarts either way so the next attempt waits for another full file.
    void rotate() {
        file.close();

        std::error_code ec;
        std::filesystem::remove(rolled_name(config.file_path, config.max_files), ec);
        for (uint32_t i = config.max_files; i > 0; --i) {
            auto from = rolled_name(config.file_path, i - 1);
            if (!std::filesystem::exists(from, ec)) {
                continue;
            }
            std::filesystem::rename(from, rolled_name(config.file_path, i), ec);
            if (ec) {
                std::cerr << "poolhub: cannot rotate " << from << ": " << ec.message() << '\n';
                break;
            }
        }

        if (!open()) {
            std::cerr << "poolhub: cannot reopen log file " << config.file_path << '\n';
        }
        written = 0;
    }
};

FileSink::FileSink(Config config) : impl_(std::make_unique<Impl>()) {
    impl_->config = std::move(config);
    if (!impl_->open()) {
        std::cerr << "poolhub: cannot open log file " << impl_->config.file_path << '\n';
    }
}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    if (!impl_->file.is_open()) {
        return;
    }
    auto line = format_line(record, Impl::FORMAT);
    impl_->file << line;
    impl_->written += line.size();

    if (impl_->config.max_file_size > 0 && impl_->written >= impl_->config.max_file_size) {
        impl_->rotate();
    }
}

void FileSink::flush() {
    if (impl_->file.is_open()) {
        impl_->file.flush();
    }
}

bool FileSink::is_ready() const noexcept {
    return impl_->file.is_open();
}

// ============================================================================
// LOGGER
// ============================================================================

Logger& Logger::instance() noexcept {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    sinks_.push_back(std::make_shared<ConsoleSink>());
}

Logger::~Logger() {
    flush();
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    std::erase(sinks_, sink);
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view category, std::string message,
                 SourceLocation location) {
    if (!filter_.should_log(level, category)) {
        return;
    }

    LogRecord record{level,
                     category,
                     std::move(message),
                     location,
                     std::chrono::system_clock::now(),
                     platform::get_thread_id()};

    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        if (sink->is_ready()) {
            sink->write(record);
        }
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// SPAN
// ============================================================================

Span::Span(std::string_view name, std::string_view category, SourceLocation location)
    : name_(name), category_(category), location_(location),
      started_(std::chrono::steady_clock::now()) {
    POOLHUB_LOG_TRACE(category_, "Span started: " << name_);
}

Span::~Span() {
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed()).count();
    if (!error_) {
        POOLHUB_LOG_TRACE(category_, "Span completed: " << name_ << " duration=" << us << "us");
        return;
    }

    std::ostringstream message;
    message << "Span completed with error: " << name_ << " duration=" << us
            << "us error=" << error_name(error_->code());
    if (!error_->message().empty()) {
        message << " msg=" << error_->message();
    }
    Logger::instance().log(LogLevel::ERROR, category_, std::move(message).str(), location_);
}

void Span::set_error(ErrorCode code, std::string_view message) {
    error_.emplace(code, message);
}

// ============================================================================
// SETUP
// ============================================================================

void init_logging(LogLevel level) {
    auto from_env = platform::get_env("POOLHUB_LOG_LEVEL");
    Logger::instance().set_level(from_env.empty() ? level : parse_log_level(from_env));
}

void shutdown_logging() {
    auto& logger = Logger::instance();
    logger.flush();
    logger.clear_sinks();
}

}  // namespace poolhub::common::debug
