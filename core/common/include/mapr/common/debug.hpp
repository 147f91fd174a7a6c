#pragma once

/**
 * @file debug.hpp
 * @brief Logging system for mapr
 *
 * Features:
 * - Hierarchical log levels
 * - Category-based filtering
 * - Automatic source location capture
 * - Pluggable sinks (console, rotating file, callback)
 * - Thread-safe logging
 * - Message construction skipped when a level is disabled
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "error.hpp"
#include "platform.hpp"

namespace mapr::common::debug {

// ============================================================================
// LOG LEVELS
// ============================================================================

/**
 * @brief Log severity levels
 */
enum class LogLevel : uint8_t {
    TRACE = 0,  // Finest granularity, very verbose
    DEBUG = 1,  // Debugging information
    INFO  = 2,  // Informational messages
    WARN  = 3,  // Warning conditions
    ERROR = 4,  // Error conditions
    FATAL = 5,  // Fatal errors
    OFF   = 6   // Logging disabled
};

constexpr std::string_view level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return "TRACE";
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::ERROR:
            return "ERROR";
        case LogLevel::FATAL:
            return "FATAL";
        case LogLevel::OFF:
            return "OFF";
        default:
            return "UNKNOWN";
    }
}

/**
 * @brief Get short level name (1 char)
 */
constexpr char level_char(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::TRACE:
            return 'T';
        case LogLevel::DEBUG:
            return 'D';
        case LogLevel::INFO:
            return 'I';
        case LogLevel::WARN:
            return 'W';
        case LogLevel::ERROR:
            return 'E';
        case LogLevel::FATAL:
            return 'F';
        default:
            return '?';
    }
}

/**
 * @brief Parse log level from string, case-insensitive
 * @return std::nullopt if the name is not a known level
 */
MAPR_API std::optional<LogLevel> try_parse_log_level(std::string_view name) noexcept;

/**
 * @brief Parse log level from string, falling back to INFO
 */
MAPR_API LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// LOG CATEGORIES
// ============================================================================

/**
 * @brief Predefined log categories for filtering
 */
namespace category {
constexpr std::string_view GENERAL  = "general";
constexpr std::string_view MAPPING  = "mapping";
constexpr std::string_view REGISTRY = "registry";
constexpr std::string_view DISPATCH = "dispatch";
constexpr std::string_view CONFIG   = "config";
}  // namespace category

// ============================================================================
// LOG RECORD
// ============================================================================

/**
 * @brief A single log entry with all context
 */
struct LogRecord {
    LogLevel level = LogLevel::INFO;
    std::string_view category;
    std::string message;
    SourceLocation location;

    std::chrono::system_clock::time_point timestamp;

    uint64_t thread_id = 0;
};

// ============================================================================
// LOG SINK INTERFACE
// ============================================================================

/**
 * @brief Interface for log output destinations
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(const LogRecord& record) = 0;

    virtual void flush() = 0;

    /**
     * @brief Check if sink is ready to accept logs
     */
    virtual bool is_ready() const noexcept = 0;
};

// ============================================================================
// BUILT-IN LOG SINKS
// ============================================================================

/**
 * @brief Console log sink with optional color support
 */
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool use_colors        = true;
        bool use_stderr        = false;  // Use stderr for errors
        bool include_timestamp = true;
        bool include_thread_id = true;
        bool include_location  = true;
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    ~ConsoleSink() override;

    void write(const LogRecord& record) override;
    void flush() override;
    bool is_ready() const noexcept override { return true; }

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * @brief File log sink with size-based rotation
 *
 * When the active file reaches max_file_size it is renamed to
 * `<path>.1`, older files shift up by one and `<path>.<max_files>` is dropped.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string file_path;
        size_t max_file_size   = 10 * 1024 * 1024;  // 10MB
        uint32_t max_files     = 5;
        bool include_thread_id = true;
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

/**
 * @brief Callback-based sink for custom handling
 */
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogRecord&)>;

    explicit CallbackSink(Callback cb) : callback_(std::move(cb)) {}

    void write(const LogRecord& record) override {
        if (callback_)
            callback_(record);
    }

    void flush() override {}
    bool is_ready() const noexcept override { return callback_ != nullptr; }

private:
    Callback callback_;
};

// ============================================================================
// LOG FILTER
// ============================================================================

/**
 * @brief Global and per-category level thresholds
 */
class LogFilter {
public:
    LogFilter() = default;

    void set_level(LogLevel level) noexcept { global_level_ = level; }
    LogLevel level() const noexcept { return global_level_.load(std::memory_order_relaxed); }

    /**
     * @brief Set level for specific category
     *
     * A category level overrides the global level in both directions.
     */
    void set_category_level(std::string_view category, LogLevel level);

    bool should_log(LogLevel level, std::string_view category) const noexcept;

    /**
     * @brief Reset all filters to defaults
     */
    void reset() noexcept;

private:
    std::atomic<LogLevel> global_level_{LogLevel::INFO};
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LogLevel> category_levels_;
};

// ============================================================================
// LOGGER
// ============================================================================

/**
 * @brief Thread-safe logger with multiple sinks
 */
class Logger {
public:
    /**
     * @brief Get the global logger instance
     */
    static Logger& instance() noexcept;

    void add_sink(std::shared_ptr<ILogSink> sink);

    /**
     * @brief Remove all sinks
     */
    void clear_sinks();

    size_t sink_count() const;

    LogFilter& filter() noexcept { return filter_; }
    const LogFilter& filter() const noexcept { return filter_; }

    void set_level(LogLevel level) noexcept { filter_.set_level(level); }

    /**
     * @brief Check if logging is enabled for level/category
     */
    bool is_enabled(LogLevel level, std::string_view category = {}) const noexcept {
        return filter_.should_log(level, category);
    }

    void log(LogLevel level, std::string_view category, std::string message,
             SourceLocation loc = MAPR_CURRENT_LOCATION);

    /**
     * @brief Flush all sinks
     */
    void flush();

private:
    Logger();
    ~Logger();

    void dispatch(const LogRecord& record);

    LogFilter filter_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinks_mutex_;
};

// ============================================================================
// LOGGING MACROS
// ============================================================================

#define MAPR_LOG_ENABLED(level) \
    ::mapr::common::debug::Logger::instance().is_enabled(::mapr::common::debug::LogLevel::level)

#define MAPR_LOG_ENABLED_CAT(level, cat) \
    ::mapr::common::debug::Logger::instance().is_enabled(::mapr::common::debug::LogLevel::level, cat)

// Core logging macro
#define MAPR_LOG_IMPL(level, category, ...)                                                    \
    do {                                                                                       \
        auto& _mapr_logger = ::mapr::common::debug::Logger::instance();                        \
        if (_mapr_logger.is_enabled(::mapr::common::debug::LogLevel::level, category)) {       \
            std::ostringstream _mapr_oss;                                                      \
            _mapr_oss << __VA_ARGS__;                                                          \
            _mapr_logger.log(::mapr::common::debug::LogLevel::level, category, _mapr_oss.str(), \
                             MAPR_CURRENT_LOCATION);                                           \
        }                                                                                      \
    } while (0)

// Category-specific macros
#define MAPR_LOG_TRACE(cat, ...) MAPR_LOG_IMPL(TRACE, cat, __VA_ARGS__)
#define MAPR_LOG_DEBUG(cat, ...) MAPR_LOG_IMPL(DEBUG, cat, __VA_ARGS__)
#define MAPR_LOG_INFO(cat, ...)  MAPR_LOG_IMPL(INFO, cat, __VA_ARGS__)
#define MAPR_LOG_WARN(cat, ...)  MAPR_LOG_IMPL(WARN, cat, __VA_ARGS__)
#define MAPR_LOG_ERROR(cat, ...) MAPR_LOG_IMPL(ERROR, cat, __VA_ARGS__)
#define MAPR_LOG_FATAL(cat, ...) MAPR_LOG_IMPL(FATAL, cat, __VA_ARGS__)

// Simplified macros (use GENERAL category)
#define MAPR_TRACE(...) MAPR_LOG_TRACE(::mapr::common::debug::category::GENERAL, __VA_ARGS__)
#define MAPR_DEBUG(...) MAPR_LOG_DEBUG(::mapr::common::debug::category::GENERAL, __VA_ARGS__)
#define MAPR_INFO(...)  MAPR_LOG_INFO(::mapr::common::debug::category::GENERAL, __VA_ARGS__)
#define MAPR_WARN(...)  MAPR_LOG_WARN(::mapr::common::debug::category::GENERAL, __VA_ARGS__)
#define MAPR_ERROR(...) MAPR_LOG_ERROR(::mapr::common::debug::category::GENERAL, __VA_ARGS__)

// ============================================================================
// INITIALIZATION
// ============================================================================

/**
 * @brief Initialize the logging system
 *
 * The MAPR_LOG_LEVEL environment variable, when set, overrides @p level.
 */
MAPR_API void init_logging(LogLevel level = LogLevel::INFO);

/**
 * @brief Flush and detach all sinks
 */
MAPR_API void shutdown_logging();

}  // namespace mapr::common::debug
