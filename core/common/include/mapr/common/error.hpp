#pragma once

/**
 * @file error.hpp
 * @brief Error handling system for mapr
 *
 * This header provides:
 * - Hierarchical error codes organized by category
 * - Rich error context with source location
 * - Error propagation without masking
 * - Result<T> and the ok()/err() helpers
 */

#include "platform.hpp"

#include <cstdint>
#include <memory>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(MAPR_HAS_SOURCE_LOCATION)
    #include <source_location>
#endif

namespace mapr::common {

// ============================================================================
// ERROR CATEGORY SYSTEM
// ============================================================================

/**
 * @brief Error categories for hierarchical classification
 *
 * - 0x00xx: General/Common errors
 * - 0x03xx: Resource errors
 * - 0x04xx: Configuration errors
 * - 0x06xx: Mapping errors
 * - 0x09xx: Validation errors
 * - 0x0Axx: Platform-specific errors
 */
enum class ErrorCategory : uint8_t {
    GENERAL    = 0x00,
    RESOURCE   = 0x03,
    CONFIG     = 0x04,
    MAPPING    = 0x06,
    VALIDATION = 0x09,
    PLATFORM   = 0x0A,
};

/**
 * @brief Get category name as string
 */
constexpr std::string_view category_name(ErrorCategory cat) noexcept {
    switch (cat) {
        case ErrorCategory::GENERAL:    return "General";
        case ErrorCategory::RESOURCE:   return "Resource";
        case ErrorCategory::CONFIG:     return "Configuration";
        case ErrorCategory::MAPPING:    return "Mapping";
        case ErrorCategory::VALIDATION: return "Validation";
        case ErrorCategory::PLATFORM:   return "Platform";
        default:                        return "Unknown";
    }
}

// ============================================================================
// ERROR CODE DEFINITIONS
// ============================================================================

/**
 * @brief Error codes
 *
 * Format: 0xCCEE where CC = category, EE = specific error
 */
enum class ErrorCode : uint32_t {
    // ========== General (0x00xx) ==========
    SUCCESS             = 0x0000,
    UNKNOWN_ERROR       = 0x0001,
    NOT_IMPLEMENTED     = 0x0002,
    INVALID_ARGUMENT    = 0x0003,
    INVALID_STATE       = 0x0004,
    ALREADY_EXISTS      = 0x0007,
    NOT_FOUND           = 0x0008,
    PRECONDITION_FAILED = 0x0009,
    INVARIANT_VIOLATED  = 0x000B,

    // ========== Resource (0x03xx) ==========
    OUT_OF_MEMORY       = 0x0300,
    CAPACITY_EXCEEDED   = 0x030C,

    // ========== Configuration (0x04xx) ==========
    CONFIG_INVALID      = 0x0400,
    CONFIG_MISSING      = 0x0401,
    CONFIG_PARSE_ERROR  = 0x0402,
    CONFIG_VALUE_OUT_OF_RANGE = 0x0403,
    CONFIG_TYPE_MISMATCH = 0x0404,
    CONFIG_FILE_NOT_FOUND = 0x0406,
    CONFIG_INVALID_VALUE = 0x0408,
    MAPPER_CONFLICT     = 0x0410,

    // ========== Mapping (0x06xx) ==========
    MAPPER_NOT_FOUND    = 0x0600,
    TYPE_INFERENCE_FAILED = 0x0601,
    TRANSFORM_FAILED    = 0x0602,
    UNSUPPORTED_TYPE    = 0x0603,

    // ========== Validation (0x09xx) ==========
    VALIDATION_FAILED   = 0x0900,
    VALUE_OUT_OF_RANGE  = 0x0901,
    TYPE_MISMATCH       = 0x0902,
    NULL_POINTER        = 0x0903,
    EMPTY_VALUE         = 0x0904,
    FORMAT_INVALID      = 0x0906,
    CONSTRAINT_VIOLATED = 0x0907,

    // ========== Platform (0x0Axx) ==========
    PLATFORM_ERROR      = 0x0A00,
    FILE_NOT_FOUND      = 0x0A05,
    FILE_ACCESS_DENIED  = 0x0A06,
    OS_ERROR            = 0x0A09,
};

/**
 * @brief Extract category from error code
 */
constexpr ErrorCategory get_category(ErrorCode code) noexcept {
    return static_cast<ErrorCategory>((static_cast<uint32_t>(code) >> 8) & 0xFF);
}

constexpr bool is_success(ErrorCode code) noexcept {
    return code == ErrorCode::SUCCESS;
}

/**
 * @brief Check if error is fatal (unrecoverable)
 */
constexpr bool is_fatal(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::OUT_OF_MEMORY:
        case ErrorCode::INVARIANT_VIOLATED:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Get human-readable error name
 */
constexpr std::string_view error_name(ErrorCode code) noexcept {
    switch (code) {
        // General
        case ErrorCode::SUCCESS:              return "SUCCESS";
        case ErrorCode::UNKNOWN_ERROR:        return "UNKNOWN_ERROR";
        case ErrorCode::NOT_IMPLEMENTED:      return "NOT_IMPLEMENTED";
        case ErrorCode::INVALID_ARGUMENT:     return "INVALID_ARGUMENT";
        case ErrorCode::INVALID_STATE:        return "INVALID_STATE";
        case ErrorCode::ALREADY_EXISTS:       return "ALREADY_EXISTS";
        case ErrorCode::NOT_FOUND:            return "NOT_FOUND";
        case ErrorCode::PRECONDITION_FAILED:  return "PRECONDITION_FAILED";
        case ErrorCode::INVARIANT_VIOLATED:   return "INVARIANT_VIOLATED";

        // Resource
        case ErrorCode::OUT_OF_MEMORY:        return "OUT_OF_MEMORY";
        case ErrorCode::CAPACITY_EXCEEDED:    return "CAPACITY_EXCEEDED";

        // Configuration
        case ErrorCode::CONFIG_INVALID:       return "CONFIG_INVALID";
        case ErrorCode::CONFIG_MISSING:       return "CONFIG_MISSING";
        case ErrorCode::CONFIG_PARSE_ERROR:   return "CONFIG_PARSE_ERROR";
        case ErrorCode::CONFIG_VALUE_OUT_OF_RANGE: return "CONFIG_VALUE_OUT_OF_RANGE";
        case ErrorCode::CONFIG_TYPE_MISMATCH: return "CONFIG_TYPE_MISMATCH";
        case ErrorCode::CONFIG_FILE_NOT_FOUND: return "CONFIG_FILE_NOT_FOUND";
        case ErrorCode::CONFIG_INVALID_VALUE: return "CONFIG_INVALID_VALUE";
        case ErrorCode::MAPPER_CONFLICT:      return "MAPPER_CONFLICT";

        // Mapping
        case ErrorCode::MAPPER_NOT_FOUND:     return "MAPPER_NOT_FOUND";
        case ErrorCode::TYPE_INFERENCE_FAILED: return "TYPE_INFERENCE_FAILED";
        case ErrorCode::TRANSFORM_FAILED:     return "TRANSFORM_FAILED";
        case ErrorCode::UNSUPPORTED_TYPE:     return "UNSUPPORTED_TYPE";

        // Validation
        case ErrorCode::VALIDATION_FAILED:    return "VALIDATION_FAILED";
        case ErrorCode::VALUE_OUT_OF_RANGE:   return "VALUE_OUT_OF_RANGE";
        case ErrorCode::TYPE_MISMATCH:        return "TYPE_MISMATCH";
        case ErrorCode::NULL_POINTER:         return "NULL_POINTER";
        case ErrorCode::EMPTY_VALUE:          return "EMPTY_VALUE";
        case ErrorCode::FORMAT_INVALID:       return "FORMAT_INVALID";
        case ErrorCode::CONSTRAINT_VIOLATED:  return "CONSTRAINT_VIOLATED";

        // Platform
        case ErrorCode::PLATFORM_ERROR:       return "PLATFORM_ERROR";
        case ErrorCode::FILE_NOT_FOUND:       return "FILE_NOT_FOUND";
        case ErrorCode::FILE_ACCESS_DENIED:   return "FILE_ACCESS_DENIED";
        case ErrorCode::OS_ERROR:             return "OS_ERROR";

        default:                              return "UNKNOWN";
    }
}

// ============================================================================
// SOURCE LOCATION
// ============================================================================

/**
 * @brief Source location information for error tracking
 */
struct SourceLocation {
    const char* file = "";
    const char* function = "";
    uint32_t line = 0;
    uint32_t column = 0;

    constexpr SourceLocation() noexcept = default;

    constexpr SourceLocation(const char* file_, const char* func_,
                             uint32_t line_, uint32_t col_ = 0) noexcept
        : file(file_), function(func_), line(line_), column(col_) {}

#if defined(MAPR_HAS_SOURCE_LOCATION)
    constexpr SourceLocation(const std::source_location& loc) noexcept
        : file(loc.file_name())
        , function(loc.function_name())
        , line(loc.line())
        , column(loc.column()) {}

    static constexpr SourceLocation current(
        const std::source_location& loc = std::source_location::current()) noexcept {
        return SourceLocation(loc);
    }
#else
    static constexpr SourceLocation current() noexcept {
        return SourceLocation();
    }
#endif

    constexpr bool is_valid() const noexcept {
        return line > 0 && file[0] != '\0';
    }
};

#if defined(MAPR_HAS_SOURCE_LOCATION)
    #define MAPR_CURRENT_LOCATION ::mapr::common::SourceLocation::current()
#else
    #define MAPR_CURRENT_LOCATION ::mapr::common::SourceLocation(__FILE__, __func__, __LINE__)
#endif

// ============================================================================
// ERROR CONTEXT
// ============================================================================

/**
 * @brief Rich error information with context
 *
 * An Error is a value: copying deep-copies the cause chain, so an error can
 * be handed across layers and threads unchanged.
 */
class Error {
public:
    Error() noexcept = default;

    Error(ErrorCode code) noexcept
        : code_(code) {}

    Error(ErrorCode code, std::string message, SourceLocation loc = {}) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    Error(const Error& other)
        : code_(other.code_)
        , message_(other.message_)
        , location_(other.location_)
        , context_(other.context_) {
        if (other.cause_) {
            cause_ = std::make_unique<Error>(*other.cause_);
        }
    }

    Error(Error&& other) noexcept = default;

    Error& operator=(const Error& other) {
        if (this != &other) {
            code_ = other.code_;
            message_ = other.message_;
            location_ = other.location_;
            context_ = other.context_;
            cause_ = other.cause_ ? std::make_unique<Error>(*other.cause_) : nullptr;
        }
        return *this;
    }

    Error& operator=(Error&& other) noexcept = default;

    // Accessors
    constexpr ErrorCode code() const noexcept { return code_; }
    constexpr ErrorCategory category() const noexcept { return get_category(code_); }
    const std::string& message() const noexcept { return message_; }
    constexpr const SourceLocation& location() const noexcept { return location_; }

    // Status checks
    constexpr bool is_success() const noexcept { return mapr::common::is_success(code_); }
    constexpr bool is_error() const noexcept { return !is_success(); }
    constexpr bool is_fatal() const noexcept { return mapr::common::is_fatal(code_); }

    constexpr explicit operator bool() const noexcept { return is_success(); }

    /// Format: [Category] NAME (0xXXXX): message, followed by location, context and cause
    std::string to_string() const;

    Error& with_cause(Error cause) {
        cause_ = std::make_unique<Error>(std::move(cause));
        return *this;
    }

    const Error* cause() const noexcept { return cause_.get(); }

    Error& with_context(std::string_view key, std::string_view value);

    const std::vector<std::pair<std::string, std::string>>& context() const noexcept {
        return context_;
    }

    /// Value of the first context entry named @p key, if any
    std::optional<std::string> context_value(std::string_view key) const;

private:
    ErrorCode code_ = ErrorCode::SUCCESS;
    std::string message_;
    SourceLocation location_;
    std::unique_ptr<Error> cause_;
    std::vector<std::pair<std::string, std::string>> context_;
};

// ============================================================================
// RESULT TYPE
// ============================================================================

/**
 * @brief Result type carrying either a value or an Error
 */
template<typename T = void>
class Result;

template<>
class Result<void> {
public:
    // Success
    Result() noexcept = default;

    Result(ErrorCode code) noexcept : error_(code) {}

    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = MAPR_CURRENT_LOCATION)
        : error_(code, std::string(message), loc) {}

    Result(Error error) noexcept : error_(std::move(error)) {}

    bool is_success() const noexcept { return error_.is_success(); }
    bool is_error() const noexcept { return error_.is_error(); }
    explicit operator bool() const noexcept { return is_success(); }

    ErrorCode code() const noexcept { return error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

private:
    Error error_;
};

template<typename T>
class Result {
public:
    // Success with value (conjunction short-circuits so Result<std::any> stays copyable)
    template<typename U = T,
             std::enable_if_t<std::conjunction_v<
                                  std::negation<std::is_same<std::remove_cvref_t<U>, Result>>,
                                  std::negation<std::is_same<std::remove_cvref_t<U>, Error>>,
                                  std::negation<std::is_same<std::remove_cvref_t<U>, ErrorCode>>,
                                  std::is_constructible<T, U&&>>,
                              int> = 0>
    Result(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>)
        : has_value_(true) {
        new (&storage_) T(std::forward<U>(value));
    }

    Result(ErrorCode code) noexcept : error_(code), has_value_(false) {}

    Result(ErrorCode code, std::string_view message,
           SourceLocation loc = MAPR_CURRENT_LOCATION)
        : error_(code, std::string(message), loc), has_value_(false) {}

    Result(Error error) noexcept : error_(std::move(error)), has_value_(false) {}

    Result(const Result& other) : error_(other.error_), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(other.value_ref());
        }
    }

    Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
        : error_(std::move(other.error_)), has_value_(other.has_value_) {
        if (has_value_) {
            new (&storage_) T(std::move(other.value_ref()));
        }
    }

    Result& operator=(const Result& other) {
        if (this != &other) {
            destroy_value();
            error_ = other.error_;
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(other.value_ref());
            }
        }
        return *this;
    }

    Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T>) {
        if (this != &other) {
            destroy_value();
            error_ = std::move(other.error_);
            has_value_ = other.has_value_;
            if (has_value_) {
                new (&storage_) T(std::move(other.value_ref()));
            }
        }
        return *this;
    }

    ~Result() {
        destroy_value();
    }

    bool is_success() const noexcept { return has_value_; }
    bool is_error() const noexcept { return !has_value_; }
    explicit operator bool() const noexcept { return is_success(); }

    // Value access (only call if is_success())
    T& value() & noexcept { return value_ref(); }
    const T& value() const& noexcept { return value_ref(); }
    T&& value() && noexcept { return std::move(value_ref()); }

    T value_or(T default_value) const& {
        return has_value_ ? value_ref() : std::move(default_value);
    }

    T value_or(T default_value) && {
        return has_value_ ? std::move(value_ref()) : std::move(default_value);
    }

    ErrorCode code() const noexcept { return has_value_ ? ErrorCode::SUCCESS : error_.code(); }
    const Error& error() const noexcept { return error_; }
    const std::string& message() const noexcept { return error_.message(); }

    Result& with_cause(Error cause) {
        error_.with_cause(std::move(cause));
        return *this;
    }

    // Transform the value (if success)
    template<typename F>
    auto map(F&& func) const& -> Result<decltype(func(std::declval<const T&>()))> {
        using ReturnType = Result<decltype(func(std::declval<const T&>()))>;
        if (has_value_) {
            return ReturnType(func(value_ref()));
        }
        return ReturnType(error_);
    }

    template<typename F>
    auto map(F&& func) && -> Result<decltype(func(std::declval<T&&>()))> {
        using ReturnType = Result<decltype(func(std::declval<T&&>()))>;
        if (has_value_) {
            return ReturnType(func(std::move(value_ref())));
        }
        return ReturnType(std::move(error_));
    }

private:
    alignas(T) unsigned char storage_[sizeof(T)];
    Error error_;
    bool has_value_;

    T& value_ref() noexcept {
        return *std::launder(reinterpret_cast<T*>(&storage_));
    }

    const T& value_ref() const noexcept {
        return *std::launder(reinterpret_cast<const T*>(&storage_));
    }

    void destroy_value() noexcept {
        if (has_value_) {
            value_ref().~T();
            has_value_ = false;
        }
    }
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
              SourceLocation loc = MAPR_CURRENT_LOCATION) {
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
 * Usage: MAPR_TRY(some_function_returning_result());
 */
#define MAPR_TRY(expr)                                              \
    do {                                                            \
        auto _mapr_result = (expr);                                 \
        if (MAPR_UNLIKELY(_mapr_result.is_error())) {               \
            return _mapr_result.error();                            \
        }                                                           \
    } while (0)

/**
 * @brief Return early if result is error, wrapping it under a new message
 */
#define MAPR_TRY_MSG(expr, msg)                                     \
    do {                                                            \
        auto _mapr_result = (expr);                                 \
        if (MAPR_UNLIKELY(_mapr_result.is_error())) {               \
            return ::mapr::common::Error(_mapr_result.code(), msg,  \
                                         MAPR_CURRENT_LOCATION)     \
                   .with_cause(_mapr_result.error());               \
        }                                                           \
    } while (0)

/**
 * @brief Assign value or return error
 *
 * Usage: MAPR_TRY_ASSIGN(var, some_function_returning_result());
 */
#define MAPR_TRY_ASSIGN(var, expr)                                  \
    auto _mapr_try_##var = (expr);                                  \
    if (MAPR_UNLIKELY(_mapr_try_##var.is_error())) {                \
        return _mapr_try_##var.error();                             \
    }                                                               \
    var = std::move(_mapr_try_##var).value()

} // namespace mapr::common
