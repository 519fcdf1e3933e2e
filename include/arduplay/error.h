/**
 * @file error.h
 * @brief Error values returned by the runtime, on std::expected.
 *
 * Provides:
 * - ErrorCode taxonomy for session, driver, snapshot, I/O and config failures
 * - Error class with code, message, and source location
 * - Result<T> type alias for std::expected<T, Error>
 * - Ok(), Err(), make_error(), make_error_fmt() helper functions
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace arduplay {

// ─────────────────────────────────────────────────────────────────────────────
// Error Codes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Failure codes, grouped in numeric ranges by subsystem.
 *
 * Zero indicates success and is never stored in an Error.
 */
enum class ErrorCode : int {
    Ok = 0,

    // General errors (1-99)
    Unknown = 1,
    InvalidArgument = 3,
    InvalidState = 4,
    NotInitialized = 5,

    // Session errors (100-199)
    CoreLoadError = 100,        ///< Core shared object missing or unusable
    ContentLoadError = 101,     ///< Content missing, malformed or rejected
    StepError = 102,            ///< Core failed while advancing a frame

    // Driver errors (200-299)
    DriverInitError = 200,      ///< Recoverable: null driver substituted
    DriverRuntimeError = 201,   ///< Recoverable: one tick of output dropped

    // Snapshot errors (300-399)
    UnsupportedBySession = 300,
    SlotNotFound = 301,
    DeserializeRejected = 302,
    InsufficientHistory = 303,

    // I/O errors (400-499)
    FileNotFound = 400,
    FileReadError = 401,
    FileWriteError = 402,

    // Configuration errors (500-599)
    ConfigParseError = 500,
    ConfigValueInvalid = 501,
};

/**
 * @brief Enumerator name of an error code.
 */
[[nodiscard]] inline constexpr const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::NotInitialized: return "NotInitialized";
        case ErrorCode::CoreLoadError: return "CoreLoadError";
        case ErrorCode::ContentLoadError: return "ContentLoadError";
        case ErrorCode::StepError: return "StepError";
        case ErrorCode::DriverInitError: return "DriverInitError";
        case ErrorCode::DriverRuntimeError: return "DriverRuntimeError";
        case ErrorCode::UnsupportedBySession: return "UnsupportedBySession";
        case ErrorCode::SlotNotFound: return "SlotNotFound";
        case ErrorCode::DeserializeRejected: return "DeserializeRejected";
        case ErrorCode::InsufficientHistory: return "InsufficientHistory";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::FileReadError: return "FileReadError";
        case ErrorCode::FileWriteError: return "FileWriteError";
        case ErrorCode::ConfigParseError: return "ConfigParseError";
        case ErrorCode::ConfigValueInvalid: return "ConfigValueInvalid";
        default: return "Unknown";
    }
}

/**
 * @brief Whether an error of this code ends the session.
 *
 * Core and content load failures abort start-up; a step failure leaves the
 * core in an unknown state. Everything else is absorbed where it happens.
 */
[[nodiscard]] inline constexpr bool is_fatal(ErrorCode code) noexcept {
    return code == ErrorCode::CoreLoadError ||
           code == ErrorCode::ContentLoadError ||
           code == ErrorCode::StepError;
}

// ─────────────────────────────────────────────────────────────────────────────
// Error Class
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief A failure: its code, a message and where it was raised.
 *
 * Example:
 * @code
 *   Error err(ErrorCode::SlotNotFound, "slot 3 is empty");
 *   std::cerr << err.format() << std::endl;
 *   // Output: SlotNotFound at snapshot_manager.cpp:88 (load): slot 3 is empty
 * @endcode
 */
class Error {
public:
    Error(ErrorCode code,
          std::string message,
          std::source_location location = std::source_location::current())
        : code_(code)
        , message_(std::move(message))
        , location_(location)
    {}

    template<typename... Args>
    [[nodiscard]] static Error formatted(
        ErrorCode code,
        std::format_string<Args...> fmt,
        Args&&... args
    ) {
        return Error{
            code,
            std::format(fmt, std::forward<Args>(args)...),
            std::source_location::current()
        };
    }

    // Accessors
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept { return location_; }
    [[nodiscard]] const char* file() const noexcept { return location_.file_name(); }
    [[nodiscard]] uint_least32_t line() const noexcept { return location_.line(); }

    /**
     * @brief One-line rendering for logs and the CLI.
     * @return Formatted string: "CODE at file:line (func): message"
     */
    [[nodiscard]] std::string format() const {
        return std::format(
            "{} at {}:{} ({}): {}",
            error_code_name(code_),
            location_.file_name(),
            location_.line(),
            location_.function_name(),
            message_
        );
    }

    /**
     * @brief Copy of this error with "context: " prepended to the message.
     *
     * Used to record which phase failed while keeping the original
     * code and location.
     */
    [[nodiscard]] Error with_context(std::string_view context) const {
        return Error{code_, std::format("{}: {}", context, message_), location_};
    }

    [[nodiscard]] bool is(ErrorCode code) const noexcept {
        return code_ == code;
    }

private:
    ErrorCode code_;
    std::string message_;
    std::source_location location_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Result Type (std::expected alias)
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Value or Error.
 *
 * Either a success value of type T, or an Error.
 */
template<typename T>
using Result = std::expected<T, Error>;

// ─────────────────────────────────────────────────────────────────────────────
// Helper Functions
// ─────────────────────────────────────────────────────────────────────────────

template<typename T>
[[nodiscard]] constexpr Result<T> Ok(T value) {
    return Result<T>{std::in_place, std::move(value)};
}

[[nodiscard]] inline constexpr Result<void> Ok() {
    return Result<void>{};
}

[[nodiscard]] inline std::unexpected<Error> Err(Error error) {
    return std::unexpected(std::move(error));
}

/**
 * @brief Error result from a code and a message.
 */
[[nodiscard]] inline std::unexpected<Error> make_error(
    ErrorCode code,
    std::string msg,
    std::source_location loc = std::source_location::current()
) {
    return std::unexpected(Error{code, std::move(msg), loc});
}

/**
 * @brief Error result with a std::format message.
 */
template<typename... Args>
[[nodiscard]] std::unexpected<Error> make_error_fmt(
    ErrorCode code,
    std::format_string<Args...> fmt,
    Args&&... args
) {
    return std::unexpected(Error::formatted(code, fmt, std::forward<Args>(args)...));
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fail the enclosing function unless cond holds.
 *
 * Usage:
 *   ARDUPLAY_CHECK(n > 0, ErrorCode::InvalidArgument, "count must be positive");
 */
#define ARDUPLAY_CHECK(cond, code, msg) \
    do { \
        if (!(cond)) { \
            return ::arduplay::make_error(code, msg); \
        } \
    } while (0)

/**
 * @brief Propagate the error of a Result<void> expression.
 */
#define ARDUPLAY_TRY_VOID(expr) \
    do { \
        auto&& _arduplay_result = (expr); \
        if (!_arduplay_result.has_value()) { \
            return ::arduplay::Err(_arduplay_result.error()); \
        } \
    } while (0)

} // namespace arduplay
