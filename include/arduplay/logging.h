/**
 * @file logging.h
 * @brief Callback-based logging for the arduplay runtime.
 *
 * The host installs a callback (function pointer + userdata) to receive
 * log messages. Without one, messages go to stderr as
 * "[LEVEL] subsystem: message".
 *
 * Thread-safety: the minimum level is atomic; callback registration is
 * mutex-guarded. Log calls may come from any thread (libretro cores log
 * from their own threads occasionally).
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include <cstdarg>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace arduplay {

// ─────────────────────────────────────────────────────────────────────────────
// Log Level
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : int {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
    Trace = 4
};

[[nodiscard]] const char* log_level_name(LogLevel level) noexcept;

/**
 * @brief Parse "error", "warn", "info", "debug" or "trace" (case-sensitive).
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Callback Registration
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log callback signature.
 *
 * @param level     Severity level
 * @param subsystem Subsystem identifier (e.g., "RUNTIME", "BRIDGE", "CORE")
 * @param message   Null-terminated message text
 * @param userdata  Opaque pointer given at registration
 */
using LogCallback = void (*)(LogLevel level, const char* subsystem,
                             const char* message, void* userdata);

/**
 * @brief Install the log callback. nullptr restores the stderr handler.
 */
void set_log_callback(LogCallback callback, void* userdata) noexcept;

/**
 * @brief Set minimum log level; messages above it are dropped.
 */
void set_log_level(LogLevel level) noexcept;

[[nodiscard]] LogLevel get_log_level() noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Logging Functions
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Log a pre-formatted message (fast path).
 */
void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept;

/**
 * @brief Log with printf-style formatting.
 */
void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept;

/**
 * @brief va_list variant of log_printf, for forwarding C varargs loggers.
 */
void log_vprintf(LogLevel level, const char* subsystem, const char* fmt, va_list args) noexcept;

/**
 * @brief Check if a log level is enabled.
 *
 * Use this to guard expensive log argument computation.
 */
[[nodiscard]] inline bool log_level_enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= static_cast<int>(get_log_level());
}

/**
 * @brief Log with std::format formatting.
 */
template<typename... Args>
void log_fmt(LogLevel level, const char* subsystem,
             std::format_string<Args...> fmt, Args&&... args) {
    // Check level before formatting (avoid work if filtered)
    if (!log_level_enabled(level)) {
        return;
    }
    std::string msg = std::format(fmt, std::forward<Args>(args)...);
    log_raw(level, subsystem, msg);
}

// ─────────────────────────────────────────────────────────────────────────────
// Repeat Suppression
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Remembers which messages were already reported.
 *
 * A recurring driver failure would otherwise log once per tick. Callers
 * log only when first_occurrence() returns true; later occurrences are
 * counted. Instances are independent, so two runtimes never share state.
 */
class RepeatFilter {
public:
    /**
     * @brief Record an occurrence of key.
     * @return true the first time key is seen (since construction or clear())
     */
    bool first_occurrence(std::string_view key);

    /**
     * @brief Times key has been recorded.
     */
    [[nodiscard]] uint64_t occurrences(std::string_view key) const;

    /**
     * @brief Total occurrences that were not first occurrences.
     */
    [[nodiscard]] uint64_t suppressed() const noexcept { return suppressed_; }

    [[nodiscard]] size_t distinct() const noexcept { return seen_.size(); }

    void clear() noexcept;

private:
    std::unordered_map<std::string, uint64_t> seen_;
    uint64_t suppressed_ = 0;
};

} // namespace arduplay

// ═══════════════════════════════════════════════════════════════════════════════
// Logging Macros
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * Usage:
 *   ARDUPLAY_LOG_INFO("RUNTIME", "Running at {:.1f} fps", fps);
 *   ARDUPLAY_LOG_WARN("DRIVER", "Audio driver '{}' failed: {}", name, why);
 */

#define ARDUPLAY_LOG_ENABLED(level) \
    ::arduplay::log_level_enabled(::arduplay::LogLevel::level)

#define ARDUPLAY_LOG(level, subsys, fmt, ...) \
    ::arduplay::log_fmt(::arduplay::LogLevel::level, subsys, fmt __VA_OPT__(,) __VA_ARGS__)

#define ARDUPLAY_LOG_ERROR(subsys, fmt, ...) ARDUPLAY_LOG(Error, subsys, fmt __VA_OPT__(,) __VA_ARGS__)
#define ARDUPLAY_LOG_WARN(subsys, fmt, ...)  ARDUPLAY_LOG(Warn, subsys, fmt __VA_OPT__(,) __VA_ARGS__)
#define ARDUPLAY_LOG_INFO(subsys, fmt, ...)  ARDUPLAY_LOG(Info, subsys, fmt __VA_OPT__(,) __VA_ARGS__)
#define ARDUPLAY_LOG_DEBUG(subsys, fmt, ...) ARDUPLAY_LOG(Debug, subsys, fmt __VA_OPT__(,) __VA_ARGS__)
