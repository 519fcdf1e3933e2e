/**
 * @file logging.cpp
 * @brief Implementation of callback-based logging.
 *
 * Thread-safety: The logging state is protected by a mutex for callback
 * registration, but log calls themselves only take the lock long enough
 * to copy the callback out.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/logging.h"

#include <atomic>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace arduplay {

namespace {

// Mutex for callback registration (not for logging itself)
std::mutex g_log_mutex;

LogCallback g_log_callback = nullptr;
void* g_log_userdata = nullptr;

// Minimum log level (atomic for lock-free reads in hot path)
std::atomic<LogLevel> g_min_log_level{LogLevel::Info};

// Buffer size for printf-style formatting
constexpr size_t LOG_BUFFER_SIZE = 1024;

void default_log_handler(LogLevel level, const char* subsystem,
                         const char* message) noexcept {
    std::fprintf(stderr, "[%s] %s: %s\n", log_level_name(level), subsystem, message);
}

} // anonymous namespace

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "error") return LogLevel::Error;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "info")  return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    if (name == "trace") return LogLevel::Trace;
    return std::nullopt;
}

void set_log_callback(LogCallback callback, void* userdata) noexcept {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = callback;
    g_log_userdata = userdata;
}

void set_log_level(LogLevel level) noexcept {
    g_min_log_level.store(level, std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
    return g_min_log_level.load(std::memory_order_relaxed);
}

// ─────────────────────────────────────────────────────────────────────────────
// Core Logging Functions
// ─────────────────────────────────────────────────────────────────────────────

void log_raw(LogLevel level, const char* subsystem, std::string_view message) noexcept {
    // Fast path: check level without locking
    if (!log_level_enabled(level)) {
        return;
    }

    LogCallback callback = nullptr;
    void* userdata = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
        userdata = g_log_userdata;
    }

    // Null-terminate into a local buffer, truncating long messages
    char buffer[LOG_BUFFER_SIZE];
    const size_t n = message.size() < LOG_BUFFER_SIZE ? message.size() : LOG_BUFFER_SIZE - 1;
    std::memcpy(buffer, message.data(), n);
    buffer[n] = '\0';

    const char* subsys = subsystem ? subsystem : "";
    if (callback) {
        callback(level, subsys, buffer, userdata);
    } else {
        default_log_handler(level, subsys, buffer);
    }
}

void log_vprintf(LogLevel level, const char* subsystem, const char* fmt, va_list args) noexcept {
    if (!log_level_enabled(level)) {
        return;
    }

    char buffer[LOG_BUFFER_SIZE];
    int written = std::vsnprintf(buffer, LOG_BUFFER_SIZE, fmt, args);

    if (written < 0) {
        // Encoding error
        buffer[0] = '\0';
    } else if (static_cast<size_t>(written) >= LOG_BUFFER_SIZE) {
        // Truncated - add ellipsis
        buffer[LOG_BUFFER_SIZE - 4] = '.';
        buffer[LOG_BUFFER_SIZE - 3] = '.';
        buffer[LOG_BUFFER_SIZE - 2] = '.';
        buffer[LOG_BUFFER_SIZE - 1] = '\0';
    }

    log_raw(level, subsystem, buffer);
}

void log_printf(LogLevel level, const char* subsystem, const char* fmt, ...) noexcept {
    va_list args;
    va_start(args, fmt);
    log_vprintf(level, subsystem, fmt, args);
    va_end(args);
}

// ─────────────────────────────────────────────────────────────────────────────
// RepeatFilter
// ─────────────────────────────────────────────────────────────────────────────

bool RepeatFilter::first_occurrence(std::string_view key) {
    auto it = seen_.find(std::string(key));
    if (it == seen_.end()) {
        seen_.emplace(std::string(key), 1);
        return true;
    }
    ++it->second;
    ++suppressed_;
    return false;
}

uint64_t RepeatFilter::occurrences(std::string_view key) const {
    auto it = seen_.find(std::string(key));
    return it == seen_.end() ? 0 : it->second;
}

void RepeatFilter::clear() noexcept {
    seen_.clear();
    suppressed_ = 0;
}

} // namespace arduplay
