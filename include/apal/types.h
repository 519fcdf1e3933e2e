// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Common Types

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace apal {

/// Result codes for driver operations
enum class Result {
    Success = 0,
    NotInitialized,
    AlreadyInitialized,
    InvalidParameter,
    NotSupported,
    DeviceNotFound,
    DeviceLost,
    OutOfMemory,
    BufferFull,
    InvalidState,
    Unknown = -1
};

/// Driver back-end families
enum class Backend {
    Null = 0,   // No I/O; always available
    SDL2,
    SDL3
};

/// Sample encodings accepted by audio drivers
enum class SampleFormat {
    S16,    // Signed 16-bit PCM
    F32     // Normalized float, [-1.0, 1.0]
};

/// Convert Result to string for debugging
constexpr const char* toString(Result r) noexcept {
    switch (r) {
        case Result::Success:            return "Success";
        case Result::NotInitialized:     return "NotInitialized";
        case Result::AlreadyInitialized: return "AlreadyInitialized";
        case Result::InvalidParameter:   return "InvalidParameter";
        case Result::NotSupported:       return "NotSupported";
        case Result::DeviceNotFound:     return "DeviceNotFound";
        case Result::DeviceLost:         return "DeviceLost";
        case Result::OutOfMemory:        return "OutOfMemory";
        case Result::BufferFull:         return "BufferFull";
        case Result::InvalidState:       return "InvalidState";
        case Result::Unknown:            return "Unknown";
    }
    return "Unknown";
}

/// Convert Backend to its configuration name
constexpr const char* toString(Backend b) noexcept {
    switch (b) {
        case Backend::Null: return "null";
        case Backend::SDL2: return "sdl2";
        case Backend::SDL3: return "sdl3";
    }
    return "unknown";
}

constexpr const char* toString(SampleFormat fmt) noexcept {
    switch (fmt) {
        case SampleFormat::S16: return "S16";
        case SampleFormat::F32: return "F32";
    }
    return "Unknown";
}

/// Parse a back-end name ("null", "none", "sdl2", "sdl3")
constexpr std::optional<Backend> parseBackend(std::string_view name) noexcept {
    if (name == "null" || name == "none") return Backend::Null;
    if (name == "sdl2") return Backend::SDL2;
    if (name == "sdl3") return Backend::SDL3;
    return std::nullopt;
}

/// Get bytes per sample for format
constexpr uint32_t bytesPerSample(SampleFormat fmt) noexcept {
    return fmt == SampleFormat::S16 ? 2 : 4;
}

/// Check if Result indicates success
constexpr bool succeeded(Result r) noexcept {
    return r == Result::Success;
}

/// Check if Result indicates failure
constexpr bool failed(Result r) noexcept {
    return r != Result::Success;
}

} // namespace apal
