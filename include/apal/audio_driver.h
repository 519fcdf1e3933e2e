// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Audio Driver Interface

#pragma once

#include "apal/types.h"
#include <cstdint>
#include <span>

namespace apal {

/// Format an audio driver consumes
struct AudioConfig {
    uint32_t sample_rate = 44100;               // Samples per second
    uint16_t channels = 2;                      // 1 = mono, 2 = stereo
    SampleFormat format = SampleFormat::S16;
    uint16_t buffer_ms = 100;                   // Queue depth in milliseconds
};

/// Interleaved samples handed to playSamples()
///
/// Exactly one of s16 / f32 is used, selected by format.
struct AudioBuffer {
    SampleFormat format = SampleFormat::S16;
    uint16_t channels = 2;
    std::span<const int16_t> s16;
    std::span<const float> f32;

    constexpr size_t sampleCount() const noexcept {
        return format == SampleFormat::S16 ? s16.size() : f32.size();
    }

    constexpr size_t frameCount() const noexcept {
        return channels == 0 ? 0 : sampleCount() / channels;
    }

    constexpr bool empty() const noexcept { return sampleCount() == 0; }
};

/// Push-based audio output
///
/// The runtime produces samples once per tick and pushes them here.
/// playSamples() never blocks: samples are queued and, when the queue is
/// full, the oldest queued samples are discarded to make room.
class IAudioDriver {
public:
    virtual ~IAudioDriver() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Open the output at the core's native sample rate
    /// @return Success, InvalidParameter, DeviceNotFound, AlreadyInitialized
    virtual Result init(uint32_t sample_rate) = 0;

    /// Close the output (safe to call if not initialized)
    virtual void close() = 0;

    /// Check if output is open
    virtual bool isRunning() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Push Model
    // ═══════════════════════════════════════════════════════════════════════

    /// Queue samples for playback (non-blocking, drop-oldest)
    ///
    /// @param buffer Samples in the format reported by getConfig()
    /// @return Success, NotInitialized, InvalidParameter (format mismatch)
    virtual Result playSamples(const AudioBuffer& buffer) = 0;

    /// Total samples discarded by the overflow policy since init
    virtual uint64_t droppedSamples() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Configuration Query
    // ═══════════════════════════════════════════════════════════════════════

    /// Active configuration (valid after init)
    virtual AudioConfig getConfig() const = 0;

    /// Short back-end name for logs
    virtual const char* name() const = 0;
};

} // namespace apal
