// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Null Back-end
//
// Drivers that perform no I/O. Used for headless runs, as the fallback
// when a real driver fails to initialize, and by tests (each class has a
// small inspection API below its interface overrides).

#pragma once

#include "apal/audio_driver.h"
#include "apal/host_clock.h"
#include "apal/input_driver.h"
#include "apal/video_driver.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

namespace apal {

/// Video driver that discards frames
class NullVideoDriver : public IVideoDriver {
public:
    NullVideoDriver() = default;
    ~NullVideoDriver() override { close(); }

    Result init(uint32_t width, uint32_t height) override;
    void close() override;
    bool isRunning() const override { return running_; }
    Result render(const RgbFrame& frame) override;
    const char* name() const override { return "null"; }

    // ═══════════════════════════════════════════════════════════════════════
    // Test API
    // ═══════════════════════════════════════════════════════════════════════

    uint64_t framesRendered() const { return frames_rendered_; }
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }

    /// Keep a copy of the most recent frame (off by default)
    void setCaptureFrames(bool enable) { capture_ = enable; }
    const std::vector<uint8_t>& lastFrame() const { return last_frame_; }

private:
    bool running_ = false;
    bool capture_ = false;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    uint64_t frames_rendered_ = 0;
    std::vector<uint8_t> last_frame_;
};

/// Audio driver that accepts and discards samples
class NullAudioDriver : public IAudioDriver {
public:
    /// @param preferred channels, format and buffer_ms to advertise;
    ///        sample_rate is replaced by the value given to init()
    explicit NullAudioDriver(const AudioConfig& preferred = {});
    ~NullAudioDriver() override { close(); }

    Result init(uint32_t sample_rate) override;
    void close() override;
    bool isRunning() const override { return running_; }
    Result playSamples(const AudioBuffer& buffer) override;
    uint64_t droppedSamples() const override { return 0; }
    AudioConfig getConfig() const override { return config_; }
    const char* name() const override { return "null"; }

    // ═══════════════════════════════════════════════════════════════════════
    // Test API
    // ═══════════════════════════════════════════════════════════════════════

    uint64_t blocksReceived() const { return blocks_received_; }
    uint64_t framesReceived() const { return frames_received_; }
    const std::vector<int16_t>& lastS16() const { return last_s16_; }
    const std::vector<float>& lastF32() const { return last_f32_; }

private:
    AudioConfig config_{};
    bool running_ = false;
    uint64_t blocks_received_ = 0;
    uint64_t frames_received_ = 0;
    std::vector<int16_t> last_s16_;
    std::vector<float> last_f32_;
};

/// Input driver returning a scripted state
class NullInputDriver : public IInputDriver {
public:
    NullInputDriver() = default;
    ~NullInputDriver() override { close(); }

    Result init() override;
    void close() override;
    bool isRunning() const override { return running_; }
    InputState poll() override;
    const char* name() const override { return "null"; }

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - State Injection
    // ═══════════════════════════════════════════════════════════════════════

    /// State returned by subsequent polls (reset is delivered once)
    void setState(const InputState& state) { state_ = state; }

    void press(Button b) { state_.setPressed(b, true); }
    void release(Button b) { state_.setPressed(b, false); }
    void requestReset() { state_.reset = true; }
    void requestQuit() { state_.quit = true; }

    uint64_t pollCount() const { return poll_count_; }

private:
    InputState state_{};
    bool running_ = false;
    uint64_t poll_count_ = 0;
};

/// Wall clock on std::chrono::steady_clock
class SteadyHostClock : public IHostClock {
public:
    SteadyHostClock() = default;
    ~SteadyHostClock() override { shutdown(); }

    Result initialize() override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_; }
    uint64_t getTicksUs() const override;
    void sleepUs(uint64_t us) override;

private:
    bool initialized_ = false;
    std::chrono::steady_clock::time_point start_{};
};

/// Virtual clock controlled programmatically
///
/// Time does not advance on its own. Sleep is non-blocking and, with
/// auto-advance enabled, moves virtual time forward by the requested amount.
class VirtualHostClock : public IHostClock {
public:
    VirtualHostClock() = default;
    ~VirtualHostClock() override { shutdown(); }

    Result initialize() override;
    void shutdown() override;
    bool isInitialized() const override { return initialized_; }
    uint64_t getTicksUs() const override;
    void sleepUs(uint64_t us) override;

    // ═══════════════════════════════════════════════════════════════════════
    // Test API - Virtual Time Control
    // ═══════════════════════════════════════════════════════════════════════

    void setTicksUs(uint64_t us) { ticks_us_ = us; }
    void advanceTicksUs(uint64_t delta_us) { ticks_us_ += delta_us; }
    void setAutoAdvanceOnSleep(bool enable) { auto_advance_on_sleep_ = enable; }

    /// Sum of all durations passed to sleepUs()
    uint64_t totalSleptUs() const { return total_slept_us_; }
    uint64_t sleepCalls() const { return sleep_calls_; }

private:
    bool initialized_ = false;
    std::atomic<uint64_t> ticks_us_{0};
    bool auto_advance_on_sleep_ = true;
    uint64_t total_slept_us_ = 0;
    uint64_t sleep_calls_ = 0;
};

} // namespace apal
