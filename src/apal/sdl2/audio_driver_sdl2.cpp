// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL2 Audio Driver

#include "apal/audio_driver.h"
#include "apal/platform.h"
#include "apal/sample_queue.h"
#include <SDL.h>
#include <cstring>
#include <memory>

namespace apal {
namespace sdl2 {

template <typename Sample>
struct SampleTraits;

template <>
struct SampleTraits<int16_t> {
    static constexpr SDL_AudioFormat kSdlFormat = AUDIO_S16SYS;
    static constexpr SampleFormat kFormat = SampleFormat::S16;
    static std::span<const int16_t> view(const AudioBuffer& b) { return b.s16; }
};

template <>
struct SampleTraits<float> {
    static constexpr SDL_AudioFormat kSdlFormat = AUDIO_F32SYS;
    static constexpr SampleFormat kFormat = SampleFormat::F32;
    static std::span<const float> view(const AudioBuffer& b) { return b.f32; }
};

/// SDL2 audio driver: the device callback drains a drop-oldest SampleQueue
template <typename Sample>
class AudioDriverSDL2 : public IAudioDriver {
    using Traits = SampleTraits<Sample>;

public:
    explicit AudioDriverSDL2(const DriverOptions& options) {
        config_.channels = options.audio_channels;
        config_.format = Traits::kFormat;
        config_.buffer_ms = options.audio_buffer_ms;
    }

    ~AudioDriverSDL2() override { close(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    Result init(uint32_t sample_rate) override {
        if (device_id_ != 0) {
            return Result::AlreadyInitialized;
        }
        if (sample_rate == 0 || config_.channels == 0 || config_.channels > 2) {
            return Result::InvalidParameter;
        }

        if (SDL_InitSubSystem(SDL_INIT_AUDIO) != 0) {
            return Result::DeviceNotFound;
        }
        subsystem_ = true;

        config_.sample_rate = sample_rate;
        queue_ = std::make_unique<SampleQueue<Sample>>(
            queueCapacityFor(sample_rate, config_.channels, config_.buffer_ms));

        SDL_AudioSpec desired{};
        desired.freq = static_cast<int>(sample_rate);
        desired.format = Traits::kSdlFormat;
        desired.channels = static_cast<Uint8>(config_.channels);
        desired.samples = 1024;
        desired.callback = audioCallback;
        desired.userdata = this;

        // No allowed changes: SDL converts to the device format internally
        SDL_AudioSpec obtained{};
        device_id_ = SDL_OpenAudioDevice(nullptr, 0, &desired, &obtained, 0);
        if (device_id_ == 0) {
            close();
            return Result::DeviceNotFound;
        }

        SDL_PauseAudioDevice(device_id_, 0);
        return Result::Success;
    }

    void close() override {
        if (device_id_ != 0) {
            SDL_CloseAudioDevice(device_id_);
            device_id_ = 0;
        }
        if (subsystem_) {
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            subsystem_ = false;
        }
        queue_.reset();
    }

    bool isRunning() const override {
        return device_id_ != 0;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Push Model
    // ═══════════════════════════════════════════════════════════════════════

    Result playSamples(const AudioBuffer& buffer) override {
        if (device_id_ == 0) {
            return Result::NotInitialized;
        }
        if (buffer.format != config_.format || buffer.channels != config_.channels) {
            return Result::InvalidParameter;
        }
        queue_->push(Traits::view(buffer));
        return Result::Success;
    }

    uint64_t droppedSamples() const override {
        return queue_ ? queue_->dropped() : 0;
    }

    AudioConfig getConfig() const override {
        return config_;
    }

    const char* name() const override { return "sdl2"; }

private:
    static void SDLCALL audioCallback(void* userdata, Uint8* stream, int len) {
        auto* self = static_cast<AudioDriverSDL2*>(userdata);
        const size_t count = static_cast<size_t>(len) / sizeof(Sample);
        auto* out = reinterpret_cast<Sample*>(stream);

        size_t got = self->queue_->pull(std::span<Sample>(out, count));

        // Silence for underrun (all-zero bits is silence for S16 and F32)
        if (got < count) {
            std::memset(out + got, 0, (count - got) * sizeof(Sample));
        }
    }

    SDL_AudioDeviceID device_id_ = 0;
    std::unique_ptr<SampleQueue<Sample>> queue_;
    AudioConfig config_{};
    bool subsystem_ = false;
};

} // namespace sdl2

// Factory function
std::unique_ptr<IAudioDriver> createAudioDriverSDL2(const DriverOptions& options) {
    if (options.audio_format == SampleFormat::F32) {
        return std::make_unique<sdl2::AudioDriverSDL2<float>>(options);
    }
    return std::make_unique<sdl2::AudioDriverSDL2<int16_t>>(options);
}

} // namespace apal
