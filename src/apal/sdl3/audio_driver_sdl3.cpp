// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL3 Audio Driver
//
// SDL3 audio streams grow without bound when fed directly. The stream is
// opened with a get-callback instead, which tops the stream up from a
// drop-oldest SampleQueue so playSamples() keeps its bounded, non-blocking
// contract.

#include "apal/audio_driver.h"
#include "apal/platform.h"
#include "apal/sample_queue.h"
#include <SDL3/SDL.h>
#include <algorithm>
#include <memory>
#include <vector>

namespace apal {
namespace sdl3 {

template <typename Sample>
struct SampleTraits;

template <>
struct SampleTraits<int16_t> {
    static constexpr SDL_AudioFormat kSdlFormat = SDL_AUDIO_S16;
    static constexpr SampleFormat kFormat = SampleFormat::S16;
    static std::span<const int16_t> view(const AudioBuffer& b) { return b.s16; }
};

template <>
struct SampleTraits<float> {
    static constexpr SDL_AudioFormat kSdlFormat = SDL_AUDIO_F32;
    static constexpr SampleFormat kFormat = SampleFormat::F32;
    static std::span<const float> view(const AudioBuffer& b) { return b.f32; }
};

/// SDL3 audio driver using SDL_AudioStream with a get-callback
template <typename Sample>
class AudioDriverSDL3 : public IAudioDriver {
    using Traits = SampleTraits<Sample>;

public:
    explicit AudioDriverSDL3(const DriverOptions& options) {
        config_.channels = options.audio_channels;
        config_.format = Traits::kFormat;
        config_.buffer_ms = options.audio_buffer_ms;
    }

    ~AudioDriverSDL3() override { close(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    Result init(uint32_t sample_rate) override {
        if (stream_) {
            return Result::AlreadyInitialized;
        }
        if (sample_rate == 0 || config_.channels == 0 || config_.channels > 2) {
            return Result::InvalidParameter;
        }

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            return Result::DeviceNotFound;
        }
        subsystem_ = true;

        config_.sample_rate = sample_rate;
        queue_ = std::make_unique<SampleQueue<Sample>>(
            queueCapacityFor(sample_rate, config_.channels, config_.buffer_ms));
        // The callback converts through this buffer and must not allocate
        scratch_.assign(queue_->capacity(), Sample{});

        SDL_AudioSpec spec{};
        spec.format = Traits::kSdlFormat;
        spec.channels = config_.channels;
        spec.freq = static_cast<int>(sample_rate);

        stream_ = SDL_OpenAudioDeviceStream(
            SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK, &spec, audioCallback, this);
        if (!stream_) {
            close();
            return Result::DeviceNotFound;
        }

        // Devices opened via SDL_OpenAudioDeviceStream start paused
        SDL_ResumeAudioStreamDevice(stream_);
        return Result::Success;
    }

    void close() override {
        if (stream_) {
            SDL_DestroyAudioStream(stream_);
            stream_ = nullptr;
        }
        if (subsystem_) {
            SDL_QuitSubSystem(SDL_INIT_AUDIO);
            subsystem_ = false;
        }
        queue_.reset();
        scratch_.clear();
    }

    bool isRunning() const override {
        return stream_ != nullptr;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Push Model
    // ═══════════════════════════════════════════════════════════════════════

    Result playSamples(const AudioBuffer& buffer) override {
        if (!stream_) {
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

    const char* name() const override { return "sdl3"; }

private:
    // Runs on the SDL audio thread
    static void SDLCALL audioCallback(void* userdata, SDL_AudioStream* stream,
                                      int additional_amount, int /*total_amount*/) {
        auto* self = static_cast<AudioDriverSDL3*>(userdata);
        if (additional_amount <= 0) {
            return;
        }
        const size_t count = static_cast<size_t>(additional_amount) / sizeof(Sample);
        drainPadded(*self->queue_, std::span<Sample>(self->scratch_), count,
                    [stream](std::span<const Sample> chunk) {
                        SDL_PutAudioStreamData(stream, chunk.data(),
                                               static_cast<int>(chunk.size_bytes()));
                    });
    }

    SDL_AudioStream* stream_ = nullptr;
    std::unique_ptr<SampleQueue<Sample>> queue_;
    std::vector<Sample> scratch_;
    AudioConfig config_{};
    bool subsystem_ = false;
};

} // namespace sdl3

// Factory function
std::unique_ptr<IAudioDriver> createAudioDriverSDL3(const DriverOptions& options) {
    if (options.audio_format == SampleFormat::F32) {
        return std::make_unique<sdl3::AudioDriverSDL3<float>>(options);
    }
    return std::make_unique<sdl3::AudioDriverSDL3<int16_t>>(options);
}

} // namespace apal
