// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL2 Host Clock

#include "apal/host_clock.h"
#include <SDL.h>
#include <memory>

namespace apal {
namespace sdl2 {

/// SDL2 host clock using SDL_GetPerformanceCounter
class HostClockSDL2 : public IHostClock {
public:
    HostClockSDL2() = default;
    ~HostClockSDL2() override { shutdown(); }

    Result initialize() override {
        if (initialized_) {
            return Result::AlreadyInitialized;
        }
        if (SDL_InitSubSystem(SDL_INIT_TIMER) != 0) {
            return Result::NotSupported;
        }

        perf_frequency_ = SDL_GetPerformanceFrequency();
        if (perf_frequency_ == 0) {
            perf_frequency_ = 1000000;
        }
        start_perf_counter_ = SDL_GetPerformanceCounter();
        initialized_ = true;
        return Result::Success;
    }

    void shutdown() override {
        if (initialized_) {
            SDL_QuitSubSystem(SDL_INIT_TIMER);
        }
        initialized_ = false;
        start_perf_counter_ = 0;
    }

    bool isInitialized() const override {
        return initialized_;
    }

    uint64_t getTicksUs() const override {
        if (!initialized_) {
            return 0;
        }
        uint64_t elapsed = SDL_GetPerformanceCounter() - start_perf_counter_;
        // Split to avoid overflow on long sessions
        return (elapsed / perf_frequency_) * 1000000ULL +
               ((elapsed % perf_frequency_) * 1000000ULL) / perf_frequency_;
    }

    void sleepUs(uint64_t us) override {
        if (us == 0 || !initialized_) {
            return;
        }
        // SDL_Delay has millisecond granularity and tends to oversleep:
        // delay all but the last millisecond, then spin on the counter
        const uint64_t deadline = getTicksUs() + us;
        if (us > 2000) {
            SDL_Delay(static_cast<Uint32>((us - 1000) / 1000));
        }
        while (getTicksUs() < deadline) {
        }
    }

private:
    bool initialized_ = false;
    uint64_t start_perf_counter_ = 0;
    uint64_t perf_frequency_ = 1000000;
};

} // namespace sdl2

// Factory function
std::unique_ptr<IHostClock> createHostClockSDL2() {
    return std::make_unique<sdl2::HostClockSDL2>();
}

} // namespace apal
