// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL3 Host Clock

#include "apal/host_clock.h"
#include <SDL3/SDL.h>
#include <memory>

namespace apal {
namespace sdl3 {

/// SDL3 host clock on SDL_GetTicksNS with nanosecond sleeps
class HostClockSDL3 : public IHostClock {
public:
    HostClockSDL3() = default;
    ~HostClockSDL3() override { shutdown(); }

    Result initialize() override {
        if (initialized_) {
            return Result::AlreadyInitialized;
        }
        start_ns_ = SDL_GetTicksNS();
        initialized_ = true;
        return Result::Success;
    }

    void shutdown() override {
        initialized_ = false;
        start_ns_ = 0;
    }

    bool isInitialized() const override {
        return initialized_;
    }

    uint64_t getTicksUs() const override {
        if (!initialized_) {
            return 0;
        }
        return (SDL_GetTicksNS() - start_ns_) / 1000;
    }

    void sleepUs(uint64_t us) override {
        if (us > 0) {
            SDL_DelayPrecise(us * 1000);
        }
    }

private:
    bool initialized_ = false;
    uint64_t start_ns_ = 0;
};

} // namespace sdl3

// Factory function
std::unique_ptr<IHostClock> createHostClockSDL3() {
    return std::make_unique<sdl3::HostClockSDL3>();
}

} // namespace apal
