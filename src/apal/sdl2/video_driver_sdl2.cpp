// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL2 Video Driver

#include "apal/platform.h"
#include "apal/video_driver.h"
#include <SDL.h>
#include <memory>
#include <string>

namespace apal {
namespace sdl2 {

/// SDL2 window with a streaming RGB24 texture scaled by an integer factor
class VideoDriverSDL2 : public IVideoDriver {
public:
    explicit VideoDriverSDL2(const DriverOptions& options)
        : title_(options.window_title ? options.window_title : "Arduplay")
        , scale_(options.video_scale == 0 ? 1 : options.video_scale) {}

    ~VideoDriverSDL2() override { close(); }

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    Result init(uint32_t width, uint32_t height) override {
        if (window_) {
            return Result::AlreadyInitialized;
        }
        if (width == 0 || height == 0) {
            return Result::InvalidParameter;
        }

        if (SDL_InitSubSystem(SDL_INIT_VIDEO) != 0) {
            return Result::DeviceNotFound;
        }
        subsystem_ = true;

        window_ = SDL_CreateWindow(
            title_.c_str(),
            SDL_WINDOWPOS_CENTERED,
            SDL_WINDOWPOS_CENTERED,
            static_cast<int>(width * scale_),
            static_cast<int>(height * scale_),
            SDL_WINDOW_SHOWN);
        if (!window_) {
            close();
            return Result::DeviceNotFound;
        }

        // No vsync: presenting must never hold the tick loop
        renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED);
        if (!renderer_) {
            renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_SOFTWARE);
        }
        if (!renderer_) {
            close();
            return Result::NotSupported;
        }

        SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "nearest");
        if (createTexture(width, height) != Result::Success) {
            close();
            return Result::OutOfMemory;
        }

        running_ = true;
        return Result::Success;
    }

    void close() override {
        if (texture_) {
            SDL_DestroyTexture(texture_);
            texture_ = nullptr;
        }
        if (renderer_) {
            SDL_DestroyRenderer(renderer_);
            renderer_ = nullptr;
        }
        if (window_) {
            SDL_DestroyWindow(window_);
            window_ = nullptr;
        }
        if (subsystem_) {
            SDL_QuitSubSystem(SDL_INIT_VIDEO);
            subsystem_ = false;
        }
        running_ = false;
        width_ = 0;
        height_ = 0;
    }

    bool isRunning() const override {
        return running_;
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Output
    // ═══════════════════════════════════════════════════════════════════════

    Result render(const RgbFrame& frame) override {
        if (!renderer_) {
            return Result::NotInitialized;
        }
        if (!frame.isValid()) {
            return Result::InvalidParameter;
        }

        // Cores may change geometry at runtime
        if (frame.width != width_ || frame.height != height_) {
            Result r = createTexture(frame.width, frame.height);
            if (r != Result::Success) {
                return r;
            }
        }

        if (SDL_UpdateTexture(texture_, nullptr, frame.pixels.data(),
                              static_cast<int>(frame.pitch())) != 0) {
            return Result::DeviceLost;
        }
        SDL_RenderClear(renderer_);
        SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
        SDL_RenderPresent(renderer_);

        // Leave the event in the queue for the input driver
        SDL_PumpEvents();
        if (SDL_HasEvent(SDL_QUIT)) {
            running_ = false;
        }
        return Result::Success;
    }

    const char* name() const override { return "sdl2"; }

private:
    Result createTexture(uint32_t width, uint32_t height) {
        if (texture_) {
            SDL_DestroyTexture(texture_);
            texture_ = nullptr;
        }
        texture_ = SDL_CreateTexture(renderer_, SDL_PIXELFORMAT_RGB24,
                                     SDL_TEXTUREACCESS_STREAMING,
                                     static_cast<int>(width), static_cast<int>(height));
        if (!texture_) {
            return Result::OutOfMemory;
        }
        SDL_RenderSetLogicalSize(renderer_, static_cast<int>(width), static_cast<int>(height));
        width_ = width;
        height_ = height;
        return Result::Success;
    }

    std::string title_;
    uint32_t scale_;
    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture* texture_ = nullptr;
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    bool subsystem_ = false;
    bool running_ = false;
};

} // namespace sdl2

// Factory function
std::unique_ptr<IVideoDriver> createVideoDriverSDL2(const DriverOptions& options) {
    return std::make_unique<sdl2::VideoDriverSDL2>(options);
}

} // namespace apal
