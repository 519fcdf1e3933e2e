// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL3 Input Driver
//
// SDL3 changes event constant names (SDL_EVENT_* instead of SDL_*) and
// SDL_GetKeyboardState returns bool instead of Uint8.

#include "apal/input_driver.h"
#include "apal/platform.h"
#include <SDL3/SDL.h>
#include <memory>

namespace apal {
namespace sdl3 {

namespace {

struct KeyBinding {
    SDL_Scancode scancode;
    Button button;
};

// Arrows + Z/X, and the one-handed WASD + J/K layout
constexpr KeyBinding kBindings[] = {
    {SDL_SCANCODE_UP,    Button::Up},
    {SDL_SCANCODE_DOWN,  Button::Down},
    {SDL_SCANCODE_LEFT,  Button::Left},
    {SDL_SCANCODE_RIGHT, Button::Right},
    {SDL_SCANCODE_Z,     Button::A},
    {SDL_SCANCODE_X,     Button::B},
    {SDL_SCANCODE_W,     Button::Up},
    {SDL_SCANCODE_S,     Button::Down},
    {SDL_SCANCODE_A,     Button::Left},
    {SDL_SCANCODE_D,     Button::Right},
    {SDL_SCANCODE_J,     Button::A},
    {SDL_SCANCODE_K,     Button::B},
    {SDL_SCANCODE_H,     Button::Start},
    {SDL_SCANCODE_G,     Button::Select},
};

constexpr SDL_Scancode kResetKey = SDL_SCANCODE_R;
constexpr SDL_Scancode kQuitKey = SDL_SCANCODE_ESCAPE;

} // namespace

/// Keyboard input via SDL3 keyboard state
class InputDriverSDL3 : public IInputDriver {
public:
    InputDriverSDL3() = default;
    ~InputDriverSDL3() override { close(); }

    Result init() override {
        if (initialized_) {
            return Result::AlreadyInitialized;
        }
        if (!SDL_InitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
            return Result::DeviceNotFound;
        }
        initialized_ = true;
        quit_ = false;
        last_reset_ = false;
        return Result::Success;
    }

    void close() override {
        if (initialized_) {
            SDL_QuitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS);
            initialized_ = false;
        }
    }

    bool isRunning() const override {
        return initialized_ && !quit_;
    }

    InputState poll() override {
        InputState state;
        if (!initialized_) {
            return state;
        }

        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            switch (event.type) {
                case SDL_EVENT_QUIT:
                case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
                    quit_ = true;
                    break;
                case SDL_EVENT_KEY_DOWN:
                    if (event.key.scancode == kQuitKey) {
                        quit_ = true;
                    }
                    break;
                default:
                    break;
            }
        }

        const bool* keys = SDL_GetKeyboardState(nullptr);
        for (const auto& binding : kBindings) {
            if (keys[binding.scancode]) {
                state.setPressed(binding.button, true);
            }
        }

        bool reset_down = keys[kResetKey];
        state.reset = reset_down && !last_reset_;
        last_reset_ = reset_down;
        state.quit = quit_;
        return state;
    }

    const char* name() const override { return "sdl3"; }

private:
    bool initialized_ = false;
    bool quit_ = false;
    bool last_reset_ = false;
};

} // namespace sdl3

// Factory function
std::unique_ptr<IInputDriver> createInputDriverSDL3(const DriverOptions&) {
    return std::make_unique<sdl3::InputDriverSDL3>();
}

} // namespace apal
