// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - SDL2 Input Driver

#include "apal/input_driver.h"
#include "apal/platform.h"
#include <SDL.h>
#include <memory>

namespace apal {
namespace sdl2 {

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

/// Keyboard input via SDL2 keyboard state
class InputDriverSDL2 : public IInputDriver {
public:
    InputDriverSDL2() = default;
    ~InputDriverSDL2() override { close(); }

    Result init() override {
        if (initialized_) {
            return Result::AlreadyInitialized;
        }
        // Keyboard events are delivered by the video subsystem
        if (SDL_InitSubSystem(SDL_INIT_VIDEO | SDL_INIT_EVENTS) != 0) {
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
            if (event.type == SDL_QUIT) {
                quit_ = true;
            } else if (event.type == SDL_KEYDOWN &&
                       event.key.keysym.scancode == kQuitKey) {
                quit_ = true;
            }
        }

        const Uint8* keys = SDL_GetKeyboardState(nullptr);
        for (const auto& binding : kBindings) {
            if (keys[binding.scancode]) {
                state.setPressed(binding.button, true);
            }
        }

        bool reset_down = keys[kResetKey] != 0;
        state.reset = reset_down && !last_reset_;
        last_reset_ = reset_down;
        state.quit = quit_;
        return state;
    }

    const char* name() const override { return "sdl2"; }

private:
    bool initialized_ = false;
    bool quit_ = false;
    bool last_reset_ = false;
};

} // namespace sdl2

// Factory function
std::unique_ptr<IInputDriver> createInputDriverSDL2(const DriverOptions&) {
    return std::make_unique<sdl2::InputDriverSDL2>();
}

} // namespace apal
