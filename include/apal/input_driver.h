// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Input Driver Interface

#pragma once

#include "apal/types.h"
#include <bitset>
#include <cstddef>
#include <cstdint>

namespace apal {

/// Logical buttons of the emulated console
enum class Button : uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
    A,
    B,
    Start,
    Select
};

inline constexpr size_t kButtonCount = 8;

/// Instantaneous controller state for one tick
///
/// reset and quit are host requests rather than console buttons.
/// reset is edge-triggered: a driver reports it on a single poll only.
struct InputState {
    std::bitset<kButtonCount> buttons;
    bool reset = false;
    bool quit = false;

    bool isPressed(Button b) const {
        return buttons.test(static_cast<size_t>(b));
    }

    void setPressed(Button b, bool pressed) {
        buttons.set(static_cast<size_t>(b), pressed);
    }

    bool anyPressed() const { return buttons.any(); }

    friend bool operator==(const InputState&, const InputState&) = default;
};

/// Input back-end
///
/// poll() returns promptly with the latest known state and never waits
/// for an event.
class IInputDriver {
public:
    virtual ~IInputDriver() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Initialize the input source
    /// @return Success, AlreadyInitialized, DeviceNotFound
    virtual Result init() = 0;

    /// Shutdown the input source (safe to call if not initialized)
    virtual void close() = 0;

    /// False before init, after close, or once the host asked to quit
    virtual bool isRunning() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Polling
    // ═══════════════════════════════════════════════════════════════════════

    /// Latest controller state
    virtual InputState poll() = 0;

    /// Short back-end name for logs
    virtual const char* name() const = 0;
};

/// Convert Button to string for debugging
constexpr const char* toString(Button b) noexcept {
    switch (b) {
        case Button::Up:     return "Up";
        case Button::Down:   return "Down";
        case Button::Left:   return "Left";
        case Button::Right:  return "Right";
        case Button::A:      return "A";
        case Button::B:      return "B";
        case Button::Start:  return "Start";
        case Button::Select: return "Select";
    }
    return "Unknown";
}

} // namespace apal
