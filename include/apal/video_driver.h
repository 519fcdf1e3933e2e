// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Video Driver Interface

#pragma once

#include "apal/types.h"
#include <cstdint>
#include <span>

namespace apal {

/// One converted frame, tightly packed RGB888 (3 bytes per pixel, no padding)
///
/// The pixel memory belongs to the caller and is only valid for the
/// duration of render(). Drivers that need the frame later must copy it.
struct RgbFrame {
    std::span<const uint8_t> pixels;
    uint32_t width = 0;
    uint32_t height = 0;

    /// Bytes per row
    constexpr uint32_t pitch() const noexcept { return width * 3; }

    /// True if dimensions and buffer size agree
    constexpr bool isValid() const noexcept {
        return width > 0 && height > 0 &&
               pixels.size() >= static_cast<size_t>(pitch()) * height;
    }
};

/// Display back-end
///
/// render() must not block longer than one frame interval. A driver that
/// cannot keep up drops the frame instead of stalling the caller.
class IVideoDriver {
public:
    virtual ~IVideoDriver() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Prepare output for frames of the given size
    /// @return Success, InvalidParameter, DeviceNotFound, AlreadyInitialized
    virtual Result init(uint32_t width, uint32_t height) = 0;

    /// Release the display (safe to call if not initialized)
    virtual void close() = 0;

    /// False before init, after close, or once the user closed the display
    virtual bool isRunning() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Output
    // ═══════════════════════════════════════════════════════════════════════

    /// Present one frame
    /// @return Success, NotInitialized, InvalidParameter, DeviceLost
    virtual Result render(const RgbFrame& frame) = 0;

    /// Short back-end name for logs
    virtual const char* name() const = 0;
};

} // namespace apal
