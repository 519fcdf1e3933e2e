// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Host Clock Interface

#pragma once

#include "apal/types.h"
#include <cstdint>

namespace apal {

/// Host wall-clock used for tick pacing and FPS measurement
///
/// This is NOT emulated time. The emulated clock advances exactly one
/// frame per tick no matter what this clock reports.
class IHostClock {
public:
    virtual ~IHostClock() = default;

    // ═══════════════════════════════════════════════════════════════════════
    // Lifecycle
    // ═══════════════════════════════════════════════════════════════════════

    /// Initialize the host clock
    /// @return Success, AlreadyInitialized
    virtual Result initialize() = 0;

    /// Shutdown the host clock (safe to call if not initialized)
    virtual void shutdown() = 0;

    virtual bool isInitialized() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Time Query
    // ═══════════════════════════════════════════════════════════════════════

    /// Microseconds since initialization, 0 if not initialized
    /// @note Values increase monotonically (never decrease)
    virtual uint64_t getTicksUs() const = 0;

    // ═══════════════════════════════════════════════════════════════════════
    // Sleep
    // ═══════════════════════════════════════════════════════════════════════

    /// Sleep for approximately us microseconds
    /// @note May sleep longer than requested, but never returns early
    virtual void sleepUs(uint64_t us) = 0;
};

} // namespace apal
