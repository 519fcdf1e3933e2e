// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Steady and Virtual Host Clocks

#include "apal/null_drivers.h"
#include <thread>

namespace apal {

// ═══════════════════════════════════════════════════════════════════════════
// SteadyHostClock
// ═══════════════════════════════════════════════════════════════════════════

Result SteadyHostClock::initialize() {
    if (initialized_) {
        return Result::AlreadyInitialized;
    }
    start_ = std::chrono::steady_clock::now();
    initialized_ = true;
    return Result::Success;
}

void SteadyHostClock::shutdown() {
    initialized_ = false;
}

uint64_t SteadyHostClock::getTicksUs() const {
    if (!initialized_) {
        return 0;
    }
    auto elapsed = std::chrono::steady_clock::now() - start_;
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

void SteadyHostClock::sleepUs(uint64_t us) {
    if (us > 0) {
        std::this_thread::sleep_for(std::chrono::microseconds(us));
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// VirtualHostClock
// ═══════════════════════════════════════════════════════════════════════════

Result VirtualHostClock::initialize() {
    if (initialized_) {
        return Result::AlreadyInitialized;
    }
    ticks_us_ = 0;
    initialized_ = true;
    return Result::Success;
}

void VirtualHostClock::shutdown() {
    initialized_ = false;
}

uint64_t VirtualHostClock::getTicksUs() const {
    if (!initialized_) {
        return 0;
    }
    return ticks_us_;
}

void VirtualHostClock::sleepUs(uint64_t us) {
    // Non-blocking; optionally advance virtual time
    ++sleep_calls_;
    total_slept_us_ += us;
    if (auto_advance_on_sleep_ && initialized_) {
        ticks_us_ += us;
    }
}

} // namespace apal
