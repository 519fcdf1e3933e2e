// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Null Input Driver

#include "apal/null_drivers.h"

namespace apal {

Result NullInputDriver::init() {
    if (running_) {
        return Result::AlreadyInitialized;
    }
    poll_count_ = 0;
    running_ = true;
    return Result::Success;
}

void NullInputDriver::close() {
    running_ = false;
}

InputState NullInputDriver::poll() {
    ++poll_count_;
    InputState out = state_;
    // Reset is an edge, not a level
    state_.reset = false;
    return out;
}

} // namespace apal
