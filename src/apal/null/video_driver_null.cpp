// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Null Video Driver

#include "apal/null_drivers.h"

namespace apal {

Result NullVideoDriver::init(uint32_t width, uint32_t height) {
    if (running_) {
        return Result::AlreadyInitialized;
    }
    if (width == 0 || height == 0) {
        return Result::InvalidParameter;
    }
    width_ = width;
    height_ = height;
    frames_rendered_ = 0;
    running_ = true;
    return Result::Success;
}

void NullVideoDriver::close() {
    running_ = false;
    last_frame_.clear();
}

Result NullVideoDriver::render(const RgbFrame& frame) {
    if (!running_) {
        return Result::NotInitialized;
    }
    if (!frame.isValid()) {
        return Result::InvalidParameter;
    }
    if (capture_) {
        last_frame_.assign(frame.pixels.begin(),
                           frame.pixels.begin() + static_cast<std::ptrdiff_t>(frame.pitch()) * frame.height);
    }
    width_ = frame.width;
    height_ = frame.height;
    ++frames_rendered_;
    return Result::Success;
}

} // namespace apal
