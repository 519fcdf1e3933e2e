// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Null Audio Driver

#include "apal/null_drivers.h"

namespace apal {

NullAudioDriver::NullAudioDriver(const AudioConfig& preferred)
    : config_(preferred) {}

Result NullAudioDriver::init(uint32_t sample_rate) {
    if (running_) {
        return Result::AlreadyInitialized;
    }
    if (sample_rate == 0 || config_.channels == 0 || config_.channels > 2) {
        return Result::InvalidParameter;
    }
    config_.sample_rate = sample_rate;
    blocks_received_ = 0;
    frames_received_ = 0;
    running_ = true;
    return Result::Success;
}

void NullAudioDriver::close() {
    running_ = false;
    last_s16_.clear();
    last_f32_.clear();
}

Result NullAudioDriver::playSamples(const AudioBuffer& buffer) {
    if (!running_) {
        return Result::NotInitialized;
    }
    if (buffer.format != config_.format || buffer.channels != config_.channels) {
        return Result::InvalidParameter;
    }

    if (buffer.format == SampleFormat::S16) {
        last_s16_.assign(buffer.s16.begin(), buffer.s16.end());
    } else {
        last_f32_.assign(buffer.f32.begin(), buffer.f32.end());
    }
    ++blocks_received_;
    frames_received_ += buffer.frameCount();
    return Result::Success;
}

} // namespace apal
