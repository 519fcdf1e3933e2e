// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Driver Factories
//
// Back-ends are chosen explicitly per call. There is no process-wide
// platform state: every driver owns what it opens, so several runtimes
// can coexist in one process.

#pragma once

#include "apal/audio_driver.h"
#include "apal/host_clock.h"
#include "apal/input_driver.h"
#include "apal/types.h"
#include "apal/video_driver.h"
#include <memory>

namespace apal {

/// Options forwarded to drivers at construction
struct DriverOptions {
    const char* window_title = "Arduplay";
    uint32_t video_scale = 4;                       // Window pixels per frame pixel
    uint16_t audio_channels = 2;
    SampleFormat audio_format = SampleFormat::S16;
    uint16_t audio_buffer_ms = 100;
};

/// Check if a back-end was compiled into this build
bool isBackendAvailable(Backend backend) noexcept;

/// Create a video driver
/// @return Driver, or nullptr if the back-end is not compiled in
std::unique_ptr<IVideoDriver> createVideoDriver(Backend backend,
                                                const DriverOptions& options = {});

/// Create an audio driver
/// @return Driver, or nullptr if the back-end is not compiled in
std::unique_ptr<IAudioDriver> createAudioDriver(Backend backend,
                                                const DriverOptions& options = {});

/// Create an input driver
/// @return Driver, or nullptr if the back-end is not compiled in
std::unique_ptr<IInputDriver> createInputDriver(Backend backend,
                                                const DriverOptions& options = {});

/// Create a host clock. Backend::Null yields a steady wall clock.
/// @return Clock, or nullptr if the back-end is not compiled in
std::unique_ptr<IHostClock> createHostClock(Backend backend);

} // namespace apal
