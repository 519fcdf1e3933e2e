// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Arduplay Platform Abstraction Layer - Driver Factory Implementation

#include "apal/platform.h"
#include "apal/null_drivers.h"

namespace apal {

// Forward declarations for SDL2 factory functions (when available)
#if defined(APAL_HAS_SDL2)
std::unique_ptr<IVideoDriver> createVideoDriverSDL2(const DriverOptions& options);
std::unique_ptr<IAudioDriver> createAudioDriverSDL2(const DriverOptions& options);
std::unique_ptr<IInputDriver> createInputDriverSDL2(const DriverOptions& options);
std::unique_ptr<IHostClock> createHostClockSDL2();
#endif

// Forward declarations for SDL3 factory functions (when available)
#if defined(APAL_HAS_SDL3)
std::unique_ptr<IVideoDriver> createVideoDriverSDL3(const DriverOptions& options);
std::unique_ptr<IAudioDriver> createAudioDriverSDL3(const DriverOptions& options);
std::unique_ptr<IInputDriver> createInputDriverSDL3(const DriverOptions& options);
std::unique_ptr<IHostClock> createHostClockSDL3();
#endif

bool isBackendAvailable(Backend backend) noexcept {
    switch (backend) {
        case Backend::Null:
            return true;
        case Backend::SDL2:
#if defined(APAL_HAS_SDL2)
            return true;
#else
            return false;
#endif
        case Backend::SDL3:
#if defined(APAL_HAS_SDL3)
            return true;
#else
            return false;
#endif
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════
// Factories
// ═══════════════════════════════════════════════════════════════════════════

std::unique_ptr<IVideoDriver> createVideoDriver(Backend backend,
                                                const DriverOptions& options) {
    switch (backend) {
        case Backend::Null:
            return std::make_unique<NullVideoDriver>();
        case Backend::SDL2:
#if defined(APAL_HAS_SDL2)
            return createVideoDriverSDL2(options);
#else
            break;
#endif
        case Backend::SDL3:
#if defined(APAL_HAS_SDL3)
            return createVideoDriverSDL3(options);
#else
            break;
#endif
    }
    (void)options;
    return nullptr;
}

std::unique_ptr<IAudioDriver> createAudioDriver(Backend backend,
                                                const DriverOptions& options) {
    switch (backend) {
        case Backend::Null: {
            AudioConfig preferred{};
            preferred.channels = options.audio_channels;
            preferred.format = options.audio_format;
            preferred.buffer_ms = options.audio_buffer_ms;
            return std::make_unique<NullAudioDriver>(preferred);
        }
        case Backend::SDL2:
#if defined(APAL_HAS_SDL2)
            return createAudioDriverSDL2(options);
#else
            break;
#endif
        case Backend::SDL3:
#if defined(APAL_HAS_SDL3)
            return createAudioDriverSDL3(options);
#else
            break;
#endif
    }
    return nullptr;
}

std::unique_ptr<IInputDriver> createInputDriver(Backend backend,
                                                const DriverOptions& options) {
    switch (backend) {
        case Backend::Null:
            return std::make_unique<NullInputDriver>();
        case Backend::SDL2:
#if defined(APAL_HAS_SDL2)
            return createInputDriverSDL2(options);
#else
            break;
#endif
        case Backend::SDL3:
#if defined(APAL_HAS_SDL3)
            return createInputDriverSDL3(options);
#else
            break;
#endif
    }
    (void)options;
    return nullptr;
}

std::unique_ptr<IHostClock> createHostClock(Backend backend) {
    switch (backend) {
        case Backend::Null:
            return std::make_unique<SteadyHostClock>();
        case Backend::SDL2:
#if defined(APAL_HAS_SDL2)
            return createHostClockSDL2();
#else
            break;
#endif
        case Backend::SDL3:
#if defined(APAL_HAS_SDL3)
            return createHostClockSDL3();
#else
            break;
#endif
    }
    return nullptr;
}

} // namespace apal
