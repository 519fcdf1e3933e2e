/**
 * @file libretro_core.h
 * @brief Production CoreFactory: libretro cores loaded with dlopen.
 *
 * Only available when the build found libretro.h (ARDUPLAY_HAS_LIBRETRO).
 * Without it the factory still exists and reports CoreLoadError, so hosts
 * need no conditional code.
 *
 * Libretro callbacks are plain C function pointers with no userdata. The
 * core object routes them through a thread-local "active instance" that is
 * set for the duration of each call into the core, so several cores may
 * run on different threads. Two instances of the same shared object share
 * that object's globals: load each core file at most once per process.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/core.h"

#include <filesystem>

namespace arduplay {

struct LibretroOptions {
    /// Reported for RETRO_ENVIRONMENT_GET_SYSTEM_DIRECTORY (empty = content dir)
    std::filesystem::path system_dir;

    /// Reported for RETRO_ENVIRONMENT_GET_SAVE_DIRECTORY (empty = content dir)
    std::filesystem::path save_dir;
};

/// Pixel format of a libretro core until it sends RETRO_ENVIRONMENT_SET_PIXEL_FORMAT
inline constexpr PixelFormat kLibretroDefaultPixelFormat = PixelFormat::RGB1555;

/// Whether this build can load libretro cores
[[nodiscard]] bool libretro_available() noexcept;

/**
 * @brief Factory that loads a libretro shared object per core_path.
 *
 * Missing files, missing entry points and an API version mismatch fail
 * with CoreLoadError.
 */
[[nodiscard]] CoreFactory make_libretro_factory(LibretroOptions options = {});

} // namespace arduplay
