/**
 * @file config.h
 * @brief Runtime configuration, fluent builder and TOML file loader.
 *
 * Configuration is static: it is fixed when a Runtime is constructed.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/error.h"
#include "apal/types.h"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arduplay {

/**
 * @brief Static configuration of one Runtime.
 */
struct RuntimeConfig {
    /// Ticks per second of emulated time to advance
    double target_fps = 60.0;

    /// Hard stop after this many ticks (nullopt = run until stopped)
    std::optional<uint64_t> max_frames;

    /// Maximum snapshots held by the rewind ring (0 disables rewind)
    size_t rewind_capacity = 0;

    /// Capture a rewind snapshot every N ticks
    uint32_t rewind_interval = 1;

    /// Output gain, 0.0 to 1.0, applied before clamping
    float audio_volume = 1.0f;

    /// Depth of the audio driver queue
    uint16_t audio_buffer_ms = 100;

    /// Channel layout and encoding requested from the audio driver
    uint16_t audio_channels = 2;
    apal::SampleFormat audio_format = apal::SampleFormat::S16;

    /// Frames between performance log lines (0 disables)
    uint32_t stats_interval = 300;

    /// Directory for named snapshot slots
    std::filesystem::path snapshot_dir = ".";

    /// Driver selection
    apal::Backend video_backend = apal::Backend::Null;
    apal::Backend audio_backend = apal::Backend::Null;
    apal::Backend input_backend = apal::Backend::Null;
    uint32_t video_scale = 4;

    /**
     * @brief Check every field against its allowed range.
     * @return ConfigValueInvalid listing every violation
     */
    [[nodiscard]] Result<void> validate() const;

    /// Target tick interval in microseconds
    [[nodiscard]] uint64_t tick_interval_us() const noexcept {
        return target_fps > 0.0 ? static_cast<uint64_t>(1'000'000.0 / target_fps) : 0;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// RuntimeConfigBuilder
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Fluent builder for RuntimeConfig.
 *
 * Example:
 * @code
 *   auto config = RuntimeConfigBuilder()
 *       .target_fps(60)
 *       .max_frames(120)
 *       .rewind(256)
 *       .volume(0.5f)
 *       .build();
 * @endcode
 */
class RuntimeConfigBuilder {
public:
    RuntimeConfigBuilder() = default;
    explicit RuntimeConfigBuilder(RuntimeConfig base) : config_(std::move(base)) {}

    // ─────────────────────────────────────────────────────────────────────────
    // Timing
    // ─────────────────────────────────────────────────────────────────────────

    RuntimeConfigBuilder& target_fps(double fps) noexcept {
        config_.target_fps = fps;
        return *this;
    }

    RuntimeConfigBuilder& max_frames(uint64_t frames) noexcept {
        config_.max_frames = frames;
        return *this;
    }

    RuntimeConfigBuilder& unlimited() noexcept {
        config_.max_frames.reset();
        return *this;
    }

    RuntimeConfigBuilder& stats_interval(uint32_t frames) noexcept {
        config_.stats_interval = frames;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Snapshots
    // ─────────────────────────────────────────────────────────────────────────

    RuntimeConfigBuilder& rewind(size_t capacity, uint32_t interval = 1) noexcept {
        config_.rewind_capacity = capacity;
        config_.rewind_interval = interval;
        return *this;
    }

    RuntimeConfigBuilder& snapshot_dir(std::filesystem::path dir) {
        config_.snapshot_dir = std::move(dir);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Audio
    // ─────────────────────────────────────────────────────────────────────────

    RuntimeConfigBuilder& volume(float v) noexcept {
        config_.audio_volume = v;
        return *this;
    }

    RuntimeConfigBuilder& audio_buffer_ms(uint16_t ms) noexcept {
        config_.audio_buffer_ms = ms;
        return *this;
    }

    RuntimeConfigBuilder& audio_format(apal::SampleFormat format, uint16_t channels) noexcept {
        config_.audio_format = format;
        config_.audio_channels = channels;
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Drivers
    // ─────────────────────────────────────────────────────────────────────────

    RuntimeConfigBuilder& video(apal::Backend backend, uint32_t scale = 4) noexcept {
        config_.video_backend = backend;
        config_.video_scale = scale;
        return *this;
    }

    RuntimeConfigBuilder& audio(apal::Backend backend) noexcept {
        config_.audio_backend = backend;
        return *this;
    }

    RuntimeConfigBuilder& input(apal::Backend backend) noexcept {
        config_.input_backend = backend;
        return *this;
    }

    /// All three drivers on one back-end
    RuntimeConfigBuilder& backend(apal::Backend b) noexcept {
        config_.video_backend = b;
        config_.audio_backend = b;
        config_.input_backend = b;
        return *this;
    }

    /// Null drivers everywhere
    RuntimeConfigBuilder& headless() noexcept {
        return backend(apal::Backend::Null);
    }

    // ─────────────────────────────────────────────────────────────────────────
    // Build
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] Result<RuntimeConfig> build() const {
        auto valid = config_.validate();
        if (!valid) {
            return Err(valid.error());
        }
        return Ok(config_);
    }

private:
    RuntimeConfig config_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Config Files
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Parse TOML text on top of base.
 *
 * Keys may sit at the top level or under a [runtime] table. Unknown keys,
 * other tables, malformed TOML and values of the wrong type or range fail
 * with ConfigParseError naming the line. The result is validated.
 *
 * Keys: target_fps, max_frames (0 = unlimited), rewind_capacity,
 * rewind_interval, audio_volume, audio_buffer_ms, audio_channels,
 * audio_format ("s16"|"f32"), stats_interval, snapshot_dir, video, audio,
 * input ("null"|"sdl2"|"sdl3"), video_scale.
 */
[[nodiscard]] Result<RuntimeConfig> parse_runtime_config(std::string_view text,
                                                         RuntimeConfig base = {});

/**
 * @brief Read and parse a TOML config file.
 * @return FileNotFound / FileReadError, or the parse result with the path
 *         as context
 */
[[nodiscard]] Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path,
                                                        RuntimeConfig base = {});

} // namespace arduplay
