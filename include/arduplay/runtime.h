/**
 * @file runtime.h
 * @brief The frame pump: one session, its drivers and the pacing clock.
 *
 * Each tick polls input, advances the core exactly one frame, converts and
 * hands the frame and samples to the drivers, then sleeps off what is left
 * of the frame interval. Running late never skips frames.
 *
 * Driver failures are absorbed (logged once, counted as drops). A core
 * failure stops the loop and surfaces as StepError naming the phase.
 *
 * Example:
 * @code
 *   auto config = RuntimeConfigBuilder().max_frames(600).build();
 *   Runtime runtime(*config, std::make_unique<SessionBridge>(make_libretro_factory()));
 *   if (auto r = runtime.start("arduous_libretro.so", "game.hex"); !r) { ... }
 *   auto result = runtime.run();
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/config.h"
#include "arduplay/error.h"
#include "arduplay/format_converter.h"
#include "arduplay/logging.h"
#include "arduplay/session_bridge.h"
#include "arduplay/snapshot_manager.h"
#include "apal/audio_driver.h"
#include "apal/host_clock.h"
#include "apal/input_driver.h"
#include "apal/video_driver.h"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace arduplay {

enum class RuntimeState {
    Idle,       ///< Constructed, start() not yet called
    Running,
    Stopped,    ///< Stop requested, max_frames reached or a driver closed
    Failed      ///< The core failed; see the error returned by tick()/run()
};

[[nodiscard]] constexpr const char* runtime_state_name(RuntimeState s) noexcept {
    switch (s) {
        case RuntimeState::Idle:    return "Idle";
        case RuntimeState::Running: return "Running";
        case RuntimeState::Stopped: return "Stopped";
        case RuntimeState::Failed:  return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Counters sampled by stats().
 */
struct RuntimeStats {
    uint64_t frame_count = 0;
    double fps = 0.0;               ///< Smoothed instantaneous rate
    double average_fps = 0.0;       ///< frame_count / elapsed since start()
    uint64_t elapsed_us = 0;
    uint64_t video_drops = 0;       ///< Frames the video driver did not take
    uint64_t audio_drops = 0;       ///< Blocks the audio driver did not take
    uint64_t input_failures = 0;    ///< Polls that failed (no buttons latched)
    uint64_t late_ticks = 0;        ///< Ticks that overran the frame interval
    uint64_t rewind_captures = 0;
    uint64_t resets = 0;
};

class Runtime {
public:
    /**
     * @param bridge Session to drive; must not be null
     * @param clock  Pacing clock; nullptr selects one matching the video
     *               back-end (a steady wall clock for Null)
     */
    Runtime(RuntimeConfig config,
            std::unique_ptr<SessionBridge> bridge,
            std::unique_ptr<apal::IHostClock> clock = nullptr);
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Driver Injection
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Replace the video driver.
     *
     * Before start() the driver is used instead of one created from the
     * configured back-end. While Running the current driver is closed and
     * this one initialized in its place, with the usual null fallback. Call
     * between ticks, from the thread that ticks.
     *
     * @return DriverInitError only if the null fallback fails as well
     */
    Result<void> set_video_driver(std::unique_ptr<apal::IVideoDriver> driver);

    /// As set_video_driver(); the converter follows the new driver's format
    Result<void> set_audio_driver(std::unique_ptr<apal::IAudioDriver> driver);

    Result<void> set_input_driver(std::unique_ptr<apal::IInputDriver> driver);

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Load the session, bring up drivers and start the bridge.
     *
     * A driver that cannot be created or initialized is replaced by its
     * null variant (DriverInitError is logged, not returned).
     *
     * @return ConfigValueInvalid, CoreLoadError, ContentLoadError,
     *         InvalidState if already started
     */
    Result<void> start(const std::filesystem::path& core_path,
                       const std::filesystem::path& content_path);

    /**
     * @brief Run one tick.
     *
     * On success the runtime is Running, or Stopped if this tick reached
     * max_frames or a driver closed. On StepError it is Failed.
     *
     * @return InvalidState unless Running; StepError with phase context
     */
    Result<void> tick();

    /**
     * @brief Tick until stopped, then shut down.
     *
     * @return Ok on a clean stop, otherwise the error that stopped the loop
     */
    Result<void> run();

    /**
     * @brief Ask run() to stop at the next tick boundary.
     *
     * Lock-free; safe from other threads and signal handlers.
     */
    void request_stop() noexcept { stop_requested_.store(true, std::memory_order_relaxed); }

    [[nodiscard]] bool stop_requested() const noexcept {
        return stop_requested_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Close drivers in reverse order, then stop and clean up the
     *        session. Runs once; later calls do nothing.
     */
    void shutdown() noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] RuntimeState state() const noexcept { return state_; }
    [[nodiscard]] bool is_running() const noexcept { return state_ == RuntimeState::Running; }
    [[nodiscard]] uint64_t frame_count() const noexcept { return stats_.frame_count; }
    [[nodiscard]] const RuntimeStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const RuntimeConfig& config() const noexcept { return config_; }

    [[nodiscard]] SessionBridge& bridge() noexcept { return *bridge_; }

    /// nullptr before start()
    [[nodiscard]] SnapshotManager* snapshots() noexcept { return snapshots_.get(); }

    [[nodiscard]] apal::IVideoDriver* video_driver() noexcept { return video_.get(); }
    [[nodiscard]] apal::IAudioDriver* audio_driver() noexcept { return audio_.get(); }
    [[nodiscard]] apal::IInputDriver* input_driver() noexcept { return input_.get(); }

    /// Distinct driver errors seen, and how many repeats were not logged
    [[nodiscard]] const RepeatFilter& driver_errors() const noexcept { return driver_errors_; }

private:
    Result<void> start_drivers();
    Result<void> init_video();
    Result<void> init_audio();
    Result<void> init_input();
    [[nodiscard]] apal::AudioConfig null_audio_config() const;
    void report_driver_error(const char* driver, const std::string& what);

    apal::InputState poll_input();
    Result<void> present_video();
    Result<void> present_audio();
    void capture_rewind();
    void update_timing();
    void log_stats() const;
    Result<void> fail(Error error, const char* phase);

    RuntimeConfig config_;
    std::unique_ptr<SessionBridge> bridge_;
    std::unique_ptr<apal::IHostClock> clock_;
    std::unique_ptr<apal::IVideoDriver> video_;
    std::unique_ptr<apal::IAudioDriver> audio_;
    std::unique_ptr<apal::IInputDriver> input_;
    std::unique_ptr<SnapshotManager> snapshots_;

    RuntimeState state_ = RuntimeState::Idle;
    std::atomic<bool> stop_requested_{false};
    bool shut_down_ = false;

    // Per-tick scratch, reused to keep the hot path allocation-free
    RgbImage image_;
    SampleBlock samples_;
    AudioTarget audio_target_;

    RuntimeStats stats_;
    uint64_t ticks_ = 0;
    uint64_t start_us_ = 0;
    uint64_t last_tick_end_us_ = 0;
    uint64_t interval_us_ = 0;
    RepeatFilter driver_errors_;
    RepeatFilter rewind_errors_;
};

} // namespace arduplay
