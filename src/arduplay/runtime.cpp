/**
 * @file runtime.cpp
 * @brief Frame pump implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/runtime.h"
#include "arduplay/gsl.hpp"
#include "apal/null_drivers.h"
#include "apal/platform.h"

#include <exception>

namespace arduplay {

namespace {

constexpr const char* kLogSubsys = "RUNTIME";

// Used when a core does not report a sample rate
constexpr uint32_t kFallbackSampleRate = 44100;

// Weight of the newest tick in the smoothed fps
constexpr double kFpsSmoothing = 0.1;

std::string describe(apal::Result result) {
    return std::string(apal::toString(result));
}

/// Keep a created driver, or substitute a null one if the back-end is missing
template<typename Driver, typename MakeNull>
std::unique_ptr<Driver> created_or_null(std::unique_ptr<Driver> driver, const char* kind,
                                        apal::Backend backend, MakeNull make_null) {
    if (driver) {
        return driver;
    }
    const Error error(ErrorCode::DriverInitError,
                      std::format("{} back-end '{}' is not available; using null",
                                  kind, apal::toString(backend)));
    ARDUPLAY_LOG_WARN(kLogSubsys, "{}", error.message());
    return make_null();
}

/**
 * Initialize driver; if it fails or throws, replace it with a null driver
 * and initialize that. Only a failing null driver is an error.
 */
template<typename Driver, typename Init, typename MakeNull>
Result<void> init_or_null(std::unique_ptr<Driver>& driver, const char* kind,
                          Init init, MakeNull make_null) {
    std::string why;
    try {
        const apal::Result r = init(*driver);
        if (apal::succeeded(r)) {
            return Ok();
        }
        why = describe(r);
    } catch (const std::exception& e) {
        why = e.what();
    }

    const Error error(ErrorCode::DriverInitError,
                      std::format("{} driver '{}' failed to initialize ({}); using null",
                                  kind, driver->name(), why));
    ARDUPLAY_LOG_WARN(kLogSubsys, "{}", error.message());

    driver = make_null();
    const apal::Result r = init(*driver);
    if (apal::failed(r)) {
        return make_error_fmt(ErrorCode::DriverInitError, "null {} driver: {}", kind, describe(r));
    }
    return Ok();
}

/// Close a driver; a throwing close() is logged, never propagated
template<typename Driver>
void close_driver(const std::unique_ptr<Driver>& driver, const char* kind) noexcept {
    if (!driver) {
        return;
    }
    try {
        driver->close();
    } catch (const std::exception& e) {
        ARDUPLAY_LOG_WARN(kLogSubsys, "{} driver '{}' failed to close: {}",
                          kind, driver->name(), e.what());
    }
}

} // anonymous namespace

Runtime::Runtime(RuntimeConfig config,
                 std::unique_ptr<SessionBridge> bridge,
                 std::unique_ptr<apal::IHostClock> clock)
    : config_(std::move(config))
    , bridge_(std::move(bridge))
    , clock_(std::move(clock))
{
    gsl_Expects(bridge_ != nullptr);
}

Runtime::~Runtime() {
    shutdown();
}

Result<void> Runtime::set_video_driver(std::unique_ptr<apal::IVideoDriver> driver) {
    gsl_Expects(driver != nullptr);
    gsl_Expects(state_ == RuntimeState::Idle || state_ == RuntimeState::Running);
    if (state_ == RuntimeState::Running) {
        close_driver(video_, "video");
    }
    video_ = std::move(driver);
    return state_ == RuntimeState::Running ? init_video() : Ok();
}

Result<void> Runtime::set_audio_driver(std::unique_ptr<apal::IAudioDriver> driver) {
    gsl_Expects(driver != nullptr);
    gsl_Expects(state_ == RuntimeState::Idle || state_ == RuntimeState::Running);
    if (state_ == RuntimeState::Running) {
        close_driver(audio_, "audio");
    }
    audio_ = std::move(driver);
    return state_ == RuntimeState::Running ? init_audio() : Ok();
}

Result<void> Runtime::set_input_driver(std::unique_ptr<apal::IInputDriver> driver) {
    gsl_Expects(driver != nullptr);
    gsl_Expects(state_ == RuntimeState::Idle || state_ == RuntimeState::Running);
    if (state_ == RuntimeState::Running) {
        close_driver(input_, "input");
    }
    input_ = std::move(driver);
    return state_ == RuntimeState::Running ? init_input() : Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Runtime::start(const std::filesystem::path& core_path,
                            const std::filesystem::path& content_path) {
    if (state_ != RuntimeState::Idle) {
        return make_error_fmt(ErrorCode::InvalidState, "start() from {}",
                              runtime_state_name(state_));
    }
    ARDUPLAY_TRY_VOID(config_.validate());

    auto loaded = bridge_->initialize(core_path, content_path);
    if (!loaded) {
        state_ = RuntimeState::Failed;
        return Err(loaded.error().with_context("initialize"));
    }

    if (!clock_) {
        clock_ = apal::createHostClock(config_.video_backend);
        if (!clock_) {
            clock_ = apal::createHostClock(apal::Backend::Null);
        }
    }
    if (!clock_->isInitialized()) {
        const apal::Result clock_result = clock_->initialize();
        if (apal::failed(clock_result)) {
            state_ = RuntimeState::Failed;
            return make_error_fmt(ErrorCode::DriverInitError, "host clock: {}",
                                  describe(clock_result));
        }
    }

    auto drivers = start_drivers();
    if (!drivers) {
        state_ = RuntimeState::Failed;
        return drivers;
    }

    auto started = bridge_->start();
    if (!started) {
        state_ = RuntimeState::Failed;
        return Err(started.error().with_context("start"));
    }

    snapshots_ = std::make_unique<SnapshotManager>(
        *bridge_, SnapshotOptions{config_.snapshot_dir, config_.rewind_capacity});

    interval_us_ = config_.tick_interval_us();
    start_us_ = clock_->getTicksUs();
    last_tick_end_us_ = start_us_;
    stats_ = {};
    ticks_ = 0;
    state_ = RuntimeState::Running;

    ARDUPLAY_LOG_INFO(kLogSubsys, "Running '{}' at {:.1f} fps (video: {}, audio: {}, input: {})",
                      bridge_->content_id(), config_.target_fps,
                      video_->name(), audio_->name(), input_->name());
    if (config_.max_frames) {
        ARDUPLAY_LOG_INFO(kLogSubsys, "Stopping after {} frames", *config_.max_frames);
    }
    return Ok();
}

apal::AudioConfig Runtime::null_audio_config() const {
    apal::AudioConfig config;
    config.channels = config_.audio_channels;
    config.format = config_.audio_format;
    config.buffer_ms = config_.audio_buffer_ms;
    return config;
}

Result<void> Runtime::start_drivers() {
    apal::DriverOptions options;
    options.video_scale = config_.video_scale;
    options.audio_channels = config_.audio_channels;
    options.audio_format = config_.audio_format;
    options.audio_buffer_ms = config_.audio_buffer_ms;

    if (!video_) {
        video_ = created_or_null(apal::createVideoDriver(config_.video_backend, options),
                                 "video", config_.video_backend,
                                 [] { return std::make_unique<apal::NullVideoDriver>(); });
    }
    if (!audio_) {
        audio_ = created_or_null(apal::createAudioDriver(config_.audio_backend, options),
                                 "audio", config_.audio_backend,
                                 [&] { return std::make_unique<apal::NullAudioDriver>(null_audio_config()); });
    }
    if (!input_) {
        input_ = created_or_null(apal::createInputDriver(config_.input_backend, options),
                                 "input", config_.input_backend,
                                 [] { return std::make_unique<apal::NullInputDriver>(); });
    }

    // Same order as teardown, reversed
    ARDUPLAY_TRY_VOID(init_video());
    ARDUPLAY_TRY_VOID(init_audio());
    ARDUPLAY_TRY_VOID(init_input());
    return Ok();
}

Result<void> Runtime::init_video() {
    const CoreInfo& info = bridge_->info();
    return init_or_null(video_, "video",
        [&](apal::IVideoDriver& d) { return d.init(info.width, info.height); },
        [] { return std::make_unique<apal::NullVideoDriver>(); });
}

Result<void> Runtime::init_audio() {
    const uint32_t rate = bridge_->info().sample_rate != 0 ? bridge_->info().sample_rate
                                                           : kFallbackSampleRate;
    ARDUPLAY_TRY_VOID(init_or_null(audio_, "audio",
        [&](apal::IAudioDriver& d) { return d.init(rate); },
        [&] { return std::make_unique<apal::NullAudioDriver>(null_audio_config()); }));

    // Convert to whatever the driver settled on
    const apal::AudioConfig actual = audio_->getConfig();
    audio_target_.format = actual.format;
    audio_target_.channels = actual.channels;
    audio_target_.volume = config_.audio_volume;
    return Ok();
}

Result<void> Runtime::init_input() {
    return init_or_null(input_, "input",
        [](apal::IInputDriver& d) { return d.init(); },
        [] { return std::make_unique<apal::NullInputDriver>(); });
}

Result<void> Runtime::run() {
    if (state_ != RuntimeState::Running) {
        return make_error_fmt(ErrorCode::InvalidState, "run() from {}",
                              runtime_state_name(state_));
    }

    Result<void> result = Ok();
    while (state_ == RuntimeState::Running) {
        if (stop_requested()) {
            ARDUPLAY_LOG_INFO(kLogSubsys, "Stop requested");
            state_ = RuntimeState::Stopped;
            break;
        }
        result = tick();
        if (!result) {
            break;
        }
    }

    shutdown();
    return result;
}

void Runtime::shutdown() noexcept {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    // Reverse acquisition order
    close_driver(input_, "input");
    close_driver(audio_, "audio");
    close_driver(video_, "video");

    bridge_->stop();
    bridge_->cleanup();

    if (state_ == RuntimeState::Running) {
        state_ = RuntimeState::Stopped;
    }
    if (stats_.frame_count > 0) {
        ARDUPLAY_LOG_INFO(kLogSubsys,
                          "Stopped after {} frames ({:.1f} fps average, {} late, "
                          "{} video / {} audio drops, {} input failures)",
                          stats_.frame_count, stats_.average_fps, stats_.late_ticks,
                          stats_.video_drops, stats_.audio_drops, stats_.input_failures);
    }
    if (driver_errors_.suppressed() > 0) {
        ARDUPLAY_LOG_INFO(kLogSubsys, "{} repeated driver error(s) were not logged",
                          driver_errors_.suppressed());
    }
    if (clock_) {
        clock_->shutdown();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Tick
// ─────────────────────────────────────────────────────────────────────────────

Result<void> Runtime::tick() {
    if (state_ != RuntimeState::Running) {
        return make_error_fmt(ErrorCode::InvalidState, "tick() from {}",
                              runtime_state_name(state_));
    }

    const uint64_t tick_start = clock_->getTicksUs();
    ++ticks_;

    // Input
    const apal::InputState input = poll_input();
    if (input.quit) {
        ARDUPLAY_LOG_INFO(kLogSubsys, "Quit requested by input driver");
        state_ = RuntimeState::Stopped;
        return Ok();
    }
    if (input.reset) {
        auto reset = bridge_->reset();
        if (!reset) {
            return fail(reset.error(), "reset");
        }
        ++stats_.resets;
    }
    if (auto latched = bridge_->set_input_state(input); !latched) {
        return fail(latched.error(), "set_input_state");
    }

    // Core
    if (auto stepped = bridge_->run_frame(); !stepped) {
        return fail(stepped.error(), "run_frame");
    }
    ++stats_.frame_count;

    // Output
    ARDUPLAY_TRY_VOID(present_video());
    ARDUPLAY_TRY_VOID(present_audio());

    if (config_.rewind_capacity > 0 && stats_.frame_count % config_.rewind_interval == 0) {
        capture_rewind();
    }

    // Pacing: sleep off the rest of the interval, never catch up
    const uint64_t elapsed = clock_->getTicksUs() - tick_start;
    if (elapsed < interval_us_) {
        clock_->sleepUs(interval_us_ - elapsed);
    } else if (elapsed > interval_us_) {
        ++stats_.late_ticks;
    }
    update_timing();

    if (config_.stats_interval > 0 && stats_.frame_count % config_.stats_interval == 0) {
        log_stats();
    }

    if (config_.max_frames && stats_.frame_count >= *config_.max_frames) {
        ARDUPLAY_LOG_DEBUG(kLogSubsys, "Reached max_frames ({})", *config_.max_frames);
        state_ = RuntimeState::Stopped;
    } else if (!video_->isRunning() || !input_->isRunning()) {
        ARDUPLAY_LOG_INFO(kLogSubsys, "Driver closed; stopping");
        state_ = RuntimeState::Stopped;
    }
    return Ok();
}

apal::InputState Runtime::poll_input() {
    try {
        return input_->poll();
    } catch (const std::exception& e) {
        ++stats_.input_failures;
        report_driver_error(input_->name(), e.what());
    }
    return {};
}

Result<void> Runtime::present_video() {
    auto frame = bridge_->get_frame();
    if (!frame) {
        return fail(frame.error(), "get_frame");
    }

    // A malformed frame from the core costs one frame of output, not the session
    auto converted = to_rgb888(*frame, image_);
    if (!converted) {
        ++stats_.video_drops;
        report_driver_error("video", converted.error().message());
        return Ok();
    }

    try {
        const apal::Result r = video_->render(image_.view());
        if (apal::failed(r)) {
            ++stats_.video_drops;
            report_driver_error(video_->name(), "render: " + describe(r));
        }
    } catch (const std::exception& e) {
        ++stats_.video_drops;
        report_driver_error(video_->name(), e.what());
    }
    return Ok();
}

Result<void> Runtime::present_audio() {
    auto audio = bridge_->get_audio_samples();
    if (!audio) {
        return fail(audio.error(), "get_audio_samples");
    }
    if (audio->sample_count() == 0) {
        return Ok();
    }

    auto converted = to_driver_format(*audio, audio_target_, samples_);
    if (!converted) {
        ++stats_.audio_drops;
        report_driver_error("audio", converted.error().message());
        return Ok();
    }

    try {
        const apal::Result r = audio_->playSamples(samples_.view());
        if (apal::failed(r)) {
            ++stats_.audio_drops;
            report_driver_error(audio_->name(), "playSamples: " + describe(r));
        }
    } catch (const std::exception& e) {
        ++stats_.audio_drops;
        report_driver_error(audio_->name(), e.what());
    }
    return Ok();
}

void Runtime::capture_rewind() {
    auto captured = snapshots_->capture();
    if (captured) {
        ++stats_.rewind_captures;
        return;
    }
    if (rewind_errors_.first_occurrence(captured.error().message())) {
        ARDUPLAY_LOG_WARN(kLogSubsys, "Rewind capture failed: {}", captured.error().message());
    }
}

void Runtime::update_timing() {
    const uint64_t now = clock_->getTicksUs();
    const uint64_t tick_us = now - last_tick_end_us_;
    last_tick_end_us_ = now;

    if (tick_us > 0) {
        const double instant = 1'000'000.0 / static_cast<double>(tick_us);
        stats_.fps = stats_.fps == 0.0
            ? instant
            : stats_.fps + kFpsSmoothing * (instant - stats_.fps);
    }

    stats_.elapsed_us = now - start_us_;
    if (stats_.elapsed_us > 0) {
        stats_.average_fps = static_cast<double>(stats_.frame_count) * 1'000'000.0 /
                             static_cast<double>(stats_.elapsed_us);
    }
}

void Runtime::log_stats() const {
    ARDUPLAY_LOG_INFO(kLogSubsys, "Frame {}: {:.1f} fps (average {:.1f}), {} late, {} video / {} audio drops",
                      stats_.frame_count, stats_.fps, stats_.average_fps, stats_.late_ticks,
                      stats_.video_drops, stats_.audio_drops);
}

void Runtime::report_driver_error(const char* driver, const std::string& what) {
    std::string key = std::format("{}: {}", driver, what);
    if (driver_errors_.first_occurrence(key)) {
        ARDUPLAY_LOG_WARN(kLogSubsys, "{}",
                          Error(ErrorCode::DriverRuntimeError, std::move(key)).message());
    }
}

Result<void> Runtime::fail(Error error, const char* phase) {
    state_ = RuntimeState::Failed;
    Error annotated = error.with_context(std::format("tick {}: {}", ticks_, phase));
    ARDUPLAY_LOG_ERROR(kLogSubsys, "{}", annotated.message());
    return Err(std::move(annotated));
}

} // namespace arduplay
