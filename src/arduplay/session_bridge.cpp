/**
 * @file session_bridge.cpp
 * @brief SessionBridge implementation.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/session_bridge.h"
#include "arduplay/logging.h"

#include <exception>
#include <system_error>

namespace arduplay {

namespace {

constexpr const char* kLogSubsys = "BRIDGE";

/**
 * Run fn against the core, turning any exception into an Error of the
 * given code. Exceptions never cross the bridge.
 */
template<typename Fn>
Result<void> guarded(ErrorCode code, const char* what, Fn&& fn) {
    try {
        fn();
        return Ok();
    } catch (const std::exception& e) {
        return make_error_fmt(code, "{}: {}", what, e.what());
    } catch (...) {
        return make_error_fmt(code, "{}: non-standard exception", what);
    }
}

} // anonymous namespace

SessionBridge::SessionBridge(CoreFactory factory)
    : factory_(std::move(factory))
{}

SessionBridge::~SessionBridge() {
    cleanup();
}

bool SessionBridge::has_core() const noexcept {
    return core_ != nullptr &&
           (state_ == SessionState::Initialized ||
            state_ == SessionState::Running ||
            state_ == SessionState::Stopped);
}

void SessionBridge::fail(const Error& error) {
    state_ = SessionState::Failed;
    ARDUPLAY_LOG_ERROR(kLogSubsys, "{}", error.format());
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

Result<void> SessionBridge::initialize(const std::filesystem::path& core_path,
                                       const std::filesystem::path& content_path) {
    if (state_ == SessionState::Failed) {
        return make_error(ErrorCode::InvalidState,
                          "session failed; cleanup() is required before initialize()");
    }
    if (state_ != SessionState::Uninitialized) {
        return Ok();
    }
    if (!factory_) {
        return make_error(ErrorCode::CoreLoadError, "no core factory configured");
    }

    // Core
    std::unique_ptr<ICore> core;
    try {
        auto created = factory_(core_path);
        if (!created) {
            if (created.error().is(ErrorCode::CoreLoadError)) {
                return Err(created.error());
            }
            return make_error_fmt(ErrorCode::CoreLoadError, "{}: {}",
                                  core_path.string(), created.error().message());
        }
        core = std::move(created).value();
    } catch (const std::exception& e) {
        return make_error_fmt(ErrorCode::CoreLoadError, "{}: {}", core_path.string(), e.what());
    }
    if (!core) {
        return make_error_fmt(ErrorCode::CoreLoadError, "{}: factory returned no core",
                              core_path.string());
    }

    // Content
    std::error_code ec;
    if (!std::filesystem::is_regular_file(content_path, ec)) {
        return make_error_fmt(ErrorCode::ContentLoadError, "content '{}' not found",
                              content_path.string());
    }

    Result<void> loaded = Ok();
    auto call = guarded(ErrorCode::ContentLoadError, "load_content", [&] {
        loaded = core->load_content(content_path);
    });
    if (!call) {
        return Err(call.error());
    }
    if (!loaded) {
        if (loaded.error().is(ErrorCode::ContentLoadError)) {
            return Err(loaded.error());
        }
        return make_error_fmt(ErrorCode::ContentLoadError, "{}: {}",
                              content_path.string(), loaded.error().message());
    }

    CoreInfo info;
    auto queried = guarded(ErrorCode::ContentLoadError, "info", [&] { info = core->info(); });
    if (!queried) {
        return Err(queried.error());
    }
    if (info.width == 0 || info.height == 0) {
        return make_error(ErrorCode::ContentLoadError, "core reported an empty framebuffer");
    }

    core_ = std::move(core);
    info_ = std::move(info);
    core_path_ = core_path;
    content_path_ = content_path;
    frames_run_ = 0;
    latched_input_ = {};
    state_ = SessionState::Initialized;

    ARDUPLAY_LOG_INFO(kLogSubsys, "Loaded '{}' into {} {} ({}x{} {}, {:.2f} fps, {} Hz x{})",
                      content_id(), info_.name, info_.version, info_.width, info_.height,
                      pixel_format_name(info_.pixel_format), info_.fps,
                      info_.sample_rate, info_.audio_channels);
    return Ok();
}

Result<void> SessionBridge::start() {
    if (state_ == SessionState::Running) {
        return Ok();
    }
    if (state_ != SessionState::Initialized) {
        return make_error_fmt(ErrorCode::InvalidState, "start() from {}",
                              session_state_name(state_));
    }
    state_ = SessionState::Running;
    return Ok();
}

void SessionBridge::stop() noexcept {
    if (state_ == SessionState::Running) {
        state_ = SessionState::Stopped;
    }
}

void SessionBridge::cleanup() noexcept {
    if (core_) {
        // A failed core may throw again while unloading; it is destroyed anyway
        auto unloaded = guarded(ErrorCode::Unknown, "unload", [&] { core_->unload(); });
        if (!unloaded) {
            ARDUPLAY_LOG_WARN(kLogSubsys, "{}", unloaded.error().message());
        }
        core_.reset();
    }
    state_ = SessionState::Uninitialized;
    info_ = {};
    frames_run_ = 0;
    latched_input_ = {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Per-Tick
// ─────────────────────────────────────────────────────────────────────────────

Result<void> SessionBridge::set_input_state(const apal::InputState& state) {
    if (!has_core()) {
        return make_error_fmt(ErrorCode::InvalidState, "set_input_state() from {}",
                              session_state_name(state_));
    }
    latched_input_ = state;
    return Ok();
}

Result<void> SessionBridge::run_frame() {
    if (state_ != SessionState::Running) {
        return make_error_fmt(ErrorCode::InvalidState, "run_frame() from {}",
                              session_state_name(state_));
    }

    auto stepped = guarded(ErrorCode::StepError, "run_frame", [&] {
        core_->set_input(latched_input_);
        core_->run_frame();
    });
    if (!stepped) {
        fail(stepped.error());
        return stepped;
    }
    ++frames_run_;
    return Ok();
}

Result<NativeFrame> SessionBridge::get_frame() const {
    if (!has_core() || frames_run_ == 0) {
        return make_error(ErrorCode::InvalidState, "no frame has been run");
    }
    NativeFrame frame;
    auto got = guarded(ErrorCode::StepError, "frame", [&] { frame = core_->frame(); });
    if (!got) {
        return Err(got.error());
    }
    return frame;
}

Result<NativeAudio> SessionBridge::get_audio_samples() const {
    if (!has_core() || frames_run_ == 0) {
        return make_error(ErrorCode::InvalidState, "no frame has been run");
    }
    NativeAudio audio;
    auto got = guarded(ErrorCode::StepError, "audio", [&] { audio = core_->audio(); });
    if (!got) {
        return Err(got.error());
    }
    return audio;
}

// ─────────────────────────────────────────────────────────────────────────────
// State Serialization
// ─────────────────────────────────────────────────────────────────────────────

size_t SessionBridge::serialize_size() const noexcept {
    if (!has_core()) {
        return 0;
    }
    size_t size = 0;
    auto got = guarded(ErrorCode::UnsupportedBySession, "serialize_size",
                       [&] { size = core_->serialize_size(); });
    if (!got) {
        ARDUPLAY_LOG_WARN(kLogSubsys, "{}", got.error().message());
        return 0;
    }
    return size;
}

Result<std::vector<uint8_t>> SessionBridge::serialize() const {
    if (!has_core()) {
        return make_error_fmt(ErrorCode::InvalidState, "serialize() from {}",
                              session_state_name(state_));
    }
    const size_t size = serialize_size();
    if (size == 0) {
        return make_error(ErrorCode::UnsupportedBySession, "core does not support snapshots");
    }

    std::vector<uint8_t> blob(size);
    bool ok = false;
    auto called = guarded(ErrorCode::UnsupportedBySession, "serialize",
                          [&] { ok = core_->serialize(blob); });
    if (!called) {
        return Err(called.error());
    }
    if (!ok) {
        return make_error(ErrorCode::UnsupportedBySession, "core refused to serialize");
    }
    return blob;
}

Result<void> SessionBridge::deserialize(std::span<const uint8_t> blob) {
    if (!has_core()) {
        return make_error_fmt(ErrorCode::InvalidState, "deserialize() from {}",
                              session_state_name(state_));
    }
    if (serialize_size() == 0) {
        return make_error(ErrorCode::UnsupportedBySession, "core does not support snapshots");
    }

    bool ok = false;
    auto called = guarded(ErrorCode::DeserializeRejected, "deserialize",
                          [&] { ok = core_->deserialize(blob); });
    if (!called) {
        return Err(called.error());
    }
    if (!ok) {
        return make_error_fmt(ErrorCode::DeserializeRejected,
                              "core rejected a {}-byte snapshot", blob.size());
    }
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Reset
// ─────────────────────────────────────────────────────────────────────────────

Result<void> SessionBridge::reset() {
    if (state_ != SessionState::Running) {
        return make_error_fmt(ErrorCode::InvalidState, "reset() from {}",
                              session_state_name(state_));
    }
    auto done = guarded(ErrorCode::StepError, "reset", [&] { core_->reset(); });
    if (!done) {
        fail(done.error());
        return done;
    }
    ARDUPLAY_LOG_INFO(kLogSubsys, "Reset '{}'", content_id());
    return Ok();
}

Result<void> SessionBridge::reload() {
    if (core_path_.empty()) {
        return make_error(ErrorCode::InvalidState, "reload() before initialize()");
    }
    const auto core_path = core_path_;
    const auto content_path = content_path_;

    cleanup();
    ARDUPLAY_TRY_VOID(initialize(core_path, content_path));
    return start();
}

std::string SessionBridge::content_id() const {
    return content_path_.stem().string();
}

} // namespace arduplay
