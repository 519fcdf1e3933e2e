/**
 * @file session_bridge.h
 * @brief Crash-isolated facade over one emulation core.
 *
 * State machine:
 *
 *   Uninitialized --initialize--> Initialized --start--> Running --stop--> Stopped
 *         ^                                                 |
 *         |                                        run_frame throws
 *         |                                                 v
 *         +------------------- cleanup -------------------- Failed
 *
 * cleanup() returns any state to Uninitialized and is idempotent.
 * Not thread-safe: one thread drives the bridge.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/core.h"
#include "arduplay/error.h"
#include "apal/input_driver.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace arduplay {

enum class SessionState {
    Uninitialized,
    Initialized,
    Running,
    Stopped,
    Failed
};

[[nodiscard]] constexpr const char* session_state_name(SessionState s) noexcept {
    switch (s) {
        case SessionState::Uninitialized: return "Uninitialized";
        case SessionState::Initialized:   return "Initialized";
        case SessionState::Running:       return "Running";
        case SessionState::Stopped:       return "Stopped";
        case SessionState::Failed:        return "Failed";
    }
    return "Unknown";
}

/**
 * @brief Owns the core handle and exposes a narrow, checked API.
 *
 * Anything the core throws is caught here: during loading it becomes
 * CoreLoadError / ContentLoadError, during a frame it becomes StepError and
 * the bridge moves to Failed.
 */
class SessionBridge {
public:
    explicit SessionBridge(CoreFactory factory);
    ~SessionBridge();

    SessionBridge(const SessionBridge&) = delete;
    SessionBridge& operator=(const SessionBridge&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Load the core and the content. No-op if already initialized.
     * @return CoreLoadError, ContentLoadError, InvalidState (after Failed)
     */
    Result<void> initialize(const std::filesystem::path& core_path,
                            const std::filesystem::path& content_path);

    /**
     * @brief Initialized -> Running. No-op when already Running.
     * @return InvalidState from any other state
     */
    Result<void> start();

    /**
     * @brief Running -> Stopped. The core stays loaded until cleanup().
     */
    void stop() noexcept;

    /**
     * @brief Unload and destroy the core. Safe to call repeatedly.
     */
    void cleanup() noexcept;

    // ─────────────────────────────────────────────────────────────────────────
    // Per-Tick
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Latch input for the next run_frame(). Overwrites, never queues.
     */
    Result<void> set_input_state(const apal::InputState& state);

    /**
     * @brief Advance one emulated frame.
     * @return InvalidState unless Running; StepError if the core failed
     */
    Result<void> run_frame();

    /**
     * @brief Native framebuffer of the last frame.
     * @return InvalidState before the first run_frame()
     */
    [[nodiscard]] Result<NativeFrame> get_frame() const;

    /**
     * @brief Native samples of the last frame.
     * @return InvalidState before the first run_frame()
     */
    [[nodiscard]] Result<NativeAudio> get_audio_samples() const;

    // ─────────────────────────────────────────────────────────────────────────
    // State Serialization
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Snapshot size; 0 when unsupported or no core is loaded.
     */
    [[nodiscard]] size_t serialize_size() const noexcept;

    /**
     * @return UnsupportedBySession if the core cannot snapshot
     */
    [[nodiscard]] Result<std::vector<uint8_t>> serialize() const;

    /**
     * @return UnsupportedBySession, DeserializeRejected
     */
    Result<void> deserialize(std::span<const uint8_t> blob);

    // ─────────────────────────────────────────────────────────────────────────
    // Reset
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Soft-reset the running core.
     * @return InvalidState unless Running; StepError if the core failed
     */
    Result<void> reset();

    /**
     * @brief Tear the core down and load it again from the same paths.
     *
     * Ends in Running on success. On failure the bridge is Uninitialized.
     */
    Result<void> reload();

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] bool is_running() const noexcept { return state_ == SessionState::Running; }

    /// Core constants; default-constructed before initialize()
    [[nodiscard]] const CoreInfo& info() const noexcept { return info_; }

    /// Frames advanced since initialize()
    [[nodiscard]] uint64_t frames_run() const noexcept { return frames_run_; }

    /// Content file stem, used to name snapshot files
    [[nodiscard]] std::string content_id() const;

private:
    [[nodiscard]] bool has_core() const noexcept;
    void fail(const Error& error);

    CoreFactory factory_;
    std::unique_ptr<ICore> core_;
    SessionState state_ = SessionState::Uninitialized;
    CoreInfo info_{};
    apal::InputState latched_input_{};
    uint64_t frames_run_ = 0;
    std::filesystem::path core_path_;
    std::filesystem::path content_path_;
};

} // namespace arduplay
