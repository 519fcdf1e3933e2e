/**
 * @file snapshot_manager.h
 * @brief Save slots and the rewind ring for one session.
 *
 * Named slots live on disk as "<snapshot_dir>/<content_id>.state<N>" with an
 * optional "<...>.meta" TOML sidecar. The quick slot lives in
 * memory and is lost when the manager is destroyed.
 *
 * Example:
 * @code
 *   SnapshotManager snapshots(bridge, {.dir = "saves", .rewind_capacity = 120});
 *   snapshots.save(SlotId::named(0), "before boss");
 *   // ...
 *   snapshots.load(SlotId::named(0));
 * @endcode
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/error.h"
#include "arduplay/rewind_buffer.h"

#include <chrono>
#include <compare>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arduplay {

class SessionBridge;

/**
 * @brief Snapshot key: a numbered disk slot or the in-memory quick slot.
 */
class SlotId {
public:
    [[nodiscard]] static constexpr SlotId quick() noexcept { return SlotId{true, 0}; }
    [[nodiscard]] static constexpr SlotId named(uint32_t index) noexcept { return SlotId{false, index}; }

    [[nodiscard]] constexpr bool is_quick() const noexcept { return quick_; }

    /// Disk slot number; 0 for the quick slot
    [[nodiscard]] constexpr uint32_t index() const noexcept { return index_; }

    /// "quick" or the slot number
    [[nodiscard]] std::string to_string() const;

    // Quick sorts before every named slot
    constexpr auto operator<=>(const SlotId& other) const noexcept {
        if (quick_ != other.quick_) {
            return quick_ ? std::strong_ordering::less : std::strong_ordering::greater;
        }
        return index_ <=> other.index_;
    }
    constexpr bool operator==(const SlotId&) const noexcept = default;

private:
    constexpr SlotId(bool quick, uint32_t index) noexcept
        : quick_(quick), index_(index) {}

    bool quick_;
    uint32_t index_;
};

/**
 * @brief What was recorded alongside a snapshot.
 */
struct SnapshotMetadata {
    std::chrono::system_clock::time_point timestamp{};
    uint64_t frame = 0;
    std::string description;
};

struct SnapshotOptions {
    std::filesystem::path dir = ".";
    size_t rewind_capacity = 0;
};

/**
 * @brief Persists and restores session state through a SessionBridge.
 *
 * The bridge must outlive the manager. Calls are made from the tick thread
 * or while the loop is paused.
 */
class SnapshotManager {
public:
    SnapshotManager(SessionBridge& bridge, SnapshotOptions options);

    SnapshotManager(const SnapshotManager&) = delete;
    SnapshotManager& operator=(const SnapshotManager&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Slots
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Serialize the session into a slot, replacing what was there.
     * @return UnsupportedBySession, FileWriteError
     */
    Result<void> save(SlotId slot, std::string description = {});

    /**
     * @brief Restore the session from a slot.
     * @return SlotNotFound, FileReadError, DeserializeRejected
     */
    Result<void> load(SlotId slot);

    /**
     * @brief Populated slots for the current content.
     * @return FileReadError if the snapshot directory cannot be scanned
     */
    [[nodiscard]] Result<std::set<SlotId>> list() const;

    /**
     * @brief Delete a slot and its sidecar.
     * @return SlotNotFound, FileWriteError
     */
    Result<void> remove(SlotId slot);

    /**
     * @brief Metadata recorded by save().
     * @return SlotNotFound if the slot is empty, FileNotFound if a disk slot
     *         has no sidecar, FileReadError if the sidecar is malformed
     */
    [[nodiscard]] Result<SnapshotMetadata> metadata(SlotId slot) const;

    /// Path of a disk slot (the slot need not exist)
    [[nodiscard]] std::filesystem::path slot_path(SlotId slot) const;

    // ─────────────────────────────────────────────────────────────────────────
    // Rewind
    // ─────────────────────────────────────────────────────────────────────────

    /**
     * @brief Append the current state to the rewind ring.
     * @return UnsupportedBySession when rewind is disabled or the core
     *         cannot snapshot
     */
    Result<void> capture();

    /**
     * @brief Drop the n newest captures and restore the newest remaining one.
     *
     * Requires n < rewind_depth(). On any failure the ring and the session
     * are unchanged.
     *
     * @return UnsupportedBySession, InsufficientHistory, DeserializeRejected
     */
    Result<void> rewind(size_t n = 1);

    [[nodiscard]] size_t rewind_depth() const noexcept { return ring_.size(); }
    [[nodiscard]] const RewindBuffer& rewind_buffer() const noexcept { return ring_; }

    [[nodiscard]] const SnapshotOptions& options() const noexcept { return options_; }

private:
    struct QuickSlot {
        std::vector<uint8_t> blob;
        SnapshotMetadata meta;
    };

    [[nodiscard]] SnapshotMetadata make_metadata(std::string description) const;

    SessionBridge& bridge_;
    SnapshotOptions options_;
    std::optional<QuickSlot> quick_;
    RewindBuffer ring_;
};

} // namespace arduplay
