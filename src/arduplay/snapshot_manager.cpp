/**
 * @file snapshot_manager.cpp
 * @brief Slot storage and rewind ring.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/snapshot_manager.h"
#include "arduplay/logging.h"
#include "arduplay/session_bridge.h"

#include <toml++/toml.hpp>

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace arduplay {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLogSubsys = "SNAPSHOT";

fs::path sidecar_path(const fs::path& slot_file) {
    fs::path meta = slot_file;
    meta += ".meta";
    return meta;
}

/**
 * Write bytes to "<path>.tmp" and rename over path, so a reader never sees
 * a partially written slot.
 */
Result<void> write_file_atomic(const fs::path& path, std::span<const char> bytes) {
    fs::path tmp = path;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error_fmt(ErrorCode::FileWriteError, "cannot create '{}'", tmp.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            std::error_code ignored;
            fs::remove(tmp, ignored);
            return make_error_fmt(ErrorCode::FileWriteError, "short write to '{}'", tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return make_error_fmt(ErrorCode::FileWriteError, "cannot rename '{}' to '{}': {}",
                              tmp.string(), path.string(), ec.message());
    }
    return Ok();
}

Result<std::vector<uint8_t>> read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error_fmt(ErrorCode::FileReadError, "cannot open '{}'", path.string());
    }
    std::vector<uint8_t> data{std::istreambuf_iterator<char>(in),
                              std::istreambuf_iterator<char>()};
    if (in.bad()) {
        return make_error_fmt(ErrorCode::FileReadError, "error reading '{}'", path.string());
    }
    return data;
}

std::string encode_metadata(const SnapshotMetadata& meta) {
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
        meta.timestamp.time_since_epoch()).count();

    toml::table table{
        {"timestamp", static_cast<int64_t>(seconds)},
        {"frame", static_cast<int64_t>(meta.frame)},
        {"description", meta.description},
    };
    std::ostringstream out;
    out << table << '\n';
    return out.str();
}

Result<SnapshotMetadata> decode_metadata(std::string_view text, const fs::path& origin) {
    toml::table table;
    try {
        table = toml::parse(text, origin.string());
    } catch (const toml::parse_error& err) {
        return make_error_fmt(ErrorCode::FileReadError, "'{}': line {}: {}",
                              origin.string(), err.source().begin.line, err.description());
    }

    // Missing keys keep their defaults; unknown keys are left for newer writers
    SnapshotMetadata meta;
    if (auto* node = table.get("timestamp")) {
        auto seconds = node->value_exact<int64_t>();
        if (!seconds) {
            return make_error_fmt(ErrorCode::FileReadError, "'{}': line {}: bad timestamp",
                                  origin.string(), node->source().begin.line);
        }
        meta.timestamp = std::chrono::system_clock::time_point{
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds{*seconds})};
    }
    if (auto* node = table.get("frame")) {
        auto frame = node->value_exact<int64_t>();
        if (!frame || *frame < 0) {
            return make_error_fmt(ErrorCode::FileReadError, "'{}': line {}: bad frame",
                                  origin.string(), node->source().begin.line);
        }
        meta.frame = static_cast<uint64_t>(*frame);
    }
    if (auto* node = table.get("description")) {
        auto description = node->value_exact<std::string>();
        if (!description) {
            return make_error_fmt(ErrorCode::FileReadError, "'{}': line {}: bad description",
                                  origin.string(), node->source().begin.line);
        }
        meta.description = std::move(*description);
    }
    return meta;
}

} // anonymous namespace

std::string SlotId::to_string() const {
    return quick_ ? std::string("quick") : std::to_string(index_);
}

SnapshotManager::SnapshotManager(SessionBridge& bridge, SnapshotOptions options)
    : bridge_(bridge)
    , options_(std::move(options))
    , ring_(options_.rewind_capacity)
{}

fs::path SnapshotManager::slot_path(SlotId slot) const {
    return options_.dir / std::format("{}.state{}", bridge_.content_id(), slot.index());
}

SnapshotMetadata SnapshotManager::make_metadata(std::string description) const {
    SnapshotMetadata meta;
    meta.timestamp = std::chrono::system_clock::now();
    meta.frame = bridge_.frames_run();
    meta.description = std::move(description);
    return meta;
}

// ─────────────────────────────────────────────────────────────────────────────
// Slots
// ─────────────────────────────────────────────────────────────────────────────

Result<void> SnapshotManager::save(SlotId slot, std::string description) {
    auto blob = bridge_.serialize();
    if (!blob) {
        return Err(blob.error().with_context(std::format("save slot {}", slot.to_string())));
    }

    SnapshotMetadata meta = make_metadata(std::move(description));

    if (slot.is_quick()) {
        quick_ = QuickSlot{std::move(*blob), std::move(meta)};
        ARDUPLAY_LOG_DEBUG(kLogSubsys, "Saved quick slot ({} bytes)", quick_->blob.size());
        return Ok();
    }

    std::error_code ec;
    fs::create_directories(options_.dir, ec);
    if (ec) {
        return make_error_fmt(ErrorCode::FileWriteError, "cannot create '{}': {}",
                              options_.dir.string(), ec.message());
    }

    const fs::path path = slot_path(slot);
    const std::span<const char> bytes(reinterpret_cast<const char*>(blob->data()), blob->size());
    ARDUPLAY_TRY_VOID(write_file_atomic(path, bytes));

    const std::string sidecar = encode_metadata(meta);
    ARDUPLAY_TRY_VOID(write_file_atomic(sidecar_path(path), sidecar));

    ARDUPLAY_LOG_INFO(kLogSubsys, "Saved slot {} to '{}' ({} bytes, frame {})",
                      slot.to_string(), path.string(), blob->size(), meta.frame);
    return Ok();
}

Result<void> SnapshotManager::load(SlotId slot) {
    if (slot.is_quick()) {
        if (!quick_) {
            return make_error(ErrorCode::SlotNotFound, "quick slot is empty");
        }
        return bridge_.deserialize(quick_->blob);
    }

    const fs::path path = slot_path(slot);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error_fmt(ErrorCode::SlotNotFound, "slot {} is empty ('{}')",
                              slot.to_string(), path.string());
    }

    auto blob = read_file(path);
    if (!blob) {
        return Err(blob.error());
    }
    ARDUPLAY_TRY_VOID(bridge_.deserialize(*blob));

    ARDUPLAY_LOG_INFO(kLogSubsys, "Loaded slot {} from '{}'", slot.to_string(), path.string());
    return Ok();
}

Result<std::set<SlotId>> SnapshotManager::list() const {
    std::set<SlotId> slots;
    if (quick_) {
        slots.insert(SlotId::quick());
    }

    std::error_code ec;
    if (!fs::is_directory(options_.dir, ec)) {
        return slots;
    }

    const std::string prefix = bridge_.content_id() + ".state";
    fs::directory_iterator it(options_.dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const std::string name = it->path().filename().string();
        if (!name.starts_with(prefix)) {
            continue;
        }
        // Only "<id>.state<digits>": skips sidecars and temp files
        uint32_t index = 0;
        if (parse_uint(std::string_view(name).substr(prefix.size()), index)) {
            slots.insert(SlotId::named(index));
        }
    }
    if (ec) {
        return make_error_fmt(ErrorCode::FileReadError, "cannot scan '{}': {}",
                              options_.dir.string(), ec.message());
    }
    return slots;
}

Result<void> SnapshotManager::remove(SlotId slot) {
    if (slot.is_quick()) {
        if (!quick_) {
            return make_error(ErrorCode::SlotNotFound, "quick slot is empty");
        }
        quick_.reset();
        return Ok();
    }

    const fs::path path = slot_path(slot);
    std::error_code ec;
    if (!fs::remove(path, ec)) {
        if (ec) {
            return make_error_fmt(ErrorCode::FileWriteError, "cannot delete '{}': {}",
                                  path.string(), ec.message());
        }
        return make_error_fmt(ErrorCode::SlotNotFound, "slot {} is empty", slot.to_string());
    }

    fs::remove(sidecar_path(path), ec);
    if (ec) {
        return make_error_fmt(ErrorCode::FileWriteError, "cannot delete '{}': {}",
                              sidecar_path(path).string(), ec.message());
    }
    ARDUPLAY_LOG_INFO(kLogSubsys, "Deleted slot {}", slot.to_string());
    return Ok();
}

Result<SnapshotMetadata> SnapshotManager::metadata(SlotId slot) const {
    if (slot.is_quick()) {
        if (!quick_) {
            return make_error(ErrorCode::SlotNotFound, "quick slot is empty");
        }
        return quick_->meta;
    }

    const fs::path path = slot_path(slot);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return make_error_fmt(ErrorCode::SlotNotFound, "slot {} is empty", slot.to_string());
    }
    const fs::path meta_path = sidecar_path(path);
    if (!fs::is_regular_file(meta_path, ec)) {
        return make_error_fmt(ErrorCode::FileNotFound, "slot {} has no metadata", slot.to_string());
    }

    auto bytes = read_file(meta_path);
    if (!bytes) {
        return Err(bytes.error());
    }
    std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    return decode_metadata(text, meta_path);
}

// ─────────────────────────────────────────────────────────────────────────────
// Rewind
// ─────────────────────────────────────────────────────────────────────────────

Result<void> SnapshotManager::capture() {
    if (ring_.capacity() == 0) {
        return make_error(ErrorCode::UnsupportedBySession, "rewind is disabled");
    }
    auto blob = bridge_.serialize();
    if (!blob) {
        return Err(blob.error());
    }
    ring_.push(std::move(*blob));
    return Ok();
}

Result<void> SnapshotManager::rewind(size_t n) {
    if (ring_.capacity() == 0) {
        return make_error(ErrorCode::UnsupportedBySession, "rewind is disabled");
    }
    if (n >= ring_.size()) {
        return make_error_fmt(ErrorCode::InsufficientHistory,
                              "cannot rewind {} step(s) with {} capture(s)", n, ring_.size());
    }

    // Restore first: a rejected blob leaves the ring untouched
    ARDUPLAY_TRY_VOID(bridge_.deserialize(ring_.peek_back(n)));
    ring_.discard_back(n);
    return Ok();
}

} // namespace arduplay
