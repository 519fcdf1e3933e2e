/**
 * @file config.cpp
 * @brief RuntimeConfig validation and config file parsing.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/config.h"

#include <toml++/toml.hpp>

#include <limits>
#include <system_error>

namespace arduplay {

// ─────────────────────────────────────────────────────────────────────────────
// Validation
// ─────────────────────────────────────────────────────────────────────────────

Result<void> RuntimeConfig::validate() const {
    std::vector<std::string> errors;

    if (!(target_fps > 0.0)) {
        errors.push_back("target_fps must be positive");
    } else if (target_fps > 1000.0) {
        errors.push_back("target_fps cannot exceed 1000");
    }
    if (!(audio_volume >= 0.0f && audio_volume <= 1.0f)) {
        errors.push_back("audio_volume must be within 0.0 to 1.0");
    }
    if (audio_buffer_ms == 0) {
        errors.push_back("audio_buffer_ms must be at least 1");
    }
    if (audio_channels != 1 && audio_channels != 2) {
        errors.push_back("audio_channels must be 1 or 2");
    }
    if (rewind_interval == 0) {
        errors.push_back("rewind_interval must be at least 1");
    }
    if (video_scale == 0) {
        errors.push_back("video_scale must be at least 1");
    }

    if (!errors.empty()) {
        std::string msg = "Configuration validation failed:";
        for (const auto& err : errors) {
            msg += "\n  - " + err;
        }
        return make_error(ErrorCode::ConfigValueInvalid, msg);
    }
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Parsing
// ─────────────────────────────────────────────────────────────────────────────

namespace {

template<typename T>
bool read_unsigned(const toml::node& node, T& out) {
    auto value = node.value_exact<int64_t>();
    if (!value || *value < 0 ||
        static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
        return false;
    }
    out = static_cast<T>(*value);
    return true;
}

bool read_backend(const toml::node& node, apal::Backend& out) {
    auto name = node.value_exact<std::string>();
    if (!name) {
        return false;
    }
    auto backend = apal::parseBackend(*name);
    if (!backend) {
        return false;
    }
    out = *backend;
    return true;
}

/**
 * Apply one key to config. Returns ConfigParseError for an unknown key or a
 * value of the wrong type or range.
 */
Result<void> apply_key(RuntimeConfig& config, std::string_view key, const toml::node& node) {
    const auto line = node.source().begin.line;

    bool ok = true;
    if (key == "target_fps") {
        auto fps = node.value<double>();
        ok = fps.has_value();
        if (ok) {
            config.target_fps = *fps;
        }
    } else if (key == "max_frames") {
        uint64_t frames = 0;
        ok = read_unsigned(node, frames);
        if (ok) {
            config.max_frames = frames == 0 ? std::nullopt : std::optional<uint64_t>(frames);
        }
    } else if (key == "rewind_capacity") {
        ok = read_unsigned(node, config.rewind_capacity);
    } else if (key == "rewind_interval") {
        ok = read_unsigned(node, config.rewind_interval);
    } else if (key == "audio_volume") {
        auto volume = node.value<double>();
        ok = volume.has_value();
        if (ok) {
            config.audio_volume = static_cast<float>(*volume);
        }
    } else if (key == "audio_buffer_ms") {
        ok = read_unsigned(node, config.audio_buffer_ms);
    } else if (key == "audio_channels") {
        ok = read_unsigned(node, config.audio_channels);
    } else if (key == "audio_format") {
        auto format = node.value_exact<std::string>();
        if (format == "s16") {
            config.audio_format = apal::SampleFormat::S16;
        } else if (format == "f32") {
            config.audio_format = apal::SampleFormat::F32;
        } else {
            ok = false;
        }
    } else if (key == "stats_interval") {
        ok = read_unsigned(node, config.stats_interval);
    } else if (key == "snapshot_dir") {
        auto dir = node.value_exact<std::string>();
        ok = dir && !dir->empty();
        if (ok) {
            config.snapshot_dir = std::filesystem::path(*dir);
        }
    } else if (key == "video") {
        ok = read_backend(node, config.video_backend);
    } else if (key == "audio") {
        ok = read_backend(node, config.audio_backend);
    } else if (key == "input") {
        ok = read_backend(node, config.input_backend);
    } else if (key == "video_scale") {
        ok = read_unsigned(node, config.video_scale);
    } else {
        return make_error_fmt(ErrorCode::ConfigParseError,
                              "line {}: unknown key '{}'", line, key);
    }

    if (!ok) {
        return make_error_fmt(ErrorCode::ConfigParseError,
                              "line {}: invalid value for '{}'", line, key);
    }
    return Ok();
}

Result<RuntimeConfig> apply_table(const toml::table& root, RuntimeConfig config) {
    for (auto&& [key, node] : root) {
        if (auto* section = node.as_table()) {
            if (key.str() != "runtime") {
                return make_error_fmt(ErrorCode::ConfigParseError,
                                      "line {}: unknown section '{}'",
                                      section->source().begin.line, key.str());
            }
            for (auto&& [inner_key, inner_node] : *section) {
                ARDUPLAY_TRY_VOID(apply_key(config, inner_key.str(), inner_node));
            }
            continue;
        }
        ARDUPLAY_TRY_VOID(apply_key(config, key.str(), node));
    }

    auto valid = config.validate();
    if (!valid) {
        return Err(valid.error());
    }
    return Ok(std::move(config));
}

Error from_parse_error(const toml::parse_error& err) {
    return Error::formatted(ErrorCode::ConfigParseError, "line {}: {}",
                            err.source().begin.line, err.description());
}

} // anonymous namespace

Result<RuntimeConfig> parse_runtime_config(std::string_view text, RuntimeConfig base) {
    toml::table root;
    try {
        root = toml::parse(text);
    } catch (const toml::parse_error& err) {
        return Err(from_parse_error(err));
    }
    return apply_table(root, std::move(base));
}

Result<RuntimeConfig> load_runtime_config(const std::filesystem::path& path, RuntimeConfig base) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error_fmt(ErrorCode::FileNotFound, "config file '{}' not found", path.string());
    }

    toml::table root;
    try {
        root = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        // parse_file reports an unreadable file through the same exception,
        // with no position
        if (err.source().begin.line == 0) {
            return make_error_fmt(ErrorCode::FileReadError, "cannot read config file '{}': {}",
                                  path.string(), err.description());
        }
        return Err(from_parse_error(err).with_context(path.string()));
    }

    auto parsed = apply_table(root, std::move(base));
    if (!parsed) {
        return Err(parsed.error().with_context(path.string()));
    }
    return parsed;
}

} // namespace arduplay
