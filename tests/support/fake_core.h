// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// Deterministic in-process core for session, snapshot and runtime tests.

#pragma once

#include "arduplay/core.h"
#include "arduplay/exceptions.h"

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace arduplay::test {

struct FakeCoreOptions {
    uint32_t width = 128;
    uint32_t height = 64;
    PixelFormat pixel_format = PixelFormat::RGB565;
    double fps = 60.0;
    uint32_t sample_rate = 44100;
    uint16_t audio_channels = 1;
    size_t samples_per_frame = 735;         ///< Per channel

    bool serializable = true;
    bool reject_deserialize = false;
    bool reject_content = false;
    bool report_empty_geometry = false;
    std::optional<uint64_t> throw_on_frame; ///< 1-based frame that throws
    bool throw_on_reset = false;
};

class FakeCore;

/// Shared between a factory and the test that owns it
struct FakeCoreProbe {
    int created = 0;
    int unloaded = 0;
    FakeCore* last = nullptr;
};

/**
 * Every observable output is a function of the frame counter and the last
 * input, so a restored snapshot reproduces the frame it was taken at.
 */
class FakeCore : public ICore {
public:
    static constexpr uint32_t kMagic = 0x46414B45;  // "FAKE"
    static constexpr size_t kStateSize = 24;

    FakeCore(FakeCoreOptions options, std::shared_ptr<FakeCoreProbe> probe)
        : options_(std::move(options))
        , probe_(std::move(probe))
    {}

    Result<void> load_content(const std::filesystem::path& content) override {
        if (options_.reject_content) {
            return make_error_fmt(ErrorCode::ContentLoadError, "'{}' rejected", content.string());
        }
        render();
        return Ok();
    }

    CoreInfo info() const override {
        CoreInfo info;
        info.name = "fake";
        info.version = "1.0";
        info.width = options_.report_empty_geometry ? 0 : options_.width;
        info.height = options_.report_empty_geometry ? 0 : options_.height;
        info.pixel_format = options_.pixel_format;
        info.fps = options_.fps;
        info.sample_rate = options_.sample_rate;
        info.audio_channels = options_.audio_channels;
        return info;
    }

    void set_input(const apal::InputState& state) override { input_ = state; }

    void run_frame() override {
        if (options_.throw_on_frame && frame_ + 1 == *options_.throw_on_frame) {
            throw CoreException("illegal opcode");
        }
        ++frame_;
        render();
    }

    NativeFrame frame() const override {
        NativeFrame out;
        out.data = pixels_;
        out.width = options_.width;
        out.height = options_.height;
        out.pitch = static_cast<size_t>(options_.width) * bytes_per_pixel(options_.pixel_format);
        out.format = options_.pixel_format;
        return out;
    }

    NativeAudio audio() const override {
        NativeAudio out;
        out.channels = options_.audio_channels;
        out.sample_rate = options_.sample_rate;
        out.s16 = samples_;
        return out;
    }

    size_t serialize_size() const override {
        return options_.serializable ? kStateSize : 0;
    }

    bool serialize(std::span<uint8_t> out) const override {
        if (out.size() != kStateSize) {
            return false;
        }
        const uint32_t buttons = static_cast<uint32_t>(input_.buttons.to_ulong());
        std::memcpy(out.data(), &kMagic, 4);
        std::memcpy(out.data() + 4, &frame_, 8);
        std::memcpy(out.data() + 12, &resets_, 8);
        std::memcpy(out.data() + 20, &buttons, 4);
        return true;
    }

    bool deserialize(std::span<const uint8_t> data) override {
        if (options_.reject_deserialize || data.size() != kStateSize) {
            return false;
        }
        uint32_t magic = 0;
        std::memcpy(&magic, data.data(), 4);
        if (magic != kMagic) {
            return false;
        }
        uint32_t buttons = 0;
        std::memcpy(&frame_, data.data() + 4, 8);
        std::memcpy(&resets_, data.data() + 12, 8);
        std::memcpy(&buttons, data.data() + 20, 4);
        input_.buttons = decltype(input_.buttons)(buttons);
        render();
        return true;
    }

    void reset() override {
        if (options_.throw_on_reset) {
            throw CoreException("reset vector corrupt");
        }
        frame_ = 0;
        ++resets_;
        render();
    }

    void unload() override {
        if (probe_) {
            ++probe_->unloaded;
        }
    }

    // Introspection
    uint64_t emulated_frame() const { return frame_; }
    uint64_t resets() const { return resets_; }
    const apal::InputState& input() const { return input_; }

    /// Value of the first pixel as the core wrote it
    static uint16_t seed_pixel(uint64_t frame, const apal::InputState& input) {
        return static_cast<uint16_t>((frame * 37 + input.buttons.to_ulong()) & 0xFFFF);
    }

private:
    void render() {
        const size_t bpp = bytes_per_pixel(options_.pixel_format);
        pixels_.assign(static_cast<size_t>(options_.width) * options_.height * bpp, 0);
        const uint16_t seed = seed_pixel(frame_, input_);
        for (size_t i = 0; i + bpp <= pixels_.size(); i += bpp) {
            const uint32_t value = seed + static_cast<uint32_t>(i / bpp);
            std::memcpy(pixels_.data() + i, &value, bpp);
        }

        samples_.resize(options_.samples_per_frame * options_.audio_channels);
        for (size_t i = 0; i < samples_.size(); ++i) {
            samples_[i] = static_cast<int16_t>(static_cast<int>((frame_ * 101 + i * 7) % 2000) - 1000);
        }
    }

    FakeCoreOptions options_;
    std::shared_ptr<FakeCoreProbe> probe_;
    uint64_t frame_ = 0;
    uint64_t resets_ = 0;
    apal::InputState input_{};
    std::vector<uint8_t> pixels_;
    std::vector<int16_t> samples_;
};

/// Factory producing FakeCores; "missing.so" (or any path named "missing*") fails
inline CoreFactory make_fake_factory(FakeCoreOptions options = {},
                                     std::shared_ptr<FakeCoreProbe> probe = nullptr) {
    return [options, probe](const std::filesystem::path& core_path)
               -> Result<std::unique_ptr<ICore>> {
        if (core_path.filename().string().starts_with("missing")) {
            return make_error_fmt(ErrorCode::CoreLoadError, "cannot load '{}'",
                                  core_path.string());
        }
        auto core = std::make_unique<FakeCore>(options, probe);
        if (probe) {
            ++probe->created;
            probe->last = core.get();
        }
        return std::unique_ptr<ICore>(std::move(core));
    };
}

/// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("arduplay-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& name, const std::string& contents) const {
        const auto file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << contents;
        return file;
    }

private:
    std::filesystem::path path_;
};

} // namespace arduplay::test
