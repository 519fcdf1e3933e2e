/**
 * @file format_converter.h
 * @brief Conversion from core-native video/audio encodings to driver formats.
 *
 * Everything here is a pure function of its inputs. Output containers
 * (RgbImage, SampleBlock) are owned by the caller and reused from tick to
 * tick, so steady-state conversion does not allocate.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/error.h"
#include "apal/audio_driver.h"
#include "apal/video_driver.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <span>
#include <vector>

namespace arduplay {

// ─────────────────────────────────────────────────────────────────────────────
// Native Encodings
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Packed pixel encodings a core may report (libretro's three).
 */
enum class PixelFormat {
    RGB565,     ///< 16-bit, 5-6-5 (native endian)
    XRGB8888,   ///< 32-bit, top byte ignored
    RGB1555     ///< 16-bit 0RGB1555, top bit ignored
};

[[nodiscard]] constexpr uint32_t bytes_per_pixel(PixelFormat fmt) noexcept {
    return fmt == PixelFormat::XRGB8888 ? 4 : 2;
}

/**
 * @brief Bytes a frame of this shape spans in its source buffer.
 *
 * Every row but the last advances by pitch; the last row only needs
 * width * bpp, so a core may hand over a buffer that ends there.
 */
[[nodiscard]] constexpr size_t frame_span_bytes(uint32_t width, uint32_t height, size_t pitch,
                                                PixelFormat fmt) noexcept {
    if (width == 0 || height == 0) {
        return 0;
    }
    return pitch * (height - 1) + static_cast<size_t>(width) * bytes_per_pixel(fmt);
}

[[nodiscard]] constexpr const char* pixel_format_name(PixelFormat fmt) noexcept {
    switch (fmt) {
        case PixelFormat::RGB565:   return "RGB565";
        case PixelFormat::XRGB8888: return "XRGB8888";
        case PixelFormat::RGB1555:  return "0RGB1555";
    }
    return "Unknown";
}

/**
 * @brief View of a core's framebuffer. Valid until the next run_frame().
 */
struct NativeFrame {
    std::span<const uint8_t> data;
    uint32_t width = 0;
    uint32_t height = 0;
    size_t pitch = 0;                       ///< Bytes per row, >= width * bpp
    PixelFormat format = PixelFormat::RGB565;
};

/**
 * @brief View of the samples a core produced during the last frame.
 *
 * Interleaved when channels == 2. Exactly one of s16 / f32 is used.
 */
struct NativeAudio {
    apal::SampleFormat format = apal::SampleFormat::S16;
    uint16_t channels = 1;
    uint32_t sample_rate = 0;
    std::span<const int16_t> s16;
    std::span<const float> f32;

    [[nodiscard]] size_t sample_count() const noexcept {
        return format == apal::SampleFormat::S16 ? s16.size() : f32.size();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Pixel Conversion
// ─────────────────────────────────────────────────────────────────────────────

struct Rgb888 {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    friend constexpr bool operator==(const Rgb888&, const Rgb888&) = default;
};

namespace convert {

/// 5-bit channel to 8 bits by bit replication (0 -> 0, 31 -> 255)
[[nodiscard]] constexpr uint8_t expand5(uint32_t v) noexcept {
    v &= 0x1F;
    return static_cast<uint8_t>((v << 3) | (v >> 2));
}

/// 6-bit channel to 8 bits by bit replication (0 -> 0, 63 -> 255)
[[nodiscard]] constexpr uint8_t expand6(uint32_t v) noexcept {
    v &= 0x3F;
    return static_cast<uint8_t>((v << 2) | (v >> 4));
}

[[nodiscard]] constexpr Rgb888 unpack_rgb565(uint16_t p) noexcept {
    return {expand5(p >> 11), expand6(p >> 5), expand5(p)};
}

[[nodiscard]] constexpr Rgb888 unpack_rgb1555(uint16_t p) noexcept {
    return {expand5(p >> 10), expand5(p >> 5), expand5(p)};
}

[[nodiscard]] constexpr Rgb888 unpack_xrgb8888(uint32_t p) noexcept {
    return {static_cast<uint8_t>(p >> 16), static_cast<uint8_t>(p >> 8), static_cast<uint8_t>(p)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Sample Conversion
// ─────────────────────────────────────────────────────────────────────────────

/// Full-scale divisor between int16 and normalized float
inline constexpr float kSampleScale = 32768.0f;

/// int16 to float; 32767 maps just below +1.0, -32768 to exactly -1.0
[[nodiscard]] constexpr float s16_to_float(int16_t s) noexcept {
    return static_cast<float>(s) / kSampleScale;
}

/// float to int16 with clamping; NaN maps to silence
[[nodiscard]] inline int16_t float_to_s16(float f) noexcept {
    if (std::isnan(f)) {
        return 0;
    }
    float scaled = std::clamp(f * kSampleScale, -32768.0f, 32767.0f);
    return static_cast<int16_t>(std::lrint(scaled));
}

/// Clamp a normalized float to [-1, 1]; NaN maps to silence
[[nodiscard]] inline float clamp_unit(float f) noexcept {
    return std::isnan(f) ? 0.0f : std::clamp(f, -1.0f, 1.0f);
}

} // namespace convert

// ─────────────────────────────────────────────────────────────────────────────
// Output Containers
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Tightly packed RGB888 image.
 */
class RgbImage {
public:
    [[nodiscard]] uint32_t width() const noexcept { return width_; }
    [[nodiscard]] uint32_t height() const noexcept { return height_; }
    [[nodiscard]] const std::vector<uint8_t>& pixels() const noexcept { return pixels_; }

    [[nodiscard]] Rgb888 at(uint32_t x, uint32_t y) const noexcept {
        const size_t i = (static_cast<size_t>(y) * width_ + x) * 3;
        return {pixels_[i], pixels_[i + 1], pixels_[i + 2]};
    }

    /// Driver-facing view; valid while this image is alive and unchanged
    [[nodiscard]] apal::RgbFrame view() const noexcept {
        return apal::RgbFrame{pixels_, width_, height_};
    }

    void resize(uint32_t width, uint32_t height) {
        width_ = width;
        height_ = height;
        pixels_.resize(static_cast<size_t>(width) * height * 3);
    }

    [[nodiscard]] uint8_t* data() noexcept { return pixels_.data(); }

private:
    uint32_t width_ = 0;
    uint32_t height_ = 0;
    std::vector<uint8_t> pixels_;
};

/**
 * @brief Interleaved samples in a driver's format.
 */
struct SampleBlock {
    apal::SampleFormat format = apal::SampleFormat::S16;
    uint16_t channels = 2;
    std::vector<int16_t> s16;
    std::vector<float> f32;

    [[nodiscard]] size_t sample_count() const noexcept {
        return format == apal::SampleFormat::S16 ? s16.size() : f32.size();
    }

    [[nodiscard]] apal::AudioBuffer view() const noexcept {
        apal::AudioBuffer buf;
        buf.format = format;
        buf.channels = channels;
        buf.s16 = s16;
        buf.f32 = f32;
        return buf;
    }
};

/**
 * @brief What an audio driver wants to receive.
 */
struct AudioTarget {
    apal::SampleFormat format = apal::SampleFormat::S16;
    uint16_t channels = 2;
    float volume = 1.0f;
};

// ─────────────────────────────────────────────────────────────────────────────
// Conversions
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Convert a native frame to RGB888.
 *
 * @return InvalidArgument if the frame is empty, the pitch is shorter than
 *         a row, or the buffer is shorter than pitch * height
 */
[[nodiscard]] Result<void> to_rgb888(const NativeFrame& src, RgbImage& dst);

/**
 * @brief Convert a native sample block to a driver's format.
 *
 * Applies volume in the normalized domain, then clamps to the target's
 * representable range. Mono input is duplicated into both channels for a
 * stereo target; stereo input is averaged for a mono target.
 *
 * @return InvalidArgument for channel counts other than 1 or 2, or a
 *         sample count that is not a whole number of frames
 */
[[nodiscard]] Result<void> to_driver_format(const NativeAudio& src,
                                            const AudioTarget& target,
                                            SampleBlock& dst);

} // namespace arduplay
