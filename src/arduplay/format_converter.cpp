/**
 * @file format_converter.cpp
 * @brief Pixel and sample conversion.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/format_converter.h"

#include <cstring>

namespace arduplay {

namespace {

// Native buffers are host-endian and may be unaligned
template<typename T>
T load(const uint8_t* p) noexcept {
    T v;
    std::memcpy(&v, p, sizeof(T));
    return v;
}

template<typename Word, typename Unpack>
void convert_rows(const NativeFrame& src, uint8_t* out, Unpack unpack) noexcept {
    for (uint32_t y = 0; y < src.height; ++y) {
        const uint8_t* row = src.data.data() + static_cast<size_t>(y) * src.pitch;
        for (uint32_t x = 0; x < src.width; ++x) {
            Rgb888 px = unpack(load<Word>(row + static_cast<size_t>(x) * sizeof(Word)));
            *out++ = px.r;
            *out++ = px.g;
            *out++ = px.b;
        }
    }
}

// Source sample i as a normalized float
float read_normalized(const NativeAudio& src, size_t i) noexcept {
    return src.format == apal::SampleFormat::S16
        ? convert::s16_to_float(src.s16[i])
        : src.f32[i];
}

} // anonymous namespace

// ─────────────────────────────────────────────────────────────────────────────
// Video
// ─────────────────────────────────────────────────────────────────────────────

Result<void> to_rgb888(const NativeFrame& src, RgbImage& dst) {
    ARDUPLAY_CHECK(src.width > 0 && src.height > 0,
                   ErrorCode::InvalidArgument, "frame has zero size");

    const size_t row_bytes = static_cast<size_t>(src.width) * bytes_per_pixel(src.format);
    if (src.pitch < row_bytes) {
        return make_error_fmt(ErrorCode::InvalidArgument,
                              "pitch {} shorter than row of {} bytes", src.pitch, row_bytes);
    }
    const size_t needed = frame_span_bytes(src.width, src.height, src.pitch, src.format);
    if (src.data.size() < needed) {
        return make_error_fmt(ErrorCode::InvalidArgument,
                              "frame buffer holds {} bytes, {}x{} {} needs {}",
                              src.data.size(), src.width, src.height,
                              pixel_format_name(src.format), needed);
    }

    dst.resize(src.width, src.height);
    uint8_t* out = dst.data();

    switch (src.format) {
        case PixelFormat::RGB565:
            convert_rows<uint16_t>(src, out, convert::unpack_rgb565);
            break;
        case PixelFormat::RGB1555:
            convert_rows<uint16_t>(src, out, convert::unpack_rgb1555);
            break;
        case PixelFormat::XRGB8888:
            convert_rows<uint32_t>(src, out, convert::unpack_xrgb8888);
            break;
    }
    return Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Audio
// ─────────────────────────────────────────────────────────────────────────────

Result<void> to_driver_format(const NativeAudio& src, const AudioTarget& target,
                              SampleBlock& dst) {
    ARDUPLAY_CHECK(src.channels == 1 || src.channels == 2,
                   ErrorCode::InvalidArgument, "source must be mono or stereo");
    ARDUPLAY_CHECK(target.channels == 1 || target.channels == 2,
                   ErrorCode::InvalidArgument, "target must be mono or stereo");

    const size_t in_samples = src.sample_count();
    if (in_samples % src.channels != 0) {
        return make_error_fmt(ErrorCode::InvalidArgument,
                              "{} samples is not a whole number of {}-channel frames",
                              in_samples, src.channels);
    }

    const size_t frames = in_samples / src.channels;
    const size_t out_samples = frames * target.channels;
    const float volume = std::isnan(target.volume) ? 0.0f : std::clamp(target.volume, 0.0f, 1.0f);

    dst.format = target.format;
    dst.channels = target.channels;
    if (target.format == apal::SampleFormat::S16) {
        dst.s16.resize(out_samples);
        dst.f32.clear();
    } else {
        dst.f32.resize(out_samples);
        dst.s16.clear();
    }

    // Fast path: identical int16 layout at unity gain
    if (src.format == apal::SampleFormat::S16 && target.format == apal::SampleFormat::S16 &&
        src.channels == target.channels && volume == 1.0f) {
        std::copy(src.s16.begin(), src.s16.end(), dst.s16.begin());
        return Ok();
    }

    auto write = [&](size_t i, float v) {
        v *= volume;
        if (target.format == apal::SampleFormat::S16) {
            dst.s16[i] = convert::float_to_s16(v);
        } else {
            dst.f32[i] = convert::clamp_unit(v);
        }
    };

    for (size_t f = 0; f < frames; ++f) {
        if (src.channels == target.channels) {
            for (uint16_t c = 0; c < src.channels; ++c) {
                const size_t i = f * src.channels + c;
                write(i, read_normalized(src, i));
            }
        } else if (src.channels == 1) {
            // Mono -> stereo: duplicate
            const float v = read_normalized(src, f);
            write(f * 2, v);
            write(f * 2 + 1, v);
        } else {
            // Stereo -> mono: average
            const float l = read_normalized(src, f * 2);
            const float r = read_normalized(src, f * 2 + 1);
            write(f, (l + r) * 0.5f);
        }
    }
    return Ok();
}

} // namespace arduplay
