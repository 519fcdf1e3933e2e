/**
 * @file core.h
 * @brief Boundary to the opaque emulation core.
 *
 * An ICore is the black box that actually emulates the console. The
 * session bridge is its only user: it owns exactly one core, calls it from
 * one thread, and converts anything the core throws into a StepError.
 *
 * @copyright GPL-2.0-or-later
 */

#pragma once

#include "arduplay/error.h"
#include "arduplay/format_converter.h"
#include "apal/input_driver.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>

namespace arduplay {

/**
 * @brief Constants a core reports once content is loaded.
 */
struct CoreInfo {
    std::string name;
    std::string version;
    uint32_t width = 0;
    uint32_t height = 0;
    PixelFormat pixel_format = PixelFormat::RGB565;
    double fps = 60.0;
    uint32_t sample_rate = 0;
    uint16_t audio_channels = 1;
    apal::SampleFormat sample_format = apal::SampleFormat::S16;
};

/**
 * @brief Emulation core interface.
 *
 * Implementations may throw (CoreException or anything derived from
 * std::exception) from any member; callers treat a throw from
 * run_frame() as fatal for the session.
 */
class ICore {
public:
    virtual ~ICore() = default;

    /**
     * @brief Load game content.
     * @return ContentLoadError if the file is missing or rejected
     */
    virtual Result<void> load_content(const std::filesystem::path& content) = 0;

    /// Valid after load_content() succeeded
    [[nodiscard]] virtual CoreInfo info() const = 0;

    /// Controller state used by the next run_frame()
    virtual void set_input(const apal::InputState& state) = 0;

    /// Advance exactly one emulated frame
    virtual void run_frame() = 0;

    /// Framebuffer of the last run_frame()
    [[nodiscard]] virtual NativeFrame frame() const = 0;

    /// Samples produced by the last run_frame()
    [[nodiscard]] virtual NativeAudio audio() const = 0;

    /// Bytes needed for serialize(); 0 means snapshots are unsupported
    [[nodiscard]] virtual size_t serialize_size() const = 0;

    /// Write state into out (out.size() == serialize_size())
    virtual bool serialize(std::span<uint8_t> out) const = 0;

    /// Restore state; false if the blob is rejected
    virtual bool deserialize(std::span<const uint8_t> data) = 0;

    /// Soft reset (power cycle without reloading content)
    virtual void reset() = 0;

    /// Unload content; no other member is called afterwards
    virtual void unload() = 0;
};

/**
 * @brief Creates a core from a core path.
 *
 * @return CoreLoadError if nothing usable exists at core_path
 */
using CoreFactory =
    std::function<Result<std::unique_ptr<ICore>>(const std::filesystem::path& core_path)>;

} // namespace arduplay
