/**
 * @file libretro_core.cpp
 * @brief ICore over a dlopen'ed libretro shared object.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/libretro_core.h"
#include "arduplay/logging.h"

#ifdef ARDUPLAY_HAS_LIBRETRO

#include "arduplay/exceptions.h"

#include <libretro.h>
#include <dlfcn.h>

#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <format>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace arduplay {

namespace {

constexpr const char* kLogSubsys = "CORE";

// ─────────────────────────────────────────────────────────────────────────────
// Shared Object
// ─────────────────────────────────────────────────────────────────────────────

struct DlClose {
    void operator()(void* handle) const noexcept {
        if (handle) {
            dlclose(handle);
        }
    }
};
using DlHandle = std::unique_ptr<void, DlClose>;

/// Entry points every core must export
struct RetroApi {
    void (*init)(void) = nullptr;
    void (*deinit)(void) = nullptr;
    unsigned (*api_version)(void) = nullptr;
    void (*get_system_info)(retro_system_info*) = nullptr;
    void (*get_system_av_info)(retro_system_av_info*) = nullptr;
    void (*set_controller_port_device)(unsigned, unsigned) = nullptr;
    void (*reset)(void) = nullptr;
    void (*run)(void) = nullptr;
    size_t (*serialize_size)(void) = nullptr;
    bool (*serialize)(void*, size_t) = nullptr;
    bool (*unserialize)(const void*, size_t) = nullptr;
    bool (*load_game)(const retro_game_info*) = nullptr;
    void (*unload_game)(void) = nullptr;
    void (*set_environment)(retro_environment_t) = nullptr;
    void (*set_video_refresh)(retro_video_refresh_t) = nullptr;
    void (*set_audio_sample)(retro_audio_sample_t) = nullptr;
    void (*set_audio_sample_batch)(retro_audio_sample_batch_t) = nullptr;
    void (*set_input_poll)(retro_input_poll_t) = nullptr;
    void (*set_input_state)(retro_input_state_t) = nullptr;
};

template<typename Fn>
bool resolve(void* handle, const char* name, Fn& out) noexcept {
    out = reinterpret_cast<Fn>(dlsym(handle, name));
    return out != nullptr;
}

/// apal button -> RETRO_DEVICE_ID_JOYPAD_*
constexpr struct {
    apal::Button button;
    unsigned id;
} kJoypadMap[] = {
    {apal::Button::B,      RETRO_DEVICE_ID_JOYPAD_B},
    {apal::Button::Select, RETRO_DEVICE_ID_JOYPAD_SELECT},
    {apal::Button::Start,  RETRO_DEVICE_ID_JOYPAD_START},
    {apal::Button::Up,     RETRO_DEVICE_ID_JOYPAD_UP},
    {apal::Button::Down,   RETRO_DEVICE_ID_JOYPAD_DOWN},
    {apal::Button::Left,   RETRO_DEVICE_ID_JOYPAD_LEFT},
    {apal::Button::Right,  RETRO_DEVICE_ID_JOYPAD_RIGHT},
    {apal::Button::A,      RETRO_DEVICE_ID_JOYPAD_A},
};

std::optional<PixelFormat> from_retro(retro_pixel_format format) noexcept {
    switch (format) {
        case RETRO_PIXEL_FORMAT_0RGB1555: return PixelFormat::RGB1555;
        case RETRO_PIXEL_FORMAT_XRGB8888: return PixelFormat::XRGB8888;
        case RETRO_PIXEL_FORMAT_RGB565:   return PixelFormat::RGB565;
        default:                          return std::nullopt;
    }
}

LogLevel from_retro(retro_log_level level) noexcept {
    switch (level) {
        case RETRO_LOG_DEBUG: return LogLevel::Debug;
        case RETRO_LOG_INFO:  return LogLevel::Info;
        case RETRO_LOG_WARN:  return LogLevel::Warn;
        default:              return LogLevel::Error;
    }
}

class LibretroCore;

// Target of the C callbacks while this thread is inside a core call
thread_local LibretroCore* t_active_core = nullptr;

class ActiveScope {
public:
    explicit ActiveScope(LibretroCore* core) noexcept
        : previous_(t_active_core) {
        t_active_core = core;
    }
    ~ActiveScope() { t_active_core = previous_; }

    ActiveScope(const ActiveScope&) = delete;
    ActiveScope& operator=(const ActiveScope&) = delete;

private:
    LibretroCore* previous_;
};

// ─────────────────────────────────────────────────────────────────────────────
// LibretroCore
// ─────────────────────────────────────────────────────────────────────────────

class LibretroCore final : public ICore {
public:
    static Result<std::unique_ptr<ICore>> open(const std::filesystem::path& core_path,
                                               const LibretroOptions& options);

    ~LibretroCore() override;

    Result<void> load_content(const std::filesystem::path& content) override;
    [[nodiscard]] CoreInfo info() const override { return info_; }
    void set_input(const apal::InputState& state) override { input_ = state; }
    void run_frame() override;
    [[nodiscard]] NativeFrame frame() const override;
    [[nodiscard]] NativeAudio audio() const override;
    [[nodiscard]] size_t serialize_size() const override;
    bool serialize(std::span<uint8_t> out) const override;
    bool deserialize(std::span<const uint8_t> data) override;
    void reset() override;
    void unload() override;

private:
    LibretroCore(DlHandle handle, const RetroApi& api, std::string name)
        : handle_(std::move(handle)), api_(api), name_(std::move(name)) {}

    // C entry points; each forwards to t_active_core
    static bool on_environment(unsigned cmd, void* data);
    static void on_video_refresh(const void* data, unsigned width, unsigned height, size_t pitch);
    static void on_audio_sample(int16_t left, int16_t right);
    static size_t on_audio_sample_batch(const int16_t* data, size_t frames);
    static void on_input_poll() {}
    static int16_t on_input_state(unsigned port, unsigned device, unsigned index, unsigned id);
    static void on_log(enum retro_log_level level, const char* fmt, ...);

    bool environment(unsigned cmd, void* data);
    void store_frame(const void* data, unsigned width, unsigned height, size_t pitch);

    /// Rethrow a fault recorded inside a callback
    void raise_pending_fault();

    DlHandle handle_;
    RetroApi api_;
    std::string name_;

    std::string system_dir_;
    std::string save_dir_;
    std::string content_path_;
    std::vector<uint8_t> content_data_;
    bool initialized_ = false;
    bool game_loaded_ = false;

    CoreInfo info_;
    apal::InputState input_;
    std::vector<uint8_t> frame_;
    uint32_t frame_width_ = 0;
    uint32_t frame_height_ = 0;
    size_t frame_pitch_ = 0;
    std::vector<int16_t> audio_;
    std::string fault_;
};

Result<std::unique_ptr<ICore>> LibretroCore::open(const std::filesystem::path& core_path,
                                                  const LibretroOptions& options) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(core_path, ec)) {
        return make_error_fmt(ErrorCode::CoreLoadError, "core '{}' not found", core_path.string());
    }

    DlHandle handle(dlopen(core_path.c_str(), RTLD_LAZY | RTLD_LOCAL));
    if (!handle) {
        const char* why = dlerror();
        return make_error_fmt(ErrorCode::CoreLoadError, "dlopen '{}': {}",
                              core_path.string(), why ? why : "unknown error");
    }

    RetroApi api;
    const char* missing = nullptr;
    auto need = [&](const char* symbol, auto& fn) {
        if (!missing && !resolve(handle.get(), symbol, fn)) {
            missing = symbol;
        }
    };
    need("retro_init", api.init);
    need("retro_deinit", api.deinit);
    need("retro_api_version", api.api_version);
    need("retro_get_system_info", api.get_system_info);
    need("retro_get_system_av_info", api.get_system_av_info);
    need("retro_set_controller_port_device", api.set_controller_port_device);
    need("retro_reset", api.reset);
    need("retro_run", api.run);
    need("retro_serialize_size", api.serialize_size);
    need("retro_serialize", api.serialize);
    need("retro_unserialize", api.unserialize);
    need("retro_load_game", api.load_game);
    need("retro_unload_game", api.unload_game);
    need("retro_set_environment", api.set_environment);
    need("retro_set_video_refresh", api.set_video_refresh);
    need("retro_set_audio_sample", api.set_audio_sample);
    need("retro_set_audio_sample_batch", api.set_audio_sample_batch);
    need("retro_set_input_poll", api.set_input_poll);
    need("retro_set_input_state", api.set_input_state);
    if (missing) {
        return make_error_fmt(ErrorCode::CoreLoadError, "'{}' does not export {}",
                              core_path.string(), missing);
    }

    const unsigned version = api.api_version();
    if (version != RETRO_API_VERSION) {
        return make_error_fmt(ErrorCode::CoreLoadError, "'{}' implements libretro API {}, expected {}",
                              core_path.string(), version, RETRO_API_VERSION);
    }

    std::unique_ptr<LibretroCore> core(
        new LibretroCore(std::move(handle), api, core_path.filename().string()));
    core->system_dir_ = options.system_dir.string();
    core->save_dir_ = options.save_dir.string();
    // A core that never sends SET_PIXEL_FORMAT outputs 0RGB1555
    core->info_.pixel_format = kLibretroDefaultPixelFormat;

    retro_system_info sys{};
    {
        ActiveScope scope(core.get());
        api.set_environment(&LibretroCore::on_environment);
        api.set_video_refresh(&LibretroCore::on_video_refresh);
        api.set_audio_sample(&LibretroCore::on_audio_sample);
        api.set_audio_sample_batch(&LibretroCore::on_audio_sample_batch);
        api.set_input_poll(&LibretroCore::on_input_poll);
        api.set_input_state(&LibretroCore::on_input_state);
        api.init();
        core->initialized_ = true;
        api.get_system_info(&sys);
    }

    core->info_.name = sys.library_name ? sys.library_name : core->name_;
    core->info_.version = sys.library_version ? sys.library_version : "";
    ARDUPLAY_LOG_INFO(kLogSubsys, "Opened {} {} from '{}'",
                      core->info_.name, core->info_.version, core_path.string());
    return Ok<std::unique_ptr<ICore>>(std::move(core));
}

LibretroCore::~LibretroCore() {
    ActiveScope scope(this);
    if (game_loaded_) {
        api_.unload_game();
    }
    if (initialized_) {
        api_.deinit();
    }
}

Result<void> LibretroCore::load_content(const std::filesystem::path& content) {
    ActiveScope scope(this);

    retro_system_info sys{};
    api_.get_system_info(&sys);

    content_path_ = content.string();
    retro_game_info game{};
    game.path = content_path_.c_str();

    if (!sys.need_fullpath) {
        std::ifstream in(content, std::ios::binary);
        if (!in) {
            return make_error_fmt(ErrorCode::ContentLoadError, "cannot open '{}'", content_path_);
        }
        content_data_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            return make_error_fmt(ErrorCode::ContentLoadError, "error reading '{}'", content_path_);
        }
        game.data = content_data_.data();
        game.size = content_data_.size();
    }

    // Directories default to the content's own
    const std::string content_dir = content.parent_path().string();
    if (system_dir_.empty()) {
        system_dir_ = content_dir.empty() ? "." : content_dir;
    }
    if (save_dir_.empty()) {
        save_dir_ = content_dir.empty() ? "." : content_dir;
    }

    if (!api_.load_game(&game)) {
        raise_pending_fault();
        return make_error_fmt(ErrorCode::ContentLoadError, "{} rejected '{}'",
                              info_.name, content_path_);
    }
    game_loaded_ = true;
    api_.set_controller_port_device(0, RETRO_DEVICE_JOYPAD);

    retro_system_av_info av{};
    api_.get_system_av_info(&av);
    info_.width = av.geometry.base_width;
    info_.height = av.geometry.base_height;
    info_.fps = av.timing.fps > 0.0 ? av.timing.fps : 60.0;
    info_.sample_rate = static_cast<uint32_t>(std::lround(av.timing.sample_rate));
    info_.audio_channels = 2;
    info_.sample_format = apal::SampleFormat::S16;

    raise_pending_fault();
    return Ok();
}

void LibretroCore::run_frame() {
    ActiveScope scope(this);
    audio_.clear();
    api_.run();
    raise_pending_fault();
}

NativeFrame LibretroCore::frame() const {
    NativeFrame out;
    out.data = frame_;
    out.width = frame_width_;
    out.height = frame_height_;
    out.pitch = frame_pitch_;
    out.format = info_.pixel_format;
    return out;
}

NativeAudio LibretroCore::audio() const {
    NativeAudio out;
    out.format = apal::SampleFormat::S16;
    out.channels = 2;
    out.sample_rate = info_.sample_rate;
    out.s16 = audio_;
    return out;
}

size_t LibretroCore::serialize_size() const {
    ActiveScope scope(const_cast<LibretroCore*>(this));
    return api_.serialize_size();
}

bool LibretroCore::serialize(std::span<uint8_t> out) const {
    ActiveScope scope(const_cast<LibretroCore*>(this));
    return api_.serialize(out.data(), out.size());
}

bool LibretroCore::deserialize(std::span<const uint8_t> data) {
    ActiveScope scope(this);
    return api_.unserialize(data.data(), data.size());
}

void LibretroCore::reset() {
    ActiveScope scope(this);
    api_.reset();
    raise_pending_fault();
}

void LibretroCore::unload() {
    if (!game_loaded_) {
        return;
    }
    ActiveScope scope(this);
    api_.unload_game();
    game_loaded_ = false;
}

void LibretroCore::raise_pending_fault() {
    if (!fault_.empty()) {
        std::string fault = std::move(fault_);
        fault_.clear();
        throw CoreException(fault);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Callbacks
// ─────────────────────────────────────────────────────────────────────────────
//
// These run inside the core's C frames and must not throw. A failure is
// recorded in fault_ and rethrown once control is back in C++.

bool LibretroCore::on_environment(unsigned cmd, void* data) {
    LibretroCore* self = t_active_core;
    return self != nullptr && self->environment(cmd, data);
}

bool LibretroCore::environment(unsigned cmd, void* data) {
    switch (cmd) {
        case RETRO_ENVIRONMENT_SET_PIXEL_FORMAT: {
            auto format = from_retro(*static_cast<const retro_pixel_format*>(data));
            if (!format) {
                return false;
            }
            info_.pixel_format = *format;
            ARDUPLAY_LOG_DEBUG(kLogSubsys, "Pixel format {}", pixel_format_name(*format));
            return true;
        }
        case RETRO_ENVIRONMENT_GET_CAN_DUPE:
            *static_cast<bool*>(data) = true;
            return true;
        case RETRO_ENVIRONMENT_GET_SYSTEM_DIRECTORY:
            *static_cast<const char**>(data) = system_dir_.empty() ? nullptr : system_dir_.c_str();
            return !system_dir_.empty();
        case RETRO_ENVIRONMENT_GET_SAVE_DIRECTORY:
            *static_cast<const char**>(data) = save_dir_.empty() ? nullptr : save_dir_.c_str();
            return !save_dir_.empty();
        case RETRO_ENVIRONMENT_GET_LOG_INTERFACE:
            static_cast<retro_log_callback*>(data)->log = &LibretroCore::on_log;
            return true;
        case RETRO_ENVIRONMENT_SET_GEOMETRY: {
            const auto* geometry = static_cast<const retro_game_geometry*>(data);
            info_.width = geometry->base_width;
            info_.height = geometry->base_height;
            return true;
        }
        case RETRO_ENVIRONMENT_SET_SUPPORT_NO_GAME:
            return true;
        default:
            return false;
    }
}

void LibretroCore::on_video_refresh(const void* data, unsigned width, unsigned height,
                                    size_t pitch) {
    if (LibretroCore* self = t_active_core) {
        self->store_frame(data, width, height, pitch);
    }
}

void LibretroCore::store_frame(const void* data, unsigned width, unsigned height, size_t pitch) {
    // NULL means "same as last frame" (GET_CAN_DUPE)
    if (data == nullptr) {
        return;
    }
    try {
        const auto* bytes = static_cast<const uint8_t*>(data);
        frame_.assign(bytes, bytes + frame_span_bytes(width, height, pitch, info_.pixel_format));
        frame_width_ = width;
        frame_height_ = height;
        frame_pitch_ = pitch;
    } catch (const std::exception& e) {
        fault_ = std::format("video_refresh: {}", e.what());
    }
}

void LibretroCore::on_audio_sample(int16_t left, int16_t right) {
    LibretroCore* self = t_active_core;
    if (!self) {
        return;
    }
    try {
        self->audio_.push_back(left);
        self->audio_.push_back(right);
    } catch (const std::exception& e) {
        self->fault_ = std::format("audio_sample: {}", e.what());
    }
}

size_t LibretroCore::on_audio_sample_batch(const int16_t* data, size_t frames) {
    LibretroCore* self = t_active_core;
    if (!self) {
        return frames;
    }
    try {
        self->audio_.insert(self->audio_.end(), data, data + frames * 2);
    } catch (const std::exception& e) {
        self->fault_ = std::format("audio_sample_batch: {}", e.what());
    }
    return frames;
}

int16_t LibretroCore::on_input_state(unsigned port, unsigned device, unsigned /*index*/,
                                     unsigned id) {
    LibretroCore* self = t_active_core;
    if (!self || port != 0 || device != RETRO_DEVICE_JOYPAD) {
        return 0;
    }
    for (const auto& entry : kJoypadMap) {
        if (entry.id == id) {
            return self->input_.isPressed(entry.button) ? 1 : 0;
        }
    }
    return 0;
}

void LibretroCore::on_log(enum retro_log_level level, const char* fmt, ...) {
    const LogLevel mapped = from_retro(level);
    if (!log_level_enabled(mapped)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    int written = std::vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);
    if (written < 0) {
        return;
    }

    // Cores terminate their lines; the sink adds its own
    size_t len = std::min(static_cast<size_t>(written), sizeof(buffer) - 1);
    while (len > 0 && (buffer[len - 1] == '\n' || buffer[len - 1] == '\r')) {
        --len;
    }
    log_raw(mapped, kLogSubsys, std::string_view(buffer, len));
}

} // anonymous namespace

bool libretro_available() noexcept {
    return true;
}

CoreFactory make_libretro_factory(LibretroOptions options) {
    return [options = std::move(options)](const std::filesystem::path& core_path) {
        return LibretroCore::open(core_path, options);
    };
}

} // namespace arduplay

#else // !ARDUPLAY_HAS_LIBRETRO

namespace arduplay {

bool libretro_available() noexcept {
    return false;
}

CoreFactory make_libretro_factory(LibretroOptions /*options*/) {
    return [](const std::filesystem::path& core_path) -> Result<std::unique_ptr<ICore>> {
        return make_error_fmt(ErrorCode::CoreLoadError,
                              "cannot load '{}': built without libretro support",
                              core_path.string());
    };
}

} // namespace arduplay

#endif // ARDUPLAY_HAS_LIBRETRO
