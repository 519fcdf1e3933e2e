/**
 * @file arduplay_run.cpp
 * @brief Command-line frontend: run a libretro core on one piece of content.
 *
 * Run:
 *   arduplay-run [options] <core.so> <content>
 *
 * Ctrl+C stops at the next tick boundary; drivers and the core are torn
 * down normally.
 *
 * @copyright GPL-2.0-or-later
 */

#include "arduplay/config.h"
#include "arduplay/libretro_core.h"
#include "arduplay/logging.h"
#include "arduplay/runtime.h"
#include "apal/platform.h"

#include <atomic>
#include <charconv>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace {

std::atomic<arduplay::Runtime*> g_runtime{nullptr};

void signal_handler(int /*signal*/) {
    if (arduplay::Runtime* runtime = g_runtime.load()) {
        runtime->request_stop();
    }
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <core.so> <content>\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>       Read settings from a TOML file\n"
              << "  --frames <n>          Stop after n frames (0 = run until stopped)\n"
              << "  --fps <f>             Target frame rate (default: 60)\n"
              << "  --video <backend>     null | sdl2 | sdl3 (default: null)\n"
              << "  --audio <backend>     null | sdl2 | sdl3 (default: null)\n"
              << "  --input <backend>     null | sdl2 | sdl3 (default: null)\n"
              << "  --volume <v>          Output volume, 0.0 to 1.0 (default: 1.0)\n"
              << "  --rewind <n>          Keep n rewind snapshots (default: 0)\n"
              << "  --state-dir <dir>     Directory for snapshot slots (default: .)\n"
              << "  --log-level <level>   error | warn | info | debug | trace\n"
              << "  --help                Show this help message\n";
}

template<typename T>
std::optional<T> parse_number(std::string_view text) {
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

struct Args {
    std::optional<std::string> config_file;
    std::optional<uint64_t> frames;
    std::optional<double> fps;
    std::optional<apal::Backend> video;
    std::optional<apal::Backend> audio;
    std::optional<apal::Backend> input;
    std::optional<float> volume;
    std::optional<size_t> rewind;
    std::optional<std::string> state_dir;
    std::optional<arduplay::LogLevel> log_level;
    std::string core_path;
    std::string content_path;
};

/// @return false (after printing why) on a malformed command line
bool parse_args(int argc, char* argv[], Args& args, bool& help) {
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool has_value = i + 1 < argc;
        bool ok = true;

        if (arg == "--help" || arg == "-h") {
            help = true;
            return true;
        } else if (arg == "--config" && has_value) {
            args.config_file = argv[++i];
        } else if (arg == "--frames" && has_value) {
            ok = (args.frames = parse_number<uint64_t>(argv[++i])).has_value();
        } else if (arg == "--fps" && has_value) {
            ok = (args.fps = parse_number<double>(argv[++i])).has_value();
        } else if (arg == "--video" && has_value) {
            ok = (args.video = apal::parseBackend(argv[++i])).has_value();
        } else if (arg == "--audio" && has_value) {
            ok = (args.audio = apal::parseBackend(argv[++i])).has_value();
        } else if (arg == "--input" && has_value) {
            ok = (args.input = apal::parseBackend(argv[++i])).has_value();
        } else if (arg == "--volume" && has_value) {
            ok = (args.volume = parse_number<float>(argv[++i])).has_value();
        } else if (arg == "--rewind" && has_value) {
            ok = (args.rewind = parse_number<size_t>(argv[++i])).has_value();
        } else if (arg == "--state-dir" && has_value) {
            args.state_dir = argv[++i];
        } else if (arg == "--log-level" && has_value) {
            ok = (args.log_level = arduplay::parse_log_level(argv[++i])).has_value();
        } else if (!arg.starts_with("-") && positional == 0) {
            args.core_path = arg;
            ++positional;
        } else if (!arg.starts_with("-") && positional == 1) {
            args.content_path = arg;
            ++positional;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return false;
        }

        if (!ok) {
            std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
            return false;
        }
    }

    if (positional != 2) {
        std::cerr << "Error: a core and a content file are required\n";
        return false;
    }
    return true;
}

arduplay::Result<arduplay::RuntimeConfig> build_config(const Args& args) {
    arduplay::RuntimeConfig base;
    if (args.config_file) {
        auto loaded = arduplay::load_runtime_config(*args.config_file);
        if (!loaded) {
            return arduplay::Err(loaded.error());
        }
        base = std::move(*loaded);
    }

    // Command-line flags override the file
    const uint32_t scale = base.video_scale;
    arduplay::RuntimeConfigBuilder builder(std::move(base));
    if (args.frames) {
        if (*args.frames == 0) {
            builder.unlimited();
        } else {
            builder.max_frames(*args.frames);
        }
    }
    if (args.fps) {
        builder.target_fps(*args.fps);
    }
    if (args.video) {
        builder.video(*args.video, scale);
    }
    if (args.audio) {
        builder.audio(*args.audio);
    }
    if (args.input) {
        builder.input(*args.input);
    }
    if (args.volume) {
        builder.volume(*args.volume);
    }
    if (args.rewind) {
        builder.rewind(*args.rewind);
    }
    if (args.state_dir) {
        builder.snapshot_dir(*args.state_dir);
    }
    return builder.build();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Args args;
    bool help = false;
    if (!parse_args(argc, argv, args, help)) {
        print_usage(argv[0]);
        return 1;
    }
    if (help) {
        print_usage(argv[0]);
        return 0;
    }

    if (args.log_level) {
        arduplay::set_log_level(*args.log_level);
    }

    auto config = build_config(args);
    if (!config) {
        std::cerr << "Error: " << config.error().message() << "\n";
        return 1;
    }

    if (!arduplay::libretro_available()) {
        std::cerr << "Error: this build cannot load libretro cores\n";
        return 1;
    }

    arduplay::Runtime runtime(
        *config, std::make_unique<arduplay::SessionBridge>(arduplay::make_libretro_factory()));

    auto started = runtime.start(args.core_path, args.content_path);
    if (!started) {
        std::cerr << "Error: " << started.error().message() << "\n";
        return 1;
    }

    g_runtime.store(&runtime);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto result = runtime.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_runtime.store(nullptr);

    if (!result) {
        std::cerr << "Error: " << result.error().message() << "\n";
        return 2;
    }
    return 0;
}
