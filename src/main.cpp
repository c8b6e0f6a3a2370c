/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation/animation_count.hpp"
#include "animation/value_animation.hpp"
#include "config/engine_config.hpp"
#include "config/options_json.hpp"
#include "core/logger.hpp"
#include "driver/frame_loop.hpp"
#include "driver/frameloop_driver.hpp"

#include <charconv>
#include <cstdio>
#include <expected>
#include <string>

namespace {

    constexpr double DEFAULT_FPS = 60.0;
    // Upper bound on printed frames, for infinitely repeating animations
    constexpr int MAX_FRAMES = 100000;
    constexpr double START_TIME = 1000.0;

    struct SampleArgs {
        std::string options_path;
        double fps = DEFAULT_FPS;
        std::string engine_path;
    };

    std::expected<SampleArgs, std::string> parseArgs(const int argc, char* argv[]) {
        if (argc < 2 || argc > 4) {
            return std::unexpected("usage: kinema_sample <options.json> [fps] [engine.json]");
        }

        SampleArgs args;
        args.options_path = argv[1];
        if (argc >= 3) {
            const std::string_view fps_arg(argv[2]);
            const auto [ptr, ec] = std::from_chars(fps_arg.data(), fps_arg.data() + fps_arg.size(), args.fps);
            if (ec != std::errc{} || ptr != fps_arg.data() + fps_arg.size() || args.fps <= 0.0) {
                return std::unexpected(fmt::format("Invalid fps: {}", fps_arg));
            }
        }
        if (argc == 4) args.engine_path = argv[3];
        return args;
    }

} // namespace

int main(int argc, char* argv[]) {
    using namespace kinema;

    auto args_result = parseArgs(argc, argv);
    if (!args_result) {
        fmt::print(stderr, "Error: {}\n", args_result.error());
        return -1;
    }
    const auto args = std::move(*args_result);

    config::EngineConfig engine_config;
    engine_config.log_level = core::LogLevel::Warn;
    if (!args.engine_path.empty()) {
        auto loaded = config::loadEngineConfig(args.engine_path);
        if (!loaded) {
            fmt::print(stderr, "Error: {}\n", loaded.error());
            return -1;
        }
        engine_config = *loaded;
    }
    config::applyEngineConfig(engine_config);

    auto options_result = config::loadAnimationOptions(args.options_path);
    if (!options_result) {
        fmt::print(stderr, "Error: {}\n", options_result.error());
        return -1;
    }
    auto options = std::move(*options_result);

    driver::FrameLoop loop(true);
    loop.setTime(START_TIME);
    options.driver = driver::frameloopDriver(loop);

    int frame = 0;
    options.on_update = [&frame, &loop](const values::Value& value) {
        fmt::print("{:6d} {:10.3f} {}\n", frame, loop.now() - START_TIME, values::formatValue(value));
    };

    bool completed = false;
    options.on_complete = [&completed] { completed = true; };

    try {
        auto animation = animation::animateValue(std::move(options));
        LOG_INFO("Sampling {} at {} fps (duration {:.3f}s)", args.options_path, args.fps, animation->duration());

        const double frame_delta = 1000.0 / args.fps;
        while (!completed && loop.hasPending() && frame < MAX_FRAMES) {
            loop.process(START_TIME + frame * frame_delta);
            ++frame;
        }

        if (!completed) {
            LOG_WARN("Animation did not complete after {} frames", frame);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Animation failed: {}", e.what());
        fmt::print(stderr, "Error: {}\n", e.what());
        core::Logger::get().flush();
        return -1;
    }

    LOG_DEBUG("Active animations at exit: {}", animation::stats::activeAnimations().main_thread.load());
    core::Logger::get().flush();
    return 0;
}
