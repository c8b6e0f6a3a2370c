/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "driver/driver.hpp"
#include "generators/generator.hpp"
#include "values/motion_value.hpp"
#include "values/value.hpp"
#include <climits>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace kinema::animation {

    using values::Value;

    inline constexpr int REPEAT_FOREVER = INT_MAX;

    enum class RepeatType : uint8_t {
        LOOP,
        REVERSE,
        MIRROR
    };

    enum class AnimationPlayState : uint8_t {
        IDLE,
        RUNNING,
        PAUSED,
        FINISHED
    };

    struct RepeatOptions {
        int repeat = 0;
        RepeatType repeat_type = RepeatType::LOOP;
    };

    /**
     * @brief Everything needed to animate a single value.
     *
     * All times are in milliseconds. Generator tuning (duration, ease, spring,
     * inertia, ...) is inherited from GeneratorOptions.
     */
    struct AnimationOptions : generators::GeneratorOptions {
        int repeat = 0;
        RepeatType repeat_type = RepeatType::LOOP;
        double repeat_delay = 0.0;
        double delay = 0.0;

        bool autoplay = true;
        double speed = 1.0;
        std::optional<double> start_time;
        bool allow_flatten = false;

        // Rest value used instead of the last keyframe when finishing forwards
        std::optional<Value> final_keyframe;

        driver::DriverFactory driver;
        std::shared_ptr<values::MotionValue> motion_value;

        std::function<void(const Value&)> on_update;
        std::function<void()> on_play;
        std::function<void()> on_complete;
        std::function<void()> on_stop;
        std::function<void()> on_cancel;

        [[nodiscard]] RepeatOptions repeatOptions() const { return {repeat, repeat_type}; }
    };

    [[nodiscard]] std::string_view repeatTypeName(RepeatType type);
    [[nodiscard]] std::string_view playStateName(AnimationPlayState state);

} // namespace kinema::animation
