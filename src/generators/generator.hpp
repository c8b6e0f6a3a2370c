/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "generators/easing.hpp"
#include "values/value.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace kinema::generators {

    using values::Value;

    struct AnimationState {
        Value value;
        bool done = false;
    };

    /**
     * @brief Samples an animation curve at an elapsed time (ms).
     *
     * next() must accept t = 0 at any point and any t beyond the duration.
     * calculated_duration stays empty until known and is never recomputed once set.
     */
    struct KeyframeGenerator {
        std::function<AnimationState(double)> next;
        std::optional<double> calculated_duration;
    };

    enum class GeneratorType : uint8_t {
        KEYFRAMES,
        SPRING,
        INERTIA,
        CUSTOM
    };

    inline constexpr double DEFAULT_TWEEN_DURATION = 300.0;

    struct SpringOptions {
        // Setting any of stiffness, damping or mass selects the physical model.
        // Otherwise a duration or bounce resolves the spring from them.
        std::optional<double> stiffness;
        std::optional<double> damping;
        std::optional<double> mass;
        std::optional<double> bounce;
        std::optional<double> rest_speed;
        std::optional<double> rest_delta;
    };

    struct InertiaOptions {
        double power = 0.8;
        double time_constant = 325.0;
        double bounce_damping = 10.0;
        double bounce_stiffness = 500.0;
        std::optional<double> min;
        std::optional<double> max;
        double rest_delta = 0.5;
        std::optional<double> rest_speed;
        std::function<double(double)> modify_target;
    };

    struct GeneratorOptions;
    using GeneratorFactory = std::function<KeyframeGenerator(const GeneratorOptions&)>;

    struct GeneratorOptions {
        std::vector<Value> keyframes;
        GeneratorType type = GeneratorType::KEYFRAMES;
        GeneratorFactory custom_factory; // used when type == CUSTOM

        std::optional<double> duration; // ms
        double velocity = 0.0;          // units per second
        std::vector<Easing> ease;       // empty: default, one entry: every segment
        std::vector<double> times;      // keyframe offsets in [0, 1]

        SpringOptions spring;
        InertiaOptions inertia;
    };

    [[nodiscard]] KeyframeGenerator keyframes(const GeneratorOptions& options);
    [[nodiscard]] KeyframeGenerator spring(const GeneratorOptions& options);
    [[nodiscard]] KeyframeGenerator inertia(const GeneratorOptions& options);

    // Factory for the type; CUSTOM resolves to options.custom_factory when set.
    [[nodiscard]] GeneratorFactory generatorFactoryFor(GeneratorType type, const GeneratorFactory& custom = {});

    // Whether the type interpolates arbitrary values or only numbers.
    [[nodiscard]] bool supportsValueMixing(GeneratorType type);

    [[nodiscard]] std::string_view generatorTypeName(GeneratorType type);

} // namespace kinema::generators
