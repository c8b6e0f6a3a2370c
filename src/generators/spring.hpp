/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "generators/generator.hpp"
#include <optional>

namespace kinema::generators {

    namespace spring_defaults {
        inline constexpr double STIFFNESS = 100.0;
        inline constexpr double DAMPING = 10.0;
        inline constexpr double MASS = 1.0;
        inline constexpr double DURATION = 800.0; // ms
        inline constexpr double BOUNCE = 0.3;
        inline constexpr double REST_SPEED_GRANULAR = 0.01;
        inline constexpr double REST_SPEED_DEFAULT = 2.0;
        inline constexpr double REST_DELTA_GRANULAR = 0.005;
        inline constexpr double REST_DELTA_DEFAULT = 0.5;
        inline constexpr double MIN_DURATION = 0.01; // s
        inline constexpr double MAX_DURATION = 10.0; // s
        inline constexpr double MIN_DAMPING = 0.05;
        inline constexpr double MAX_DAMPING = 1.0;
    } // namespace spring_defaults

    struct SpringParameters {
        double stiffness = spring_defaults::STIFFNESS;
        double damping = spring_defaults::DAMPING;
        double mass = spring_defaults::MASS;
        double duration = spring_defaults::DURATION; // ms
    };

    /**
     * @brief Solve for the stiffness and damping that settle a spring in `duration`.
     * @param duration ms, clamped to [10ms, 10s]
     * @param bounce 0 = critically damped, towards 1 = more oscillation
     * @param velocity initial velocity in the spring's internal units
     */
    [[nodiscard]] SpringParameters findSpring(double duration, double bounce, double velocity, double mass = 1.0);

    /**
     * @brief Numeric spring from origin to target.
     *
     * velocity is in units per second. duration and bounce are only used when
     * the options carry no physical parameters.
     */
    [[nodiscard]] KeyframeGenerator makeSpring(double origin, double target, double velocity,
                                               const SpringOptions& options,
                                               std::optional<double> duration = std::nullopt);

} // namespace kinema::generators
