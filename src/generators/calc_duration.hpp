/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "generators/generator.hpp"
#include <functional>

namespace kinema::generators {

    // Generators still running after this long are treated as endless.
    inline constexpr double MAX_GENERATOR_DURATION = 20000.0;
    inline constexpr double DURATION_SAMPLE_STEP = 50.0;
    inline constexpr double VELOCITY_SAMPLE_DURATION = 5.0;

    /**
     * @brief Find how long a generator runs by stepping it until done.
     * @return duration in ms, or +infinity if the generator never settles
     *         within MAX_GENERATOR_DURATION
     */
    [[nodiscard]] double calcGeneratorDuration(const KeyframeGenerator& generator);

    // Units per second over the trailing VELOCITY_SAMPLE_DURATION window ending at t.
    [[nodiscard]] double calcGeneratorVelocity(const std::function<double(double)>& resolve_value,
                                               double t, double current);

    [[nodiscard]] double velocityPerSecond(double velocity, double frame_duration);

} // namespace kinema::generators
