/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "calc_duration.hpp"
#include <algorithm>
#include <limits>

namespace kinema::generators {

    double calcGeneratorDuration(const KeyframeGenerator& generator) {
        double duration = 0.0;
        auto state = generator.next(duration);
        while (!state.done && duration < MAX_GENERATOR_DURATION) {
            duration += DURATION_SAMPLE_STEP;
            state = generator.next(duration);
        }
        return duration >= MAX_GENERATOR_DURATION ? std::numeric_limits<double>::infinity() : duration;
    }

    double velocityPerSecond(const double velocity, const double frame_duration) {
        return frame_duration != 0.0 ? velocity * (1000.0 / frame_duration) : 0.0;
    }

    double calcGeneratorVelocity(const std::function<double(double)>& resolve_value,
                                 const double t, const double current) {
        const double prev_t = std::max(t - VELOCITY_SAMPLE_DURATION, 0.0);
        return velocityPerSecond(current - resolve_value(prev_t), t - prev_t);
    }

} // namespace kinema::generators
