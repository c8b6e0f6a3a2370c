/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "generators/easing.hpp"
#include "values/value.hpp"
#include <functional>
#include <span>
#include <vector>

namespace kinema::generators {

    using Interpolator = std::function<values::Value(double)>;

    // Fraction of the way from `from` to `to`; 1 for an empty range.
    [[nodiscard]] double progress(double from, double to, double value);

    [[nodiscard]] std::vector<double> defaultOffsets(size_t count);

    /**
     * @brief Piecewise map from an input range onto keyframe values.
     *
     * ease[i] shapes segment i; missing entries are linear. Input must be sorted
     * (descending input is reversed together with the output). Throws
     * std::invalid_argument when input and output sizes differ or are empty.
     */
    [[nodiscard]] Interpolator interpolate(std::vector<double> input,
                                           std::vector<values::Value> output,
                                           std::span<const EasingFunction> ease = {},
                                           bool clamp = true);

} // namespace kinema::generators
