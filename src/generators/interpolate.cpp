/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "interpolate.hpp"
#include "values/mix.hpp"
#include <algorithm>
#include <stdexcept>

namespace kinema::generators {

    double progress(const double from, const double to, const double value) {
        const double range = to - from;
        return range == 0.0 ? 1.0 : (value - from) / range;
    }

    std::vector<double> defaultOffsets(const size_t count) {
        if (count <= 1) return std::vector<double>(count, 0.0);

        std::vector<double> offsets(count);
        for (size_t i = 0; i < count; ++i) {
            offsets[i] = static_cast<double>(i) / static_cast<double>(count - 1);
        }
        return offsets;
    }

    Interpolator interpolate(std::vector<double> input,
                             std::vector<values::Value> output,
                             std::span<const EasingFunction> ease,
                             const bool clamp) {
        if (input.empty() || input.size() != output.size()) {
            throw std::invalid_argument("interpolate: input and output ranges must be the same non-zero length");
        }

        if (input.size() == 1) {
            return [value = output[0]](double) { return value; };
        }
        if (input.size() == 2 && output[0] == output[1]) {
            return [value = output[1]](double) { return value; };
        }

        const bool zero_delta_range = input[0] == input[1];

        std::vector<EasingFunction> segment_easing(ease.begin(), ease.end());
        if (input.front() > input.back()) {
            std::reverse(input.begin(), input.end());
            std::reverse(output.begin(), output.end());
        }

        // One mixer per segment, each shaped by its easing
        std::vector<values::Mixer> mixers;
        mixers.reserve(output.size() - 1);
        for (size_t i = 0; i + 1 < output.size(); ++i) {
            auto mixer = values::mix(output[i], output[i + 1]);
            if (i < segment_easing.size() && segment_easing[i]) {
                mixer = [mixer = std::move(mixer), easing = segment_easing[i]](const double p) {
                    return mixer(easing(p));
                };
            }
            mixers.push_back(std::move(mixer));
        }

        return [input = std::move(input), first = output.front(), mixers = std::move(mixers),
                zero_delta_range, clamp](double v) -> values::Value {
            if (clamp) {
                v = std::clamp(v, input.front(), input.back());
            }
            if (zero_delta_range && v < input[0]) return first;

            // Find segment containing v
            size_t i = 0;
            if (mixers.size() > 1) {
                for (; i < input.size() - 2; ++i) {
                    if (v < input[i + 1]) break;
                }
            }
            return mixers[i](progress(input[i], input[i + 1], v));
        };
    }

} // namespace kinema::generators
