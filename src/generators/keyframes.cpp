/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include "generators/generator.hpp"
#include "generators/interpolate.hpp"
#include <stdexcept>

namespace kinema::generators {

    namespace {
        constexpr EasingType DEFAULT_EASING = EasingType::EASE_IN_OUT;

        [[nodiscard]] std::vector<EasingFunction> segmentEasing(const std::vector<Easing>& ease, const size_t segments) {
            std::vector<EasingFunction> easing;
            easing.reserve(segments);
            if (ease.size() > 1) {
                // Per-segment list; segments past the end stay linear
                for (size_t i = 0; i < segments; ++i) {
                    easing.push_back(i < ease.size() ? toEasingFunction(ease[i]) : EasingFunction{});
                }
                return easing;
            }
            const auto shared = toEasingFunction(ease.empty() ? Easing{DEFAULT_EASING} : ease.front());
            easing.assign(segments, shared);
            return easing;
        }
    } // namespace

    KeyframeGenerator keyframes(const GeneratorOptions& options) {
        const auto& values = options.keyframes;
        if (values.empty()) {
            throw std::invalid_argument("keyframes generator needs at least one keyframe");
        }

        const double duration = options.duration.value_or(DEFAULT_TWEEN_DURATION);

        if (!options.times.empty() && options.times.size() != values.size()) {
            LOG_WARN("Ignoring {} keyframe times for {} keyframes, spacing evenly", options.times.size(), values.size());
        }
        auto offsets = options.times.size() == values.size() ? options.times : defaultOffsets(values.size());
        for (auto& offset : offsets) {
            offset *= duration;
        }

        const auto easing = segmentEasing(options.ease, values.size() - 1);
        auto map_time_to_keyframe = interpolate(std::move(offsets), values, easing);

        return KeyframeGenerator{
            .next = [map = std::move(map_time_to_keyframe), duration](const double t) {
                return AnimationState{map(t), t >= duration};
            },
            .calculated_duration = duration,
        };
    }

} // namespace kinema::generators
