/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "get_final.hpp"
#include <stdexcept>

namespace kinema::animation {

    Value getFinalKeyframe(std::span<const Value> keyframes,
                           const RepeatOptions& repeat,
                           const std::optional<Value>& final_keyframe,
                           const double speed) {
        if (keyframes.empty()) {
            throw std::invalid_argument("getFinalKeyframe: no keyframes");
        }

        const bool use_first_keyframe =
            speed < 0.0 ||
            (repeat.repeat != 0 && repeat.repeat_type != RepeatType::LOOP && repeat.repeat % 2 == 1);
        const size_t index = use_first_keyframe ? 0 : keyframes.size() - 1;

        return index == 0 || !final_keyframe ? keyframes[index] : *final_keyframe;
    }

} // namespace kinema::animation
