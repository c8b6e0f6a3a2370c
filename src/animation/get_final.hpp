/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation/options.hpp"
#include <optional>
#include <span>

namespace kinema::animation {

    /**
     * @brief Value an animation rests on once all repeats have played.
     *
     * Ends on the first keyframe when playing backwards, or when an odd number of
     * reverse/mirror repeats brings it back to the start. Otherwise ends on the
     * last keyframe, or on `final_keyframe` when given. Throws
     * std::invalid_argument for an empty keyframe list.
     */
    [[nodiscard]] Value getFinalKeyframe(std::span<const Value> keyframes,
                                         const RepeatOptions& repeat,
                                         const std::optional<Value>& final_keyframe = std::nullopt,
                                         double speed = 1.0);

} // namespace kinema::animation
