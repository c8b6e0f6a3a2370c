/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "options.hpp"

namespace kinema::animation {

    std::string_view repeatTypeName(const RepeatType type) {
        switch (type) {
            case RepeatType::LOOP: return "loop";
            case RepeatType::REVERSE: return "reverse";
            case RepeatType::MIRROR: return "mirror";
        }
        return "loop";
    }

    std::string_view playStateName(const AnimationPlayState state) {
        switch (state) {
            case AnimationPlayState::IDLE: return "idle";
            case AnimationPlayState::RUNNING: return "running";
            case AnimationPlayState::PAUSED: return "paused";
            case AnimationPlayState::FINISHED: return "finished";
        }
        return "idle";
    }

} // namespace kinema::animation
