/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>

namespace kinema::generators {

    using EasingFunction = std::function<double(double)>;

    enum class EasingType : uint8_t {
        LINEAR,
        EASE_IN,
        EASE_OUT,
        EASE_IN_OUT,
        CIRC_IN,
        CIRC_OUT,
        CIRC_IN_OUT,
        BACK_IN,
        BACK_OUT,
        BACK_IN_OUT,
        ANTICIPATE
    };

    struct CubicBezier {
        double x1 = 0.0;
        double y1 = 0.0;
        double x2 = 1.0;
        double y2 = 1.0;
    };

    // A named curve, a bezier definition or any custom function of progress.
    using Easing = std::variant<EasingType, CubicBezier, EasingFunction>;

    [[nodiscard]] EasingFunction cubicBezier(double x1, double y1, double x2, double y2);

    // Mirrored around the centre: ease-in becomes ease-in-out.
    [[nodiscard]] EasingFunction mirrorEasing(EasingFunction easing);
    // Played backwards: ease-in becomes ease-out.
    [[nodiscard]] EasingFunction reverseEasing(EasingFunction easing);

    [[nodiscard]] double applyEasing(double t, EasingType easing);
    [[nodiscard]] EasingFunction toEasingFunction(const Easing& easing);

    [[nodiscard]] std::optional<EasingType> easingFromName(std::string_view name);
    [[nodiscard]] std::string_view easingName(EasingType easing);

} // namespace kinema::generators
