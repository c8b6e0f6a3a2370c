/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "easing.hpp"
#include <array>
#include <cmath>
#include <utility>

namespace kinema::generators {

    namespace {
        constexpr double SUBDIVISION_PRECISION = 0.0000001;
        constexpr int SUBDIVISION_MAX_ITERATIONS = 12;

        constexpr std::array<std::pair<std::string_view, EasingType>, 11> EASING_NAMES{{
            {"linear", EasingType::LINEAR},
            {"easeIn", EasingType::EASE_IN},
            {"easeOut", EasingType::EASE_OUT},
            {"easeInOut", EasingType::EASE_IN_OUT},
            {"circIn", EasingType::CIRC_IN},
            {"circOut", EasingType::CIRC_OUT},
            {"circInOut", EasingType::CIRC_IN_OUT},
            {"backIn", EasingType::BACK_IN},
            {"backOut", EasingType::BACK_OUT},
            {"backInOut", EasingType::BACK_IN_OUT},
            {"anticipate", EasingType::ANTICIPATE},
        }};

        // Bezier coordinate at t for control points a1, a2 (endpoints fixed at 0 and 1)
        [[nodiscard]] double calcBezier(const double t, const double a1, const double a2) {
            return (((1.0 - 3.0 * a2 + 3.0 * a1) * t + (3.0 * a2 - 6.0 * a1)) * t + 3.0 * a1) * t;
        }

        [[nodiscard]] double binarySubdivide(const double x, double lower, double upper,
                                             const double x1, const double x2) {
            double current_x = 0.0;
            double current_t = 0.0;
            int i = 0;
            do {
                current_t = lower + (upper - lower) / 2.0;
                current_x = calcBezier(current_t, x1, x2) - x;
                if (current_x > 0.0) {
                    upper = current_t;
                } else {
                    lower = current_t;
                }
            } while (std::abs(current_x) > SUBDIVISION_PRECISION && ++i < SUBDIVISION_MAX_ITERATIONS);
            return current_t;
        }

        [[nodiscard]] double circIn(const double p) {
            return 1.0 - std::sin(std::acos(p));
        }

        const EasingFunction& backOut() {
            static const EasingFunction fn = cubicBezier(0.33, 1.53, 0.69, 0.99);
            return fn;
        }

        const EasingFunction& backIn() {
            static const EasingFunction fn = reverseEasing(backOut());
            return fn;
        }

        const EasingFunction& backInOut() {
            static const EasingFunction fn = mirrorEasing(backIn());
            return fn;
        }

        const EasingFunction& easeIn() {
            static const EasingFunction fn = cubicBezier(0.42, 0.0, 1.0, 1.0);
            return fn;
        }

        const EasingFunction& easeOut() {
            static const EasingFunction fn = cubicBezier(0.0, 0.0, 0.58, 1.0);
            return fn;
        }

        const EasingFunction& easeInOut() {
            static const EasingFunction fn = cubicBezier(0.42, 0.0, 0.58, 1.0);
            return fn;
        }

        [[nodiscard]] double anticipate(double p) {
            p *= 2.0;
            return p < 1.0 ? 0.5 * backIn()(p) : 0.5 * (2.0 - std::pow(2.0, -10.0 * (p - 1.0)));
        }
    } // namespace

    EasingFunction cubicBezier(const double x1, const double y1, const double x2, const double y2) {
        // Control points on the diagonal describe a straight line
        if (x1 == y1 && x2 == y2) {
            return [](const double t) { return t; };
        }
        return [x1, y1, x2, y2](const double t) {
            if (t == 0.0 || t == 1.0) return t;
            return calcBezier(binarySubdivide(t, 0.0, 1.0, x1, x2), y1, y2);
        };
    }

    EasingFunction mirrorEasing(EasingFunction easing) {
        return [easing = std::move(easing)](const double p) {
            return p <= 0.5 ? easing(2.0 * p) / 2.0 : (2.0 - easing(2.0 * (1.0 - p))) / 2.0;
        };
    }

    EasingFunction reverseEasing(EasingFunction easing) {
        return [easing = std::move(easing)](const double p) { return 1.0 - easing(1.0 - p); };
    }

    double applyEasing(const double t, const EasingType easing) {
        switch (easing) {
            case EasingType::LINEAR:
                return t;
            case EasingType::EASE_IN:
                return easeIn()(t);
            case EasingType::EASE_OUT:
                return easeOut()(t);
            case EasingType::EASE_IN_OUT:
                return easeInOut()(t);
            case EasingType::CIRC_IN:
                return circIn(t);
            case EasingType::CIRC_OUT:
                return 1.0 - circIn(1.0 - t);
            case EasingType::CIRC_IN_OUT:
                return t <= 0.5 ? circIn(2.0 * t) / 2.0 : (2.0 - circIn(2.0 * (1.0 - t))) / 2.0;
            case EasingType::BACK_IN:
                return backIn()(t);
            case EasingType::BACK_OUT:
                return backOut()(t);
            case EasingType::BACK_IN_OUT:
                return backInOut()(t);
            case EasingType::ANTICIPATE:
                return anticipate(t);
        }
        return t;
    }

    EasingFunction toEasingFunction(const Easing& easing) {
        if (const auto* type = std::get_if<EasingType>(&easing)) {
            const EasingType resolved = *type;
            if (resolved == EasingType::LINEAR) {
                return [](const double t) { return t; };
            }
            return [resolved](const double t) { return applyEasing(t, resolved); };
        }
        if (const auto* bezier = std::get_if<CubicBezier>(&easing)) {
            return cubicBezier(bezier->x1, bezier->y1, bezier->x2, bezier->y2);
        }
        const auto& fn = std::get<EasingFunction>(easing);
        if (!fn) {
            return [](const double t) { return t; };
        }
        return fn;
    }

    std::optional<EasingType> easingFromName(const std::string_view name) {
        for (const auto& [easing_name, type] : EASING_NAMES) {
            if (easing_name == name) return type;
        }
        return std::nullopt;
    }

    std::string_view easingName(const EasingType easing) {
        for (const auto& [easing_name, type] : EASING_NAMES) {
            if (type == easing) return easing_name;
        }
        return "linear";
    }

} // namespace kinema::generators
