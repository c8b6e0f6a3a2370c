/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "mix.hpp"
#include "core/logger.hpp"

namespace kinema::values {

    float mixNumber(const float from, const float to, const double progress) {
        return static_cast<float>(from + (static_cast<double>(to) - from) * progress);
    }

    Mixer mixImmediate(const Value& from, const Value& to) {
        return [from, to](const double progress) -> Value {
            return progress > 0.0 ? to : from;
        };
    }

    Mixer mix(const Value& from, const Value& to) {
        if (from.index() != to.index()) {
            LOG_WARN("Cannot mix {} with {}, values of different kinds switch immediately",
                     formatValue(from), formatValue(to));
            return mixImmediate(from, to);
        }

        switch (kindOf(from)) {
            case ValueKind::SCALAR: {
                const float a = std::get<float>(from);
                const float b = std::get<float>(to);
                return [a, b](const double p) -> Value { return mixNumber(a, b, p); };
            }
            case ValueKind::VEC2: {
                const auto a = std::get<glm::vec2>(from);
                const auto b = std::get<glm::vec2>(to);
                return [a, b](const double p) -> Value { return glm::mix(a, b, static_cast<float>(p)); };
            }
            case ValueKind::VEC3: {
                const auto a = std::get<glm::vec3>(from);
                const auto b = std::get<glm::vec3>(to);
                return [a, b](const double p) -> Value { return glm::mix(a, b, static_cast<float>(p)); };
            }
            case ValueKind::VEC4: {
                const auto a = std::get<glm::vec4>(from);
                const auto b = std::get<glm::vec4>(to);
                return [a, b](const double p) -> Value { return glm::mix(a, b, static_cast<float>(p)); };
            }
            case ValueKind::QUAT: {
                const auto a = std::get<glm::quat>(from);
                const auto b = std::get<glm::quat>(to);
                return [a, b](const double p) -> Value { return glm::slerp(a, b, static_cast<float>(p)); };
            }
        }
        return mixImmediate(from, to);
    }

} // namespace kinema::values
