/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <optional>
#include <span>
#include <string>
#include <variant>

namespace kinema::values {

    // Anything an animation can interpolate through.
    using Value = std::variant<float, glm::vec2, glm::vec3, glm::vec4, glm::quat>;

    enum class ValueKind : uint8_t {
        SCALAR,
        VEC2,
        VEC3,
        VEC4,
        QUAT
    };

    [[nodiscard]] inline ValueKind kindOf(const Value& value) {
        return static_cast<ValueKind>(value.index());
    }

    [[nodiscard]] inline bool isNumber(const Value& value) {
        return std::holds_alternative<float>(value);
    }

    [[nodiscard]] inline std::optional<float> asNumber(const Value& value) {
        if (const auto* number = std::get_if<float>(&value)) return *number;
        return std::nullopt;
    }

    [[nodiscard]] std::string formatValue(const Value& value);
    [[nodiscard]] std::string formatValues(std::span<const Value> values);

} // namespace kinema::values
