/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "value.hpp"
#include <spdlog/fmt/fmt.h>

namespace kinema::values {

    namespace {
        struct ValueFormatter {
            std::string operator()(const float v) const { return fmt::format("{}", v); }
            std::string operator()(const glm::vec2& v) const { return fmt::format("[{}, {}]", v.x, v.y); }
            std::string operator()(const glm::vec3& v) const { return fmt::format("[{}, {}, {}]", v.x, v.y, v.z); }
            std::string operator()(const glm::vec4& v) const {
                return fmt::format("[{}, {}, {}, {}]", v.x, v.y, v.z, v.w);
            }
            std::string operator()(const glm::quat& q) const {
                return fmt::format("quat({}, {}, {}, {})", q.w, q.x, q.y, q.z);
            }
        };
    } // namespace

    std::string formatValue(const Value& value) {
        return std::visit(ValueFormatter{}, value);
    }

    std::string formatValues(std::span<const Value> values) {
        std::string out = "[";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out += ", ";
            out += formatValue(values[i]);
        }
        out += "]";
        return out;
    }

} // namespace kinema::values
