/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation/options.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace kinema::config {

    inline constexpr int OPTIONS_JSON_VERSION = 1;

    [[nodiscard]] std::expected<values::Value, std::string> parseValue(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json valueToJson(const values::Value& value);

    /**
     * @brief Read animation options from a JSON document.
     *
     * Callbacks, drivers and custom generators cannot be expressed in JSON and
     * are left empty. Unknown keys are ignored; malformed known keys are errors.
     */
    [[nodiscard]] std::expected<animation::AnimationOptions, std::string> parseAnimationOptions(const nlohmann::json& j);
    [[nodiscard]] nlohmann::json animationOptionsToJson(const animation::AnimationOptions& options);

    [[nodiscard]] std::expected<animation::AnimationOptions, std::string> loadAnimationOptions(const std::filesystem::path& path);
    [[nodiscard]] bool saveAnimationOptions(const animation::AnimationOptions& options, const std::filesystem::path& path);

} // namespace kinema::config
