/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <expected>
#include <filesystem>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>

namespace kinema::config {

    // Process-wide engine settings, independent of any single animation.
    struct EngineConfig {
        core::LogLevel log_level = core::LogLevel::Info;
        std::string log_file;
        bool manual_timing = false;
    };

    [[nodiscard]] std::optional<core::LogLevel> logLevelFromName(std::string_view name);
    [[nodiscard]] std::string_view logLevelName(core::LogLevel level);

    [[nodiscard]] std::expected<EngineConfig, std::string> parseEngineConfig(const nlohmann::json& j);
    [[nodiscard]] std::expected<EngineConfig, std::string> loadEngineConfig(const std::filesystem::path& path);

    // Initializes the logger and the default frame loop from the config.
    void applyEngineConfig(const EngineConfig& config);

} // namespace kinema::config
