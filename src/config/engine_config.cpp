/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "engine_config.hpp"
#include "driver/frame_loop.hpp"
#include <array>
#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

namespace kinema::config {

    namespace {
        constexpr std::array<std::pair<std::string_view, core::LogLevel>, 7> LOG_LEVEL_NAMES{{
            {"trace", core::LogLevel::Trace},
            {"debug", core::LogLevel::Debug},
            {"info", core::LogLevel::Info},
            {"warn", core::LogLevel::Warn},
            {"error", core::LogLevel::Error},
            {"critical", core::LogLevel::Critical},
            {"off", core::LogLevel::Off},
        }};
    } // namespace

    std::optional<core::LogLevel> logLevelFromName(const std::string_view name) {
        for (const auto& [level_name, level] : LOG_LEVEL_NAMES) {
            if (level_name == name) return level;
        }
        return std::nullopt;
    }

    std::string_view logLevelName(const core::LogLevel level) {
        for (const auto& [level_name, value] : LOG_LEVEL_NAMES) {
            if (value == level) return level_name;
        }
        return "info";
    }

    std::expected<EngineConfig, std::string> parseEngineConfig(const nlohmann::json& j) {
        try {
            if (!j.is_object()) return std::unexpected("Engine config must be a JSON object");

            EngineConfig config;
            if (j.contains("logLevel")) {
                const auto name = j["logLevel"].get<std::string>();
                const auto level = logLevelFromName(name);
                if (!level) return std::unexpected("Unknown logLevel: " + name);
                config.log_level = *level;
            }
            config.log_file = j.value("logFile", std::string{});
            config.manual_timing = j.value("manualTiming", false);
            return config;
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Invalid engine config: ") + e.what());
        }
    }

    std::expected<EngineConfig, std::string> loadEngineConfig(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return std::unexpected("Failed to open " + path.string());
        }
        try {
            return parseEngineConfig(nlohmann::json::parse(file));
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Failed to parse ") + path.string() + ": " + e.what());
        }
    }

    void applyEngineConfig(const EngineConfig& config) {
        core::Logger::get().init(config.log_level, config.log_file);
        driver::defaultFrameLoop().setManualTiming(config.manual_timing);
        LOG_DEBUG("Engine configured: level={} manual_timing={}", logLevelName(config.log_level), config.manual_timing);
    }

} // namespace kinema::config
