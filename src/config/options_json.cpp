/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "options_json.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

namespace kinema::config {

    namespace {
        using animation::AnimationOptions;
        using animation::RepeatType;
        using generators::CubicBezier;
        using generators::Easing;
        using generators::EasingType;
        using generators::GeneratorType;
        using nlohmann::json;

        constexpr std::string_view REPEAT_INFINITY = "infinity";

        std::expected<GeneratorType, std::string> parseGeneratorType(const std::string& name) {
            // "tween" is the duration-based alias for keyframes
            if (name == "keyframes" || name == "tween") return GeneratorType::KEYFRAMES;
            if (name == "spring") return GeneratorType::SPRING;
            if (name == "inertia") return GeneratorType::INERTIA;
            return std::unexpected("Unknown animation type: " + name);
        }

        std::expected<RepeatType, std::string> parseRepeatType(const std::string& name) {
            if (name == "loop") return RepeatType::LOOP;
            if (name == "reverse") return RepeatType::REVERSE;
            if (name == "mirror") return RepeatType::MIRROR;
            return std::unexpected("Unknown repeatType: " + name);
        }

        std::expected<Easing, std::string> parseEasing(const json& j) {
            if (j.is_string()) {
                const auto name = j.get<std::string>();
                if (const auto type = generators::easingFromName(name)) return Easing{*type};
                return std::unexpected("Unknown easing: " + name);
            }
            if (j.is_array() && j.size() == 4) {
                return Easing{CubicBezier{j[0].get<double>(), j[1].get<double>(),
                                          j[2].get<double>(), j[3].get<double>()}};
            }
            return std::unexpected("Easing must be a name or a [x1, y1, x2, y2] cubic bezier");
        }

        std::expected<std::vector<Easing>, std::string> parseEaseList(const json& j) {
            // A flat array of numbers is a single bezier, anything else a per-segment list
            const bool is_list = j.is_array() && !j.empty() && !j.front().is_number();
            if (!is_list) {
                auto easing = parseEasing(j);
                if (!easing) return std::unexpected(easing.error());
                return std::vector<Easing>{*easing};
            }

            std::vector<Easing> eases;
            for (const auto& entry : j) {
                auto easing = parseEasing(entry);
                if (!easing) return std::unexpected(easing.error());
                eases.push_back(*easing);
            }
            return eases;
        }

        json easingToJson(const Easing& easing) {
            if (const auto* type = std::get_if<EasingType>(&easing)) {
                return std::string(generators::easingName(*type));
            }
            if (const auto* bezier = std::get_if<CubicBezier>(&easing)) {
                return json::array({bezier->x1, bezier->y1, bezier->x2, bezier->y2});
            }
            LOG_WARN("Custom easing functions cannot be serialized, writing linear");
            return "linear";
        }

        template <typename T>
        void readOptional(const json& j, const char* key, std::optional<T>& out) {
            if (j.contains(key) && !j[key].is_null()) out = j[key].get<T>();
        }

        template <typename T>
        void writeOptional(json& j, const char* key, const std::optional<T>& value) {
            if (value) j[key] = *value;
        }
    } // namespace

    std::expected<values::Value, std::string> parseValue(const json& j) {
        if (j.is_number()) return values::Value{j.get<float>()};
        if (j.is_array()) {
            switch (j.size()) {
                case 2: return values::Value{glm::vec2{j[0].get<float>(), j[1].get<float>()}};
                case 3: return values::Value{glm::vec3{j[0].get<float>(), j[1].get<float>(), j[2].get<float>()}};
                case 4:
                    return values::Value{glm::vec4{j[0].get<float>(), j[1].get<float>(),
                                                   j[2].get<float>(), j[3].get<float>()}};
                default: break;
            }
        }
        if (j.is_object() && j.contains("quat") && j["quat"].is_array() && j["quat"].size() == 4) {
            const auto& q = j["quat"];
            return values::Value{glm::quat{q[0].get<float>(), q[1].get<float>(), q[2].get<float>(), q[3].get<float>()}};
        }
        return std::unexpected("Unsupported keyframe value: " + j.dump());
    }

    json valueToJson(const values::Value& value) {
        struct Visitor {
            json operator()(const float v) const { return v; }
            json operator()(const glm::vec2& v) const { return json::array({v.x, v.y}); }
            json operator()(const glm::vec3& v) const { return json::array({v.x, v.y, v.z}); }
            json operator()(const glm::vec4& v) const { return json::array({v.x, v.y, v.z, v.w}); }
            json operator()(const glm::quat& q) const { return json{{"quat", {q.w, q.x, q.y, q.z}}}; }
        };
        return std::visit(Visitor{}, value);
    }

    std::expected<AnimationOptions, std::string> parseAnimationOptions(const json& j) {
        try {
            if (!j.is_object()) return std::unexpected("Animation options must be a JSON object");

            AnimationOptions options;

            if (!j.contains("keyframes")) return std::unexpected("Animation options need keyframes");
            const auto& keyframes = j["keyframes"];
            if (keyframes.is_array()) {
                for (const auto& entry : keyframes) {
                    auto value = parseValue(entry);
                    if (!value) return std::unexpected(value.error());
                    options.keyframes.push_back(*value);
                }
            } else {
                auto value = parseValue(keyframes);
                if (!value) return std::unexpected(value.error());
                options.keyframes.push_back(*value);
            }
            if (options.keyframes.empty()) return std::unexpected("Animation options need at least one keyframe");

            if (j.contains("type")) {
                auto type = parseGeneratorType(j["type"].get<std::string>());
                if (!type) return std::unexpected(type.error());
                options.type = *type;
            }

            readOptional(j, "duration", options.duration);
            options.velocity = j.value("velocity", 0.0);

            if (j.contains("ease")) {
                auto ease = parseEaseList(j["ease"]);
                if (!ease) return std::unexpected(ease.error());
                options.ease = std::move(*ease);
            }
            if (j.contains("times")) {
                options.times = j["times"].get<std::vector<double>>();
                if (options.times.size() != options.keyframes.size()) {
                    return std::unexpected(fmt::format("times has {} entries for {} keyframes",
                                                       options.times.size(), options.keyframes.size()));
                }
            }

            if (j.contains("repeat")) {
                const auto& repeat = j["repeat"];
                if (repeat.is_string() && repeat.get<std::string>() == REPEAT_INFINITY) {
                    options.repeat = animation::REPEAT_FOREVER;
                } else {
                    options.repeat = repeat.get<int>();
                }
                if (options.repeat < 0) return std::unexpected("repeat must not be negative");
            }
            if (j.contains("repeatType")) {
                auto repeat_type = parseRepeatType(j["repeatType"].get<std::string>());
                if (!repeat_type) return std::unexpected(repeat_type.error());
                options.repeat_type = *repeat_type;
            }
            options.repeat_delay = j.value("repeatDelay", 0.0);
            if (options.repeat_delay < 0.0) return std::unexpected("repeatDelay must not be negative");
            options.delay = j.value("delay", 0.0);

            options.autoplay = j.value("autoplay", true);
            options.speed = j.value("speed", 1.0);
            readOptional(j, "startTime", options.start_time);
            options.allow_flatten = j.value("allowFlatten", false);

            if (j.contains("finalKeyframe")) {
                auto final_keyframe = parseValue(j["finalKeyframe"]);
                if (!final_keyframe) return std::unexpected(final_keyframe.error());
                options.final_keyframe = *final_keyframe;
            }

            if (j.contains("spring")) {
                const auto& s = j["spring"];
                readOptional(s, "stiffness", options.spring.stiffness);
                readOptional(s, "damping", options.spring.damping);
                readOptional(s, "mass", options.spring.mass);
                readOptional(s, "bounce", options.spring.bounce);
                readOptional(s, "restSpeed", options.spring.rest_speed);
                readOptional(s, "restDelta", options.spring.rest_delta);
            }

            if (j.contains("inertia")) {
                const auto& i = j["inertia"];
                auto& inertia = options.inertia;
                inertia.power = i.value("power", inertia.power);
                inertia.time_constant = i.value("timeConstant", inertia.time_constant);
                inertia.bounce_damping = i.value("bounceDamping", inertia.bounce_damping);
                inertia.bounce_stiffness = i.value("bounceStiffness", inertia.bounce_stiffness);
                inertia.rest_delta = i.value("restDelta", inertia.rest_delta);
                readOptional(i, "min", inertia.min);
                readOptional(i, "max", inertia.max);
                readOptional(i, "restSpeed", inertia.rest_speed);
            }

            return options;
        } catch (const std::exception& e) {
            return std::unexpected(std::string("Invalid animation options: ") + e.what());
        }
    }

    json animationOptionsToJson(const AnimationOptions& options) {
        json j;
        j["version"] = OPTIONS_JSON_VERSION;

        j["keyframes"] = json::array();
        for (const auto& value : options.keyframes) {
            j["keyframes"].push_back(valueToJson(value));
        }

        if (options.type == GeneratorType::CUSTOM) {
            LOG_WARN("Custom generators cannot be serialized, writing keyframes");
        }
        j["type"] = options.type == GeneratorType::CUSTOM ? "keyframes"
                                                          : std::string(generators::generatorTypeName(options.type));
        writeOptional(j, "duration", options.duration);
        j["velocity"] = options.velocity;

        if (!options.ease.empty()) {
            if (options.ease.size() == 1) {
                j["ease"] = easingToJson(options.ease.front());
            } else {
                j["ease"] = json::array();
                for (const auto& easing : options.ease) {
                    j["ease"].push_back(easingToJson(easing));
                }
            }
        }
        if (!options.times.empty()) j["times"] = options.times;

        if (options.repeat == animation::REPEAT_FOREVER) {
            j["repeat"] = std::string(REPEAT_INFINITY);
        } else {
            j["repeat"] = options.repeat;
        }
        j["repeatType"] = std::string(animation::repeatTypeName(options.repeat_type));
        j["repeatDelay"] = options.repeat_delay;
        j["delay"] = options.delay;
        j["autoplay"] = options.autoplay;
        j["speed"] = options.speed;
        writeOptional(j, "startTime", options.start_time);
        j["allowFlatten"] = options.allow_flatten;
        if (options.final_keyframe) j["finalKeyframe"] = valueToJson(*options.final_keyframe);

        json spring = json::object();
        writeOptional(spring, "stiffness", options.spring.stiffness);
        writeOptional(spring, "damping", options.spring.damping);
        writeOptional(spring, "mass", options.spring.mass);
        writeOptional(spring, "bounce", options.spring.bounce);
        writeOptional(spring, "restSpeed", options.spring.rest_speed);
        writeOptional(spring, "restDelta", options.spring.rest_delta);
        if (!spring.empty()) j["spring"] = spring;

        if (options.type == GeneratorType::INERTIA) {
            const auto& inertia = options.inertia;
            json i{
                {"power", inertia.power},
                {"timeConstant", inertia.time_constant},
                {"bounceDamping", inertia.bounce_damping},
                {"bounceStiffness", inertia.bounce_stiffness},
                {"restDelta", inertia.rest_delta},
            };
            writeOptional(i, "min", inertia.min);
            writeOptional(i, "max", inertia.max);
            writeOptional(i, "restSpeed", inertia.rest_speed);
            j["inertia"] = i;
        }
        return j;
    }

    std::expected<AnimationOptions, std::string> loadAnimationOptions(const std::filesystem::path& path) {
        LOG_TIMER("Animation load");

        std::ifstream file(path);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open animation file: {}", path.string());
            return std::unexpected("Failed to open " + path.string());
        }

        try {
            const auto j = json::parse(file);
            auto options = parseAnimationOptions(j);
            if (!options) {
                LOG_ERROR("Animation load failed: {}", options.error());
                return options;
            }
            LOG_INFO("Loaded {} keyframes from {}", options->keyframes.size(), path.string());
            return options;
        } catch (const std::exception& e) {
            LOG_ERROR("Animation load failed: {}", e.what());
            return std::unexpected(std::string("Failed to parse ") + path.string() + ": " + e.what());
        }
    }

    bool saveAnimationOptions(const AnimationOptions& options, const std::filesystem::path& path) {
        try {
            const auto j = animationOptionsToJson(options);

            std::ofstream file(path);
            if (!file.is_open()) {
                LOG_ERROR("Failed to open animation file: {}", path.string());
                return false;
            }
            file << j.dump(2);
            LOG_INFO("Saved {} keyframes to {}", options.keyframes.size(), path.string());
            return true;
        } catch (const std::exception& e) {
            LOG_ERROR("Animation save failed: {}", e.what());
            return false;
        }
    }

} // namespace kinema::config
