/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "generator.hpp"
#include "core/logger.hpp"
#include <array>

namespace kinema::generators {

    namespace {
        using FactoryFn = KeyframeGenerator (*)(const GeneratorOptions&);

        // Indexed by GeneratorType; CUSTOM has no built-in entry.
        constexpr std::array<FactoryFn, 3> BUILTIN_FACTORIES{
            &keyframes,
            &spring,
            &inertia,
        };
    } // namespace

    GeneratorFactory generatorFactoryFor(const GeneratorType type, const GeneratorFactory& custom) {
        if (type == GeneratorType::CUSTOM) {
            if (custom) return custom;
            LOG_WARN("Custom generator requested without a factory, falling back to keyframes");
            return &keyframes;
        }
        return BUILTIN_FACTORIES[static_cast<size_t>(type)];
    }

    bool supportsValueMixing(const GeneratorType type) {
        return type == GeneratorType::KEYFRAMES;
    }

    std::string_view generatorTypeName(const GeneratorType type) {
        switch (type) {
            case GeneratorType::KEYFRAMES: return "keyframes";
            case GeneratorType::SPRING: return "spring";
            case GeneratorType::INERTIA: return "inertia";
            case GeneratorType::CUSTOM: return "custom";
        }
        return "unknown";
    }

} // namespace kinema::generators
