/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "generators/calc_duration.hpp"
#include "generators/spring.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace kinema::generators;
using kinema::values::Value;

namespace {
    float number(const Value& value) { return std::get<float>(value); }

    GeneratorOptions springOptions(const float from, const float to) {
        GeneratorOptions options;
        options.type = GeneratorType::SPRING;
        options.keyframes = {Value{from}, Value{to}};
        return options;
    }
} // namespace

TEST(FindSpringTest, ResolvesDampingRatioFromBounce) {
    const auto params = findSpring(800.0, 0.3, 0.0);
    EXPECT_GT(params.stiffness, 0.0);
    EXPECT_DOUBLE_EQ(params.mass, 1.0);
    EXPECT_DOUBLE_EQ(params.duration, 800.0);
    EXPECT_NEAR(params.damping / (2.0 * std::sqrt(params.stiffness * params.mass)), 0.7, 1e-9);
}

TEST(FindSpringTest, ClampsDuration) {
    EXPECT_DOUBLE_EQ(findSpring(60000.0, 0.3, 0.0).duration, spring_defaults::MAX_DURATION * 1000.0);
    EXPECT_DOUBLE_EQ(findSpring(1.0, 0.3, 0.0).duration, spring_defaults::MIN_DURATION * 1000.0);
}

TEST(FindSpringTest, ShorterDurationIsStiffer) {
    EXPECT_GT(findSpring(300.0, 0.3, 0.0).stiffness, findSpring(1200.0, 0.3, 0.0).stiffness);
}

TEST(SpringGeneratorTest, PhysicalSpringSettlesOnTarget) {
    auto options = springOptions(0.0f, 100.0f);
    options.spring.stiffness = 100.0;
    const auto generator = spring(options);

    EXPECT_FALSE(generator.calculated_duration.has_value());
    EXPECT_FLOAT_EQ(number(generator.next(0.0).value), 0.0f);

    const double duration = calcGeneratorDuration(generator);
    ASSERT_TRUE(std::isfinite(duration));
    EXPECT_GT(duration, 0.0);

    const auto rest = generator.next(duration);
    EXPECT_TRUE(rest.done);
    EXPECT_FLOAT_EQ(number(rest.value), 100.0f);
}

TEST(SpringGeneratorTest, UnderdampedSpringOvershoots) {
    auto options = springOptions(0.0f, 100.0f);
    options.spring.stiffness = 300.0;
    options.spring.damping = 5.0;
    const auto generator = spring(options);

    float peak = 0.0f;
    for (double t = 0.0; t < 2000.0; t += 10.0) {
        peak = std::max(peak, number(generator.next(t).value));
    }
    EXPECT_GT(peak, 100.0f);
}

TEST(SpringGeneratorTest, DurationBasedSpring) {
    auto options = springOptions(0.0f, 100.0f);
    options.duration = 500.0;
    options.spring.bounce = 0.25;
    const auto generator = spring(options);

    ASSERT_TRUE(generator.calculated_duration.has_value());
    EXPECT_DOUBLE_EQ(*generator.calculated_duration, 500.0);
    EXPECT_FALSE(generator.next(250.0).done);

    const auto end = generator.next(500.0);
    EXPECT_TRUE(end.done);
    EXPECT_FLOAT_EQ(number(end.value), 100.0f);
}

TEST(SpringGeneratorTest, GranularDeltaUsesFinerThresholds) {
    const auto generator = spring(springOptions(0.0f, 1.0f));
    const double duration = calcGeneratorDuration(generator);
    ASSERT_TRUE(std::isfinite(duration));

    // Half a unit away from target is far from rest at this scale
    for (double t = 0.0; t < duration; t += 50.0) {
        const auto state = generator.next(t);
        if (std::abs(1.0f - number(state.value)) > 0.1f) {
            EXPECT_FALSE(state.done);
        }
    }
}

TEST(SpringGeneratorTest, InitialVelocityMovesFirst) {
    auto still = springOptions(0.0f, 100.0f);
    auto moving = springOptions(0.0f, 100.0f);
    moving.velocity = 1000.0;

    EXPECT_GT(number(spring(moving).next(16.0).value), number(spring(still).next(16.0).value));
}

TEST(SpringGeneratorTest, RejectsNonNumericKeyframes) {
    GeneratorOptions options;
    options.keyframes = {Value{glm::vec2{0.0f}}, Value{glm::vec2{1.0f}}};
    EXPECT_THROW(spring(options), std::invalid_argument);
}
