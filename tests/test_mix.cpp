/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "values/mix.hpp"
#include <glm/gtc/constants.hpp>
#include <gtest/gtest.h>

using namespace kinema::values;

namespace {
    constexpr float FLOAT_TOLERANCE = 1e-5f;
}

TEST(MixTest, NumbersMixLinearly) {
    EXPECT_FLOAT_EQ(mixNumber(0.0f, 100.0f, 0.25), 25.0f);
    EXPECT_FLOAT_EQ(mixNumber(10.0f, -10.0f, 0.5), 0.0f);
    // Overshoot is allowed (springs, back easings)
    EXPECT_FLOAT_EQ(mixNumber(0.0f, 100.0f, 1.5), 150.0f);

    const auto mixer = mix(Value{0.0f}, Value{100.0f});
    EXPECT_FLOAT_EQ(std::get<float>(mixer(0.0)), 0.0f);
    EXPECT_FLOAT_EQ(std::get<float>(mixer(0.75)), 75.0f);
    EXPECT_FLOAT_EQ(std::get<float>(mixer(1.0)), 100.0f);
}

TEST(MixTest, VectorsMixComponentWise) {
    const auto mixer = mix(Value{glm::vec3{0.0f, 10.0f, -4.0f}}, Value{glm::vec3{10.0f, 20.0f, 4.0f}});
    const auto mid = std::get<glm::vec3>(mixer(0.5));
    EXPECT_FLOAT_EQ(mid.x, 5.0f);
    EXPECT_FLOAT_EQ(mid.y, 15.0f);
    EXPECT_FLOAT_EQ(mid.z, 0.0f);
}

TEST(MixTest, QuaternionsSlerp) {
    const glm::vec3 axis{0.0f, 0.0f, 1.0f};
    const glm::quat from = glm::angleAxis(0.0f, axis);
    const glm::quat to = glm::angleAxis(glm::half_pi<float>(), axis);

    const auto mid = std::get<glm::quat>(mix(Value{from}, Value{to})(0.5));
    const glm::quat expected = glm::angleAxis(glm::quarter_pi<float>(), axis);
    EXPECT_NEAR(mid.w, expected.w, FLOAT_TOLERANCE);
    EXPECT_NEAR(mid.x, expected.x, FLOAT_TOLERANCE);
    EXPECT_NEAR(mid.y, expected.y, FLOAT_TOLERANCE);
    EXPECT_NEAR(mid.z, expected.z, FLOAT_TOLERANCE);
}

TEST(MixTest, MismatchedKindsSwitchImmediately) {
    const Value from{1.0f};
    const Value to{glm::vec2{3.0f, 4.0f}};
    const auto mixer = mix(from, to);

    EXPECT_EQ(mixer(0.0), from);
    EXPECT_EQ(mixer(0.01), to);
    EXPECT_EQ(mixer(1.0), to);
}

TEST(MixTest, FormatValue) {
    EXPECT_EQ(formatValue(Value{1.5f}), "1.5");
    EXPECT_EQ(formatValue(Value{glm::vec2{1.0f, 2.0f}}), "[1, 2]");
    const std::vector<Value> values{Value{0.0f}, Value{1.0f}};
    EXPECT_EQ(formatValues(values), "[0, 1]");
}
