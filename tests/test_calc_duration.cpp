/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "generators/calc_duration.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace kinema::generators;
using kinema::values::Value;

TEST(CalcDurationTest, StepsUntilDone) {
    GeneratorOptions options;
    options.keyframes = {Value{0.0f}, Value{1.0f}};
    options.duration = 300.0;

    EXPECT_DOUBLE_EQ(calcGeneratorDuration(keyframes(options)), 300.0);
}

TEST(CalcDurationTest, RoundsUpToSampleStep) {
    const KeyframeGenerator generator{
        [](const double t) { return AnimationState{Value{0.0f}, t >= 120.0}; },
        std::nullopt,
    };
    EXPECT_DOUBLE_EQ(calcGeneratorDuration(generator), 150.0);
}

TEST(CalcDurationTest, EndlessGeneratorIsInfinite) {
    const KeyframeGenerator generator{
        [](double) { return AnimationState{Value{0.0f}, false}; },
        std::nullopt,
    };
    EXPECT_TRUE(std::isinf(calcGeneratorDuration(generator)));
}

TEST(CalcDurationTest, Velocity) {
    EXPECT_DOUBLE_EQ(velocityPerSecond(10.0, 5.0), 2000.0);
    EXPECT_DOUBLE_EQ(velocityPerSecond(10.0, 0.0), 0.0);

    // Two units per millisecond
    const auto line = [](const double t) { return 2.0 * t; };
    EXPECT_NEAR(calcGeneratorVelocity(line, 100.0, line(100.0)), 2000.0, 1e-9);
    EXPECT_NEAR(calcGeneratorVelocity(line, 2.0, line(2.0)), 2000.0, 1e-9);
}
