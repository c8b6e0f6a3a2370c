/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation/animation_count.hpp"
#include "animation/timeline.hpp"
#include "animation/value_animation.hpp"
#include "driver/frame_loop.hpp"
#include "driver/frameloop_driver.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace kinema;
using animation::AnimationOptions;
using animation::ProgressTimeline;
using generators::EasingType;
using generators::GeneratorType;
using values::Value;

namespace {
    constexpr double START_TIME = 1000.0;
    constexpr double TIME_TOLERANCE = 1e-9;
} // namespace

class TimelineTest : public ::testing::Test {
protected:
    void SetUp() override { loop_.setTime(START_TIME); }

    AnimationOptions options(const double duration = 1000.0) {
        AnimationOptions options;
        options.keyframes = {Value{0.0f}, Value{100.0f}};
        options.duration = duration;
        options.ease = {EasingType::LINEAR};
        options.driver = driver::frameloopDriver(loop_);
        options.on_update = [this](const Value& value) { updates_.push_back(std::get<float>(value)); };
        return options;
    }

    driver::FrameLoop loop_{true};
    std::vector<float> updates_;
};

TEST_F(TimelineTest, ObserveAppliesCurrentProgress) {
    ProgressTimeline timeline;
    timeline.setProgress(0.3);

    auto anim = animation::animateValue(options());
    const auto unsubscribe = anim->attachTimeline(timeline);
    EXPECT_EQ(timeline.observerCount(), 1u);
    EXPECT_NEAR(anim->time(), 0.3, TIME_TOLERANCE);

    unsubscribe();
    EXPECT_EQ(timeline.observerCount(), 0u);
}

TEST_F(TimelineTest, ProgressSeeksAnimation) {
    ProgressTimeline timeline;
    auto anim = animation::animateValue(options());
    const auto unsubscribe = anim->attachTimeline(timeline);

    timeline.setProgress(0.5);
    EXPECT_NEAR(anim->time(), 0.5, TIME_TOLERANCE);

    // The seek re-syncs with a single frame, the internal driver no longer runs
    loop_.process(START_TIME);
    EXPECT_FLOAT_EQ(updates_.back(), 50.0f);
    EXPECT_FALSE(loop_.hasPending());

    const auto frames = updates_.size();
    loop_.process(START_TIME + 100.0);
    EXPECT_EQ(updates_.size(), frames);

    unsubscribe();
}

TEST_F(TimelineTest, UnchangedProgressDoesNotSeek) {
    ProgressTimeline timeline;
    auto anim = animation::animateValue(options());
    const auto unsubscribe = anim->attachTimeline(timeline);

    timeline.setProgress(0.5);
    anim->setTime(0.1);
    timeline.setProgress(0.5);
    EXPECT_NEAR(anim->time(), 0.1, TIME_TOLERANCE);

    timeline.setProgress(0.6);
    EXPECT_NEAR(anim->time(), 0.6, TIME_TOLERANCE);

    unsubscribe();
}

TEST_F(TimelineTest, ProgressIsClamped) {
    ProgressTimeline timeline;
    timeline.setProgress(1.5);
    EXPECT_DOUBLE_EQ(timeline.progress(), 1.0);
    timeline.setProgress(-2.0);
    EXPECT_DOUBLE_EQ(timeline.progress(), 0.0);
}

TEST_F(TimelineTest, UnsubscribedAnimationIsLeftAlone) {
    ProgressTimeline timeline;
    auto anim = animation::animateValue(options());
    const auto unsubscribe = anim->attachTimeline(timeline);
    timeline.setProgress(0.2);

    unsubscribe();
    timeline.setProgress(0.9);
    EXPECT_NEAR(anim->time(), 0.2, TIME_TOLERANCE);
}

TEST_F(TimelineTest, UnsubscribeOutlivesTimeline) {
    auto anim = animation::animateValue(options());
    animation::AnimationTimeline::Unsubscribe unsubscribe;
    {
        ProgressTimeline timeline;
        unsubscribe = anim->attachTimeline(timeline);
    }
    EXPECT_NO_THROW(unsubscribe());
}

TEST_F(TimelineTest, FlattenConvertsSpringToLinearKeyframes) {
    ProgressTimeline timeline;
    auto spring_options = options(500.0);
    spring_options.type = GeneratorType::SPRING;
    spring_options.ease.clear();
    spring_options.spring.bounce = 0.25;
    spring_options.allow_flatten = true;

    auto anim = animation::animateValue(std::move(spring_options));
    const auto unsubscribe = anim->attachTimeline(timeline);

    EXPECT_EQ(anim->options().type, GeneratorType::KEYFRAMES);
    EXPECT_DOUBLE_EQ(anim->duration(), 0.5);

    timeline.setProgress(0.5);
    loop_.process(START_TIME);
    EXPECT_FLOAT_EQ(updates_.back(), 50.0f);

    unsubscribe();
}

TEST_F(TimelineTest, WithoutFlattenGeneratorIsKept) {
    ProgressTimeline timeline;
    auto spring_options = options(500.0);
    spring_options.type = GeneratorType::SPRING;
    spring_options.spring.bounce = 0.25;

    auto anim = animation::animateValue(std::move(spring_options));
    const auto unsubscribe = anim->attachTimeline(timeline);

    EXPECT_EQ(anim->options().type, GeneratorType::SPRING);
    unsubscribe();
}
