/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "driver/frame_loop.hpp"
#include "driver/frameloop_driver.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace kinema::driver;

class FrameLoopTest : public ::testing::Test {
protected:
    FrameLoop loop_{true};
};

TEST_F(FrameLoopTest, OneShotCallbackRunsOnce) {
    int calls = 0;
    loop_.schedule(loop_.allocateId(), [&calls](const FrameData&) { ++calls; });
    EXPECT_TRUE(loop_.hasPending());

    loop_.process(16.0);
    loop_.process(32.0);
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(loop_.hasPending());
}

TEST_F(FrameLoopTest, KeepAliveRunsEveryFrameUntilCancelled) {
    std::vector<double> timestamps;
    const auto id = loop_.allocateId();
    loop_.schedule(id, [&timestamps](const FrameData& frame) { timestamps.push_back(frame.timestamp); }, true);

    loop_.process(16.0);
    loop_.process(32.0);
    loop_.cancel(id);
    loop_.process(48.0);

    EXPECT_EQ(timestamps, (std::vector<double>{16.0, 32.0}));
}

TEST_F(FrameLoopTest, KeepAliveIsStickyAcrossReschedules) {
    int calls = 0;
    const auto id = loop_.allocateId();
    loop_.schedule(id, [&calls](const FrameData&) { ++calls; }, true);
    loop_.schedule(id, [&calls](const FrameData&) { calls += 10; }, false);

    loop_.process(16.0);
    loop_.process(32.0);
    EXPECT_EQ(calls, 20);
    EXPECT_TRUE(loop_.isScheduled(id));
}

TEST_F(FrameLoopTest, ScheduledDuringProcessingRunsNextFrame) {
    int inner_calls = 0;
    const auto inner = loop_.allocateId();
    loop_.schedule(loop_.allocateId(), [&](const FrameData&) {
        loop_.schedule(inner, [&inner_calls](const FrameData&) { ++inner_calls; });
    });

    loop_.process(16.0);
    EXPECT_EQ(inner_calls, 0);
    loop_.process(32.0);
    EXPECT_EQ(inner_calls, 1);
}

TEST_F(FrameLoopTest, CancelDuringProcessingSkipsPendingCallback) {
    const auto first = loop_.allocateId();
    const auto second = loop_.allocateId();
    bool second_ran = false;

    loop_.schedule(first, [&](const FrameData&) { loop_.cancel(second); });
    loop_.schedule(second, [&second_ran](const FrameData&) { second_ran = true; }, true);

    loop_.process(16.0);
    EXPECT_FALSE(second_ran);
    EXPECT_FALSE(loop_.isScheduled(second));
}

TEST_F(FrameLoopTest, NowFollowsFrameTimestamp) {
    loop_.setTime(100.0);
    EXPECT_DOUBLE_EQ(loop_.now(), 100.0);

    double seen = 0.0;
    loop_.schedule(loop_.allocateId(), [&](const FrameData&) { seen = loop_.now(); });
    loop_.process(250.0);
    EXPECT_DOUBLE_EQ(seen, 250.0);
    EXPECT_DOUBLE_EQ(loop_.now(), 250.0);
}

TEST_F(FrameLoopTest, DeltaIsClamped) {
    loop_.process(0.0);
    EXPECT_DOUBLE_EQ(loop_.frameData().delta, DEFAULT_FRAME_DELTA);

    loop_.process(500.0);
    EXPECT_DOUBLE_EQ(loop_.frameData().delta, MAX_FRAME_DELTA);

    loop_.process(500.25);
    EXPECT_DOUBLE_EQ(loop_.frameData().delta, 1.0);
}

TEST_F(FrameLoopTest, DriverTicksWithTimestamps) {
    std::vector<double> ticks;
    auto driver = frameloopDriver(loop_)([&ticks](const double timestamp) { ticks.push_back(timestamp); });

    loop_.setTime(40.0);
    EXPECT_DOUBLE_EQ(driver->now(), 40.0);

    driver->start();
    loop_.process(50.0);
    loop_.process(60.0);
    driver->stop();
    loop_.process(70.0);

    EXPECT_EQ(ticks, (std::vector<double>{50.0, 60.0}));
}

TEST_F(FrameLoopTest, DriverSingleTick) {
    int ticks = 0;
    auto driver = frameloopDriver(loop_)([&ticks](double) { ++ticks; });

    driver->start(false);
    loop_.process(16.0);
    loop_.process(32.0);
    EXPECT_EQ(ticks, 1);
}

TEST_F(FrameLoopTest, DestroyingDriverCancelsIt) {
    int ticks = 0;
    auto driver = frameloopDriver(loop_)([&ticks](double) { ++ticks; });
    driver->start();
    driver.reset();

    loop_.process(16.0);
    EXPECT_EQ(ticks, 0);
    EXPECT_FALSE(loop_.hasPending());
}

TEST_F(FrameLoopTest, DriverMayDestroyItselfWhileTicking) {
    int ticks = 0;
    std::unique_ptr<Driver> driver;
    driver = frameloopDriver(loop_)([&](double) {
        ++ticks;
        driver.reset();
    });
    driver->start();

    loop_.process(16.0);
    loop_.process(32.0);
    EXPECT_EQ(ticks, 1);
    EXPECT_FALSE(driver);
}
