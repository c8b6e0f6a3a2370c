/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation/completion.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace kinema::animation;

TEST(CompletionTest, ResolveRunsEveryWaiter) {
    Completion completion;
    int resolved = 0;
    completion.then([&resolved] { ++resolved; });
    completion.then([&resolved] { ++resolved; });
    EXPECT_EQ(completion.status(), Completion::Status::PENDING);

    completion.resolve();
    EXPECT_EQ(resolved, 2);
    EXPECT_TRUE(completion.settled());

    // Late waiters run immediately
    completion.then([&resolved] { ++resolved; });
    EXPECT_EQ(resolved, 3);
}

TEST(CompletionTest, SettlesOnlyOnce) {
    Completion completion;
    int resolved = 0;
    std::string reason;
    completion.then([&resolved] { ++resolved; }, [&reason](const std::string& r) { reason = r; });

    completion.resolve();
    completion.resolve();
    completion.reject("too late");

    EXPECT_EQ(resolved, 1);
    EXPECT_TRUE(reason.empty());
    EXPECT_EQ(completion.status(), Completion::Status::RESOLVED);
}

TEST(CompletionTest, RejectReachesWaitersAndFuture) {
    Completion completion;
    std::string reason;
    completion.then({}, [&reason](const std::string& r) { reason = r; });

    completion.reject("cancelled");
    EXPECT_EQ(reason, "cancelled");
    EXPECT_EQ(completion.status(), Completion::Status::REJECTED);
    EXPECT_THROW(completion.future().get(), AnimationRejected);
}

TEST(CompletionTest, FutureUnblocksAcrossThreads) {
    Completion completion;
    auto future = completion.future();

    std::thread settler([&completion] { completion.resolve(); });
    EXPECT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    settler.join();
    EXPECT_NO_THROW(future.get());
}
