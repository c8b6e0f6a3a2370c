/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <gtest/gtest.h>

int main(int argc, char** argv) {
    // Initialize logger with Info level
    kinema::core::Logger::get().init(kinema::core::LogLevel::Info);

    ::testing::InitGoogleTest(&argc, argv);

    return RUN_ALL_TESTS();
}
