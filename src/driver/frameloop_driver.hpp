/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "driver/driver.hpp"
#include "driver/frame_loop.hpp"

namespace kinema::driver {

    class FrameLoopDriver final : public Driver {
    public:
        FrameLoopDriver(FrameLoop& loop, TickCallback tick);
        ~FrameLoopDriver() override;

        FrameLoopDriver(const FrameLoopDriver&) = delete;
        FrameLoopDriver& operator=(const FrameLoopDriver&) = delete;

        [[nodiscard]] double now() const override;
        void start(bool keep_alive = true) override;
        void stop() override;

    private:
        FrameLoop& loop_;
        TickCallback tick_;
        FrameLoop::CallbackId id_;
    };

    // Drivers ticking from the given loop. The loop must outlive every driver.
    [[nodiscard]] DriverFactory frameloopDriver(FrameLoop& loop);
    [[nodiscard]] DriverFactory frameloopDriver();

} // namespace kinema::driver
