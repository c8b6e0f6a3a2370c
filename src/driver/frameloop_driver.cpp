/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "frameloop_driver.hpp"

namespace kinema::driver {

    FrameLoopDriver::FrameLoopDriver(FrameLoop& loop, TickCallback tick)
        : loop_(loop),
          tick_(std::move(tick)),
          id_(loop.allocateId()) {}

    FrameLoopDriver::~FrameLoopDriver() {
        loop_.cancel(id_);
    }

    double FrameLoopDriver::now() const {
        return loop_.now();
    }

    void FrameLoopDriver::start(const bool keep_alive) {
        loop_.schedule(id_, [tick = tick_](const FrameData& frame) { tick(frame.timestamp); }, keep_alive);
    }

    void FrameLoopDriver::stop() {
        loop_.cancel(id_);
    }

    DriverFactory frameloopDriver(FrameLoop& loop) {
        return [&loop](TickCallback tick) -> std::unique_ptr<Driver> {
            return std::make_unique<FrameLoopDriver>(loop, std::move(tick));
        };
    }

    DriverFactory frameloopDriver() {
        return frameloopDriver(defaultFrameLoop());
    }

} // namespace kinema::driver
