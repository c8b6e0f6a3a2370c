/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <functional>
#include <memory>

namespace kinema::driver {

    using TickCallback = std::function<void(double timestamp)>;

    /**
     * @brief Source of frame ticks for a single animation.
     *
     * A driver is owned by exactly one animation. Timestamps and now() are in
     * milliseconds on the same clock.
     */
    class Driver {
    public:
        virtual ~Driver() = default;

        [[nodiscard]] virtual double now() const = 0;

        // keep_alive = false requests a single tick without resuming continuous ticking.
        virtual void start(bool keep_alive = true) = 0;
        virtual void stop() = 0;
    };

    using DriverFactory = std::function<std::unique_ptr<Driver>(TickCallback)>;

} // namespace kinema::driver
