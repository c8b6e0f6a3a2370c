/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <atomic>

namespace kinema::animation::stats {

    // Animations that have been started and not yet torn down.
    struct ActiveAnimations {
        std::atomic<int> main_thread{0};
    };

    [[nodiscard]] ActiveAnimations& activeAnimations();

} // namespace kinema::animation::stats
