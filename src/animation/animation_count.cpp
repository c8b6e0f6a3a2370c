/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "animation_count.hpp"

namespace kinema::animation::stats {

    ActiveAnimations& activeAnimations() {
        static ActiveAnimations counts;
        return counts;
    }

} // namespace kinema::animation::stats
