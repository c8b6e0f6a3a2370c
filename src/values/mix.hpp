/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "values/value.hpp"
#include <functional>

namespace kinema::values {

    // Maps progress (0 = from, 1 = to, may overshoot) to a value.
    using Mixer = std::function<Value(double)>;

    [[nodiscard]] float mixNumber(float from, float to, double progress);

    /**
     * @brief Build an interpolator between two values of the same kind.
     *
     * Scalars and vectors mix linearly, quaternions spherically. Values of
     * different kinds cannot be blended; the mixer then switches to `to` as
     * soon as progress leaves zero.
     */
    [[nodiscard]] Mixer mix(const Value& from, const Value& to);

    [[nodiscard]] Mixer mixImmediate(const Value& from, const Value& to);

} // namespace kinema::values
