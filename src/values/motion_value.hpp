/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "values/value.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <optional>

namespace kinema::values {

    /**
     * @brief Externally visible value an animation writes into.
     *
     * Records the clock time of the last write so a stopping animation can tell
     * whether it already rendered this frame.
     */
    class MotionValue {
    public:
        using Clock = std::function<double()>;
        using ChangeCallback = std::function<void(const Value&)>;
        using SubscriptionId = uint64_t;

        explicit MotionValue(Value initial, Clock clock = {});

        [[nodiscard]] const Value& get() const { return current_; }
        [[nodiscard]] const Value& previous() const { return previous_; }
        [[nodiscard]] std::optional<double> updatedAt() const { return updated_at_; }

        void set(const Value& value);

        SubscriptionId onChange(ChangeCallback callback);
        void unsubscribe(SubscriptionId id);

    private:
        Value current_;
        Value previous_;
        std::optional<double> updated_at_;
        Clock clock_;
        std::map<SubscriptionId, ChangeCallback> subscribers_;
        SubscriptionId next_id_ = 1;
    };

} // namespace kinema::values
