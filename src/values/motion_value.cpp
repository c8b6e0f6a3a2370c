/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "motion_value.hpp"
#include "driver/frame_loop.hpp"
#include <vector>

namespace kinema::values {

    MotionValue::MotionValue(Value initial, Clock clock)
        : current_(initial),
          previous_(initial),
          clock_(clock ? std::move(clock) : Clock{&driver::timeNow}) {}

    void MotionValue::set(const Value& value) {
        previous_ = current_;
        current_ = value;
        updated_at_ = clock_();

        if (previous_ == current_) return;

        // Subscribers may unsubscribe while being notified.
        std::vector<ChangeCallback> callbacks;
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
        for (const auto& callback : callbacks) {
            callback(current_);
        }
    }

    MotionValue::SubscriptionId MotionValue::onChange(ChangeCallback callback) {
        const auto id = next_id_++;
        subscribers_.emplace(id, std::move(callback));
        return id;
    }

    void MotionValue::unsubscribe(const SubscriptionId id) {
        subscribers_.erase(id);
    }

} // namespace kinema::values
