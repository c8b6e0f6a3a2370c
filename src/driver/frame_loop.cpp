/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "frame_loop.hpp"
#include <algorithm>
#include <chrono>
#include <utility>

namespace kinema::driver {

    namespace {
        double steadyMilliseconds() {
            static const auto origin = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - origin).count();
        }
    } // namespace

    void FrameLoop::schedule(const CallbackId id, FrameCallback callback, const bool keep_alive) {
        auto& entry = scheduled_[id];
        entry.callback = std::move(callback);
        entry.keep_alive = entry.keep_alive || keep_alive;
    }

    void FrameLoop::cancel(const CallbackId id) {
        scheduled_.erase(id);
        if (frame_data_.is_processing) {
            cancelled_in_frame_.insert(id);
        }
    }

    void FrameLoop::process(const double timestamp) {
        frame_data_.delta = has_processed_
                                ? std::clamp(timestamp - frame_data_.timestamp, 1.0, MAX_FRAME_DELTA)
                                : DEFAULT_FRAME_DELTA;
        frame_data_.timestamp = timestamp;
        has_processed_ = true;

        auto this_frame = std::exchange(scheduled_, {});
        cancelled_in_frame_.clear();
        frame_data_.is_processing = true;

        for (auto& [id, entry] : this_frame) {
            if (cancelled_in_frame_.contains(id)) continue;
            if (entry.keep_alive && !scheduled_.contains(id)) {
                scheduled_.emplace(id, Entry{entry.callback, true});
            }
            // The local copy keeps the callback alive even if its owner cancels mid-call.
            entry.callback(frame_data_);
        }

        frame_data_.is_processing = false;
        cancelled_in_frame_.clear();
    }

    double FrameLoop::now() const {
        if (frame_data_.is_processing || manual_timing_) {
            return frame_data_.timestamp;
        }
        return steadyMilliseconds();
    }

    FrameLoop& defaultFrameLoop() {
        static FrameLoop instance;
        return instance;
    }

    double timeNow() {
        return defaultFrameLoop().now();
    }

} // namespace kinema::driver
