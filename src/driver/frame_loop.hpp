/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <set>

namespace kinema::driver {

    inline constexpr double DEFAULT_FRAME_DELTA = 1000.0 / 60.0;
    inline constexpr double MAX_FRAME_DELTA = 40.0;

    struct FrameData {
        double delta = 0.0;
        double timestamp = 0.0;
        bool is_processing = false;
    };

    /**
     * @brief Batches per-frame callbacks and runs them when the host processes a frame.
     *
     * Single threaded. A callback scheduled during processing runs on the next
     * frame. Keep-alive callbacks are rescheduled every frame until cancelled.
     */
    class FrameLoop {
    public:
        using CallbackId = uint64_t;
        using FrameCallback = std::function<void(const FrameData&)>;

        explicit FrameLoop(bool manual_timing = false) : manual_timing_(manual_timing) {}

        FrameLoop(const FrameLoop&) = delete;
        FrameLoop& operator=(const FrameLoop&) = delete;

        [[nodiscard]] CallbackId allocateId() { return next_id_++; }

        // Re-scheduling an id replaces its callback; keep_alive is sticky until cancel().
        void schedule(CallbackId id, FrameCallback callback, bool keep_alive = false);
        void cancel(CallbackId id);
        [[nodiscard]] bool isScheduled(CallbackId id) const { return scheduled_.contains(id); }
        [[nodiscard]] bool hasPending() const { return !scheduled_.empty(); }

        void process(double timestamp);

        /**
         * @brief Current time in ms.
         *
         * While processing, or under manual timing, this is the frame timestamp so
         * every callback in a batch observes the same time.
         */
        [[nodiscard]] double now() const;

        void setManualTiming(bool manual) { manual_timing_ = manual; }
        [[nodiscard]] bool manualTiming() const { return manual_timing_; }

        // Manual timing only: move the clock without running callbacks.
        void setTime(double timestamp) { frame_data_.timestamp = timestamp; }

        [[nodiscard]] const FrameData& frameData() const { return frame_data_; }

    private:
        struct Entry {
            FrameCallback callback;
            bool keep_alive = false;
        };

        std::map<CallbackId, Entry> scheduled_;
        std::set<CallbackId> cancelled_in_frame_;
        FrameData frame_data_;
        bool has_processed_ = false;
        bool manual_timing_ = false;
        CallbackId next_id_ = 1;
    };

    [[nodiscard]] FrameLoop& defaultFrameLoop();

    // Clock shared by everything not bound to a specific loop.
    [[nodiscard]] double timeNow();

} // namespace kinema::driver
