/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>

namespace kinema::animation {

    class ValueAnimation;

    // External time source an animation can hand control to.
    class AnimationTimeline {
    public:
        using Unsubscribe = std::function<void()>;

        virtual ~AnimationTimeline() = default;

        // The animation must stay alive until the returned callback is invoked.
        [[nodiscard]] virtual Unsubscribe observe(ValueAnimation& animation) = 0;
    };

    /**
     * @brief Timeline driven by an externally reported progress in [0, 1].
     *
     * Observed animations are seeked to duration * progress whenever the
     * progress they last saw changes.
     */
    class ProgressTimeline final : public AnimationTimeline {
    public:
        ProgressTimeline();

        [[nodiscard]] Unsubscribe observe(ValueAnimation& animation) override;

        void setProgress(double progress);
        [[nodiscard]] double progress() const { return progress_; }
        [[nodiscard]] size_t observerCount() const { return observers_->size(); }

    private:
        struct Observer {
            ValueAnimation* animation = nullptr;
            std::optional<double> last_progress;
        };
        using ObserverMap = std::map<uint64_t, Observer>;

        static void update(Observer& observer, double progress);

        std::shared_ptr<ObserverMap> observers_;
        double progress_ = 0.0;
        uint64_t next_id_ = 1;
    };

} // namespace kinema::animation
