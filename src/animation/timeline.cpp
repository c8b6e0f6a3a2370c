/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "timeline.hpp"
#include "animation/value_animation.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <vector>

namespace kinema::animation {

    ProgressTimeline::ProgressTimeline()
        : observers_(std::make_shared<ObserverMap>()) {}

    AnimationTimeline::Unsubscribe ProgressTimeline::observe(ValueAnimation& animation) {
        const auto id = next_id_++;
        auto& observer = (*observers_)[id];
        observer.animation = &animation;
        update(observer, progress_);

        return [weak = std::weak_ptr<ObserverMap>(observers_), id] {
            if (const auto observers = weak.lock()) {
                observers->erase(id);
            }
        };
    }

    void ProgressTimeline::setProgress(const double progress) {
        progress_ = std::clamp(progress, 0.0, 1.0);

        // An observer may unsubscribe itself (or others) while seeking
        std::vector<uint64_t> ids;
        ids.reserve(observers_->size());
        for (const auto& [id, observer] : *observers_) {
            ids.push_back(id);
        }
        for (const auto id : ids) {
            const auto it = observers_->find(id);
            if (it != observers_->end()) {
                update(it->second, progress_);
            }
        }
    }

    void ProgressTimeline::update(Observer& observer, const double progress) {
        if (observer.last_progress && *observer.last_progress == progress) return;
        observer.last_progress = progress;

        LOG_TRACE("Timeline progress {} seeks animation", progress);
        observer.animation->setTime(observer.animation->duration() * progress);
    }

} // namespace kinema::animation
