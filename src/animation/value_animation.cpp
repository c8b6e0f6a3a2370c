/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "value_animation.hpp"
#include "animation/animation_count.hpp"
#include "animation/get_final.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "driver/frameloop_driver.hpp"
#include "generators/calc_duration.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace kinema::animation {

    namespace {
        constexpr double PERCENT = 100.0;

        [[nodiscard]] double secondsToMilliseconds(const double seconds) { return seconds * 1000.0; }
        [[nodiscard]] double millisecondsToSeconds(const double ms) { return ms / 1000.0; }

        // Halves round towards +infinity
        [[nodiscard]] double roundHalfUp(const double value) { return std::floor(value + 0.5); }
    } // namespace

    ValueAnimation::ValueAnimation(AnimationOptions options)
        : options_(std::move(options)),
          playback_speed_(options_.speed) {
        initAnimation();

        ++stats::activeAnimations().main_thread;
        is_counted_ = true;
        play();

        if (!options_.autoplay) pause();
    }

    ValueAnimation::~ValueAnimation() {
        stopDriver();
        if (is_counted_) {
            --stats::activeAnimations().main_thread;
        }
    }

    void ValueAnimation::initAnimation() {
        using generators::GeneratorType;

        const auto& keyframes = options_.keyframes;
        if (keyframes.empty()) {
            throw std::invalid_argument("ValueAnimation needs at least one keyframe");
        }

        const auto factory = generators::generatorFactoryFor(options_.type, options_.custom_factory);
        resolved_type_ = options_.type == GeneratorType::CUSTOM && !options_.custom_factory
                             ? GeneratorType::KEYFRAMES
                             : options_.type;

#if KINEMA_CHECK_INVARIANTS
        if (resolved_type_ != GeneratorType::KEYFRAMES) {
            core::invariant(keyframes.size() <= 2,
                            fmt::format("Only two keyframes currently supported with spring and inertia "
                                        "animations. Trying to animate {}",
                                        values::formatValues(keyframes)),
                            "spring-two-frames");
        }
#endif

        generators::GeneratorOptions generator_options = options_;

        // Numeric-only generators animate 0-100 and the mixer maps that onto the real keyframes
        mix_keyframes_ = {};
        if (!generators::supportsValueMixing(resolved_type_) && !values::isNumber(keyframes.front())) {
            auto mixer = values::mix(keyframes.front(), keyframes.back());
            mix_keyframes_ = [mixer = std::move(mixer)](const double percent) { return mixer(percent / PERCENT); };
            generator_options.keyframes = {Value{0.0f}, Value{static_cast<float>(PERCENT)}};
        }

        generator_ = factory(generator_options);

        // Mirror repeats ping-pong between this and a generator running the keyframes backwards
        mirrored_generator_.reset();
        if (options_.repeat_type == RepeatType::MIRROR) {
            auto mirrored_options = generator_options;
            std::reverse(mirrored_options.keyframes.begin(), mirrored_options.keyframes.end());
            mirrored_options.velocity = -mirrored_options.velocity;
            mirrored_generator_ = factory(mirrored_options);
        }

        if (!generator_.calculated_duration) {
            generator_.calculated_duration = generators::calcGeneratorDuration(generator_);
        }

        calculated_duration_ = *generator_.calculated_duration;
        resolved_duration_ = calculated_duration_ + options_.repeat_delay;
        total_duration_ = resolved_duration_ * (static_cast<double>(options_.repeat) + 1.0) - options_.repeat_delay;

        LOG_DEBUG("Initialised {} animation: duration {}ms, total {}ms, repeat {} ({})",
                  generators::generatorTypeName(resolved_type_), calculated_duration_, total_duration_,
                  options_.repeat, repeatTypeName(options_.repeat_type));
    }

    void ValueAnimation::updateTime(const double timestamp) {
        if (hold_time_) {
            current_time_ = *hold_time_;
            return;
        }
        if (!start_time_) return;

        // Rounded so that e.g. 3000.367 - 1000.367 compares equal to a 2000ms duration
        current_time_ = roundHalfUp(timestamp - *start_time_) * playback_speed_;
    }

    AnimationState ValueAnimation::tick(const double timestamp, const bool sample) {
        if (!start_time_) return generator_.next(0.0);

        const double total_duration = total_duration_;

        // Frame timestamps may arrive earlier than the clock reading used for startTime
        if (playback_speed_ > 0.0) {
            start_time_ = std::min(*start_time_, timestamp);
        } else if (playback_speed_ < 0.0) {
            start_time_ = std::min(timestamp - total_duration / playback_speed_, *start_time_);
        }

        if (sample) {
            current_time_ = timestamp;
        } else {
            updateTime(timestamp);
        }

        const double time_without_delay = current_time_ - options_.delay * (playback_speed_ >= 0.0 ? 1.0 : -1.0);
        const bool in_delay_phase = playback_speed_ >= 0.0 ? time_without_delay < 0.0
                                                           : time_without_delay > total_duration;
        current_time_ = std::max(time_without_delay, 0.0);

        if (state_ == AnimationPlayState::FINISHED && !hold_time_) {
            current_time_ = total_duration;
        }

        double elapsed = current_time_;
        const generators::KeyframeGenerator* frame_generator = &generator_;

        if (options_.repeat != 0 && resolved_duration_ > 0.0) {
            // 2.5 means halfway through the third iteration
            const double progress = std::min(current_time_, total_duration) / resolved_duration_;
            double current_iteration = std::floor(progress);
            double iteration_progress = std::fmod(progress, 1.0);

            // The exact end of an iteration still belongs to it
            if (iteration_progress == 0.0 && progress >= 1.0) {
                iteration_progress = 1.0;
            }
            if (iteration_progress == 1.0) {
                current_iteration -= 1.0;
            }

            current_iteration = std::min(current_iteration, static_cast<double>(options_.repeat) + 1.0);

            if (std::fmod(current_iteration, 2.0) != 0.0) {
                if (options_.repeat_type == RepeatType::REVERSE) {
                    iteration_progress = 1.0 - iteration_progress;
                    if (options_.repeat_delay != 0.0) {
                        iteration_progress -= options_.repeat_delay / resolved_duration_;
                    }
                } else if (options_.repeat_type == RepeatType::MIRROR) {
                    frame_generator = &*mirrored_generator_;
                }
            }

            elapsed = std::clamp(iteration_progress, 0.0, 1.0) * resolved_duration_;
        }

        // Holding the first keyframe during a delay keeps zero-duration animations from finishing early
        AnimationState state = in_delay_phase ? AnimationState{options_.keyframes.front(), false}
                                              : frame_generator->next(elapsed);

        if (mix_keyframes_ && !in_delay_phase) {
            if (const auto percent = values::asNumber(state.value)) {
                state.value = mix_keyframes_(*percent);
            }
        }

        if (!in_delay_phase) {
            state.done = playback_speed_ >= 0.0 ? current_time_ >= total_duration : current_time_ <= 0.0;
        }

        const bool is_finished =
            !hold_time_ &&
            (state_ == AnimationPlayState::FINISHED || (state_ == AnimationPlayState::RUNNING && state.done));

        // Inertia settles wherever its physics end, not on a keyframe
        if (is_finished && resolved_type_ != generators::GeneratorType::INERTIA) {
            state.value = getFinalKeyframe(options_.keyframes, options_.repeatOptions(),
                                           options_.final_keyframe, playback_speed_);
        }

        if (options_.on_update) {
            options_.on_update(state.value);
        }

        if (is_finished) {
            finish();
        }

        return state;
    }

    double ValueAnimation::duration() const {
        return millisecondsToSeconds(calculated_duration_);
    }

    double ValueAnimation::time() const {
        return millisecondsToSeconds(current_time_);
    }

    void ValueAnimation::setTime(const double seconds) {
        const double new_time = secondsToMilliseconds(seconds);
        current_time_ = new_time;

        if (!start_time_ || hold_time_ || playback_speed_ == 0.0) {
            hold_time_ = new_time;
        } else if (driver_) {
            start_time_ = driver_->now() - new_time / playback_speed_;
        }

        // Re-sync the next frame without resuming a held animation
        if (driver_) driver_->start(false);
    }

    void ValueAnimation::setSpeed(const double speed) {
        updateTime(now());
        const bool has_changed = playback_speed_ != speed;
        playback_speed_ = speed;

        if (has_changed) {
            setTime(millisecondsToSeconds(current_time_));
        }
    }

    void ValueAnimation::play() {
        if (is_stopped_) return;

        if (!driver_) {
            const auto& factory = options_.driver ? options_.driver : driver::frameloopDriver();
            driver_ = factory([this](const double timestamp) { tick(timestamp); });
        }

        if (!is_counted_) {
            ++stats::activeAnimations().main_thread;
            is_counted_ = true;
        }

        if (options_.on_play) options_.on_play();

        const double now = driver_->now();

        if (state_ == AnimationPlayState::FINISHED) {
            updateFinished();
            start_time_ = now;
            // Replaying a finished animation backwards starts from its end
            if (playback_speed_ < 0.0) *start_time_ += calculated_duration_;
        } else if (hold_time_) {
            start_time_ = now - (playback_speed_ != 0.0 ? *hold_time_ / playback_speed_ : *hold_time_);
        } else if (!start_time_ || *start_time_ == 0.0) {
            // A zero start time (left by sample()) counts as unset
            start_time_ = options_.start_time.value_or(now);
            if (!options_.start_time && playback_speed_ < 0.0) {
                *start_time_ += calculated_duration_;
            }
        }

        hold_time_.reset();
        state_ = AnimationPlayState::RUNNING;

        LOG_DEBUG("Animation playing from {}ms at speed {}", *start_time_, playback_speed_);
        driver_->start();
    }

    void ValueAnimation::pause() {
        state_ = AnimationPlayState::PAUSED;
        updateTime(now());
        hold_time_ = current_time_;
        LOG_DEBUG("Animation paused at {}ms", current_time_);
    }

    void ValueAnimation::stop() {
        if (const auto& motion_value = options_.motion_value) {
            const double timestamp = now();
            const auto updated_at = motion_value->updatedAt();
            if (!updated_at || *updated_at != timestamp) {
                tick(timestamp);
            }
        }

        is_stopped_ = true;
        if (state_ == AnimationPlayState::IDLE) return;

        teardown();
        LOG_DEBUG("Animation stopped");
        if (options_.on_stop) options_.on_stop();
    }

    void ValueAnimation::complete() {
        if (state_ != AnimationPlayState::RUNNING) {
            play();
        }

        state_ = AnimationPlayState::FINISHED;
        hold_time_.reset();
    }

    void ValueAnimation::finish() {
        notifyFinished();
        teardown();
        state_ = AnimationPlayState::FINISHED;

        LOG_DEBUG("Animation finished after {}ms", total_duration_);
        if (options_.on_complete) options_.on_complete();
    }

    void ValueAnimation::cancel() {
        hold_time_.reset();
        start_time_ = 0.0;
        // Idle while rewinding so a zero-length animation cannot complete here
        state_ = AnimationPlayState::IDLE;
        tick(0.0);
        teardown();

        LOG_DEBUG("Animation cancelled");
        if (options_.on_cancel) options_.on_cancel();
    }

    void ValueAnimation::teardown() {
        state_ = AnimationPlayState::IDLE;
        stopDriver();
        start_time_.reset();
        hold_time_.reset();

        if (is_counted_) {
            --stats::activeAnimations().main_thread;
            is_counted_ = false;
        }
    }

    void ValueAnimation::stopDriver() {
        if (!driver_) return;
        driver_->stop();
        driver_.reset();
    }

    AnimationState ValueAnimation::sample(const double sample_time) {
        start_time_ = 0.0;
        return tick(sample_time, true);
    }

    AnimationTimeline::Unsubscribe ValueAnimation::attachTimeline(AnimationTimeline& timeline) {
        if (options_.allow_flatten) {
            options_.type = generators::GeneratorType::KEYFRAMES;
            options_.ease = {generators::EasingType::LINEAR};
            initAnimation();
        }

        if (driver_) driver_->stop();
        LOG_DEBUG("Animation attached to timeline (flattened: {})", options_.allow_flatten);
        return timeline.observe(*this);
    }

    double ValueAnimation::now() const {
        return driver_ ? driver_->now() : driver::timeNow();
    }

    std::unique_ptr<ValueAnimation> animateValue(AnimationOptions options) {
        return std::make_unique<ValueAnimation>(std::move(options));
    }

} // namespace kinema::animation
