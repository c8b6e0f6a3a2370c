/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "animation/completion.hpp"
#include "animation/options.hpp"
#include "animation/timeline.hpp"
#include "driver/driver.hpp"
#include "generators/generator.hpp"
#include "values/mix.hpp"
#include <memory>
#include <optional>

namespace kinema::animation {

    using generators::AnimationState;

    /**
     * @brief Plays keyframes through a generator on a frame driver.
     *
     * Tracks play state, delay, repeats and playback speed. All internal times
     * are in milliseconds; time() and duration() report seconds. Ticks arrive
     * from the driver on the owning thread; the object must not move while a
     * driver or timeline references it.
     */
    class ValueAnimation : public WithCompletion {
    public:
        explicit ValueAnimation(AnimationOptions options);
        ~ValueAnimation();

        ValueAnimation(const ValueAnimation&) = delete;
        ValueAnimation& operator=(const ValueAnimation&) = delete;

        // Builds the generator(s) and derives durations from the current options.
        void initAnimation();

        AnimationState tick(double timestamp, bool sample = false);

        void play();
        void pause();
        void stop();
        void complete();
        void cancel();

        // Evaluates the animation at sample_time ms, independent of the driver.
        AnimationState sample(double sample_time);

        [[nodiscard]] AnimationTimeline::Unsubscribe attachTimeline(AnimationTimeline& timeline);

        [[nodiscard]] double duration() const; // s
        [[nodiscard]] double time() const;     // s
        void setTime(double seconds);

        [[nodiscard]] double speed() const { return playback_speed_; }
        void setSpeed(double speed);

        [[nodiscard]] AnimationPlayState state() const { return state_; }
        [[nodiscard]] std::optional<double> startTime() const { return start_time_; }
        [[nodiscard]] std::optional<double> holdTime() const { return hold_time_; }
        [[nodiscard]] double currentTime() const { return current_time_; } // ms

        [[nodiscard]] double calculatedDuration() const { return calculated_duration_; }
        [[nodiscard]] double resolvedDuration() const { return resolved_duration_; }
        [[nodiscard]] double totalDuration() const { return total_duration_; }

        [[nodiscard]] const AnimationOptions& options() const { return options_; }

    private:
        void updateTime(double timestamp);
        void finish();
        void teardown();
        void stopDriver();
        [[nodiscard]] double now() const;

        AnimationOptions options_;
        AnimationPlayState state_ = AnimationPlayState::IDLE;

        std::unique_ptr<driver::Driver> driver_;
        bool is_stopped_ = false;
        bool is_counted_ = false;

        generators::KeyframeGenerator generator_;
        std::optional<generators::KeyframeGenerator> mirrored_generator_;
        generators::GeneratorType resolved_type_ = generators::GeneratorType::KEYFRAMES;

        // Set when the generator only animates numbers: maps percent (0-100) onto the keyframes
        values::Mixer mix_keyframes_;

        double calculated_duration_ = 0.0;
        double resolved_duration_ = 0.0;
        double total_duration_ = 0.0;

        std::optional<double> start_time_;
        std::optional<double> hold_time_;
        double current_time_ = 0.0;
        double playback_speed_ = 1.0;
    };

    [[nodiscard]] std::unique_ptr<ValueAnimation> animateValue(AnimationOptions options);

} // namespace kinema::animation
