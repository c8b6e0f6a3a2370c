/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "spring.hpp"
#include "generators/calc_duration.hpp"
#include "values/value.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>

namespace kinema::generators {

    namespace {
        constexpr double SAFE_MIN = 0.001;
        constexpr int ROOT_ITERATIONS = 12;
        constexpr double MAX_HYPERBOLIC_ARGUMENT = 300.0;

        [[nodiscard]] double calcAngularFreq(const double undamped_freq, const double damping_ratio) {
            return undamped_freq * std::sqrt(1.0 - damping_ratio * damping_ratio);
        }

        template <typename Envelope, typename Derivative>
        [[nodiscard]] double approximateRoot(const Envelope& envelope, const Derivative& derivative,
                                             const double initial_guess) {
            double result = initial_guess;
            for (int i = 1; i < ROOT_ITERATIONS; ++i) {
                result = result - envelope(result) / derivative(result);
            }
            return result;
        }

        [[nodiscard]] bool hasPhysicalParameters(const SpringOptions& options) {
            return options.stiffness || options.damping || options.mass;
        }
    } // namespace

    SpringParameters findSpring(const double duration_ms, const double bounce,
                                const double velocity, const double mass) {
        using namespace spring_defaults;

        const double damping_ratio = std::clamp(1.0 - bounce, MIN_DAMPING, MAX_DAMPING);
        const double duration = std::clamp(duration_ms / 1000.0, MIN_DURATION, MAX_DURATION);

        std::function<double(double)> envelope;
        std::function<double(double)> derivative;

        if (damping_ratio < 1.0) {
            // Underdamped: find the frequency whose decay envelope reaches SAFE_MIN at `duration`
            envelope = [=](const double undamped_freq) {
                const double exponential_decay = undamped_freq * damping_ratio;
                const double delta = exponential_decay * duration;
                const double a = exponential_decay - velocity;
                const double b = calcAngularFreq(undamped_freq, damping_ratio);
                const double c = std::exp(-delta);
                return SAFE_MIN - (a / b) * c;
            };
            derivative = [=, &envelope](const double undamped_freq) {
                const double exponential_decay = undamped_freq * damping_ratio;
                const double delta = exponential_decay * duration;
                const double d = delta * velocity + velocity;
                const double e = damping_ratio * damping_ratio * undamped_freq * undamped_freq * duration;
                const double f = std::exp(-delta);
                const double g = calcAngularFreq(undamped_freq * undamped_freq, damping_ratio);
                const double factor = -envelope(undamped_freq) + SAFE_MIN > 0.0 ? -1.0 : 1.0;
                return (factor * ((d - e) * f)) / g;
            };
        } else {
            // Critically damped
            envelope = [=](const double undamped_freq) {
                const double a = std::exp(-undamped_freq * duration);
                const double b = (undamped_freq - velocity) * duration + 1.0;
                return -SAFE_MIN + a * b;
            };
            derivative = [=](const double undamped_freq) {
                const double a = std::exp(-undamped_freq * duration);
                const double b = (velocity - undamped_freq) * (duration * duration);
                return a * b;
            };
        }

        const double undamped_freq = approximateRoot(envelope, derivative, 5.0 / duration);
        const double resolved_duration = duration * 1000.0;

        if (std::isnan(undamped_freq)) {
            return {STIFFNESS, DAMPING, MASS, resolved_duration};
        }

        const double stiffness = undamped_freq * undamped_freq * mass;
        return {
            stiffness,
            damping_ratio * 2.0 * std::sqrt(mass * stiffness),
            mass,
            resolved_duration,
        };
    }

    KeyframeGenerator makeSpring(const double origin, const double target, const double velocity,
                                 const SpringOptions& options, const std::optional<double> duration) {
        using namespace spring_defaults;

        // Internal convention: per-millisecond, measured towards the origin
        const double initial_velocity = -(velocity / 1000.0);

        SpringParameters params;
        bool resolved_from_duration = false;
        if (!hasPhysicalParameters(options) && (duration || options.bounce)) {
            params = findSpring(duration.value_or(DURATION), options.bounce.value_or(BOUNCE), initial_velocity);
            resolved_from_duration = true;
        } else {
            params.stiffness = options.stiffness.value_or(STIFFNESS);
            params.damping = options.damping.value_or(DAMPING);
            params.mass = options.mass.value_or(MASS);
            params.duration = duration.value_or(DURATION);
        }

        const double damping_ratio = params.damping / (2.0 * std::sqrt(params.stiffness * params.mass));
        const double initial_delta = target - origin;
        const double undamped_angular_freq = std::sqrt(params.stiffness / params.mass) / 1000.0;

        const bool granular_scale = std::abs(initial_delta) < 5.0;
        const double rest_speed = options.rest_speed.value_or(granular_scale ? REST_SPEED_GRANULAR : REST_SPEED_DEFAULT);
        const double rest_delta = options.rest_delta.value_or(granular_scale ? REST_DELTA_GRANULAR : REST_DELTA_DEFAULT);

        std::function<double(double)> resolve_spring;
        if (damping_ratio < 1.0) {
            const double angular_freq = calcAngularFreq(undamped_angular_freq, damping_ratio);
            resolve_spring = [=](const double t) {
                const double envelope = std::exp(-damping_ratio * undamped_angular_freq * t);
                return target - envelope *
                                    (((initial_velocity + damping_ratio * undamped_angular_freq * initial_delta) /
                                      angular_freq) *
                                         std::sin(angular_freq * t) +
                                     initial_delta * std::cos(angular_freq * t));
            };
        } else if (damping_ratio == 1.0) {
            resolve_spring = [=](const double t) {
                return target - std::exp(-undamped_angular_freq * t) *
                                    (initial_delta + (initial_velocity + undamped_angular_freq * initial_delta) * t);
            };
        } else {
            const double damped_angular_freq =
                undamped_angular_freq * std::sqrt(damping_ratio * damping_ratio - 1.0);
            resolve_spring = [=](const double t) {
                const double envelope = std::exp(-damping_ratio * undamped_angular_freq * t);
                const double freq_for_t = std::min(damped_angular_freq * t, MAX_HYPERBOLIC_ARGUMENT);
                return target - (envelope * ((initial_velocity + damping_ratio * undamped_angular_freq * initial_delta) *
                                                 std::sinh(freq_for_t) +
                                             damped_angular_freq * initial_delta * std::cosh(freq_for_t))) /
                                    damped_angular_freq;
            };
        }

        const double settle_duration = params.duration;
        auto next = [=](const double t) {
            const double current = resolve_spring(t);
            bool done = false;
            if (!resolved_from_duration) {
                double current_velocity = t == 0.0 ? initial_velocity : 0.0;
                // Only underdamped springs can still be moving while near the target
                if (damping_ratio < 1.0) {
                    current_velocity = t == 0.0 ? initial_velocity * 1000.0
                                                : calcGeneratorVelocity(resolve_spring, t, current);
                }
                done = std::abs(current_velocity) <= rest_speed && std::abs(target - current) <= rest_delta;
            } else {
                done = t >= settle_duration;
            }
            return AnimationState{static_cast<float>(done ? target : current), done};
        };

        std::optional<double> calculated;
        if (resolved_from_duration && settle_duration != 0.0) {
            calculated = settle_duration;
        }
        return KeyframeGenerator{std::move(next), calculated};
    }

    KeyframeGenerator spring(const GeneratorOptions& options) {
        if (options.keyframes.empty()) {
            throw std::invalid_argument("spring generator needs at least one keyframe");
        }
        const auto origin = values::asNumber(options.keyframes.front());
        const auto target = values::asNumber(options.keyframes.back());
        if (!origin || !target) {
            throw std::invalid_argument("spring generator only animates numbers, got " +
                                        values::formatValues(options.keyframes));
        }
        return makeSpring(*origin, *target, options.velocity, options.spring, options.duration);
    }

} // namespace kinema::generators
