/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "generators/calc_duration.hpp"
#include "generators/generator.hpp"
#include "generators/spring.hpp"
#include <cmath>
#include <memory>
#include <stdexcept>

namespace kinema::generators {

    namespace {
        // Decelerates towards a target, hands over to a spring once a boundary is crossed.
        struct InertiaState {
            InertiaOptions options;
            double target = 0.0;
            double amplitude = 0.0;
            double value = 0.0;
            bool done = false;
            std::optional<double> time_reached_boundary;
            std::optional<KeyframeGenerator> boundary_spring;

            [[nodiscard]] bool isOutOfBounds(const double v) const {
                return (options.min && v < *options.min) || (options.max && v > *options.max);
            }

            [[nodiscard]] double nearestBoundary(const double v) const {
                if (!options.min) return *options.max;
                if (!options.max) return *options.min;
                return std::abs(*options.min - v) < std::abs(*options.max - v) ? *options.min : *options.max;
            }

            [[nodiscard]] double calcDelta(const double t) const {
                return -amplitude * std::exp(-t / options.time_constant);
            }

            [[nodiscard]] double calcLatest(const double t) const {
                return target + calcDelta(t);
            }

            void applyFriction(const double t) {
                const double delta = calcDelta(t);
                done = std::abs(delta) <= options.rest_delta;
                value = done ? target : calcLatest(t);
            }

            void checkCatchBoundary(const double t) {
                if (!isOutOfBounds(value)) return;

                time_reached_boundary = t;
                SpringOptions spring_options;
                spring_options.damping = options.bounce_damping;
                spring_options.stiffness = options.bounce_stiffness;
                spring_options.rest_delta = options.rest_delta;
                spring_options.rest_speed = options.rest_speed;

                const auto latest = [this](const double time) { return calcLatest(time); };
                boundary_spring = makeSpring(value, nearestBoundary(value),
                                             calcGeneratorVelocity(latest, t, value), spring_options);
            }

            [[nodiscard]] AnimationState next(const double t) {
                bool has_updated_frame = false;
                if (!boundary_spring && !time_reached_boundary) {
                    has_updated_frame = true;
                    applyFriction(t);
                    checkCatchBoundary(t);
                }

                if (time_reached_boundary && t >= *time_reached_boundary) {
                    return boundary_spring->next(t - *time_reached_boundary);
                }
                if (!has_updated_frame) applyFriction(t);
                return {static_cast<float>(value), done};
            }
        };
    } // namespace

    KeyframeGenerator inertia(const GeneratorOptions& options) {
        if (options.keyframes.empty()) {
            throw std::invalid_argument("inertia generator needs at least one keyframe");
        }
        const auto origin = values::asNumber(options.keyframes.front());
        if (!origin) {
            throw std::invalid_argument("inertia generator only animates numbers, got " +
                                        values::formatValue(options.keyframes.front()));
        }

        auto state = std::make_shared<InertiaState>();
        state->options = options.inertia;
        state->value = *origin;
        state->amplitude = options.inertia.power * options.velocity;

        const double ideal = *origin + state->amplitude;
        state->target = options.inertia.modify_target ? options.inertia.modify_target(ideal) : ideal;
        if (state->target != ideal) state->amplitude = state->target - *origin;

        state->checkCatchBoundary(0.0);

        // Sampling is stateful: the boundary spring is created lazily
        return KeyframeGenerator{
            .next = [state](const double t) { return state->next(t); },
            .calculated_duration = std::nullopt,
        };
    }

} // namespace kinema::generators
