/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace kinema::animation {

    class AnimationRejected : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief One-shot completion signal with any number of waiters.
     *
     * Continuations registered with then() run synchronously on the thread that
     * settles the signal, or immediately if it has already settled. future()
     * serves blocking waiters; a rejection surfaces as AnimationRejected.
     */
    class Completion {
    public:
        using OnResolve = std::function<void()>;
        using OnReject = std::function<void(const std::string&)>;

        enum class Status : uint8_t {
            PENDING,
            RESOLVED,
            REJECTED
        };

        Completion();

        Completion(const Completion&) = delete;
        Completion& operator=(const Completion&) = delete;

        void then(OnResolve on_resolve, OnReject on_reject = {});

        // Settling twice is a no-op.
        void resolve();
        void reject(const std::string& reason);

        [[nodiscard]] Status status() const;
        [[nodiscard]] bool settled() const { return status() != Status::PENDING; }
        [[nodiscard]] std::shared_future<void> future() const { return future_; }

    private:
        struct Waiter {
            OnResolve on_resolve;
            OnReject on_reject;
        };

        mutable std::mutex mutex_;
        Status status_ = Status::PENDING;
        std::string reason_;
        std::vector<Waiter> waiters_;
        std::promise<void> promise_;
        std::shared_future<void> future_;
    };

    // Base for playback controls that can be awaited.
    class WithCompletion {
    public:
        WithCompletion() { updateFinished(); }

        [[nodiscard]] std::shared_ptr<Completion> finished() const { return finished_; }

        void then(Completion::OnResolve on_resolve, Completion::OnReject on_reject = {}) {
            finished_->then(std::move(on_resolve), std::move(on_reject));
        }

    protected:
        // Replaces a settled signal so the next run can be awaited again.
        void updateFinished() { finished_ = std::make_shared<Completion>(); }
        void notifyFinished() { finished_->resolve(); }

    private:
        std::shared_ptr<Completion> finished_;
    };

} // namespace kinema::animation
