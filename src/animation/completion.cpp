/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "completion.hpp"
#include <exception>

namespace kinema::animation {

    Completion::Completion()
        : future_(promise_.get_future().share()) {}

    void Completion::then(OnResolve on_resolve, OnReject on_reject) {
        Status status;
        std::string reason;
        {
            std::lock_guard lock(mutex_);
            status = status_;
            if (status == Status::PENDING) {
                waiters_.push_back({std::move(on_resolve), std::move(on_reject)});
                return;
            }
            reason = reason_;
        }

        if (status == Status::RESOLVED) {
            if (on_resolve) on_resolve();
        } else if (on_reject) {
            on_reject(reason);
        }
    }

    void Completion::resolve() {
        std::vector<Waiter> waiters;
        {
            std::lock_guard lock(mutex_);
            if (status_ != Status::PENDING) return;
            status_ = Status::RESOLVED;
            waiters.swap(waiters_);
            promise_.set_value();
        }

        for (auto& waiter : waiters) {
            if (waiter.on_resolve) waiter.on_resolve();
        }
    }

    void Completion::reject(const std::string& reason) {
        std::vector<Waiter> waiters;
        {
            std::lock_guard lock(mutex_);
            if (status_ != Status::PENDING) return;
            status_ = Status::REJECTED;
            reason_ = reason;
            waiters.swap(waiters_);
            promise_.set_exception(std::make_exception_ptr(AnimationRejected(reason)));
        }

        for (auto& waiter : waiters) {
            if (waiter.on_reject) waiter.on_reject(reason);
        }
    }

    Completion::Status Completion::status() const {
        std::lock_guard lock(mutex_);
        return status_;
    }

} // namespace kinema::animation
