/* SPDX-FileCopyrightText: 2025 Kinema Authors
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include "core/logger.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

// Development checks follow NDEBUG unless the build sets them explicitly
#ifndef KINEMA_CHECK_INVARIANTS
#ifdef NDEBUG
#define KINEMA_CHECK_INVARIANTS 0
#else
#define KINEMA_CHECK_INVARIANTS 1
#endif
#endif

namespace kinema::core {

    /**
     * @brief Raised when a caller breaks a usage contract (development builds only).
     *
     * The code identifies the contract, e.g. "spring-two-frames".
     */
    class InvariantViolation : public std::logic_error {
    public:
        InvariantViolation(const std::string& message, std::string code)
            : std::logic_error(message),
              code_(std::move(code)) {}

        [[nodiscard]] const std::string& code() const noexcept { return code_; }

    private:
        std::string code_;
    };

    inline void invariant(const bool condition, std::string_view message, std::string_view code) {
        if (condition) return;
        LOG_ERROR("[{}] {}", code, message);
        throw InvariantViolation(std::string(message), std::string(code));
    }

} // namespace kinema::core
