// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * Bastion a resilient provisioning engine.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef BASTION_COMMON_REPEATER_HPP
#define BASTION_COMMON_REPEATER_HPP

#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/Jitter.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <optional>
#include <stop_token>
#include <utility>
#include <vector>

namespace bastion {

struct RetryAttempt {
    int number;
    std::optional<Error> error;
    // Sleep taken after this attempt before the next one.
    std::chrono::microseconds delay;
};

template<typename T>
struct RetryResult {
    std::expected<T, Error> result;
    std::vector<RetryAttempt> attempts;

    [[nodiscard]] bool ok() const {
        return result.has_value();
    }

    [[nodiscard]] std::size_t attemptCount() const {
        return attempts.size();
    }
};

// Runs an operation until it succeeds, fails with an error the caller does not
// classify as retryable, or maxAttempts is reached. The last error is returned
// unchanged. Rejections by a circuit breaker and cancellations are never retried.
// Performs no logging.
class Repeater {
public:
    explicit Repeater(const RetryPolicy p, Clock& c = steadyClock());

    template<typename T>
    RetryResult<T> execute(const Operation<T>& op, const RetryClassifier& isRetryable, std::stop_token token = {}) const {
        RetryResult<T> out {std::unexpected {Error {ErrorCode::Cancelled, "Repeater stopped"}}, {}};
        ExponentialBackoff backoff {policy};
        for (int attempt = 1; ; ++attempt) {
            if (token.stop_requested()) {
                out.result = std::unexpected {Error {ErrorCode::Cancelled, "Repeater stopped"}};
                return out;
            }
            auto result = op();
            if (result.has_value()) {
                out.attempts.push_back(RetryAttempt {attempt, std::nullopt, std::chrono::microseconds::zero()});
                out.result = std::move(result);
                return out;
            }
            std::optional<std::chrono::microseconds> delay;
            if (retryable(result.error(), isRetryable)) {
                delay = backoff.nextDelay();
            }
            if (!delay.has_value()) {
                out.attempts.push_back(RetryAttempt {attempt, result.error(), std::chrono::microseconds::zero()});
                out.result = std::move(result);
                return out;
            }
            auto wait = delayAfter(result.error(), delay.value());
            out.attempts.push_back(RetryAttempt {attempt, result.error(), wait});
            if (!clock.sleepFor(wait, token)) {
                out.result = std::unexpected {Error {ErrorCode::Cancelled, "Repeater stopped"}};
                return out;
            }
        }
        std::unreachable();
    }

    [[nodiscard]] const RetryPolicy& retryPolicy() const;

private:
    static bool retryable(const Error& error, const RetryClassifier& isRetryable);
    [[nodiscard]] std::chrono::microseconds delayAfter(const Error& error, std::chrono::microseconds computed) const;

    RetryPolicy policy;
    Jitter jitter;
    Clock& clock;
};

} // namespace bastion

#endif // BASTION_COMMON_REPEATER_HPP
