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
#ifndef BASTION_COMMON_EXPONENTIAL_BACKOFF_HPP
#define BASTION_COMMON_EXPONENTIAL_BACKOFF_HPP

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace bastion {

class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy policy);
    // Delay to wait after the current failed attempt, nullopt once maxAttempts is used up.
    std::optional<std::chrono::microseconds> nextDelay();
    void reset();
    [[nodiscard]] int attempts() const;
    // min(maxDelay, initialDelay * backoffFactor^(attempt-1)), attempt is 1-based.
    static std::chrono::microseconds delayFor(const RetryPolicy& policy, int attempt);
private:
    RetryPolicy policy;
    int attempt{0};
};

} // namespace bastion

#endif // BASTION_COMMON_EXPONENTIAL_BACKOFF_HPP
