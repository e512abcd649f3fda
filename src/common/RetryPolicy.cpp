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
#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>

namespace bastion {

RetryPolicy::RetryPolicy(
    int attempts,
    std::chrono::microseconds initial,
    std::chrono::microseconds max,
    double factor,
    double jitter)
    : maxAttempts(attempts),
      initialDelay(initial),
      maxDelay(max),
      backoffFactor(factor),
      jitterFraction(jitter) {
    if (attempts < 1) {
        throw std::invalid_argument("Max attempts must be >= 1.");
    }
    if (initial < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Initial delay must be >= zero.");
    }
    if (max < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Max delay must be >= zero.");
    }
    if (max < initial) {
        throw std::invalid_argument("Max delay must be >= initial delay.");
    }
    if (!(factor > 1.0)) {
        throw std::invalid_argument("Backoff factor must be > 1.");
    }
    if (!(jitter >= 0.0 && jitter <= 1.0)) {
        throw std::invalid_argument("Jitter fraction must be within [0, 1].");
    }
}

RetryPolicy RetryPolicy::defaults() {
    return RetryPolicy {3, std::chrono::seconds {1}, std::chrono::seconds {60}, 2.0, 0.1};
}

} // namespace bastion
