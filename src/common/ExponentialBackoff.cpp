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
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

#include <chrono>
#include <cmath>
#include <optional>
#include <stdexcept>

namespace bastion {

ExponentialBackoff::ExponentialBackoff(const RetryPolicy p)
    : policy {p} {}

std::optional<std::chrono::microseconds> ExponentialBackoff::nextDelay() {
    if (attempt >= policy.maxAttempts - 1) {
        return std::nullopt;
    }
    attempt++;
    return delayFor(policy, attempt);
}

void ExponentialBackoff::reset() {
    attempt = 0;
}

int ExponentialBackoff::attempts() const {
    return attempt;
}

std::chrono::microseconds ExponentialBackoff::delayFor(const RetryPolicy& policy, int attempt) {
    if (attempt < 1) {
        throw std::invalid_argument("Attempt numbers start at 1.");
    }
    const auto cap = static_cast<double>(policy.maxDelay.count());
    // Computed in floating point so large exponents saturate at maxDelay instead of overflowing.
    const auto raw = static_cast<double>(policy.initialDelay.count())
        * std::pow(policy.backoffFactor, static_cast<double>(attempt - 1));
    if (!std::isfinite(raw) || raw >= cap) {
        return policy.maxDelay;
    }
    return std::chrono::microseconds {static_cast<std::chrono::microseconds::rep>(raw)};
}

} // namespace bastion
