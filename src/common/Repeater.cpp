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
#include "common/Repeater.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>

namespace bastion {

Repeater::Repeater(const RetryPolicy p, Clock& c)
    : policy {p},
      jitter {p.jitterFraction},
      clock {c} {}

const RetryPolicy& Repeater::retryPolicy() const {
    return policy;
}

bool Repeater::retryable(const Error& error, const RetryClassifier& isRetryable) {
    if (error.rejected()) {
        return false;
    }
    return isRetryable && isRetryable(error);
}

std::chrono::microseconds Repeater::delayAfter(const Error& error, std::chrono::microseconds computed) const {
    if (error.retryAfter.has_value() && *error.retryAfter >= std::chrono::microseconds::zero()) {
        return *error.retryAfter;
    }
    return jitter.jitter(computed);
}

} // namespace bastion
