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
#ifndef BASTION_COMMON_RETRY_POLICY_HPP
#define BASTION_COMMON_RETRY_POLICY_HPP

#include <chrono>

namespace bastion {

struct RetryPolicy {
    RetryPolicy(
        int attempts,
        std::chrono::microseconds initial,
        std::chrono::microseconds max,
        double factor,
        double jitter
    );
    // 3 attempts, 1s initial delay doubling up to 60s, 10% jitter.
    static RetryPolicy defaults();

    int maxAttempts;
    std::chrono::microseconds initialDelay;
    std::chrono::microseconds maxDelay;
    double backoffFactor;
    double jitterFraction;
};

} // namespace bastion

#endif // BASTION_COMMON_RETRY_POLICY_HPP
