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
#ifndef BASTION_COMMON_RESILIENT_EXECUTOR_HPP
#define BASTION_COMMON_RESILIENT_EXECUTOR_HPP

#include "common/CircuitBreaker.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include <stop_token>
#include <vector>
#include <string>

namespace bastion {

// Remote call chain: Repeater.execute(registry.get(dependency).guard(op)).
// With UseRetry off the operation is attempted once; with UseCircuitBreaker off
// it is not gated. Logs the outcome of calls that needed more than one attempt.
class ResilientExecutor {
public:
    ResilientExecutor(
        CircuitBreakerRegistry& r,
        const RetryPolicy p,
        const FeatureToggles& t,
        Clock& c = steadyClock()
    );

    template<typename T>
    RetryResult<T> execute(
        const std::string& dependency,
        const Operation<T>& op,
        const RetryClassifier& isRetryable,
        std::stop_token token = {},
        const CircuitBreaker::FailurePredicate& countsAsFailure = nullptr) {
        Operation<T> call = op;
        if (toggles.enabled(Feature::UseCircuitBreaker)) {
            auto& breaker = registry.get(dependency);
            call = [&breaker, &op, &countsAsFailure]() {
                return breaker.guard(op, countsAsFailure);
            };
        }
        const Repeater& repeater = toggles.enabled(Feature::UseRetry) ? retrying : once;
        auto out = repeater.execute(call, isRetryable, token);
        report(dependency, out.attempts, out.result.has_value() ? nullptr : &out.result.error());
        return out;
    }

private:
    void report(const std::string& dependency, const std::vector<RetryAttempt>& attempts, const Error* error) const;

    CircuitBreakerRegistry& registry;
    const FeatureToggles toggles;
    const Repeater retrying;
    const Repeater once;
};

} // namespace bastion

#endif // BASTION_COMMON_RESILIENT_EXECUTOR_HPP
