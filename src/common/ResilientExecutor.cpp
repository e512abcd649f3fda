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
#include "common/ResilientExecutor.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>
#include <vector>

namespace bastion {

namespace {

const RetryPolicy singleAttempt {1, std::chrono::microseconds::zero(), std::chrono::microseconds::zero(), 2.0, 0.0};

} // namespace

ResilientExecutor::ResilientExecutor(CircuitBreakerRegistry& r, const RetryPolicy p, const FeatureToggles& t, Clock& c)
    : registry {r},
      toggles {t},
      retrying {p, c},
      once {singleAttempt, c} {}

void ResilientExecutor::report(const std::string& dependency, const std::vector<RetryAttempt>& attempts, const Error* error) const {
    if (error == nullptr) {
        if (attempts.size() > 1) {
            spdlog::info("{}: succeeded after {} attempts", dependency, attempts.size());
        }
        return;
    }
    if (error->rejected()) {
        spdlog::warn("{}: {} ({})", dependency, error->what, toString(error->code));
        return;
    }
    if (attempts.size() > 1) {
        spdlog::error("{}: failed after {} attempts, last error: {}", dependency, attempts.size(), error->what);
    }
}

} // namespace bastion
