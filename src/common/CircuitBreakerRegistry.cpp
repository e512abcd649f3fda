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
#include "common/CircuitBreakerRegistry.hpp"
#include "common/CircuitBreaker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace bastion {

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreakerConfig defaults, Clock& c, CircuitBreaker::StateListener l)
    : defaultConfig {defaults},
      clock {c},
      listener {std::move(l)} {}

CircuitBreaker& CircuitBreakerRegistry::get(const std::string& name) {
    return get(name, defaultConfig);
}

CircuitBreaker& CircuitBreakerRegistry::get(const std::string& name, const CircuitBreakerConfig config) {
    auto [breaker, created] = breakers.getOrEmplace(name, name, config, clock, listener);
    if (created) {
        spdlog::debug("Circuit breaker '{}' registered (failureThreshold={}, successThreshold={})",
                      name, config.failureThreshold, config.successThreshold);
    }
    return breaker;
}

std::vector<CircuitBreaker::Snapshot> CircuitBreakerRegistry::snapshot() const {
    std::vector<CircuitBreaker::Snapshot> out;
    breakers.forEach([&out](const std::string&, const CircuitBreaker& breaker) {
        out.push_back(breaker.snapshot());
    });
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
    return out;
}

void CircuitBreakerRegistry::resetAll() {
    // Reset outside the map lock: listeners may look breakers up again.
    std::vector<CircuitBreaker*> all;
    breakers.forEach([&all](const std::string&, CircuitBreaker& breaker) {
        all.push_back(&breaker);
    });
    for (auto* breaker : all) {
        breaker->reset();
    }
}

size_t CircuitBreakerRegistry::size() const {
    return breakers.size();
}

} // namespace bastion
