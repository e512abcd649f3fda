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
#ifndef BASTION_COMMON_CIRCUIT_BREAKER_REGISTRY_HPP
#define BASTION_COMMON_CIRCUIT_BREAKER_REGISTRY_HPP

#include "common/CircuitBreaker.hpp"
#include "common/Clock.hpp"
#include "common/LockedUnorderedMap.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace bastion {

// One breaker per dependency name for the registry's lifetime. Breakers are
// created lazily on first lookup and never removed, so returned references stay
// valid as long as the registry does. Pass the registry explicitly to whoever
// needs it; tests build their own.
class CircuitBreakerRegistry {
public:
    explicit CircuitBreakerRegistry(
        const CircuitBreakerConfig defaults,
        Clock& c = steadyClock(),
        CircuitBreaker::StateListener l = nullptr
    );
    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    CircuitBreaker& get(const std::string& name);
    // config only applies if this call creates the breaker.
    CircuitBreaker& get(const std::string& name, const CircuitBreakerConfig config);

    [[nodiscard]] std::vector<CircuitBreaker::Snapshot> snapshot() const;
    void resetAll();
    [[nodiscard]] size_t size() const;

private:
    const CircuitBreakerConfig defaultConfig;
    Clock& clock;
    const CircuitBreaker::StateListener listener;
    LockedUnorderedMap<std::string, CircuitBreaker> breakers;
};

} // namespace bastion

#endif // BASTION_COMMON_CIRCUIT_BREAKER_REGISTRY_HPP
