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
#ifndef BASTION_COMMON_ENGINE_CONFIG_HPP
#define BASTION_COMMON_ENGINE_CONFIG_HPP

#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <expected>

namespace bastion {

struct EngineConfig {
    RetryPolicy retry = RetryPolicy::defaults();
    CircuitBreakerConfig breaker = CircuitBreakerConfig::defaults();
    std::chrono::seconds secretTtl {3600};
    FeatureToggles toggles {};

    // Reads RETRY_*, CIRCUIT_BREAKER_*, SECRET_CACHE_TTL and FEATURE_* variables.
    // Unset variables keep their defaults; malformed ones yield InvalidArg.
    static std::expected<EngineConfig, Error> fromEnvironment();
};

} // namespace bastion

#endif // BASTION_COMMON_ENGINE_CONFIG_HPP
