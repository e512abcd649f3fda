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
#ifndef BASTION_COMMON_FEATURE_TOGGLES_HPP
#define BASTION_COMMON_FEATURE_TOGGLES_HPP

#include <array>
#include <cstddef>
#include <string_view>

namespace bastion {

enum class Feature : std::size_t {
    UseRetry,
    UseCircuitBreaker,
    UseRemoteSecretStore,
    UseRollback,
    UseTelemetry
};

inline constexpr std::size_t featureCount = 5;

[[nodiscard]] std::string_view toString(Feature f);
// Environment variable consulted by FeatureToggles::fromEnvironment().
[[nodiscard]] std::string_view environmentVariable(Feature f);

// Immutable-by-convention set of boolean switches. Every feature is off unless
// turned on explicitly or through the environment.
class FeatureToggles {
public:
    FeatureToggles() = default;
    static FeatureToggles fromEnvironment();

    [[nodiscard]] bool enabled(Feature f) const;
    FeatureToggles& set(Feature f, bool on);
    // Remote secrets, retry, rollback and telemetry all on. The circuit breaker is not required.
    [[nodiscard]] bool productionReady() const;

    void logStatus() const;

private:
    std::array<bool, featureCount> flags {};
};

} // namespace bastion

#endif // BASTION_COMMON_FEATURE_TOGGLES_HPP
