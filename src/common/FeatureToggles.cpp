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
#include "common/FeatureToggles.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

namespace bastion {

namespace {

constexpr std::array<Feature, featureCount> allFeatures {
    Feature::UseRetry,
    Feature::UseCircuitBreaker,
    Feature::UseRemoteSecretStore,
    Feature::UseRollback,
    Feature::UseTelemetry
};

} // namespace

std::string_view toString(Feature f) {
    switch (f) {
        case Feature::UseRetry: return "USE_RETRY_LOGIC";
        case Feature::UseCircuitBreaker: return "USE_CIRCUIT_BREAKER";
        case Feature::UseRemoteSecretStore: return "USE_KEY_VAULT";
        case Feature::UseRollback: return "USE_ROLLBACK";
        case Feature::UseTelemetry: return "USE_TELEMETRY";
    }
    std::unreachable();
}

std::string_view environmentVariable(Feature f) {
    switch (f) {
        case Feature::UseRetry: return "FEATURE_USE_RETRY_LOGIC";
        case Feature::UseCircuitBreaker: return "FEATURE_USE_CIRCUIT_BREAKER";
        case Feature::UseRemoteSecretStore: return "FEATURE_USE_KEY_VAULT";
        case Feature::UseRollback: return "FEATURE_USE_ROLLBACK";
        case Feature::UseTelemetry: return "FEATURE_USE_TELEMETRY";
    }
    std::unreachable();
}

FeatureToggles FeatureToggles::fromEnvironment() {
    FeatureToggles toggles;
    for (auto f : allFeatures) {
        const std::string var {environmentVariable(f)};
        const char* value = std::getenv(var.c_str());
        toggles.set(f, value != nullptr && iequals(value, "true"));
    }
    return toggles;
}

bool FeatureToggles::enabled(Feature f) const {
    return flags.at(static_cast<std::size_t>(f));
}

FeatureToggles& FeatureToggles::set(Feature f, bool on) {
    flags.at(static_cast<std::size_t>(f)) = on;
    return *this;
}

bool FeatureToggles::productionReady() const {
    return enabled(Feature::UseRemoteSecretStore) && enabled(Feature::UseRetry)
        && enabled(Feature::UseRollback) && enabled(Feature::UseTelemetry);
}

void FeatureToggles::logStatus() const {
    spdlog::info("Feature Flags Status:");
    for (auto f : allFeatures) {
        spdlog::info("  {}: {}", toString(f), enabled(f));
    }
}

} // namespace bastion
