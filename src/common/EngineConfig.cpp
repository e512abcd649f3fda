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
#include "common/EngineConfig.hpp"
#include "common/CircuitBreaker.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <expected>
#include <stdexcept>
#include <string>
#include <system_error>

namespace bastion {

namespace {

template<typename T>
std::expected<T, Error> readNumber(const char* var, T fallback) {
    const char* raw = std::getenv(var);
    if (raw == nullptr || *raw == '\0') {
        return fallback;
    }
    const std::string text {raw};
    T value {};
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc {} || end != text.data() + text.size()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {var} + ": cannot parse '" + text + "'", var}};
    }
    return value;
}

// Counts of Duration in [0, limit]; anything larger would overflow once
// converted to the clock's resolution.
template<typename Duration>
std::expected<Duration, Error> readDuration(const char* var, Duration fallback, Duration limit) {
    auto count = readNumber<typename Duration::rep>(var, fallback.count());
    if (!count) {
        return std::unexpected {count.error()};
    }
    if (*count < 0) {
        return std::unexpected {Error {ErrorCode::InvalidArg, std::string {var} + ": must be >= 0", var}};
    }
    if (*count > limit.count()) {
        return std::unexpected {Error {ErrorCode::InvalidArg,
            std::string {var} + ": must be <= " + std::to_string(limit.count()), var}};
    }
    return Duration {*count};
}

constexpr std::chrono::milliseconds maxRetryDelay = std::chrono::hours {24};
constexpr std::chrono::seconds maxCooldown = std::chrono::hours {24};
constexpr std::chrono::seconds maxSecretTtl = std::chrono::days {30};

} // namespace

std::expected<EngineConfig, Error> EngineConfig::fromEnvironment() {
    EngineConfig defaults;

    auto attempts = readNumber<int>("RETRY_MAX_ATTEMPTS", defaults.retry.maxAttempts);
    auto initialMs = readDuration("RETRY_INITIAL_DELAY_MS",
        std::chrono::duration_cast<std::chrono::milliseconds>(defaults.retry.initialDelay), maxRetryDelay);
    auto maxMs = readDuration("RETRY_MAX_DELAY_MS",
        std::chrono::duration_cast<std::chrono::milliseconds>(defaults.retry.maxDelay), maxRetryDelay);
    auto factor = readNumber<double>("RETRY_BACKOFF_FACTOR", defaults.retry.backoffFactor);
    auto jitter = readNumber<double>("RETRY_JITTER_FRACTION", defaults.retry.jitterFraction);
    auto failures = readNumber<int>("CIRCUIT_BREAKER_FAILURE_THRESHOLD", defaults.breaker.failureThreshold);
    auto cooldownS = readDuration("CIRCUIT_BREAKER_COOLDOWN_SECONDS",
        std::chrono::duration_cast<std::chrono::seconds>(defaults.breaker.cooldownDuration), maxCooldown);
    auto successes = readNumber<int>("CIRCUIT_BREAKER_SUCCESS_THRESHOLD", defaults.breaker.successThreshold);
    auto probes = readNumber<int>("CIRCUIT_BREAKER_HALF_OPEN_MAX_CALLS", defaults.breaker.halfOpenMaxConcurrent);
    auto ttlS = readDuration("SECRET_CACHE_TTL", defaults.secretTtl, maxSecretTtl);

    if (!attempts) return std::unexpected {attempts.error()};
    if (!initialMs) return std::unexpected {initialMs.error()};
    if (!maxMs) return std::unexpected {maxMs.error()};
    if (!factor) return std::unexpected {factor.error()};
    if (!jitter) return std::unexpected {jitter.error()};
    if (!failures) return std::unexpected {failures.error()};
    if (!cooldownS) return std::unexpected {cooldownS.error()};
    if (!successes) return std::unexpected {successes.error()};
    if (!probes) return std::unexpected {probes.error()};
    if (!ttlS) return std::unexpected {ttlS.error()};

    try {
        EngineConfig config {
            RetryPolicy {*attempts, *initialMs, *maxMs, *factor, *jitter},
            CircuitBreakerConfig {*failures, *cooldownS, *successes, *probes},
            *ttlS,
            FeatureToggles::fromEnvironment()
        };
        spdlog::debug("Engine configuration loaded: maxAttempts={}, failureThreshold={}, secretTtl={}s",
                      config.retry.maxAttempts, config.breaker.failureThreshold, config.secretTtl.count());
        return config;
    } catch (const std::invalid_argument& e) {
        return std::unexpected {Error {ErrorCode::InvalidArg, e.what()}};
    }
}

} // namespace bastion
