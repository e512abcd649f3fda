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
#include "secrets/SecretCache.hpp"
#include "secrets/SecretStore.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <expected>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <utility>

namespace bastion {

SecretCache::SecretCache(
    SecretStoreClient& r,
    std::chrono::seconds t,
    SecretSource& f,
    const FeatureToggles& toggles,
    const RetryPolicy p,
    RetryClassifier c,
    Clock& clk)
    : remote {r},
      ttl {t},
      fallback {f},
      remoteOn {toggles.enabled(Feature::UseRemoteSecretStore)},
      repeater {p, clk},
      isRetryable {std::move(c)},
      clock {clk} {
    if (ttl < std::chrono::seconds::zero()) {
        throw std::invalid_argument {"ttl must be >= 0"};
    }
    // Half the clock's remaining range, so now() + ttl stays representable later on.
    if (ttl > std::chrono::duration_cast<std::chrono::seconds>((Clock::time_point::max() - clock.now()) / 2)) {
        throw std::invalid_argument {"ttl exceeds the clock's range"};
    }
    if (!remoteOn) {
        spdlog::info("Remote secret store disabled, reading secrets from the local source");
    }
}

std::expected<std::string, Error> SecretCache::get(const std::string& name, std::stop_token token) {
    if (!remoteOn) {
        return fallback.get(name);
    }

    const auto now = clock.now();
    if (auto cached = cache.get(name); cached.has_value()) {
        if (now < cached->expiry) {
            return cached->value;
        }
        cache.eraseIf(name, [now](const CachedSecret& s) { return s.expiry <= now; });
        spdlog::debug("Cached secret '{}' expired", name);
    }

    auto fetched = repeater.execute<std::string>([this, &name]() { return remote.fetch(name); }, isRetryable, token);
    if (fetched.ok()) {
        cache.insertOrAssign(name, CachedSecret {fetched.result.value(), clock.now() + ttl});
        spdlog::debug("Retrieved secret '{}' from remote store after {} attempt(s)", name, fetched.attemptCount());
        return std::move(fetched.result);
    }
    if (fetched.result.error().code == ErrorCode::Cancelled) {
        return std::move(fetched.result);
    }
    return fromFallback(name, fetched.result.error());
}

std::expected<std::string, Error> SecretCache::getOr(const std::string& name, std::string defaultValue, std::stop_token token) {
    auto value = get(name, std::move(token));
    if (value.has_value() || value.error().code == ErrorCode::Cancelled) {
        return value;
    }
    spdlog::debug("Secret '{}' not found, using the default", name);
    return defaultValue;
}

std::expected<std::string, Error> SecretCache::fromFallback(const std::string& name, const Error& cause) {
    spdlog::warn("Failed to retrieve secret '{}' from remote store: {}. Falling back to local source.", name, cause.what);
    auto local = fallback.get(name);
    if (local.has_value()) {
        return local;
    }
    spdlog::error("Secret '{}' not available: remote: {}; local: {}", name, cause.what, local.error().what);
    return std::unexpected {cause};
}

std::expected<Unit, Error> SecretCache::set(const std::string& name, const std::string& value) {
    if (!remoteOn) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "remote secret store is disabled, cannot set '" + name + "'", name}};
    }
    auto stored = remote.store(name, value);
    if (!stored.has_value()) {
        spdlog::error("Failed to set secret '{}': {}", name, stored.error().what);
        return stored;
    }
    cache.erase(name);
    spdlog::info("Secret '{}' set in remote store", name);
    return stored;
}

void SecretCache::invalidate(const std::string& name) {
    cache.erase(name);
}

void SecretCache::clear() {
    cache.clear();
    spdlog::info("Secret cache cleared");
}

SecretCacheStats SecretCache::stats() const {
    auto names = cache.keys();
    std::sort(names.begin(), names.end());
    return SecretCacheStats {names.size(), ttl, std::move(names), remoteOn};
}

} // namespace bastion
