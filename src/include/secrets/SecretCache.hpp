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
#ifndef BASTION_SECRETS_SECRET_CACHE_HPP
#define BASTION_SECRETS_SECRET_CACHE_HPP

#include "secrets/SecretStore.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <stop_token>
#include <string>
#include <vector>

namespace bastion {

struct CachedSecret {
    std::string value;
    Clock::time_point expiry;
};

struct SecretCacheStats {
    std::size_t size;
    std::chrono::seconds ttl;
    std::vector<std::string> cachedNames;
    bool remoteEnabled;
};

// Remote secret lookups memoized for ttl. Expired entries are dropped on the next
// lookup; there is no background sweep. Values from the fallback source are never
// cached. Safe to share between threads.
class SecretCache {
public:
    SecretCache(
        SecretStoreClient& r,
        std::chrono::seconds t,
        SecretSource& f,
        const FeatureToggles& toggles,
        const RetryPolicy p,
        RetryClassifier c,
        Clock& clk = steadyClock()
    );
    SecretCache(const SecretCache&) = delete;
    SecretCache& operator=(const SecretCache&) = delete;

    // Remote failures (after retries) degrade to the fallback source; only
    // cancellation is returned as is. If the fallback has no value either, the
    // remote error is returned.
    std::expected<std::string, Error> get(const std::string& name, std::stop_token token = {});
    // Like get, but a secret found nowhere yields defaultValue. Cancellation is still an error.
    std::expected<std::string, Error> getOr(const std::string& name, std::string defaultValue, std::stop_token token = {});

    // Writes through to the remote store, then drops any cached copy.
    std::expected<Unit, Error> set(const std::string& name, const std::string& value);

    void invalidate(const std::string& name);
    void clear();
    [[nodiscard]] SecretCacheStats stats() const;

private:
    std::expected<std::string, Error> fromFallback(const std::string& name, const Error& cause);

    SecretStoreClient& remote;
    const std::chrono::seconds ttl;
    SecretSource& fallback;
    const bool remoteOn;
    const Repeater repeater;
    const RetryClassifier isRetryable;
    Clock& clock;
    LockedUnorderedMap<std::string, CachedSecret> cache;
};

} // namespace bastion

#endif // BASTION_SECRETS_SECRET_CACHE_HPP
