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
#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/RetryPolicy.hpp"
#include "secrets/SecretCache.hpp"
#include "support/FakeSecrets.hpp"
#include "support/ManualClock.hpp"

using bastion::Error;
using bastion::ErrorCode;
using bastion::Feature;
using bastion::FeatureToggles;
using bastion::RetryClassifier;
using bastion::RetryPolicy;
using bastion::SecretCache;
using bastion::test::FakeSecretSource;
using bastion::test::FakeSecretStore;
using bastion::test::ManualClock;

namespace {

const RetryClassifier transient = [](const Error& e) {
    return e.code == ErrorCode::ServiceUnavailable || e.code == ErrorCode::ConnectionFailed;
};

} // namespace

class SecretCacheTest : public ::testing::Test {
protected:
    ManualClock clock;
    FakeSecretStore store;
    FakeSecretSource local;
    FeatureToggles remoteOn {FeatureToggles {}.set(Feature::UseRemoteSecretStore, true)};
    const RetryPolicy policy {3, std::chrono::milliseconds {100}, std::chrono::seconds {1}, 2.0, 0.0};

    void SetUp() override {
        store.values["api-key"] = "vault-value";
        local.values["api-key"] = "local-value";
    }

    SecretCache cacheWith(std::chrono::seconds ttl, const FeatureToggles& toggles) {
        return SecretCache {store, ttl, local, toggles, policy, transient, clock};
    }
};

TEST_F(SecretCacheTest, HitWithinTtlSuppressesRemoteCall) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(store.fetches, 1);
}

TEST_F(SecretCacheTest, ExpiredEntryIsFetchedAgain) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    clock.advance(std::chrono::seconds {30});
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(store.fetches, 1);
    clock.advance(std::chrono::seconds {40});
    store.values["api-key"] = "rotated";
    EXPECT_EQ(cache.get("api-key").value(), "rotated");
    EXPECT_EQ(store.fetches, 2);
}

TEST_F(SecretCacheTest, EntryExpiresExactlyAtTtl) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    cache.get("api-key");
    clock.advance(std::chrono::seconds {60});
    cache.get("api-key");
    EXPECT_EQ(store.fetches, 2);
}

TEST_F(SecretCacheTest, RemoteOffReadsLocalSourceOnly) {
    auto cache = cacheWith(std::chrono::seconds {60}, FeatureToggles {});
    EXPECT_EQ(cache.get("api-key").value(), "local-value");
    EXPECT_EQ(cache.get("api-key").value(), "local-value");
    EXPECT_EQ(store.fetches, 0);
    EXPECT_EQ(local.reads, 2);
    EXPECT_EQ(cache.stats().size, 0U);
}

TEST_F(SecretCacheTest, TransientRemoteFailuresAreRetried) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    store.failNext(2, Error {ErrorCode::ServiceUnavailable, "vault throttled"});
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(store.fetches, 3);
    EXPECT_EQ(local.reads, 0);
    const std::vector<std::chrono::microseconds> expected {std::chrono::milliseconds {100}, std::chrono::milliseconds {200}};
    EXPECT_EQ(clock.sleeps(), expected);
}

TEST_F(SecretCacheTest, ExhaustedRetriesFallBackWithoutCaching) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    store.failNext(3, Error {ErrorCode::ConnectionFailed, "vault unreachable"});
    EXPECT_EQ(cache.get("api-key").value(), "local-value");
    EXPECT_EQ(store.fetches, 3);
    EXPECT_EQ(cache.stats().size, 0U);
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(store.fetches, 4);
}

TEST_F(SecretCacheTest, PermanentRemoteErrorFallsBackImmediately) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    store.failNext(1, Error {ErrorCode::Unauthorized, "forbidden"});
    EXPECT_EQ(cache.get("api-key").value(), "local-value");
    EXPECT_EQ(store.fetches, 1);
}

TEST_F(SecretCacheTest, MissingEverywhereReturnsRemoteError) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    auto result = cache.get("unknown");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(result.error().what, "no secret unknown");
    EXPECT_EQ(local.reads, 1);
}

TEST_F(SecretCacheTest, CancellationIsNotMaskedByFallback) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    std::stop_source source;
    source.request_stop();
    auto result = cache.get("api-key", source.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
    EXPECT_EQ(local.reads, 0);
}

TEST_F(SecretCacheTest, GetOrFallsBackToDefaultWhenMissingEverywhere) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    EXPECT_EQ(cache.getOr("MAX_RETRIES", "3").value(), "3");
    EXPECT_EQ(cache.getOr("api-key", "unused").value(), "vault-value");
    EXPECT_TRUE(cache.stats().cachedNames == std::vector<std::string> {"api-key"});
}

TEST_F(SecretCacheTest, GetOrPrefersLocalValueOverDefault) {
    auto cache = cacheWith(std::chrono::seconds {60}, FeatureToggles {});
    EXPECT_EQ(cache.getOr("api-key", "unused").value(), "local-value");
    EXPECT_EQ(cache.getOr("missing", "fallback").value(), "fallback");
}

TEST_F(SecretCacheTest, GetOrKeepsCancellation) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    std::stop_source source;
    source.request_stop();
    auto result = cache.getOr("api-key", "unused", source.get_token());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Cancelled);
}

TEST_F(SecretCacheTest, SetWritesThroughAndInvalidates) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    cache.get("api-key");
    ASSERT_TRUE(cache.set("api-key", "new-value").has_value());
    EXPECT_EQ(store.values["api-key"], "new-value");
    EXPECT_EQ(cache.get("api-key").value(), "new-value");
    EXPECT_EQ(store.fetches, 2);
}

TEST_F(SecretCacheTest, SetFailureKeepsCachedValue) {
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    cache.get("api-key");
    store.rejectStores = true;
    auto result = cache.set("api-key", "new-value");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Unauthorized);
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(store.fetches, 1);
}

TEST_F(SecretCacheTest, SetRejectedWhenRemoteOff) {
    auto cache = cacheWith(std::chrono::seconds {60}, FeatureToggles {});
    auto result = cache.set("api-key", "x");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArg);
    EXPECT_EQ(store.stores, 0);
}

TEST_F(SecretCacheTest, InvalidateAndClear) {
    store.values["db-password"] = "pw";
    auto cache = cacheWith(std::chrono::seconds {60}, remoteOn);
    cache.get("api-key");
    cache.get("db-password");
    cache.invalidate("api-key");
    cache.get("api-key");
    EXPECT_EQ(store.fetches, 3);
    cache.clear();
    EXPECT_EQ(cache.stats().size, 0U);
    cache.get("db-password");
    EXPECT_EQ(store.fetches, 4);
}

TEST_F(SecretCacheTest, StatsListCachedNames) {
    store.values["b-secret"] = "b";
    auto cache = cacheWith(std::chrono::seconds {90}, remoteOn);
    cache.get("b-secret");
    cache.get("api-key");
    const auto stats = cache.stats();
    EXPECT_EQ(stats.size, 2U);
    EXPECT_EQ(stats.ttl, std::chrono::seconds {90});
    const std::vector<std::string> names {"api-key", "b-secret"};
    EXPECT_EQ(stats.cachedNames, names);
    EXPECT_TRUE(stats.remoteEnabled);
}

TEST_F(SecretCacheTest, NegativeTtlThrows) {
    EXPECT_THROW(cacheWith(std::chrono::seconds {-1}, remoteOn), std::invalid_argument);
}

TEST_F(SecretCacheTest, TtlBeyondClockRangeThrows) {
    EXPECT_THROW(cacheWith(std::chrono::seconds {10'000'000'000}, remoteOn), std::invalid_argument);
    EXPECT_THROW(cacheWith(std::chrono::seconds::max(), remoteOn), std::invalid_argument);
}

TEST_F(SecretCacheTest, LongTtlStillHits) {
    auto cache = cacheWith(std::chrono::days {30}, remoteOn);
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    clock.advance(std::chrono::days {29});
    EXPECT_EQ(cache.get("api-key").value(), "vault-value");
    EXPECT_EQ(store.fetches, 1);
}
