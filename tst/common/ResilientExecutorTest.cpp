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
#include <expected>
#include <stop_token>
#include "common/CircuitBreaker.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/ResilientExecutor.hpp"
#include "common/RetryPolicy.hpp"
#include "support/ManualClock.hpp"

using bastion::CircuitBreakerConfig;
using bastion::CircuitBreakerRegistry;
using bastion::Error;
using bastion::ErrorCode;
using bastion::Feature;
using bastion::FeatureToggles;
using bastion::Operation;
using bastion::ResilientExecutor;
using bastion::RetryClassifier;
using bastion::RetryPolicy;
using bastion::test::ManualClock;
using State = bastion::CircuitBreaker::State;

namespace {

const RetryClassifier transient = [](const Error& e) {
    return e.code == ErrorCode::ServiceUnavailable || e.code == ErrorCode::Timeout;
};

FeatureToggles allOn() {
    FeatureToggles t;
    t.set(Feature::UseRetry, true).set(Feature::UseCircuitBreaker, true);
    return t;
}

} // namespace

class ResilientExecutorTest : public ::testing::Test {
protected:
    ManualClock clock;
    CircuitBreakerRegistry registry {CircuitBreakerConfig {3, std::chrono::seconds {60}, 1, 1}, clock};
    const RetryPolicy policy {5, std::chrono::milliseconds {10}, std::chrono::seconds {1}, 2.0, 0.0};
    int calls {0};

    Operation<int> flaky(int failures) {
        return [this, failures]() -> std::expected<int, Error> {
            if (++calls <= failures) {
                return std::unexpected {Error {ErrorCode::ServiceUnavailable, "busy"}};
            }
            return calls;
        };
    }
};

TEST_F(ResilientExecutorTest, RetriesThroughBreakerUntilSuccess) {
    ResilientExecutor executor {registry, policy, allOn(), clock};
    auto out = executor.execute("fabric-api", flaky(2), transient);
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(out.attemptCount(), 3U);
    EXPECT_EQ(registry.get("fabric-api").state(), State::Closed);
}

TEST_F(ResilientExecutorTest, OpenCircuitStopsRetryingWithoutCallingOperation) {
    ResilientExecutor executor {registry, policy, allOn(), clock};
    auto out = executor.execute("fabric-api", flaky(100), transient);
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(out.attemptCount(), 4U);
    EXPECT_EQ(out.result.error().code, ErrorCode::CircuitOpen);
    EXPECT_EQ(registry.get("fabric-api").state(), State::Open);
}

TEST_F(ResilientExecutorTest, RetryOffMeansSingleAttempt) {
    FeatureToggles toggles;
    toggles.set(Feature::UseCircuitBreaker, true);
    ResilientExecutor executor {registry, policy, toggles, clock};
    auto out = executor.execute("fabric-api", flaky(1), transient);
    ASSERT_FALSE(out.ok());
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(out.result.error().code, ErrorCode::ServiceUnavailable);
    EXPECT_TRUE(clock.sleeps().empty());
}

TEST_F(ResilientExecutorTest, BreakerOffMeansNoGating) {
    FeatureToggles toggles;
    toggles.set(Feature::UseRetry, true);
    ResilientExecutor executor {registry, policy, toggles, clock};
    auto out = executor.execute("fabric-api", flaky(100), transient);
    EXPECT_EQ(calls, policy.maxAttempts);
    EXPECT_EQ(out.result.error().code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(registry.size(), 0U);
}

TEST_F(ResilientExecutorTest, NonRetryableErrorsSurfaceUnchanged) {
    ResilientExecutor executor {registry, policy, allOn(), clock};
    const Operation<int> denied = [this]() -> std::expected<int, Error> {
        ++calls;
        return std::unexpected {Error {ErrorCode::Unauthorized, "token expired", "workspace-1"}};
    };
    auto out = executor.execute("fabric-api", denied, transient);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(out.result.error().code, ErrorCode::Unauthorized);
    EXPECT_EQ(out.result.error().resource, "workspace-1");
}

TEST_F(ResilientExecutorTest, CancellationIsReported) {
    ResilientExecutor executor {registry, policy, allOn(), clock};
    std::stop_source source;
    source.request_stop();
    auto out = executor.execute("fabric-api", flaky(0), transient, source.get_token());
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(out.result.error().code, ErrorCode::Cancelled);
}
