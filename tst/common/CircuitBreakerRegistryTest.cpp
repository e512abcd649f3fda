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
#include <string>
#include <thread>
#include <vector>
#include "common/CircuitBreaker.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Error.hpp"
#include "support/ManualClock.hpp"

using bastion::CircuitBreaker;
using bastion::CircuitBreakerConfig;
using bastion::CircuitBreakerRegistry;
using bastion::Error;
using bastion::ErrorCode;
using bastion::Operation;
using bastion::test::ManualClock;
using State = bastion::CircuitBreaker::State;

class CircuitBreakerRegistryTest : public ::testing::Test {
protected:
    ManualClock clock;
    CircuitBreakerRegistry registry {CircuitBreakerConfig {2, std::chrono::seconds {30}, 1, 1}, clock};
    const Operation<int> failing = []() -> std::expected<int, Error> {
        return std::unexpected {Error {ErrorCode::Timeout}};
    };
};

TEST_F(CircuitBreakerRegistryTest, SameNameIsSameInstance) {
    auto& a = registry.get("fabric-api");
    auto& b = registry.get("fabric-api");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(registry.size(), 1U);
}

TEST_F(CircuitBreakerRegistryTest, FailuresAreSharedByName) {
    registry.get("fabric-api").guard(failing);
    registry.get("fabric-api").guard(failing);
    EXPECT_EQ(registry.get("fabric-api").state(), State::Open);
    EXPECT_EQ(registry.get("graph-api").state(), State::Closed);
}

TEST_F(CircuitBreakerRegistryTest, ConfigAppliesOnlyOnCreation) {
    auto& first = registry.get("purview-api", CircuitBreakerConfig {9, std::chrono::seconds {1}, 1, 1});
    auto& again = registry.get("purview-api", CircuitBreakerConfig {1, std::chrono::seconds {1}, 1, 1});
    EXPECT_EQ(&first, &again);
    EXPECT_EQ(again.config().failureThreshold, 9);
    EXPECT_EQ(registry.get("other").config().failureThreshold, 2);
}

TEST_F(CircuitBreakerRegistryTest, SnapshotIsSortedByName) {
    registry.get("zeta");
    registry.get("alpha");
    registry.get("mid");
    auto snaps = registry.snapshot();
    ASSERT_EQ(snaps.size(), 3U);
    EXPECT_EQ(snaps[0].name, "alpha");
    EXPECT_EQ(snaps[1].name, "mid");
    EXPECT_EQ(snaps[2].name, "zeta");
}

TEST_F(CircuitBreakerRegistryTest, ResetAllClosesEveryBreaker) {
    for (const auto* name : {"a", "b"}) {
        registry.get(name).guard(failing);
        registry.get(name).guard(failing);
        ASSERT_EQ(registry.get(name).state(), State::Open);
    }
    registry.resetAll();
    for (const auto& snap : registry.snapshot()) {
        EXPECT_EQ(snap.state, State::Closed);
    }
}

TEST_F(CircuitBreakerRegistryTest, ListenerSeesTransitionsOfEveryBreaker) {
    std::vector<std::string> opened;
    CircuitBreakerRegistry observed {CircuitBreakerConfig {1, std::chrono::seconds {30}, 1, 1}, clock,
        [&opened](const std::string& name, State, State to) {
            if (to == State::Open) {
                opened.push_back(name);
            }
        }};
    observed.get("one").guard(failing);
    observed.get("two").guard(failing);
    const std::vector<std::string> expected {"one", "two"};
    EXPECT_EQ(opened, expected);
}

TEST_F(CircuitBreakerRegistryTest, ConcurrentLookupsCreateOneInstance) {
    constexpr int threads = 8;
    std::vector<CircuitBreaker*> seen(threads, nullptr);
    {
        std::vector<std::jthread> workers;
        for (int i = 0; i < threads; ++i) {
            workers.emplace_back([this, &seen, i]() {
                seen[static_cast<size_t>(i)] = &registry.get("shared");
            });
        }
    }
    for (auto* b : seen) {
        EXPECT_EQ(b, seen.front());
    }
    EXPECT_EQ(registry.size(), 1U);
}

TEST_F(CircuitBreakerRegistryTest, ListenerMayLookUpBreakersDuringResetAll) {
    CircuitBreakerRegistry* self = nullptr;
    std::vector<std::string> closed;
    CircuitBreakerRegistry observed {CircuitBreakerConfig {1, std::chrono::seconds {30}, 1, 1}, clock,
        [&self, &closed](const std::string& name, State, State to) {
            if (to == State::Closed) {
                closed.push_back(name);
                self->get(name + "-audit");
            }
        }};
    self = &observed;
    observed.get("fabric-api").guard(failing);
    ASSERT_EQ(observed.get("fabric-api").state(), State::Open);

    observed.resetAll();

    const std::vector<std::string> expected {"fabric-api"};
    EXPECT_EQ(closed, expected);
    EXPECT_EQ(observed.get("fabric-api").state(), State::Closed);
    EXPECT_EQ(observed.size(), 2U);
}
