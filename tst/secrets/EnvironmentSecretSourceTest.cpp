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
#include <cstdlib>
#include "common/Error.hpp"
#include "secrets/EnvironmentSecretSource.hpp"

using bastion::EnvironmentSecretSource;
using bastion::ErrorCode;

class EnvironmentSecretSourceTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("BASTION_TEST_SECRET");
        unsetenv("bastion-raw-secret");
    }
    EnvironmentSecretSource source;
};

TEST_F(EnvironmentSecretSourceTest, ReadsUpperSnakeVariable) {
    setenv("BASTION_TEST_SECRET", "s3cr3t", 1);
    auto value = source.get("bastion-test-secret");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "s3cr3t");
}

TEST_F(EnvironmentSecretSourceTest, FallsBackToRawName) {
    setenv("bastion-raw-secret", "raw", 1);
    auto value = source.get("bastion-raw-secret");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "raw");
}

TEST_F(EnvironmentSecretSourceTest, MissingIsNotFound) {
    auto value = source.get("bastion-missing-secret");
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().code, ErrorCode::NotFound);
    EXPECT_EQ(value.error().resource, "bastion-missing-secret");
}
