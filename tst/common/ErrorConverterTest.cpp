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
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <grpcpp/support/status.h>
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"

using bastion::Error;
using bastion::ErrorCode;
using bastion::fromHttpStatus;
using bastion::toError;
using bastion::toExpected;
using bastion::toGrpcStatus;
using bastion::toGrpcStatusCode;

TEST(ErrorConverterTest, ToGrpcStatusCode) {
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::NotFound), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::InvalidArg), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Timeout), grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::RateLimited), grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::CircuitOpen), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::RollbackIncomplete), grpc::StatusCode::INTERNAL);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Unknown), grpc::StatusCode::UNKNOWN);
}

TEST(ErrorConverterTest, StatusCarriesExactErrorDetails) {
    const Error err {ErrorCode::RateLimited, "too many requests", std::chrono::seconds {30}};
    const grpc::Status status = toGrpcStatus(err);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(status.error_message(), "too many requests");

    const Error back = toError(status);
    EXPECT_EQ(back.code, ErrorCode::RateLimited);
    EXPECT_EQ(back.what, "too many requests");
    ASSERT_TRUE(back.retryAfter.has_value());
    EXPECT_EQ(back.retryAfter.value(), std::chrono::seconds {30});
}

TEST(ErrorConverterTest, UnrecognisedDetailCodeBecomesUnknown) {
    const Error err {static_cast<ErrorCode>(77), "from a newer peer", "fabric-api"};
    const Error back = toError(toGrpcStatus(err));
    EXPECT_EQ(back.code, ErrorCode::Unknown);
    EXPECT_EQ(back.what, "from a newer peer");
    EXPECT_EQ(back.resource, "fabric-api");
    EXPECT_EQ(bastion::toString(back.code), bastion::toString(ErrorCode::Unknown));
}

TEST(ErrorConverterTest, DetailsPreserveCodesSharingAStatus) {
    const Error err {ErrorCode::CircuitHalfOpenLimit, "probe limit", "fabric-api"};
    const Error back = toError(toGrpcStatus(err));
    EXPECT_EQ(back.code, ErrorCode::CircuitHalfOpenLimit);
    EXPECT_EQ(back.resource, "fabric-api");
    EXPECT_FALSE(back.retryAfter.has_value());
}

TEST(ErrorConverterTest, PlainStatusFallsBackToCodeMapping) {
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::UNAVAILABLE, "x")).code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "x")).code, ErrorCode::Timeout);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::PERMISSION_DENIED, "x")).code, ErrorCode::Unauthorized);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::ALREADY_EXISTS, "x")).code, ErrorCode::Conflict);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::CANCELLED, "x")).code, ErrorCode::Cancelled);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::UNIMPLEMENTED, "x")).code, ErrorCode::Unknown);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::NOT_FOUND, "gone")).what, "gone");
}

TEST(ErrorConverterTest, ToErrorRejectsOkStatus) {
    EXPECT_THROW(toError(grpc::Status::OK), std::logic_error);
}

TEST(ErrorConverterTest, ToGrpcStatusFromExpected) {
    const std::expected<int, Error> ok = 42;
    const std::expected<int, Error> err = std::unexpected(Error(ErrorCode::InvalidArg, "bad arg"));
    EXPECT_TRUE(toGrpcStatus(ok).ok());
    EXPECT_EQ(toGrpcStatus(err).error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(ErrorConverterTest, ToExpected) {
    auto value = toExpected(grpc::Status::OK, std::string {"ws-1"});
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "ws-1");

    auto failed = toExpected(grpc::Status(grpc::StatusCode::NOT_FOUND, "missing"), 0);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::NotFound);

    EXPECT_TRUE(toExpected(grpc::Status::OK).has_value());
    EXPECT_FALSE(toExpected(grpc::Status(grpc::StatusCode::INTERNAL, "boom")).has_value());
}

TEST(ErrorConverterTest, FromHttpStatus) {
    EXPECT_EQ(fromHttpStatus(400, "x").code, ErrorCode::InvalidArg);
    EXPECT_EQ(fromHttpStatus(422, "x").code, ErrorCode::InvalidArg);
    EXPECT_EQ(fromHttpStatus(401, "x").code, ErrorCode::Unauthorized);
    EXPECT_EQ(fromHttpStatus(403, "x").code, ErrorCode::Unauthorized);
    EXPECT_EQ(fromHttpStatus(404, "x").code, ErrorCode::NotFound);
    EXPECT_EQ(fromHttpStatus(408, "x").code, ErrorCode::Timeout);
    EXPECT_EQ(fromHttpStatus(409, "x").code, ErrorCode::Conflict);
    EXPECT_EQ(fromHttpStatus(500, "x").code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(fromHttpStatus(503, "x").code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(fromHttpStatus(418, "x").code, ErrorCode::Unknown);
    EXPECT_THROW(fromHttpStatus(200, "x"), std::logic_error);
}

TEST(ErrorConverterTest, RateLimitKeepsRetryAfter) {
    const Error limited = fromHttpStatus(429, "slow down", std::chrono::seconds {12});
    EXPECT_EQ(limited.code, ErrorCode::RateLimited);
    ASSERT_TRUE(limited.retryAfter.has_value());
    EXPECT_EQ(limited.retryAfter.value(), std::chrono::seconds {12});
    EXPECT_FALSE(fromHttpStatus(429, "slow down").retryAfter.has_value());
}
