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
#include "common/ErrorConverter.hpp"
#include "proto/error.pb.h"
#include <google/protobuf/any.pb.h>
#include <grpcpp/support/status.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <chrono>
#include "common/Error.hpp"

namespace bastion {

grpc::StatusCode toGrpcStatusCode(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::OK:
            return grpc::StatusCode::OK;

        case ErrorCode::InvalidArg:
            return grpc::StatusCode::INVALID_ARGUMENT;

        case ErrorCode::NotFound:
            return grpc::StatusCode::NOT_FOUND;

        case ErrorCode::Unauthorized:
            return grpc::StatusCode::PERMISSION_DENIED;

        case ErrorCode::Conflict:
            return grpc::StatusCode::ALREADY_EXISTS;

        case ErrorCode::Timeout:
            return grpc::StatusCode::DEADLINE_EXCEEDED;

        case ErrorCode::RateLimited:
            return grpc::StatusCode::RESOURCE_EXHAUSTED;

        case ErrorCode::ConnectionFailed:
        case ErrorCode::ServiceUnavailable:
        case ErrorCode::CircuitOpen:
        case ErrorCode::CircuitHalfOpenLimit:
            return grpc::StatusCode::UNAVAILABLE;

        case ErrorCode::Cancelled:
            return grpc::StatusCode::CANCELLED;

        case ErrorCode::Internal:
        case ErrorCode::RollbackIncomplete:
            return grpc::StatusCode::INTERNAL;

        default:
            return grpc::StatusCode::UNKNOWN;
    }
}

std::expected<std::monostate, Error> toExpected(const grpc::Status& status) {
    if (status.ok()) {
        return {};
    }
    return std::unexpected {toError(status)};
}

grpc::Status toGrpcStatus(const Error& error) {
    proto::ErrorDetails details;
    details.set_code(static_cast<proto::ErrorCode>(error.code));
    details.set_what(error.what);
    details.set_resource(error.resource);
    if (error.retryAfter.has_value()) {
        details.set_retry_after_us(error.retryAfter->count());
    }
    google::protobuf::Any anyDetail;
    anyDetail.PackFrom(details);
    return grpc::Status(toGrpcStatusCode(error.code), error.what, anyDetail.SerializeAsString());
}

Error toError(const grpc::Status& status) {
    if (status.error_code() == grpc::StatusCode::OK) {
        throw std::logic_error("Cannot convert OK status to error");
    }
    proto::ErrorDetails details;
    google::protobuf::Any any;
    if (any.ParseFromString(status.error_details()) && any.UnpackTo(&details)) {
        // Open enum: a newer peer may send codes this build does not know.
        const ErrorCode code = proto::ErrorCode_IsValid(details.code())
            ? static_cast<ErrorCode>(details.code())
            : ErrorCode::Unknown;
        Error e {code, details.what(), details.resource()};
        if (details.has_retry_after_us()) {
            e.retryAfter = std::chrono::microseconds {details.retry_after_us()};
        }
        return e;
    }
    ErrorCode code = ErrorCode::Unknown;
    switch (status.error_code()) {
        case grpc::StatusCode::INVALID_ARGUMENT:
        case grpc::StatusCode::OUT_OF_RANGE:
            code = ErrorCode::InvalidArg;
            break;
        case grpc::StatusCode::NOT_FOUND:
            code = ErrorCode::NotFound;
            break;
        case grpc::StatusCode::PERMISSION_DENIED:
        case grpc::StatusCode::UNAUTHENTICATED:
            code = ErrorCode::Unauthorized;
            break;
        case grpc::StatusCode::ALREADY_EXISTS:
        case grpc::StatusCode::ABORTED:
            code = ErrorCode::Conflict;
            break;
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            code = ErrorCode::Timeout;
            break;
        case grpc::StatusCode::RESOURCE_EXHAUSTED:
            code = ErrorCode::RateLimited;
            break;
        case grpc::StatusCode::UNAVAILABLE:
            code = ErrorCode::ServiceUnavailable;
            break;
        case grpc::StatusCode::CANCELLED:
            code = ErrorCode::Cancelled;
            break;
        case grpc::StatusCode::INTERNAL:
        case grpc::StatusCode::DATA_LOSS:
            code = ErrorCode::Internal;
            break;
        default:
            code = ErrorCode::Unknown;
    }
    return Error(code, status.error_message());
}

Error fromHttpStatus(int status, std::string what, std::optional<std::chrono::seconds> retryAfter) {
    if (status >= 200 && status < 300) {
        throw std::logic_error("Cannot convert successful HTTP status to error");
    }
    switch (status) {
        case 400:
        case 422:
            return Error {ErrorCode::InvalidArg, std::move(what)};
        case 401:
        case 403:
            return Error {ErrorCode::Unauthorized, std::move(what)};
        case 404:
            return Error {ErrorCode::NotFound, std::move(what)};
        case 408:
            return Error {ErrorCode::Timeout, std::move(what)};
        case 409:
            return Error {ErrorCode::Conflict, std::move(what)};
        case 429:
            if (retryAfter.has_value()) {
                return Error {ErrorCode::RateLimited, std::move(what), std::chrono::microseconds {*retryAfter}};
            }
            return Error {ErrorCode::RateLimited, std::move(what)};
        default:
            break;
    }
    if (status >= 500 && status < 600) {
        return Error {ErrorCode::ServiceUnavailable, std::move(what)};
    }
    return Error {ErrorCode::Unknown, std::move(what)};
}

} // namespace bastion
