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
#ifndef BASTION_COMMON_ERROR_HPP
#define BASTION_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <chrono>
#include <optional>
#include <expected>
#include <functional>
#include <variant>

namespace bastion {

// Values are mirrored by proto::ErrorCode in proto/error.proto.
enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    NotFound = 2,
    Unauthorized = 3,
    Conflict = 4,
    Timeout = 5,
    ConnectionFailed = 6,
    RateLimited = 7,
    ServiceUnavailable = 8,
    Internal = 9,
    Cancelled = 10,
    CircuitOpen = 11,
    CircuitHalfOpenLimit = 12,
    RollbackIncomplete = 13,
    Unknown = 128
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string resource;
    // Server supplied "retry after" hint, overrides the computed backoff for one attempt.
    std::optional<std::chrono::microseconds> retryAfter;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string r);
    Error(const ErrorCode& c, std::string w, std::chrono::microseconds after);
    explicit Error(const ErrorCode& c);

    // Circuit rejections and cancellations: the operation was never attempted.
    [[nodiscard]] bool rejected() const;
};

std::ostream& operator<<(std::ostream& os, const Error& error);

template<typename T>
using Operation = std::function<std::expected<T, Error>()>;

using RetryClassifier = std::function<bool(const Error&)>;

using Unit = std::monostate;

} // namespace bastion

#endif // BASTION_COMMON_ERROR_HPP
