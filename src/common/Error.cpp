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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <chrono>

namespace bastion {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::ConnectionFailed: return "ConnectionFailed";
        case ErrorCode::RateLimited: return "RateLimited";
        case ErrorCode::ServiceUnavailable: return "ServiceUnavailable";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::CircuitOpen: return "CircuitOpen";
        case ErrorCode::CircuitHalfOpenLimit: return "CircuitHalfOpenLimit";
        case ErrorCode::RollbackIncomplete: return "RollbackIncomplete";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, resource {}, retryAfter {} {}
Error::Error(const ErrorCode& c, std::string w, std::string r) : code {c}, what {std::move(w)}, resource {std::move(r)}, retryAfter {} {}
Error::Error(const ErrorCode& c, std::string w, std::chrono::microseconds after) : code {c}, what {std::move(w)}, resource {}, retryAfter {after} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, resource {}, retryAfter {} {}

bool Error::rejected() const {
    return code == ErrorCode::CircuitOpen
        || code == ErrorCode::CircuitHalfOpenLimit
        || code == ErrorCode::Cancelled;
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    os << toString(error.code) << ": " << error.what;
    if (!error.resource.empty()) {
        os << " (" << error.resource << ")";
    }
    return os;
}

} // namespace bastion
