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
#include "secrets/EnvironmentSecretSource.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <expected>
#include <string>

namespace bastion {

std::expected<std::string, Error> EnvironmentSecretSource::get(const std::string& name) {
    for (const auto& var : {to_upper_snake(name), name}) {
        if (const char* value = std::getenv(var.c_str()); value != nullptr) {
            spdlog::debug("Retrieved secret '{}' from environment variable {}", name, var);
            return std::string {value};
        }
    }
    return std::unexpected {Error {ErrorCode::NotFound, "secret '" + name + "' not set in environment", name}};
}

} // namespace bastion
