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
#ifndef BASTION_COMMON_CLOCK_HPP
#define BASTION_COMMON_CLOCK_HPP

#include <chrono>
#include <stop_token>

namespace bastion {

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    virtual ~Clock() = default;
    [[nodiscard]] virtual time_point now() const = 0;
    // Blocks for d. Returns false if a stop was requested on token before d elapsed.
    virtual bool sleepFor(std::chrono::microseconds d, std::stop_token token) = 0;
};

class SteadyClock : public Clock {
public:
    [[nodiscard]] time_point now() const override;
    bool sleepFor(std::chrono::microseconds d, std::stop_token token) override;
};

Clock& steadyClock();

} // namespace bastion

#endif // BASTION_COMMON_CLOCK_HPP
