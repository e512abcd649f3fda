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
#include "common/Clock.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace bastion {

Clock::time_point SteadyClock::now() const {
    return std::chrono::steady_clock::now();
}

bool SteadyClock::sleepFor(std::chrono::microseconds d, std::stop_token token) {
    if (token.stop_requested()) {
        return false;
    }
    if (d <= std::chrono::microseconds::zero()) {
        return true;
    }
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock {mtx};
    // The predicate is never satisfied; only the deadline or a stop request wakes us.
    cv.wait_for(lock, token, d, [] { return false; });
    return !token.stop_requested();
}

Clock& steadyClock() {
    static SteadyClock clock;
    return clock;
}

} // namespace bastion
