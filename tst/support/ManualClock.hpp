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
#ifndef BASTION_TST_SUPPORT_MANUAL_CLOCK_HPP
#define BASTION_TST_SUPPORT_MANUAL_CLOCK_HPP

#include "common/Clock.hpp"
#include <chrono>
#include <mutex>
#include <stop_token>
#include <vector>

namespace bastion::test {

// Virtual time. sleepFor returns immediately, advancing now() by the requested
// duration and recording it.
class ManualClock : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        std::lock_guard lock {m};
        return current;
    }

    bool sleepFor(std::chrono::microseconds d, std::stop_token token) override {
        std::lock_guard lock {m};
        if (token.stop_requested()) {
            return false;
        }
        slept.push_back(d);
        current += d;
        return true;
    }

    void advance(std::chrono::microseconds d) {
        std::lock_guard lock {m};
        current += d;
    }

    [[nodiscard]] std::vector<std::chrono::microseconds> sleeps() const {
        std::lock_guard lock {m};
        return slept;
    }

private:
    mutable std::mutex m;
    time_point current {std::chrono::hours {1}};
    std::vector<std::chrono::microseconds> slept;
};

} // namespace bastion::test

#endif // BASTION_TST_SUPPORT_MANUAL_CLOCK_HPP
