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
#include "common/Jitter.hpp"
#include <chrono>
#include <stdexcept>
#include <random>
#include "common/Util.hpp"

namespace bastion {

Jitter::Jitter(double fraction) : spread {fraction} {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw std::invalid_argument("Jitter fraction must be within [0, 1]");
    }
}

std::chrono::microseconds Jitter::jitter(const std::chrono::microseconds v) const {
    if (v < std::chrono::microseconds(0)) {
        throw std::invalid_argument("Negative duration is not supported");
    }
    if (spread == 0.0 || v == std::chrono::microseconds::zero()) {
        return v;
    }
    thread_local auto rng = random_generator<>();
    std::uniform_real_distribution<double> dist(-spread, spread);
    const auto scaled = static_cast<double>(v.count()) * (1.0 + dist(rng));
    return std::chrono::microseconds(static_cast<std::chrono::microseconds::rep>(scaled));
}

double Jitter::fraction() const {
    return spread;
}

} // namespace bastion
