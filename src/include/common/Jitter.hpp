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
#ifndef BASTION_COMMON_JITTER_HPP
#define BASTION_COMMON_JITTER_HPP

#include <chrono>

namespace bastion {

// Spreads a delay uniformly over [v * (1 - fraction), v * (1 + fraction)].
class Jitter {
public:
    explicit Jitter(double fraction);
    std::chrono::microseconds jitter(const std::chrono::microseconds v) const;
    [[nodiscard]] double fraction() const;
private:
    double spread;
};

} // namespace bastion

#endif // BASTION_COMMON_JITTER_HPP
