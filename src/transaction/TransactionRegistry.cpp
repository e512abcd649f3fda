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
#include "transaction/TransactionRegistry.hpp"
#include "transaction/DeploymentTransaction.hpp"
#include "common/Clock.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace bastion {

TransactionRegistry::TransactionRegistry(Clock& c)
    : clock {c} {}

void TransactionRegistry::enlist(const TransactionStats& stats) {
    transactions.insertOrAssign(stats.id, stats);
}

void TransactionRegistry::delist(const std::string& id) {
    if (transactions.erase(id)) {
        spdlog::debug("Transaction {} unregistered", id);
    }
}

std::vector<TransactionStats> TransactionRegistry::active() const {
    const auto now = clock.now();
    std::vector<TransactionStats> out;
    transactions.forEach([&out, now](const std::string&, const TransactionStats& stats) {
        out.push_back(stats);
        out.back().duration = std::chrono::duration_cast<std::chrono::microseconds>(now - stats.startedAt);
    });
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.startedAt != b.startedAt ? a.startedAt < b.startedAt : a.id < b.id;
    });
    return out;
}

size_t TransactionRegistry::size() const {
    return transactions.size();
}

} // namespace bastion
