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
#ifndef BASTION_TRANSACTION_TRANSACTION_REGISTRY_HPP
#define BASTION_TRANSACTION_TRANSACTION_REGISTRY_HPP

#include "common/Clock.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "transaction/DeploymentTransaction.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace bastion {

// In-flight deployments, for monitoring. Holds a snapshot of each transaction's
// stats, refreshed by the transaction itself, so it can be read from any thread
// while the owner keeps working. Pass it explicitly; tests build their own.
class TransactionRegistry {
public:
    explicit TransactionRegistry(Clock& c = steadyClock());
    TransactionRegistry(const TransactionRegistry&) = delete;
    TransactionRegistry& operator=(const TransactionRegistry&) = delete;

    // Inserts or refreshes the entry keyed by stats.id.
    void enlist(const TransactionStats& stats);
    void delist(const std::string& id);

    // Active transactions ordered by start time, durations measured up to now.
    [[nodiscard]] std::vector<TransactionStats> active() const;
    [[nodiscard]] size_t size() const;

private:
    Clock& clock;
    LockedUnorderedMap<std::string, TransactionStats> transactions;
};

} // namespace bastion

#endif // BASTION_TRANSACTION_TRANSACTION_REGISTRY_HPP
