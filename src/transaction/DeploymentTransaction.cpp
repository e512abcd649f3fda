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
#include "transaction/DeploymentTransaction.hpp"
#include "transaction/TransactionRegistry.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion {

std::string_view toString(TransactionStatus s) {
    switch (s) {
        case TransactionStatus::Active: return "active";
        case TransactionStatus::Committed: return "committed";
        case TransactionStatus::RolledBack: return "rolled_back";
        case TransactionStatus::Failed: return "failed";
    }
    std::unreachable();
}

bool RollbackReport::complete() const {
    return failed.empty();
}

std::optional<Error> RollbackReport::toError() const {
    if (complete()) {
        return std::nullopt;
    }
    std::string ids;
    for (const auto& f : failed) {
        if (!ids.empty()) {
            ids += ",";
        }
        ids += f.resource.id;
    }
    return Error {
        ErrorCode::RollbackIncomplete,
        std::to_string(failed.size()) + " of " + std::to_string(failed.size() + cleaned.size()) + " cleanups failed",
        ids
    };
}

DeploymentTransaction::DeploymentTransaction(
    std::string n,
    const FeatureToggles& toggles,
    const TransactionOptions o,
    Clock& c,
    TransactionRegistry* r)
    : transactionName {std::move(n)},
      transactionId {uuid_v7_to_string(generate_uuid_v7())},
      rollbackOn {o.enableRollback && toggles.enabled(Feature::UseRollback)},
      dryRun {o.dryRun},
      clock {c},
      registry {r},
      startedAt {c.now()} {
    spdlog::info("Transaction '{}' ({}) started (rollback={}{})",
                 transactionName, transactionId, rollbackOn ? "enabled" : "disabled", dryRun ? ", dry run" : "");
    if (registry != nullptr) {
        registry->enlist(stats());
    }
}

DeploymentTransaction::~DeploymentTransaction() {
    if (registry != nullptr && current == TransactionStatus::Active) {
        registry->delist(transactionId);
    }
}

bool DeploymentTransaction::track(std::string label, std::string resourceId, CleanupAction cleanup, ResourceInfo info) {
    if (current != TransactionStatus::Active) {
        spdlog::warn("Transaction '{}' already {}: not tracking '{}' ({})",
                     transactionName, toString(current), label, resourceId);
        return false;
    }
    if (!cleanup) {
        spdlog::error("Transaction '{}': '{}' ({}) has no cleanup action, not tracked",
                      transactionName, label, resourceId);
        return false;
    }
    spdlog::info("Transaction '{}': tracking {} '{}' (ID: {})",
                 transactionName, info.kind.empty() ? "resource" : info.kind, label, resourceId);
    tracked.push_back(TrackedResource {std::move(label), std::move(resourceId), std::move(info), std::move(cleanup), clock.now()});
    if (registry != nullptr) {
        registry->enlist(stats());
    }
    return true;
}

void DeploymentTransaction::commit() {
    if (current == TransactionStatus::Committed) {
        return;
    }
    if (current != TransactionStatus::Active) {
        spdlog::warn("Transaction '{}' already {}: cannot commit", transactionName, toString(current));
        return;
    }
    finish(TransactionStatus::Committed);
    spdlog::info("Transaction '{}' committed ({} resources, {}ms)", transactionName, tracked.size(),
                 std::chrono::duration_cast<std::chrono::milliseconds>(*completedAt - startedAt).count());
}

RollbackReport DeploymentTransaction::rollback(std::string_view reason) {
    RollbackReport report;
    if (current != TransactionStatus::Active) {
        if (current == TransactionStatus::Committed) {
            spdlog::error("Transaction '{}' rollback requested after commit, ignoring", transactionName);
        } else {
            spdlog::warn("Transaction '{}' already {}: cannot roll back", transactionName, toString(current));
        }
        return report;
    }

    if (!rollbackOn) {
        spdlog::warn("Transaction '{}' rollback disabled: {} resources will NOT be cleaned up",
                     transactionName, tracked.size());
        for (auto it = tracked.rbegin(); it != tracked.rend(); ++it) {
            report.skipped.push_back(ResourceRef {it->label, it->id});
        }
        finish(TransactionStatus::Failed);
        return report;
    }

    spdlog::warn("Transaction '{}' rolling back {} resources", transactionName, tracked.size());
    if (!reason.empty()) {
        spdlog::warn("Rollback reason: {}", reason);
    }

    // Later resources usually depend on earlier ones.
    for (auto it = tracked.rbegin(); it != tracked.rend(); ++it) {
        ResourceRef ref {it->label, it->id};
        if (dryRun) {
            spdlog::info("[dry run] would clean up '{}' ({})", it->label, it->id);
            report.skipped.push_back(std::move(ref));
            continue;
        }
        auto error = runCleanup(*it);
        if (error.has_value()) {
            spdlog::error("Failed to clean up '{}' ({}): {}", it->label, it->id, error->what);
            rollbackErrors.push_back("Failed to clean up '" + it->label + "': " + error->what);
            report.failed.push_back(CleanupFailure {std::move(ref), std::move(error.value())});
        } else {
            spdlog::info("Cleaned up '{}' ({})", it->label, it->id);
            report.cleaned.push_back(std::move(ref));
        }
    }
    finish(TransactionStatus::RolledBack);

    if (report.complete()) {
        spdlog::info("Transaction '{}' rolled back ({} cleaned, {} skipped)",
                     transactionName, report.cleaned.size(), report.skipped.size());
    } else {
        spdlog::error("Transaction '{}' rollback completed with {} errors (cleaned up {}/{}), manual cleanup required",
                      transactionName, report.failed.size(), report.cleaned.size(), tracked.size());
    }
    return report;
}

std::optional<Error> DeploymentTransaction::runCleanup(const TrackedResource& resource) const {
    try {
        auto result = resource.cleanup();
        if (!result.has_value()) {
            return result.error();
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        return Error {ErrorCode::Internal, e.what(), resource.id};
    } catch (...) {
        return Error {ErrorCode::Internal, "unknown exception", resource.id};
    }
}

void DeploymentTransaction::finish(TransactionStatus s) {
    current = s;
    completedAt = clock.now();
    if (registry != nullptr) {
        registry->delist(transactionId);
    }
}

TransactionStats DeploymentTransaction::stats() const {
    auto end = completedAt.value_or(clock.now());
    return TransactionStats {
        transactionName,
        transactionId,
        current,
        rollbackOn,
        dryRun,
        tracked.size(),
        std::chrono::duration_cast<std::chrono::microseconds>(end - startedAt),
        rollbackErrors,
        startedAt
    };
}

const std::string& DeploymentTransaction::name() const {
    return transactionName;
}

const std::string& DeploymentTransaction::id() const {
    return transactionId;
}

TransactionStatus DeploymentTransaction::status() const {
    return current;
}

bool DeploymentTransaction::rollbackEnabled() const {
    return rollbackOn;
}

const std::vector<TrackedResource>& DeploymentTransaction::resources() const {
    return tracked;
}

TransactionScope::TransactionScope(DeploymentTransaction& t, ReportHandler onRollback)
    : txn {t},
      handler {std::move(onRollback)} {}

TransactionScope::~TransactionScope() {
    if (txn.status() != TransactionStatus::Active) {
        return;
    }
    auto report = txn.rollback("scope exited without commit");
    if (!handler) {
        return;
    }
    try {
        handler(report);
    } catch (const std::exception& e) {
        spdlog::error("Transaction '{}': rollback report handler threw: {}", txn.name(), e.what());
    } catch (...) {
        spdlog::error("Transaction '{}': rollback report handler threw an unknown exception", txn.name());
    }
}

DeploymentTransaction& TransactionScope::transaction() {
    return txn;
}

void TransactionScope::commit() {
    txn.commit();
}

RollbackReport TransactionScope::rollback(std::string_view reason) {
    return txn.rollback(reason);
}

} // namespace bastion
