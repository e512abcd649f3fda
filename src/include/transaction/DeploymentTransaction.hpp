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
#ifndef BASTION_TRANSACTION_DEPLOYMENT_TRANSACTION_HPP
#define BASTION_TRANSACTION_DEPLOYMENT_TRANSACTION_HPP

#include "common/Clock.hpp"
#include "common/Error.hpp"
#include "common/FeatureToggles.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bastion {

class TransactionRegistry;

// Deletes one provisioned resource. Should tolerate the resource being gone already.
using CleanupAction = std::function<std::expected<Unit, Error>()>;

struct ResourceInfo {
    // Free-form, e.g. "workspace", "lakehouse", "role-binding".
    std::string kind;
    std::optional<std::string> parentId;
};

struct TrackedResource {
    std::string label;
    std::string id;
    ResourceInfo info;
    CleanupAction cleanup;
    Clock::time_point createdAt;
};

enum class TransactionStatus : char {
    Active,
    Committed,
    RolledBack,
    // Rollback was requested but is disabled, nothing was cleaned up.
    Failed
};

[[nodiscard]] std::string_view toString(TransactionStatus s);

struct TransactionOptions {
    // Effective only when Feature::UseRollback is on as well.
    bool enableRollback {true};
    // Log the cleanups rollback would run without running them.
    bool dryRun {false};
};

struct ResourceRef {
    std::string label;
    std::string id;
};

struct CleanupFailure {
    ResourceRef resource;
    Error error;
};

// Outcome of one rollback. cleaned and failed are in cleanup (reverse tracking) order.
struct RollbackReport {
    std::vector<ResourceRef> cleaned;
    std::vector<CleanupFailure> failed;
    std::vector<ResourceRef> skipped;

    [[nodiscard]] bool complete() const;
    // RollbackIncomplete naming the failed resources, or nothing when complete.
    [[nodiscard]] std::optional<Error> toError() const;
};

struct TransactionStats {
    std::string name;
    std::string id;
    TransactionStatus status;
    bool rollbackEnabled;
    bool dryRun;
    std::size_t resources;
    std::chrono::microseconds duration;
    std::vector<std::string> rollbackErrors;
    Clock::time_point startedAt;
};

// Ordered record of the resources a multi-step deployment created. Owned by a
// single deployment and not thread-safe. Reaches exactly one terminal state.
// With a registry, the transaction is listed there until it commits, rolls
// back or is destroyed; the registry must outlive it.
class DeploymentTransaction {
public:
    DeploymentTransaction(
        std::string n,
        const FeatureToggles& toggles,
        const TransactionOptions o = {},
        Clock& c = steadyClock(),
        TransactionRegistry* r = nullptr
    );
    DeploymentTransaction(const DeploymentTransaction&) = delete;
    DeploymentTransaction& operator=(const DeploymentTransaction&) = delete;
    ~DeploymentTransaction();

    // Call only once the resource is confirmed created. Returns false, and tracks
    // nothing, for an empty cleanup or a transaction that already finished.
    bool track(std::string label, std::string resourceId, CleanupAction cleanup, ResourceInfo info = {});

    // Idempotent. Disables rollback.
    void commit();

    // Runs every cleanup in reverse tracking order; a failing cleanup does not stop
    // the rest. A no-op with a warning once the transaction is not Active.
    RollbackReport rollback(std::string_view reason = {});

    [[nodiscard]] TransactionStats stats() const;
    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] const std::string& id() const;
    [[nodiscard]] TransactionStatus status() const;
    [[nodiscard]] bool rollbackEnabled() const;
    [[nodiscard]] const std::vector<TrackedResource>& resources() const;

private:
    std::optional<Error> runCleanup(const TrackedResource& resource) const;
    void finish(TransactionStatus s);

    const std::string transactionName;
    const std::string transactionId;
    const bool rollbackOn;
    const bool dryRun;
    Clock& clock;
    TransactionRegistry* registry;
    TransactionStatus current {TransactionStatus::Active};
    std::vector<TrackedResource> tracked;
    std::vector<std::string> rollbackErrors;
    const Clock::time_point startedAt;
    std::optional<Clock::time_point> completedAt;
};

// Guarantees rollback on every exit path that does not commit. Destroying the
// scope while the transaction is still Active rolls it back exactly once and
// hands the report to onRollback.
class TransactionScope {
public:
    using ReportHandler = std::function<void(const RollbackReport&)>;

    explicit TransactionScope(DeploymentTransaction& t, ReportHandler onRollback = nullptr);
    TransactionScope(const TransactionScope&) = delete;
    TransactionScope& operator=(const TransactionScope&) = delete;
    ~TransactionScope();

    DeploymentTransaction& transaction();
    void commit();
    RollbackReport rollback(std::string_view reason);

private:
    DeploymentTransaction& txn;
    ReportHandler handler;
};

} // namespace bastion

#endif // BASTION_TRANSACTION_DEPLOYMENT_TRANSACTION_HPP
