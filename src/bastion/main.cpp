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
#include <spdlog/spdlog.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <grpcpp/support/status.h>
#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "common/CircuitBreaker.hpp"
#include "common/CircuitBreakerRegistry.hpp"
#include "common/Clock.hpp"
#include "common/EngineConfig.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include "common/FeatureToggles.hpp"
#include "common/ResilientExecutor.hpp"
#include "transaction/DeploymentTransaction.hpp"
#include "transaction/TransactionRegistry.hpp"

using bastion::CircuitBreakerRegistry;
using bastion::DeploymentTransaction;
using bastion::EngineConfig;
using bastion::Error;
using bastion::ErrorCode;
using bastion::ResilientExecutor;
using bastion::ResourceInfo;
using bastion::RollbackReport;
using bastion::TransactionRegistry;
using bastion::TransactionScope;

namespace {

// Stand-in for the provisioning API: every create call answers UNAVAILABLE a
// fixed number of times before it goes through, forbidden kinds are refused.
class FlakyEndpoint {
public:
    FlakyEndpoint(int f, std::string forbidden) : flakes {f}, forbiddenKind {std::move(forbidden)} {}

    grpc::Status create(const std::string& kind, const std::string& name, std::string& id) {
        if (kind == forbiddenKind) {
            return bastion::toGrpcStatus(Error {ErrorCode::Unauthorized, "caller may not create " + kind, name});
        }
        if (++calls % (flakes + 1) != 0) {
            return bastion::toGrpcStatus(Error {ErrorCode::ServiceUnavailable, "provisioning API overloaded", name});
        }
        id = kind + "-" + std::to_string(++created);
        return grpc::Status::OK;
    }

    grpc::Status remove(const std::string& id) {
        spdlog::info("endpoint: deleted {}", id);
        return grpc::Status::OK;
    }

private:
    int flakes;
    std::string forbiddenKind;
    int calls {0};
    int created {0};
};

bool isTransient(const Error& e) {
    switch (e.code) {
        case ErrorCode::Timeout:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::RateLimited:
        case ErrorCode::ServiceUnavailable:
            return true;
        default:
            return false;
    }
}

void setupLogging() {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/bastion.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "gAsync", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::block);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
}

} // namespace

int main(int /*argc*/, char** /*argv*/) {
    setupLogging();
    spdlog::info("Bastion! Starting...");

    auto config = EngineConfig::fromEnvironment();
    if (!config.has_value()) {
        spdlog::error("Invalid configuration: {}", config.error().what);
        spdlog::shutdown();
        return 2;
    }
    config->toggles.logStatus();
    if (!config->toggles.productionReady()) {
        spdlog::warn("Not all production features are enabled");
    }

    CircuitBreakerRegistry breakers {config->breaker};
    ResilientExecutor executor {breakers, config->retry, config->toggles};
    FlakyEndpoint endpoint {1, "role-binding"};

    TransactionRegistry inFlight;
    DeploymentTransaction txn {"Deploy analytics workspace", config->toggles, {}, bastion::steadyClock(), &inFlight};
    RollbackReport report;
    {
        TransactionScope scope {txn, [&report](const RollbackReport& r) { report = r; }};
        const std::vector<std::pair<std::string, std::string>> plan {
            {"workspace", "analytics"},
            {"lakehouse", "analytics-data"},
            {"role-binding", "analytics-admins"}
        };
        std::string parent;
        for (const auto& step : plan) {
            const std::string& kind = step.first;
            const std::string& name = step.second;
            const bastion::Operation<std::string> create = [&endpoint, &kind, &name]() -> std::expected<std::string, Error> {
                std::string id;
                return bastion::toExpected(endpoint.create(kind, name, id), id);
            };
            auto outcome = executor.execute("provisioning-api", create, isTransient);
            if (!outcome.ok()) {
                for (const auto& t : inFlight.active()) {
                    spdlog::warn("in flight: {} ({}) with {} resources for {}ms", t.name, t.id, t.resources,
                                 std::chrono::duration_cast<std::chrono::milliseconds>(t.duration).count());
                }
                spdlog::error("Provisioning {} '{}' failed after {} attempt(s): {}",
                              kind, name, outcome.attemptCount(), outcome.result.error().what);
                break;
            }
            const std::string id = outcome.result.value();
            ResourceInfo info {kind, parent.empty() ? std::nullopt : std::optional<std::string> {parent}};
            txn.track(name, id, [&endpoint, id]() { return bastion::toExpected(endpoint.remove(id)); }, info);
            if (kind == "workspace") {
                parent = id;
            }
        }
        if (txn.resources().size() == plan.size()) {
            scope.commit();
        }
    }

    if (config->toggles.enabled(bastion::Feature::UseTelemetry)) {
        for (const auto& s : breakers.snapshot()) {
            spdlog::info("breaker {}: {} (rejected {})", s.name, bastion::toString(s.state), s.rejected);
        }
    }
    const auto stats = txn.stats();
    spdlog::info("Transaction {} {}: {} resources, {} cleaned, {} failed, {} skipped",
                 stats.id, bastion::toString(stats.status), stats.resources,
                 report.cleaned.size(), report.failed.size(), report.skipped.size());
    const int rc = stats.status == bastion::TransactionStatus::Committed ? 0 : 1;
    spdlog::shutdown();
    return rc;
}
