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
#ifndef BASTION_COMMON_CIRCUIT_BREAKER_HPP
#define BASTION_COMMON_CIRCUIT_BREAKER_HPP

#include "common/Clock.hpp"
#include "common/Error.hpp"
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace bastion {

struct CircuitBreakerConfig {
    CircuitBreakerConfig(
        int failures,
        std::chrono::microseconds cooldown,
        int successes,
        int probes
    );
    // 5 failures, 60s cooldown, 2 successes, 3 concurrent probes.
    static CircuitBreakerConfig defaults();

    int failureThreshold;
    std::chrono::microseconds cooldownDuration;
    int successThreshold;
    int halfOpenMaxConcurrent;
};

// Closed -> Open after failureThreshold consecutive failures.
// Open -> HalfOpen once cooldownDuration has elapsed since opening.
// HalfOpen -> Closed after successThreshold consecutive successes,
// HalfOpen -> Open on any failure (cooldown restarts).
// All state is guarded by one mutex; the wrapped operation runs outside it.
class CircuitBreaker {
public:
    enum class State : char {
        Closed,
        Open,
        HalfOpen
    };
    using StateListener = std::function<void(const std::string& name, State from, State to)>;
    // Returns false for errors that say nothing about the dependency's health (e.g. NotFound).
    using FailurePredicate = std::function<bool(const Error&)>;

    struct Snapshot {
        std::string name;
        State state;
        int consecutiveFailures;
        int consecutiveSuccesses;
        int probesInFlight;
        uint64_t rejected;
        std::optional<std::chrono::microseconds> sinceLastFailure;
        std::optional<std::chrono::microseconds> untilHalfOpen;
    };

    // Admission ticket for one call. Must be settled exactly once; a permit destroyed
    // unsettled (the operation threw) counts as a failure.
    class Permit {
    public:
        Permit(Permit&& other) noexcept;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;
        ~Permit();
        void success();
        void failure();
        // Settle without affecting the counters (the call was cancelled by the caller).
        void release();
        [[nodiscard]] bool probe() const;
    private:
        friend class CircuitBreaker;
        Permit(CircuitBreaker* b, uint64_t e, bool p);
        CircuitBreaker* breaker;
        uint64_t epoch;
        bool isProbe;
        bool settled{false};
    };

    CircuitBreaker(std::string n, const CircuitBreakerConfig c, Clock& clk = steadyClock(), StateListener l = nullptr);
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template<typename T>
    std::expected<T, Error> guard(const Operation<T>& op, const FailurePredicate& countsAsFailure = nullptr) {
        auto permit = acquire();
        if (!permit.has_value()) {
            return std::unexpected {permit.error()};
        }
        auto result = op();
        if (result.has_value()) {
            permit->success();
        } else if (result.error().code == ErrorCode::Cancelled) {
            permit->release();
        } else if (countsAsFailure && !countsAsFailure(result.error())) {
            permit->success();
        } else {
            permit->failure();
        }
        return result;
    }

    // Fails fast with CircuitOpen or CircuitHalfOpenLimit without running anything.
    std::expected<Permit, Error> acquire();

    void reset();

    [[nodiscard]] State state() const;
    [[nodiscard]] Snapshot snapshot() const;
    [[nodiscard]] const std::string& name() const;
    [[nodiscard]] const CircuitBreakerConfig& config() const;

private:
    enum class Outcome : char {
        Success,
        Failure,
        Neutral
    };
    struct Transition {
        State from;
        State to;
    };

    void settle(uint64_t permitEpoch, bool probe, Outcome outcome);
    Transition transitionTo(State next);
    void notify(const std::optional<Transition>& t) const;

    const std::string breakerName;
    const CircuitBreakerConfig cfg;
    Clock& clock;
    const StateListener listener;

    mutable std::mutex m;
    State current {State::Closed};
    // Bumped on every transition so late results from an earlier state are ignored.
    uint64_t epoch {0};
    int consecutiveFailures {0};
    int consecutiveSuccesses {0};
    int probesInFlight {0};
    uint64_t rejected {0};
    std::optional<Clock::time_point> openedAt;
    std::optional<Clock::time_point> lastFailure;
};

[[nodiscard]] std::string_view toString(CircuitBreaker::State s);

} // namespace bastion

#endif // BASTION_COMMON_CIRCUIT_BREAKER_HPP
