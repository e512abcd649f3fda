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
#include "common/CircuitBreaker.hpp"
#include "common/Clock.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <expected>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace bastion {

CircuitBreakerConfig::CircuitBreakerConfig(
    int failures,
    std::chrono::microseconds cooldown,
    int successes,
    int probes)
    : failureThreshold(failures),
      cooldownDuration(cooldown),
      successThreshold(successes),
      halfOpenMaxConcurrent(probes) {
    if (failures < 1) {
        throw std::invalid_argument("Failure threshold must be >= 1.");
    }
    if (cooldown < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Cooldown duration must be >= zero.");
    }
    if (successes < 1) {
        throw std::invalid_argument("Success threshold must be >= 1.");
    }
    if (probes < 1) {
        throw std::invalid_argument("Half-open concurrency limit must be >= 1.");
    }
}

CircuitBreakerConfig CircuitBreakerConfig::defaults() {
    return CircuitBreakerConfig {5, std::chrono::seconds {60}, 2, 3};
}

CircuitBreaker::Permit::Permit(CircuitBreaker* b, uint64_t e, bool p)
    : breaker {b}, epoch {e}, isProbe {p} {}

CircuitBreaker::Permit::Permit(Permit&& other) noexcept
    : breaker {other.breaker},
      epoch {other.epoch},
      isProbe {other.isProbe},
      settled {other.settled} {
    other.settled = true;
}

CircuitBreaker::Permit::~Permit() {
    if (settled) {
        return;
    }
    try {
        breaker->settle(epoch, isProbe, Outcome::Failure);
    } catch (const std::exception& e) {
        spdlog::error("Circuit breaker '{}' failed to record abandoned call: {}", breaker->name(), e.what());
    }
}

void CircuitBreaker::Permit::success() {
    if (!settled) {
        settled = true;
        breaker->settle(epoch, isProbe, Outcome::Success);
    }
}

void CircuitBreaker::Permit::failure() {
    if (!settled) {
        settled = true;
        breaker->settle(epoch, isProbe, Outcome::Failure);
    }
}

void CircuitBreaker::Permit::release() {
    if (!settled) {
        settled = true;
        breaker->settle(epoch, isProbe, Outcome::Neutral);
    }
}

bool CircuitBreaker::Permit::probe() const {
    return isProbe;
}

CircuitBreaker::CircuitBreaker(std::string n, const CircuitBreakerConfig c, Clock& clk, StateListener l)
    : breakerName {std::move(n)},
      cfg {c},
      clock {clk},
      listener {std::move(l)} {}

std::expected<CircuitBreaker::Permit, Error> CircuitBreaker::acquire() {
    std::optional<Transition> t;
    std::optional<Error> refusal;
    std::optional<Permit> permit;
    {
        std::lock_guard lock {m};
        switch (current) {
            case State::Open:
                if (clock.now() - openedAt.value_or(Clock::time_point {}) < cfg.cooldownDuration) {
                    ++rejected;
                    refusal = Error {ErrorCode::CircuitOpen, "Circuit breaker '" + breakerName + "' is open", breakerName};
                    break;
                }
                t = transitionTo(State::HalfOpen);
                [[fallthrough]];
            case State::HalfOpen:
                if (probesInFlight >= cfg.halfOpenMaxConcurrent) {
                    ++rejected;
                    refusal = Error {ErrorCode::CircuitHalfOpenLimit,
                                     "Circuit breaker '" + breakerName + "' is half-open, limit reached", breakerName};
                    break;
                }
                ++probesInFlight;
                permit.emplace(Permit {this, epoch, true});
                break;
            case State::Closed:
                permit.emplace(Permit {this, epoch, false});
                break;
        }
    }
    notify(t);
    if (refusal.has_value()) {
        spdlog::warn("{}", refusal->what);
        return std::unexpected {std::move(refusal.value())};
    }
    return std::move(permit.value());
}

void CircuitBreaker::settle(uint64_t permitEpoch, bool probe, Outcome outcome) {
    std::optional<Transition> t;
    {
        std::lock_guard lock {m};
        if (permitEpoch != epoch) {
            return;
        }
        if (probe && probesInFlight > 0) {
            --probesInFlight;
        }
        switch (outcome) {
            case Outcome::Success:
                if (current == State::Closed) {
                    consecutiveFailures = 0;
                } else if (current == State::HalfOpen) {
                    ++consecutiveSuccesses;
                    spdlog::debug("Circuit breaker '{}' half-open success ({}/{})",
                                  breakerName, consecutiveSuccesses, cfg.successThreshold);
                    if (consecutiveSuccesses >= cfg.successThreshold) {
                        t = transitionTo(State::Closed);
                    }
                }
                break;
            case Outcome::Failure:
                lastFailure = clock.now();
                if (current == State::Closed) {
                    ++consecutiveFailures;
                    spdlog::warn("Circuit breaker '{}' failure ({}/{})",
                                 breakerName, consecutiveFailures, cfg.failureThreshold);
                    if (consecutiveFailures >= cfg.failureThreshold) {
                        t = transitionTo(State::Open);
                    }
                } else if (current == State::HalfOpen) {
                    t = transitionTo(State::Open);
                }
                break;
            case Outcome::Neutral:
                break;
        }
    }
    notify(t);
}

CircuitBreaker::Transition CircuitBreaker::transitionTo(State next) {
    const Transition t {current, next};
    current = next;
    ++epoch;
    consecutiveSuccesses = 0;
    probesInFlight = 0;
    switch (next) {
        case State::Closed:
            consecutiveFailures = 0;
            openedAt.reset();
            break;
        case State::Open:
            openedAt = clock.now();
            break;
        case State::HalfOpen:
            break;
    }
    return t;
}

void CircuitBreaker::notify(const std::optional<Transition>& t) const {
    if (!t.has_value()) {
        return;
    }
    if (t->to == State::Open && t->from == State::Closed) {
        spdlog::error("Circuit breaker '{}' threshold reached - transitioning to OPEN", breakerName);
    } else if (t->to == State::Open) {
        spdlog::warn("Circuit breaker '{}' failure in HALF_OPEN - transitioning to OPEN", breakerName);
    } else {
        spdlog::info("Circuit breaker '{}' transitioning from {} to {}", breakerName, toString(t->from), toString(t->to));
    }
    if (listener) {
        listener(breakerName, t->from, t->to);
    }
}

void CircuitBreaker::reset() {
    std::optional<Transition> t;
    {
        std::lock_guard lock {m};
        if (current != State::Closed) {
            t = transitionTo(State::Closed);
        }
        consecutiveFailures = 0;
        consecutiveSuccesses = 0;
        probesInFlight = 0;
        rejected = 0;
        lastFailure.reset();
    }
    spdlog::info("Circuit breaker '{}' manually reset to CLOSED", breakerName);
    notify(t);
}

CircuitBreaker::State CircuitBreaker::state() const {
    std::lock_guard lock {m};
    return current;
}

CircuitBreaker::Snapshot CircuitBreaker::snapshot() const {
    std::lock_guard lock {m};
    const auto now = clock.now();
    Snapshot s {breakerName, current, consecutiveFailures, consecutiveSuccesses, probesInFlight, rejected, std::nullopt, std::nullopt};
    if (lastFailure.has_value()) {
        s.sinceLastFailure = std::chrono::duration_cast<std::chrono::microseconds>(now - *lastFailure);
    }
    if (current == State::Open && openedAt.has_value()) {
        auto remaining = cfg.cooldownDuration - std::chrono::duration_cast<std::chrono::microseconds>(now - *openedAt);
        s.untilHalfOpen = std::max(remaining, std::chrono::microseconds::zero());
    }
    return s;
}

const std::string& CircuitBreaker::name() const {
    return breakerName;
}

const CircuitBreakerConfig& CircuitBreaker::config() const {
    return cfg;
}

std::string_view toString(CircuitBreaker::State s) {
    switch (s) {
        case CircuitBreaker::State::Closed:
            return "closed";
        case CircuitBreaker::State::Open:
            return "open";
        case CircuitBreaker::State::HalfOpen:
            return "half_open";
    }
    return "unknown";
}

} // namespace bastion
