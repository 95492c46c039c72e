/*
 * Copyright 2025 Sluice Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Sluice Circuit Breaker - Header
// Stops calling a chronically failing handler until a cooldown elapses

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string_view>

namespace sluice::ctrl {

/// Circuit breaker state
enum class CircuitState : uint8_t {
    CLOSED,     // Normal operation, calls allowed
    OPEN,       // Handler failing, calls rejected until the timeout passes
    HALF_OPEN   // Timeout passed, trial calls test recovery
};

/// Circuit breaker configuration
struct CircuitBreakerConfig {
    /// Consecutive failures that open the circuit
    uint32_t failure_threshold = 5;

    /// Time in milliseconds before OPEN → HALF_OPEN transition
    uint32_t open_timeout_ms = 30000;  // 30 seconds
};

/// Circuit breaker guarding one handler
///
/// State machine:
///   CLOSED → OPEN (failure_threshold consecutive failures)
///   OPEN → HALF_OPEN (allow() once open_timeout_ms passed since the last failure)
///   HALF_OPEN/OPEN → CLOSED (any success)
///   HALF_OPEN → OPEN (any failure)
///
/// HALF_OPEN does not limit concurrency: every call is allowed until a
/// result moves the breaker. All transitions are serialized by one mutex;
/// counters are atomic for lock-free observability.
class CircuitBreaker {
public:
    CircuitBreaker();
    explicit CircuitBreaker(CircuitBreakerConfig config);
    ~CircuitBreaker() = default;

    // Non-copyable, non-movable (shared by concurrent callers)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Check if a call may go through (may move OPEN → HALF_OPEN)
    [[nodiscard]] bool allow();

    /// Record successful call
    void record_success();

    /// Record failed call
    void record_failure();

    /// Get current circuit state
    [[nodiscard]] CircuitState get_state() const;

    /// Consecutive failures since the last success
    [[nodiscard]] uint32_t consecutive_failures() const;

    /// Get total failures recorded
    [[nodiscard]] uint64_t get_total_failures() const noexcept {
        return total_failures_.load(std::memory_order_relaxed);
    }

    /// Get total successes recorded
    [[nodiscard]] uint64_t get_total_successes() const noexcept {
        return total_successes_.load(std::memory_order_relaxed);
    }

    /// Get total calls rejected by the circuit
    [[nodiscard]] uint64_t get_rejected_requests() const noexcept {
        return rejected_requests_.load(std::memory_order_relaxed);
    }

    /// Get total state transitions
    [[nodiscard]] uint64_t get_state_transitions() const noexcept {
        return state_transitions_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

private:
    /// Transition to new state and update metrics (mutex held)
    void transition_to(CircuitState new_state);

    const CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::CLOSED;
    uint32_t consecutive_failures_ = 0;
    std::chrono::steady_clock::time_point last_failure_time_{};

    // Metrics (atomic for cross-thread observability)
    std::atomic<uint64_t> total_failures_{0};
    std::atomic<uint64_t> total_successes_{0};
    std::atomic<uint64_t> rejected_requests_{0};
    std::atomic<uint64_t> state_transitions_{0};
};

/// Convert CircuitState to string (for logging)
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

}  // namespace sluice::ctrl
