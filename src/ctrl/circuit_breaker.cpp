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

// Sluice Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include "../core/logging.hpp"

namespace sluice::ctrl {

CircuitBreaker::CircuitBreaker() : CircuitBreaker(CircuitBreakerConfig{}) {}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config) : config_(config) {}

bool CircuitBreaker::allow() {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (state_) {
        case CircuitState::CLOSED:
            return true;

        case CircuitState::OPEN: {
            auto elapsed = std::chrono::steady_clock::now() - last_failure_time_;
            if (elapsed < std::chrono::milliseconds(config_.open_timeout_ms)) {
                rejected_requests_.fetch_add(1, std::memory_order_relaxed);
                return false;
            }
            // Cooldown over, let trial calls through
            transition_to(CircuitState::HALF_OPEN);
            LOG_INFO(logging::get_logger(), "Circuit breaker OPEN → HALF_OPEN (timeout expired)");
            return true;
        }

        case CircuitState::HALF_OPEN:
            return true;
    }

    return false;  // Unreachable, but satisfies compiler
}

void CircuitBreaker::record_success() {
    total_successes_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0;

    if (state_ != CircuitState::CLOSED) {
        auto previous = state_;
        transition_to(CircuitState::CLOSED);
        LOG_INFO(logging::get_logger(), "Circuit breaker {} → CLOSED (recovery successful)",
                 to_string(previous));
    }
}

void CircuitBreaker::record_failure() {
    total_failures_.fetch_add(1, std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(mutex_);
    last_failure_time_ = std::chrono::steady_clock::now();

    if (state_ == CircuitState::HALF_OPEN) {
        // Trial call failed, reopen immediately
        consecutive_failures_ = config_.failure_threshold;
        transition_to(CircuitState::OPEN);
        LOG_WARNING(logging::get_logger(), "Circuit breaker HALF_OPEN → OPEN (recovery test failed)");
        return;
    }

    consecutive_failures_++;

    if (state_ == CircuitState::CLOSED && consecutive_failures_ >= config_.failure_threshold) {
        transition_to(CircuitState::OPEN);
        LOG_WARNING(logging::get_logger(), "Circuit breaker CLOSED → OPEN ({} consecutive failures)",
                    consecutive_failures_);
    }
}

CircuitState CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint32_t CircuitBreaker::consecutive_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return consecutive_failures_;
}

void CircuitBreaker::transition_to(CircuitState new_state) {
    if (state_ != new_state) {
        state_ = new_state;
        state_transitions_.fetch_add(1, std::memory_order_relaxed);
    }
}

}  // namespace sluice::ctrl
