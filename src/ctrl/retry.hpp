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

// Sluice Retry - Header
// Replays buffered input with exponential backoff until an attempt succeeds

#pragma once

#include <chrono>
#include <memory>
#include <string_view>

#include "../flow/handler.hpp"

namespace sluice::ctrl {

using flow::HandlerPtr;

/// Retry configuration
struct RetryConfig {
    /// Total attempts including the first one (must be > 0)
    int max_attempts = 3;

    /// Delay before the second attempt; doubles after every failure
    std::chrono::milliseconds base_delay{100};
};

/// Retries a handler on failure.
///
/// The whole input is buffered once so every attempt sees identical bytes,
/// and each attempt writes into a private buffer: only the successful
/// attempt's output reaches the real output. Backoff sleeps end early when
/// the request context is cancelled. The wrapped handler must be safe to
/// repeat.
class RetryHandler : public flow::Handler {
public:
    RetryHandler(HandlerPtr handler, RetryConfig config);

    [[nodiscard]] flow::Error serve_flow(flow::Request& req, flow::Response& res) override;

    [[nodiscard]] std::string_view name() const override { return "retry"; }

    [[nodiscard]] const RetryConfig& config() const noexcept { return config_; }

    /// Backoff after failed attempt `attempt` (0-based): base_delay * 2^attempt
    [[nodiscard]] static std::chrono::milliseconds backoff_delay(const RetryConfig& config,
                                                                 int attempt) noexcept;

private:
    HandlerPtr handler_;
    RetryConfig config_;
};

[[nodiscard]] std::shared_ptr<RetryHandler> retry(HandlerPtr handler, int max_attempts);

[[nodiscard]] std::shared_ptr<RetryHandler> retry(HandlerPtr handler, RetryConfig config);

}  // namespace sluice::ctrl
