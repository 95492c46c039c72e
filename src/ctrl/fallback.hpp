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

// Sluice Fallback - Header
// Ordered handler alternatives, each guarded by its own circuit breaker

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "../flow/handler.hpp"
#include "circuit_breaker.hpp"

namespace sluice::ctrl {

using flow::HandlerPtr;

/// Fallback configuration (one breaker per handler, all with this config)
struct FallbackConfig {
    CircuitBreakerConfig breaker;
};

/// Tries handlers in order until one succeeds.
///
/// Handlers whose breaker rejects the call are skipped. Each attempt runs
/// against the buffered input and writes into a private buffer, so a failed
/// attempt never leaks partial output. Only the winning output is written.
class FallbackHandler : public flow::Handler {
public:
    FallbackHandler(std::vector<HandlerPtr> handlers, FallbackConfig config);

    [[nodiscard]] flow::Error serve_flow(flow::Request& req, flow::Response& res) override;

    [[nodiscard]] std::string_view name() const override { return "fallback"; }

    [[nodiscard]] size_t size() const noexcept { return handlers_.size(); }

    /// Breaker guarding the handler at index
    [[nodiscard]] CircuitBreaker& breaker(size_t index) { return *breakers_.at(index); }

private:
    std::vector<HandlerPtr> handlers_;
    std::vector<std::unique_ptr<CircuitBreaker>> breakers_;
};

/// Build a fallback over handlers. An empty list yields a handler that fails
/// every call with errc::no_handlers.
[[nodiscard]] std::shared_ptr<FallbackHandler> fallback(std::vector<HandlerPtr> handlers,
                                                        FallbackConfig config = {});

}  // namespace sluice::ctrl
