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

// Sluice Flow - Header
// Pipeline engine: runs an ordered chain of handlers concurrently over pipes

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "converter.hpp"
#include "handler.hpp"

namespace sluice::flow {

/// No limit on concurrently running handler tasks
constexpr int kConcurrencyUnlimited = 0;

/// Limit derived from the CPU count (cpu_count * cpu_multiplier)
constexpr int kConcurrencyAuto = -1;

/// Handler stages are mostly I/O bound, so the automatic limit oversubscribes
constexpr int kDefaultCpuMultiplier = 50;

/// Flow configuration
struct FlowConfig {
    /// Max handler tasks running at once across all runs of one flow
    /// (kConcurrencyUnlimited, kConcurrencyAuto or a positive limit).
    /// A run reserves one slot per handler before any stage starts, so a
    /// limit below the handler count makes run() fail with errc::invalid_config.
    int max_concurrent = kConcurrencyUnlimited;

    /// Multiplier applied to the CPU count for kConcurrencyAuto
    int cpu_multiplier = kDefaultCpuMultiplier;
};

class ConcurrencyLimiter;

/// Streaming pipeline of handlers.
///
/// Every run() wires handler i's output to handler i+1's input through a
/// zero-capacity pipe and runs one task per handler, plus an input feeder
/// and an output collector. A slow stage therefore throttles its upstream.
///
/// The first error from any stage, or cancellation of the context, aborts
/// the run: every pipe is closed with that error and run() returns without
/// waiting for handler tasks that ignore it, nor for a feeder or collector
/// blocked inside a caller-owned stream. Bytes already written to a
/// caller-owned Writer are not rolled back; in-memory destinations are only
/// assigned on success.
///
/// A Flow is itself a Handler, so flows nest inside other flows.
/// Handlers must be added before the first run.
class Flow : public Handler {
public:
    Flow();
    explicit Flow(FlowConfig config);
    ~Flow() override = default;

    // Non-copyable, movable
    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;
    Flow(Flow&&) noexcept = default;
    Flow& operator=(Flow&&) noexcept = default;

    /// Append a handler (returns *this for chaining)
    Flow& use(HandlerPtr handler);

    /// Append a handler function
    Flow& use(HandlerFunc func, std::string name = "function");

    /// Execute the whole chain once
    [[nodiscard]] Error run(const ContextPtr& ctx, Input input, Output output);

    /// Run this flow as a stage of another flow
    [[nodiscard]] Error serve_flow(Request& req, Response& res) override;

    [[nodiscard]] std::string_view name() const override { return "flow"; }

    /// Number of handlers
    [[nodiscard]] size_t size() const noexcept { return handlers_.size(); }

    /// Effective concurrency limit (0 = unlimited)
    [[nodiscard]] size_t concurrency_limit() const noexcept;

    [[nodiscard]] const FlowConfig& config() const noexcept { return config_; }

private:
    FlowConfig config_;
    std::vector<HandlerPtr> handlers_;
    std::shared_ptr<ConcurrencyLimiter> limiter_;  // nullptr when unlimited
};

[[nodiscard]] inline std::shared_ptr<Flow> make_flow(FlowConfig config = {}) {
    return std::make_shared<Flow>(config);
}

}  // namespace sluice::flow
