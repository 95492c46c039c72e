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

// Sluice Batch - Header
// Coalesces concurrent calls into one combined handler call and splits the result

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../flow/handler.hpp"

namespace sluice::ctrl {

using flow::HandlerPtr;

/// Joins inputs and splits outputs; must survive the wrapped handler unchanged
inline constexpr std::string_view kDefaultBatchSeparator = "\n---BATCH_SEPARATOR---\n";

/// Batch configuration
struct BatchConfig {
    /// Requests that trigger an immediate flush
    size_t max_size = 10;

    /// Longest time the first request of a window waits for company
    std::chrono::milliseconds max_wait{100};

    std::string separator{kDefaultBatchSeparator};
};

/// Split data on every occurrence of separator (n separators → n + 1 parts)
[[nodiscard]] std::vector<std::string> split_batch(std::string_view data, std::string_view separator);

/// Batching middleware.
///
/// Each call reads its whole input and queues it for a background loop that
/// owns the current window. The window is flushed when it holds max_size
/// requests or max_wait after its first request, whichever comes first.
/// A flush leaves out requests whose context already ended, joins the rest
/// with the separator, calls the wrapped handler once under a context owned
/// by the batcher and splits the output back:
///   - part count matches: part i goes to request i (submission order)
///   - handler failed: every request gets the error
///   - part count differs: the first request gets the raw output, the
///     others get errc::batch_split_failed
/// A caller whose context ends first returns its context error; the rest of
/// the batch is unaffected. Destroying the handler stops the loop, cancels
/// an in-flight combined call and fails every still-queued request with
/// errc::batch_closed.
class BatchHandler : public flow::Handler {
public:
    BatchHandler(HandlerPtr handler, BatchConfig config);
    ~BatchHandler() override;

    // Non-copyable, non-movable (owns the coalescing thread)
    BatchHandler(const BatchHandler&) = delete;
    BatchHandler& operator=(const BatchHandler&) = delete;

    [[nodiscard]] flow::Error serve_flow(flow::Request& req, flow::Response& res) override;

    [[nodiscard]] std::string_view name() const override { return "batch"; }

    /// Stop the coalescing loop (idempotent)
    void stop();

    /// Number of combined handler calls made so far
    [[nodiscard]] uint64_t batches_flushed() const noexcept;

    [[nodiscard]] const BatchConfig& config() const noexcept;

private:
    struct State;

    /// Coalescing loop body (runs on worker_)
    static void run_loop(const std::shared_ptr<State>& state);

    std::shared_ptr<State> state_;
    std::thread worker_;
};

[[nodiscard]] std::shared_ptr<BatchHandler> batch(HandlerPtr handler, size_t max_size,
                                                  std::chrono::milliseconds max_wait);

[[nodiscard]] std::shared_ptr<BatchHandler> batch(HandlerPtr handler, BatchConfig config);

}  // namespace sluice::ctrl
