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

// Sluice Control Helpers - Header
// Routing and composition handlers: pass-through, branch, tee, parallel, timeout, chain

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

#include "../flow/handler.hpp"

namespace sluice::ctrl {

using flow::HandlerPtr;

/// Joins parallel outputs, in registration order
inline constexpr std::string_view kParallelSeparator = "\n---\n";

/// Predicate evaluated over the whole buffered input
using BranchPredicate = std::function<bool(std::string_view)>;

/// Copy input to output unchanged
[[nodiscard]] HandlerPtr pass_through();

/// Buffer the input, then route it to if_handler when pred holds, else_handler otherwise
[[nodiscard]] HandlerPtr branch(BranchPredicate pred, HandlerPtr if_handler, HandlerPtr else_handler);

/// Stream input to the output and to every extra writer.
/// Writers are borrowed and must outlive every run using the handler.
[[nodiscard]] HandlerPtr tee(std::vector<core::Writer*> writers);

/// Feed the buffered input to every handler concurrently and join their
/// outputs with kParallelSeparator. The first failure cancels the siblings
/// and is returned; no handlers means pass-through.
[[nodiscard]] HandlerPtr parallel(std::vector<HandlerPtr> handlers);

/// Run handler on its own task under a context ending after `limit`.
/// Returns errc::timeout (wrapping the deadline error) when the budget runs
/// out before the handler finishes; output is written only on success.
[[nodiscard]] HandlerPtr timeout(HandlerPtr handler, std::chrono::milliseconds limit);

/// Run handlers one after another, buffering between them; the last one
/// streams to the output. No handlers means pass-through.
[[nodiscard]] HandlerPtr chain(std::vector<HandlerPtr> handlers);

}  // namespace sluice::ctrl
