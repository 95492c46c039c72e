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

// Sluice Handler - Header
// Stream-processing stage contract shared by the engine and all middleware

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "../core/context.hpp"
#include "../core/error.hpp"
#include "../core/stream.hpp"

namespace sluice::flow {

using core::ContextPtr;
using core::Error;

/// Input side of one handler invocation
struct Request {
    ContextPtr context;
    core::Reader* data = nullptr;
};

/// Output side of one handler invocation
struct Response {
    core::Writer* data = nullptr;
};

/// Handler base class.
///
/// A handler reads its input stream, writes its output stream and returns
/// success or the first failure. Handlers are shared between flows and runs,
/// so serve_flow() may be called concurrently and must not keep per-call
/// state in members.
class Handler {
public:
    virtual ~Handler() = default;

    [[nodiscard]] virtual Error serve_flow(Request& req, Response& res) = 0;

    /// Handler name (for logging)
    [[nodiscard]] virtual std::string_view name() const { return "handler"; }
};

using HandlerPtr = std::shared_ptr<Handler>;

/// Handler function signature
using HandlerFunc = std::function<Error(Request&, Response&)>;

/// Adapts a callable into a Handler
class FunctionHandler : public Handler {
public:
    explicit FunctionHandler(HandlerFunc func, std::string name = "function")
        : func_(std::move(func)), name_(std::move(name)) {}

    [[nodiscard]] Error serve_flow(Request& req, Response& res) override { return func_(req, res); }

    [[nodiscard]] std::string_view name() const override { return name_; }

private:
    HandlerFunc func_;
    std::string name_;
};

[[nodiscard]] inline HandlerPtr make_handler(HandlerFunc func, std::string name = "function") {
    return std::make_shared<FunctionHandler>(std::move(func), std::move(name));
}

/// Read the whole request body
[[nodiscard]] Error read_all(Request& req, std::string& out);

/// Write the whole payload to the response
[[nodiscard]] Error write_all(Response& res, std::string_view data);

/// Serve a request, converting an escaping exception into errc::handler_panicked
[[nodiscard]] Error call_handler(Handler& handler, Request& req, Response& res);

/// Invoke a handler on an in-memory payload, capturing its output (exceptions are
/// reported as errc::handler_panicked)
[[nodiscard]] Error invoke(Handler& handler, const ContextPtr& ctx, std::string_view input,
                           std::string& output);

}  // namespace sluice::flow
