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

// Sluice Handler - Implementation

#include "handler.hpp"

#include <fmt/format.h>

#include <exception>

namespace sluice::flow {

Error read_all(Request& req, std::string& out) {
    if (req.data == nullptr) {
        return Error(core::errc::invalid_argument, "request has no input stream");
    }
    return core::read_all(*req.data, out);
}

Error write_all(Response& res, std::string_view data) {
    if (res.data == nullptr) {
        return Error(core::errc::invalid_argument, "response has no output stream");
    }
    return core::write_all(*res.data, data);
}

Error call_handler(Handler& handler, Request& req, Response& res) {
    try {
        return handler.serve_flow(req, res);
    } catch (const std::exception& e) {
        return Error(core::errc::handler_panicked,
                     fmt::format("handler '{}' threw: {}", handler.name(), e.what()));
    } catch (...) {
        return Error(core::errc::handler_panicked,
                     fmt::format("handler '{}' threw a non-standard exception", handler.name()));
    }
}

Error invoke(Handler& handler, const ContextPtr& ctx, std::string_view input, std::string& output) {
    core::BytesReader reader(input);
    core::StringWriter writer;

    Request req{ctx, &reader};
    Response res{&writer};

    auto err = call_handler(handler, req, res);
    output = writer.take();
    return err;
}

}  // namespace sluice::flow
