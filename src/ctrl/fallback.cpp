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

// Sluice Fallback - Implementation

#include "fallback.hpp"

#include <string>

#include "../core/logging.hpp"

namespace sluice::ctrl {

using core::errc;
using flow::Error;

FallbackHandler::FallbackHandler(std::vector<HandlerPtr> handlers, FallbackConfig config)
    : handlers_(std::move(handlers)) {
    breakers_.reserve(handlers_.size());
    for (size_t i = 0; i < handlers_.size(); ++i) {
        breakers_.push_back(std::make_unique<CircuitBreaker>(config.breaker));
    }
}

Error FallbackHandler::serve_flow(flow::Request& req, flow::Response& res) {
    if (handlers_.empty()) {
        return Error(errc::no_handlers, "no handlers provided to fallback");
    }

    std::string input;
    if (auto err = flow::read_all(req, input)) {
        return err;
    }

    Error last_err;
    for (size_t i = 0; i < handlers_.size(); ++i) {
        if (req.context && req.context->done()) {
            return req.context->err();
        }

        if (!breakers_[i]->allow()) {
            continue;  // Circuit open, skip
        }

        std::string output;
        auto err = flow::invoke(*handlers_[i], req.context, input, output);
        if (!err) {
            breakers_[i]->record_success();
            return flow::write_all(res, output);
        }

        breakers_[i]->record_failure();
        LOG_DEBUG(logging::get_logger(), "Fallback handler {} ({}) failed: {}", i,
                  handlers_[i]->name(), err.what());
        last_err = std::move(err);
    }

    if (!last_err) {
        // Every handler was skipped
        last_err = Error(errc::circuit_open);
    }
    return Error(errc::all_handlers_failed, "all handlers failed, last error", std::move(last_err));
}

std::shared_ptr<FallbackHandler> fallback(std::vector<HandlerPtr> handlers, FallbackConfig config) {
    return std::make_shared<FallbackHandler>(std::move(handlers), config);
}

}  // namespace sluice::ctrl
