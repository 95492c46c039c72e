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

// Sluice Retry - Implementation

#include "retry.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <thread>

#include "../core/logging.hpp"

namespace sluice::ctrl {

using core::errc;
using flow::Error;

namespace {

// 2^30 * base already exceeds any sane delay; keeps the shift defined
constexpr int kMaxBackoffExponent = 30;

}  // namespace

RetryHandler::RetryHandler(HandlerPtr handler, RetryConfig config)
    : handler_(std::move(handler))
    , config_(config) {}

std::chrono::milliseconds RetryHandler::backoff_delay(const RetryConfig& config,
                                                      int attempt) noexcept {
    int exponent = std::clamp(attempt, 0, kMaxBackoffExponent);
    return config.base_delay * (int64_t{1} << exponent);
}

Error RetryHandler::serve_flow(flow::Request& req, flow::Response& res) {
    if (config_.max_attempts <= 0) {
        return Error(errc::invalid_argument,
                     fmt::format("invalid retry attempts: must be greater than 0, got {}",
                                 config_.max_attempts));
    }

    std::string input;
    if (auto err = flow::read_all(req, input)) {
        return err;
    }

    auto* logger = logging::get_logger();

    Error last_err;
    for (int attempt = 0; attempt < config_.max_attempts; ++attempt) {
        std::string output;
        auto err = flow::invoke(*handler_, req.context, input, output);
        if (!err) {
            return flow::write_all(res, output);
        }

        SLUICE_LOG_FAILURE(logger,
                           fmt::format("Retry attempt {}/{} failed", attempt + 1,
                                       config_.max_attempts),
                           req.context ? req.context->request_id() : "", err);
        last_err = std::move(err);

        if (attempt < config_.max_attempts - 1) {
            auto delay = backoff_delay(config_, attempt);
            if (req.context) {
                if (auto ctx_err = req.context->wait_for(delay)) {
                    return ctx_err;
                }
            } else {
                std::this_thread::sleep_for(delay);
            }
        }
    }

    return Error(errc::retry_exhausted, "retry exhausted", std::move(last_err));
}

std::shared_ptr<RetryHandler> retry(HandlerPtr handler, int max_attempts) {
    RetryConfig config;
    config.max_attempts = max_attempts;
    return retry(std::move(handler), config);
}

std::shared_ptr<RetryHandler> retry(HandlerPtr handler, RetryConfig config) {
    return std::make_shared<RetryHandler>(std::move(handler), config);
}

}  // namespace sluice::ctrl
