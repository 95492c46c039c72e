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

// Sluice Rate Limiting - Implementation

#include "rate_limit.hpp"

#include <fmt/format.h>

#include <algorithm>

#include "../core/logging.hpp"

namespace sluice::ctrl {

using core::errc;
using core::Error;

// TokenBucket implementation

TokenBucket::TokenBucket(uint64_t capacity, std::chrono::nanoseconds refill_interval)
    : capacity_(capacity)
    , refill_interval_(std::max(refill_interval, std::chrono::nanoseconds(1)))
    , tokens_(capacity)
    , last_refill_(std::chrono::steady_clock::now()) {}

bool TokenBucket::try_consume() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();

    if (tokens_ > 0) {
        --tokens_;
        return true;  // Successfully consumed
    }

    return false;  // Bucket empty
}

Error TokenBucket::wait(const core::Context& ctx) {
    // Poll at a tenth of the refill interval, never busy-spin
    auto poll = std::max<std::chrono::nanoseconds>(refill_interval_ / 10,
                                                   std::chrono::microseconds(50));

    while (true) {
        if (ctx.done()) {
            return ctx.err();
        }
        if (try_consume()) {
            return {};
        }
        if (auto err = ctx.wait_for(poll)) {
            return err;
        }
    }
}

uint64_t TokenBucket::available() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill();
    return tokens_;
}

void TokenBucket::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = capacity_;
    last_refill_ = std::chrono::steady_clock::now();
}

void TokenBucket::refill() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = now - last_refill_;

    if (elapsed < refill_interval_) {
        return;  // Not enough time elapsed to add a token
    }

    auto intervals = static_cast<uint64_t>(elapsed / refill_interval_);
    if (tokens_ + intervals >= capacity_) {
        tokens_ = capacity_;
        last_refill_ = now;
        return;
    }

    // Keep the partial interval so fractional progress is not lost
    tokens_ += intervals;
    last_refill_ += refill_interval_ * static_cast<int64_t>(intervals);
}

// RateLimiter implementation

RateLimiter::RateLimiter(int rate, std::chrono::nanoseconds per) : rate_(rate), per_(per) {
    if (rate_ > 0) {
        bucket_ = std::make_unique<TokenBucket>(static_cast<uint64_t>(rate_), per_ / rate_);
    }
}

Error RateLimiter::wait(const core::Context& ctx) {
    if (!bucket_) {
        auto err = Error(errc::invalid_rate_limit,
                         fmt::format("invalid rate limit: rate must be greater than 0, got {}", rate_));
        LOG_ERROR(logging::get_logger(), "{}", err.what());
        return err;
    }
    return bucket_->wait(ctx);
}

// RateLimitHandler implementation

RateLimitHandler::RateLimitHandler(HandlerPtr handler, std::shared_ptr<RateLimiter> limiter)
    : handler_(std::move(handler))
    , limiter_(std::move(limiter)) {}

Error RateLimitHandler::serve_flow(flow::Request& req, flow::Response& res) {
    auto ctx = req.context ? req.context : core::Context::background();

    if (auto err = limiter_->wait(*ctx)) {
        if (err.is(errc::invalid_rate_limit)) {
            return err;
        }
        return core::wrap(std::move(err), errc::rate_limit_exceeded, "rate limit exceeded");
    }

    if (handler_) {
        return handler_->serve_flow(req, res);
    }

    if (req.data == nullptr || res.data == nullptr) {
        return Error(errc::invalid_argument, "rate limit requires input and output streams");
    }
    return core::copy(*res.data, *req.data);
}

std::shared_ptr<RateLimitHandler> rate_limit(int rate, std::chrono::nanoseconds per) {
    return std::make_shared<RateLimitHandler>(nullptr, std::make_shared<RateLimiter>(rate, per));
}

std::shared_ptr<RateLimitHandler> rate_limit(HandlerPtr handler, int rate,
                                             std::chrono::nanoseconds per) {
    return std::make_shared<RateLimitHandler>(std::move(handler),
                                              std::make_shared<RateLimiter>(rate, per));
}

std::shared_ptr<RateLimitHandler> rate_limit(HandlerPtr handler,
                                             std::shared_ptr<RateLimiter> limiter) {
    return std::make_shared<RateLimitHandler>(std::move(handler), std::move(limiter));
}

}  // namespace sluice::ctrl
