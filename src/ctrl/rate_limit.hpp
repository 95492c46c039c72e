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

// Sluice Rate Limiting - Header
// Token bucket shared by concurrent callers, with cancellable waits

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

#include "../core/context.hpp"
#include "../flow/handler.hpp"

namespace sluice::ctrl {

using flow::HandlerPtr;

/// Token bucket for rate limiting (mutex-guarded, shared across threads)
class TokenBucket {
public:
    /// Create a token bucket (starts full)
    /// @param capacity Maximum number of tokens (burst size)
    /// @param refill_interval Time to regenerate one token
    TokenBucket(uint64_t capacity, std::chrono::nanoseconds refill_interval);

    ~TokenBucket() = default;

    // Non-copyable, non-movable
    TokenBucket(const TokenBucket&) = delete;
    TokenBucket& operator=(const TokenBucket&) = delete;

    /// Try to consume one token without waiting
    /// @return true if a token was consumed, false if the bucket is empty
    [[nodiscard]] bool try_consume();

    /// Consume one token, polling every refill_interval / 10 until one frees
    /// up. Returns the context error if the context finishes first.
    [[nodiscard]] core::Error wait(const core::Context& ctx);

    /// Get current number of available tokens (after lazy refill)
    [[nodiscard]] uint64_t available();

    /// Get bucket capacity
    [[nodiscard]] uint64_t capacity() const noexcept { return capacity_; }

    /// Get time to regenerate one token
    [[nodiscard]] std::chrono::nanoseconds refill_interval() const noexcept {
        return refill_interval_;
    }

    /// Reset the bucket to full capacity
    void reset();

private:
    /// Add tokens for elapsed whole refill intervals (mutex held)
    void refill();

    const uint64_t capacity_;                      // Maximum tokens (burst size)
    const std::chrono::nanoseconds refill_interval_;  // Time per token

    std::mutex mutex_;
    uint64_t tokens_;
    std::chrono::steady_clock::time_point last_refill_;
};

/// Limiter allowing `rate` operations per `per`.
///
/// A non-positive rate is kept as a configuration error and reported on
/// every wait() instead of failing construction.
class RateLimiter {
public:
    RateLimiter(int rate, std::chrono::nanoseconds per);

    // Non-copyable, non-movable
    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Block until the call may proceed
    [[nodiscard]] core::Error wait(const core::Context& ctx);

    [[nodiscard]] bool valid() const noexcept { return bucket_ != nullptr; }

    [[nodiscard]] int rate() const noexcept { return rate_; }

    [[nodiscard]] std::chrono::nanoseconds per() const noexcept { return per_; }

    /// Underlying bucket (nullptr when the rate is invalid)
    [[nodiscard]] TokenBucket* bucket() noexcept { return bucket_.get(); }

private:
    const int rate_;
    const std::chrono::nanoseconds per_;
    std::unique_ptr<TokenBucket> bucket_;
};

/// Waits on a limiter, then streams the input through the wrapped handler
/// (or straight to the output when there is none). The payload is never buffered.
class RateLimitHandler : public flow::Handler {
public:
    RateLimitHandler(HandlerPtr handler, std::shared_ptr<RateLimiter> limiter);

    [[nodiscard]] flow::Error serve_flow(flow::Request& req, flow::Response& res) override;

    [[nodiscard]] std::string_view name() const override { return "rate_limit"; }

    [[nodiscard]] RateLimiter& limiter() noexcept { return *limiter_; }

private:
    HandlerPtr handler_;  // nullptr = pass-through gate
    std::shared_ptr<RateLimiter> limiter_;
};

/// Pass-through gate: `rate` calls per `per`
[[nodiscard]] std::shared_ptr<RateLimitHandler> rate_limit(int rate, std::chrono::nanoseconds per);

/// Wrap a handler with its own limiter
[[nodiscard]] std::shared_ptr<RateLimitHandler> rate_limit(HandlerPtr handler, int rate,
                                                           std::chrono::nanoseconds per);

/// Wrap a handler with a limiter shared with other handlers
[[nodiscard]] std::shared_ptr<RateLimitHandler> rate_limit(HandlerPtr handler,
                                                           std::shared_ptr<RateLimiter> limiter);

}  // namespace sluice::ctrl
