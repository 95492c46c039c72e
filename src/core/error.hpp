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

// Sluice Error - Header
// Error codes, error category and the chained Error value returned by every stage

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace sluice::core {

/// Library error codes (value 0 is reserved for success)
enum class errc : uint8_t {
    cancelled = 1,         // Context cancelled by caller
    deadline_exceeded,     // Context deadline passed
    io_error,              // Stream read/write failure
    closed_pipe,           // Write or read on a closed pipe end
    handler_failed,        // Generic handler failure
    handler_panicked,      // Handler threw an exception
    retry_exhausted,       // Every retry attempt failed
    no_handlers,           // Fallback constructed without handlers
    all_handlers_failed,   // Every fallback handler failed or was skipped
    circuit_open,          // Circuit breaker rejected the call
    invalid_rate_limit,    // Rate limiter configured with rate <= 0
    rate_limit_exceeded,   // Rate limiter wait failed
    batch_split_failed,    // Combined batch output could not be attributed
    batch_closed,          // Batcher shut down before responding
    timeout,               // Handler exceeded its time budget
    cache_store_error,     // Cache backing store failure
    invalid_argument,      // Bad parameter passed to a factory
    invalid_config         // Configuration failed validation
};

/// Error category for sluice::core::errc
[[nodiscard]] const std::error_category& sluice_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), sluice_category()};
}

/// Error value returned by handlers and middleware.
///
/// Default-constructed Error means success. A failed Error carries a code,
/// a human-readable message and optionally the error it wraps, so callers
/// can inspect the whole chain (e.g. retry exhaustion wrapping the last
/// handler failure).
class Error {
public:
    Error() = default;

    Error(errc code);  // NOLINT(google-explicit-constructor)
    Error(std::error_code code);  // NOLINT(google-explicit-constructor)
    Error(std::error_code code, std::string message);
    Error(std::error_code code, std::string message, Error cause);

    /// True when this value represents a failure
    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(code_); }

    [[nodiscard]] bool ok() const noexcept { return !code_; }

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }

    /// Message of this link only (without the cause)
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// Wrapped error, nullptr if this is the root
    [[nodiscard]] const Error* cause() const noexcept { return cause_.get(); }

    /// Innermost error of the chain
    [[nodiscard]] const Error& root_cause() const noexcept;

    /// Full rendering: "message: cause message: ..."
    [[nodiscard]] std::string what() const;

    /// True if this error or any wrapped error has the given code
    [[nodiscard]] bool is(std::error_code code) const noexcept;
    [[nodiscard]] bool is(errc code) const noexcept { return is(make_error_code(code)); }

    /// Correlation ids copied from the context the error was produced under
    [[nodiscard]] std::string_view trace_id() const noexcept { return trace_id_; }
    [[nodiscard]] std::string_view request_id() const noexcept { return request_id_; }

    Error& with_ids(std::string_view trace_id, std::string_view request_id);

private:
    std::error_code code_;
    std::string message_;
    std::shared_ptr<const Error> cause_;
    std::string trace_id_;
    std::string request_id_;
};

/// Wrap an error with additional context, keeping the cause's code
[[nodiscard]] Error wrap(Error cause, std::string message);

/// Wrap an error under a new code
[[nodiscard]] Error wrap(Error cause, errc code, std::string message);

/// Default message for a library error code
[[nodiscard]] constexpr std::string_view to_string(errc code) noexcept {
    switch (code) {
        case errc::cancelled: return "context canceled";
        case errc::deadline_exceeded: return "context deadline exceeded";
        case errc::io_error: return "i/o error";
        case errc::closed_pipe: return "read/write on closed pipe";
        case errc::handler_failed: return "handler failed";
        case errc::handler_panicked: return "handler panicked";
        case errc::retry_exhausted: return "retry exhausted";
        case errc::no_handlers: return "no handlers provided to fallback";
        case errc::all_handlers_failed: return "all handlers failed";
        case errc::circuit_open: return "circuit breaker is open";
        case errc::invalid_rate_limit: return "invalid rate limit";
        case errc::rate_limit_exceeded: return "rate limit exceeded";
        case errc::batch_split_failed: return "batch response splitting failed";
        case errc::batch_closed: return "batcher closed";
        case errc::timeout: return "handler timeout";
        case errc::cache_store_error: return "cache store error";
        case errc::invalid_argument: return "invalid argument";
        case errc::invalid_config: return "invalid configuration";
    }
    return "unknown error";
}

}  // namespace sluice::core

template <>
struct std::is_error_code_enum<sluice::core::errc> : std::true_type {};
