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

// Unit tests for Error values and error codes

#include <catch2/catch_test_macros.hpp>

#include <string>

#include "core/error.hpp"

using namespace sluice::core;

TEST_CASE("Error - default is success", "[error]") {
    Error err;

    REQUIRE_FALSE(err);
    REQUIRE(err.ok());
    REQUIRE(err.what().empty());
    REQUIRE(err.cause() == nullptr);
}

TEST_CASE("Error - code carries default message", "[error]") {
    Error err(errc::cancelled);

    REQUIRE(err);
    REQUIRE_FALSE(err.ok());
    REQUIRE(err.code() == errc::cancelled);
    REQUIRE(err.what() == "context canceled");
    REQUIRE(err.code().category().name() == std::string("sluice"));
}

TEST_CASE("Error - to_string messages", "[error]") {
    REQUIRE(to_string(errc::deadline_exceeded) == "context deadline exceeded");
    REQUIRE(to_string(errc::no_handlers) == "no handlers provided to fallback");
    REQUIRE(to_string(errc::batch_split_failed) == "batch response splitting failed");
    REQUIRE(to_string(errc::rate_limit_exceeded) == "rate limit exceeded");
}

TEST_CASE("Error - wrapping keeps the chain", "[error]") {
    Error root(errc::handler_failed, "upstream unavailable");
    auto wrapped = wrap(root, errc::retry_exhausted, "retry exhausted");

    SECTION("what renders every link") {
        REQUIRE(wrapped.what() == "retry exhausted: upstream unavailable");
    }

    SECTION("is() walks the chain") {
        REQUIRE(wrapped.is(errc::retry_exhausted));
        REQUIRE(wrapped.is(errc::handler_failed));
        REQUIRE_FALSE(wrapped.is(errc::cancelled));
    }

    SECTION("cause and root cause") {
        REQUIRE(wrapped.cause() != nullptr);
        REQUIRE(wrapped.cause()->message() == "upstream unavailable");
        REQUIRE(wrapped.root_cause().code() == errc::handler_failed);
    }

    SECTION("wrap without a code keeps the cause's code") {
        auto annotated = wrap(root, "while loading");
        REQUIRE(annotated.code() == errc::handler_failed);
        REQUIRE(annotated.what() == "while loading: upstream unavailable");
    }
}

TEST_CASE("Error - correlation ids", "[error]") {
    Error err(errc::io_error, "disk gone");
    err.with_ids("trace-1", "req-1");

    REQUIRE(err.trace_id() == "trace-1");
    REQUIRE(err.request_id() == "req-1");

    SECTION("wrapping inherits ids") {
        auto wrapped = wrap(err, "read failed");
        REQUIRE(wrapped.trace_id() == "trace-1");
        REQUIRE(wrapped.request_id() == "req-1");
    }

    SECTION("empty ids do not overwrite") {
        err.with_ids("", "");
        REQUIRE(err.trace_id() == "trace-1");
    }
}

TEST_CASE("Error - interoperates with std::error_code", "[error]") {
    std::error_code ec = errc::circuit_open;
    Error err(ec);

    REQUIRE(err.is(errc::circuit_open));
    REQUIRE(err.what() == "circuit breaker is open");

    Error system_err(std::make_error_code(std::errc::broken_pipe), "write failed");
    REQUIRE(system_err);
    REQUIRE_FALSE(system_err.is(errc::io_error));
}
