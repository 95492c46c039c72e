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

// Unit tests for Context (cancellation, deadlines, correlation ids)

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <thread>

#include "core/context.hpp"

using namespace sluice::core;
using namespace std::chrono_literals;

TEST_CASE("Context - background is never done", "[context]") {
    auto ctx = Context::background();

    REQUIRE_FALSE(ctx->done());
    REQUIRE_FALSE(ctx->err());
    REQUIRE_FALSE(ctx->deadline().has_value());
}

TEST_CASE("Context - cancellation propagates to children", "[context]") {
    auto root = Context::background();
    auto parent = Context::with_cancel(root);
    auto child = Context::with_cancel(parent);

    parent->cancel();

    REQUIRE(parent->done());
    REQUIRE(child->done());
    REQUIRE(child->err().is(errc::cancelled));
    REQUIRE_FALSE(root->done());

    SECTION("cancel is idempotent") {
        parent->cancel();
        REQUIRE(parent->err().is(errc::cancelled));
    }
}

TEST_CASE("Context - cancelling a child leaves the parent running", "[context]") {
    auto parent = Context::background();
    auto child = Context::with_cancel(parent);

    child->cancel();

    REQUIRE(child->done());
    REQUIRE_FALSE(parent->done());
}

TEST_CASE("Context - deadlines", "[context]") {
    auto ctx = Context::with_timeout(Context::background(), 20ms);

    REQUIRE(ctx->deadline().has_value());
    REQUIRE_FALSE(ctx->done());

    std::this_thread::sleep_for(40ms);

    REQUIRE(ctx->done());
    REQUIRE(ctx->err().is(errc::deadline_exceeded));

    SECTION("earliest deadline along the chain wins") {
        auto outer = Context::with_timeout(Context::background(), 50ms);
        auto inner = Context::with_timeout(outer, 10s);
        REQUIRE(inner->deadline() == outer->deadline());
    }
}

TEST_CASE("Context - wait_for is interrupted by cancel", "[context]") {
    auto ctx = Context::with_cancel(Context::background());

    std::thread canceller([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx->cancel();
    });

    auto start = std::chrono::steady_clock::now();
    auto err = ctx->wait_for(5s);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(err.is(errc::cancelled));
    REQUIRE(elapsed < 2s);
}

TEST_CASE("Context - wait_for completes when not cancelled", "[context]") {
    auto ctx = Context::background();

    auto start = std::chrono::steady_clock::now();
    auto err = ctx->wait_for(15ms);

    REQUIRE_FALSE(err);
    REQUIRE(std::chrono::steady_clock::now() - start >= 15ms);
}

TEST_CASE("Context - on_done callbacks", "[context]") {
    auto parent = Context::with_cancel(Context::background());
    auto child = Context::with_cancel(parent);

    std::atomic<int> calls{0};

    SECTION("fires on ancestor cancellation") {
        auto subscription = child->on_done([&calls] { ++calls; });
        parent->cancel();
        REQUIRE(calls.load() == 1);
    }

    SECTION("unsubscribes on destruction") {
        {
            auto subscription = child->on_done([&calls] { ++calls; });
        }
        parent->cancel();
        REQUIRE(calls.load() == 0);
    }

    SECTION("never fires inline on an already-done context") {
        parent->cancel();
        auto subscription = child->on_done([&calls] { ++calls; });
        REQUIRE(calls.load() == 0);
        REQUIRE(child->done());
    }
}

TEST_CASE("Context - correlation ids are inherited", "[context]") {
    auto traced = Context::with_trace_id(Context::background(), "trace-abc");
    auto request = Context::with_request_id(traced, "req-42");
    auto child = Context::with_cancel(request);

    REQUIRE(child->trace_id() == "trace-abc");
    REQUIRE(child->request_id() == "req-42");

    child->cancel();
    auto err = child->err();
    REQUIRE(err.trace_id() == "trace-abc");
    REQUIRE(err.request_id() == "req-42");
}
