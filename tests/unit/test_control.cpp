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

// Unit tests for routing and composition handlers

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <string>
#include <thread>

#include "ctrl/control.hpp"

using namespace sluice;
using namespace sluice::ctrl;
using core::errc;
using flow::Error;
using flow::Request;
using flow::Response;
using namespace std::chrono_literals;

namespace {

flow::HandlerPtr stage(std::string name, std::string (*fn)(std::string)) {
    return flow::make_handler(
        [fn](Request& req, Response& res) -> Error {
            std::string input;
            if (auto err = flow::read_all(req, input)) {
                return err;
            }
            return flow::write_all(res, fn(std::move(input)));
        },
        std::move(name));
}

std::string to_upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string reversed(std::string s) {
    std::reverse(s.begin(), s.end());
    return s;
}

std::string bracketed(std::string s) {
    return "[" + s + "]";
}

flow::HandlerPtr sleeping(std::chrono::milliseconds duration, std::string output) {
    return flow::make_handler([duration, output](Request& req, Response& res) -> Error {
        if (auto err = req.context->wait_for(duration)) {
            return err;
        }
        return flow::write_all(res, output);
    });
}

flow::HandlerPtr failing(errc code) {
    return flow::make_handler([code](Request&, Response&) -> Error { return Error(code, "branch failed"); });
}

}  // namespace

TEST_CASE("pass_through copies input", "[control]") {
    std::string out;
    REQUIRE_FALSE(flow::invoke(*pass_through(), core::Context::background(), "unchanged", out));
    REQUIRE(out == "unchanged");
}

TEST_CASE("pass_through requires streams", "[control]") {
    Request req{core::Context::background(), nullptr};
    Response res{nullptr};
    REQUIRE(pass_through()->serve_flow(req, res).is(errc::invalid_argument));
}

TEST_CASE("branch routes on the buffered input", "[control]") {
    auto is_json = [](std::string_view data) { return !data.empty() && data.front() == '{'; };
    auto router = branch(is_json, stage("upper", to_upper), stage("reverse", reversed));

    std::string json_out;
    std::string text_out;
    REQUIRE_FALSE(flow::invoke(*router, core::Context::background(), "{\"a\":1}", json_out));
    REQUIRE_FALSE(flow::invoke(*router, core::Context::background(), "abc", text_out));

    REQUIRE(json_out == "{\"A\":1}");
    REQUIRE(text_out == "cba");
}

TEST_CASE("tee copies to every writer", "[control]") {
    core::StringWriter audit;
    core::StringWriter mirror;
    auto splitter = tee({&audit, &mirror});

    std::string out;
    REQUIRE_FALSE(flow::invoke(*splitter, core::Context::background(), "payload", out));

    REQUIRE(out == "payload");
    REQUIRE(audit.str() == "payload");
    REQUIRE(mirror.str() == "payload");
}

TEST_CASE("parallel joins outputs in registration order", "[control]") {
    // The slowest branch is registered first
    auto fan_out = parallel({sleeping(60ms, "slow"), stage("upper", to_upper),
                             stage("reverse", reversed)});

    std::string out;
    REQUIRE_FALSE(flow::invoke(*fan_out, core::Context::background(), "abc", out));

    REQUIRE(out == "slow\n---\nABC\n---\ncba");
}

TEST_CASE("parallel returns the first failure", "[control]") {
    auto fan_out = parallel({sleeping(5s, "never"), failing(errc::handler_failed)});

    auto start = std::chrono::steady_clock::now();
    std::string out;
    auto err = flow::invoke(*fan_out, core::Context::background(), "abc", out);

    REQUIRE(err.is(errc::handler_failed));
    REQUIRE(out.empty());
    // The sleeping sibling was cancelled rather than awaited
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("parallel without handlers passes through", "[control]") {
    std::string out;
    REQUIRE_FALSE(flow::invoke(*parallel({}), core::Context::background(), "as is", out));
    REQUIRE(out == "as is");
}

TEST_CASE("parallel honours the caller context", "[control]") {
    auto fan_out = parallel({sleeping(5s, "a"), sleeping(5s, "b")});
    auto ctx = core::Context::with_timeout(core::Context::background(), 30ms);

    std::string out;
    REQUIRE(flow::invoke(*fan_out, ctx, "x", out).is(errc::deadline_exceeded));
}

TEST_CASE("timeout returns the handler output within budget", "[control]") {
    auto bounded = timeout(sleeping(10ms, "done"), 500ms);

    std::string out;
    REQUIRE_FALSE(flow::invoke(*bounded, core::Context::background(), "x", out));
    REQUIRE(out == "done");
}

TEST_CASE("timeout fails a slow handler", "[control]") {
    auto bounded = timeout(sleeping(5s, "late"), 50ms);

    auto start = std::chrono::steady_clock::now();
    std::string out;
    auto err = flow::invoke(*bounded, core::Context::background(), "x", out);

    REQUIRE(err.is(errc::timeout));
    REQUIRE(err.is(errc::deadline_exceeded));
    REQUIRE(err.what().find("handler timeout after 50ms") != std::string::npos);
    REQUIRE(out.empty());
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
}

TEST_CASE("timeout passes handler errors through", "[control]") {
    auto bounded = timeout(failing(errc::handler_failed), 500ms);

    std::string out;
    REQUIRE(flow::invoke(*bounded, core::Context::background(), "x", out).is(errc::handler_failed));
}

TEST_CASE("timeout reports a cancelled caller context", "[control]") {
    auto bounded = timeout(sleeping(5s, "late"), 5s);
    auto ctx = core::Context::with_cancel(core::Context::background());

    std::thread canceller([ctx] {
        std::this_thread::sleep_for(30ms);
        ctx->cancel();
    });
    std::string out;
    auto err = flow::invoke(*bounded, ctx, "x", out);
    canceller.join();

    REQUIRE(err.is(errc::cancelled));
    REQUIRE_FALSE(err.is(errc::timeout));
}

TEST_CASE("chain runs handlers in order", "[control]") {
    auto pipeline = chain({stage("upper", to_upper), stage("reverse", reversed),
                           stage("bracket", bracketed)});

    std::string out;
    REQUIRE_FALSE(flow::invoke(*pipeline, core::Context::background(), "abc", out));
    REQUIRE(out == "[CBA]");
}

TEST_CASE("chain stops at the first failure", "[control]") {
    std::atomic<int> later_calls{0};
    auto counted = flow::make_handler([&later_calls](Request&, Response&) -> Error {
        ++later_calls;
        return {};
    });
    auto pipeline = chain({stage("upper", to_upper), failing(errc::handler_failed), counted});

    std::string out;
    REQUIRE(flow::invoke(*pipeline, core::Context::background(), "abc", out).is(errc::handler_failed));
    REQUIRE(later_calls.load() == 0);
}

TEST_CASE("chain without handlers passes through", "[control]") {
    std::string out;
    REQUIRE_FALSE(flow::invoke(*chain({}), core::Context::background(), "same", out));
    REQUIRE(out == "same");
}
