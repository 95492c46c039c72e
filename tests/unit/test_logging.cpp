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

// Unit tests for logging helpers

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <thread>

#include "core/context.hpp"
#include "core/logging.hpp"

using namespace sluice::logging;

TEST_CASE("Request id generation", "[logging][request_id]") {
    SECTION("generated ids validate") {
        for (int i = 0; i < 100; ++i) {
            REQUIRE(is_valid_request_id(generate_request_id()));
        }
    }

    SECTION("ids share a per-thread base with increasing counters") {
        std::string id1 = generate_request_id();
        std::string id2 = generate_request_id();

        REQUIRE(std::count(id1.begin(), id1.end(), '#') == 1);
        REQUIRE(id1 != id2);

        size_t pos1 = id1.find('#');
        size_t pos2 = id2.find('#');
        REQUIRE(id1.substr(0, pos1) == id2.substr(0, pos2));
        REQUIRE(std::stoull(id2.substr(pos2 + 1)) == std::stoull(id1.substr(pos1 + 1)) + 1);
    }

    SECTION("another thread gets another base") {
        std::string here = generate_request_id();
        std::string there;
        std::thread worker([&there] { there = generate_request_id(); });
        worker.join();

        REQUIRE(is_valid_request_id(there));
        REQUIRE(here.substr(0, here.find('#')) != there.substr(0, there.find('#')));
    }

    SECTION("ids are unique") {
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            ids.insert(generate_request_id());
        }
        REQUIRE(ids.size() == 1000);
    }
}

TEST_CASE("Request id validation", "[logging][request_id]") {
    REQUIRE(is_valid_request_id("550e8400-e29b-41d4-a716-446655440000#0"));
    REQUIRE(is_valid_request_id("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));

    REQUIRE_FALSE(is_valid_request_id(""));
    REQUIRE_FALSE(is_valid_request_id("550e8400-e29b-41d4-a716-446655440000"));
    REQUIRE_FALSE(is_valid_request_id("550e8400-e29b-41d4-a716-446655440000#"));
    REQUIRE_FALSE(is_valid_request_id("550e8400-e29b-41d4-a716-446655440000#12a"));
    REQUIRE_FALSE(is_valid_request_id("550e8400e29b41d4a716446655440000#0"));
    REQUIRE_FALSE(is_valid_request_id("550e8400-e29b-31d4-a716-446655440000#0"));  // Version 3
    REQUIRE_FALSE(is_valid_request_id("550e8400-e29b-41d4-c716-446655440000#0"));  // Variant c
    REQUIRE_FALSE(is_valid_request_id("550g8400-e29b-41d4-a716-446655440000#0"));
    REQUIRE_FALSE(is_valid_request_id("550e8400-e29b-41d4-a716-446655440000#1#2"));
}

TEST_CASE("Context request ids", "[logging][request_id]") {
    auto root = sluice::core::Context::background();
    auto tagged = sluice::core::Context::with_request_id(root, "req-1");
    auto child = sluice::core::Context::with_cancel(tagged);

    REQUIRE(tagged->request_id() == "req-1");
    REQUIRE(child->request_id() == "req-1");
}

TEST_CASE("Level parsing", "[logging][level]") {
    REQUIRE(parse_level("debug") == quill::LogLevel::Debug);
    REQUIRE(parse_level("INFO") == quill::LogLevel::Info);
    REQUIRE(parse_level("warning") == quill::LogLevel::Warning);
    REQUIRE(parse_level("Warn") == quill::LogLevel::Warning);
    REQUIRE(parse_level("error") == quill::LogLevel::Error);
    REQUIRE(parse_level("verbose") == quill::LogLevel::Info);
}

TEST_CASE("Process logger is always available", "[logging][logger]") {
    auto* logger = get_logger();
    REQUIRE(logger != nullptr);
    REQUIRE(get_logger() == logger);
}

TEST_CASE("Failure logging carries the error chain", "[logging][logger]") {
    auto* logger = get_logger();
    sluice::core::Error err(sluice::core::errc::timeout, "handler timeout after 5ms",
                            sluice::core::Error(sluice::core::errc::deadline_exceeded));
    REQUIRE(err.what().find("deadline") != std::string::npos);
    REQUIRE_NOTHROW([&] { SLUICE_LOG_FAILURE(logger, "Stage failed", "req#1", err); }());
    REQUIRE_NOTHROW(
        [&] { SLUICE_LOG_FAILURE(logger, std::string("Stage failed"), std::string_view{}, err); }());
}
