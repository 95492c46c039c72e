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

// Unit tests for Cache middleware and MemoryStore

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "cache/cache.hpp"
#include "cache/memory_store.hpp"

using namespace sluice;
using namespace sluice::cache;
using core::errc;
using flow::Error;
using flow::Request;
using flow::Response;
using namespace std::chrono_literals;

namespace {

flow::HandlerPtr counting_echo(std::atomic<int>& calls) {
    return flow::make_handler([&calls](Request& req, Response& res) -> Error {
        ++calls;
        std::string input;
        if (auto err = flow::read_all(req, input)) {
            return err;
        }
        return flow::write_all(res, "result:" + input);
    });
}

/// Store whose writes always fail
class FailingStore : public CacheStore {
public:
    std::optional<std::string> get(std::string_view) override { return std::nullopt; }
    core::Error set(std::string_view, std::string_view, std::chrono::milliseconds) override {
        return core::Error(errc::cache_store_error, "disk full");
    }
    core::Error remove(std::string_view) override { return {}; }
    core::Error clear() override { return {}; }
    bool exists(std::string_view) override { return false; }
    std::vector<std::string> list() override { return {}; }
};

}  // namespace

TEST_CASE("sha256_hex", "[cache]") {
    REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("payload").size() == 64);
}

TEST_CASE("MemoryStore - basic operations", "[cache][store]") {
    MemoryStore store;

    REQUIRE_FALSE(store.get("missing").has_value());
    REQUIRE_FALSE(store.exists("missing"));

    REQUIRE_FALSE(store.set("a", "alpha", 10s));
    REQUIRE_FALSE(store.set("b", "beta", 10s));
    REQUIRE(store.get("a") == std::optional<std::string>("alpha"));
    REQUIRE(store.exists("b"));
    REQUIRE(store.size() == 2);

    auto keys = store.list();
    std::sort(keys.begin(), keys.end());
    REQUIRE(keys == std::vector<std::string>{"a", "b"});

    SECTION("set overwrites") {
        REQUIRE_FALSE(store.set("a", "again", 10s));
        REQUIRE(store.get("a") == std::optional<std::string>("again"));
        REQUIRE(store.size() == 2);
    }

    SECTION("remove") {
        REQUIRE_FALSE(store.remove("a"));
        REQUIRE_FALSE(store.exists("a"));
        REQUIRE(store.size() == 1);
        // Removing an absent key is not an error
        REQUIRE_FALSE(store.remove("a"));
    }

    SECTION("clear") {
        REQUIRE_FALSE(store.clear());
        REQUIRE(store.size() == 0);
        REQUIRE(store.list().empty());
    }
}

TEST_CASE("MemoryStore - entries expire", "[cache][store]") {
    MemoryStore store;

    REQUIRE_FALSE(store.set("short", "x", 20ms));
    REQUIRE_FALSE(store.set("long", "y", 10s));
    std::this_thread::sleep_for(60ms);

    REQUIRE_FALSE(store.get("short").has_value());
    REQUIRE_FALSE(store.exists("short"));
    REQUIRE(store.list() == std::vector<std::string>{"long"});
    REQUIRE(store.get("long") == std::optional<std::string>("y"));
}

TEST_CASE("MemoryStore - sweep removes expired entries", "[cache][store]") {
    MemoryStore store;

    REQUIRE_FALSE(store.set("short-1", "x", 10ms));
    REQUIRE_FALSE(store.set("short-2", "x", 10ms));
    REQUIRE_FALSE(store.set("long", "y", 10s));
    std::this_thread::sleep_for(50ms);

    REQUIRE(store.size() == 3);
    REQUIRE(store.sweep() == 2);
    REQUIRE(store.size() == 1);
    REQUIRE(store.sweep() == 0);
}

TEST_CASE("MemoryStore - background sweep", "[cache][store]") {
    MemoryStoreOptions options;
    options.sweep_interval = 20ms;
    MemoryStore store(options);

    REQUIRE_FALSE(store.set("short", "x", 10ms));
    std::this_thread::sleep_for(200ms);

    REQUIRE(store.size() == 0);

    store.stop();
    store.stop();  // Idempotent
}

TEST_CASE("Cache - hit skips the handler", "[cache]") {
    std::atomic<int> calls{0};
    Cache cache;
    auto cached = cache.cache(counting_echo(calls), 10s);

    std::string first;
    std::string second;
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "input", first));
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "input", second));

    REQUIRE(first == "result:input");
    REQUIRE(second == "result:input");
    REQUIRE(calls.load() == 1);

    // Keyed by the digest of the input
    REQUIRE(cache.exists(sha256_hex("input")));
    REQUIRE(cache.get(sha256_hex("input")) == std::optional<std::string>("result:input"));
}

TEST_CASE("Cache - different inputs are cached separately", "[cache]") {
    std::atomic<int> calls{0};
    Cache cache;
    auto cached = cache.cache(counting_echo(calls), 10s);

    std::string a;
    std::string b;
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "a", a));
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "b", b));

    REQUIRE(a == "result:a");
    REQUIRE(b == "result:b");
    REQUIRE(calls.load() == 2);
    REQUIRE(cache.list_keys().size() == 2);
}

TEST_CASE("Cache - expired entries run the handler again", "[cache]") {
    std::atomic<int> calls{0};
    Cache cache;
    auto cached = cache.cache(counting_echo(calls), 30ms);

    std::string out;
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "input", out));
    std::this_thread::sleep_for(80ms);
    out.clear();
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "input", out));

    REQUIRE(out == "result:input");
    REQUIRE(calls.load() == 2);
}

TEST_CASE("Cache - failures are not cached", "[cache]") {
    std::atomic<int> calls{0};
    auto failing = flow::make_handler([&calls](Request&, Response&) -> Error {
        ++calls;
        return Error(errc::handler_failed, "nope");
    });
    Cache cache;
    auto cached = cache.cache(failing, 10s);

    std::string out;
    REQUIRE(flow::invoke(*cached, core::Context::background(), "input", out).is(errc::handler_failed));
    REQUIRE(flow::invoke(*cached, core::Context::background(), "input", out).is(errc::handler_failed));

    REQUIRE(calls.load() == 2);
    REQUIRE(cache.list_keys().empty());
}

TEST_CASE("Cache - store failure reports and still serves", "[cache]") {
    std::atomic<int> calls{0};
    Cache cache(std::make_shared<FailingStore>());

    std::vector<Error> reported;
    cache.on_error([&reported](const Error& err) { reported.push_back(err); });

    auto cached = cache.cache(counting_echo(calls), 10s);
    std::string out;
    REQUIRE_FALSE(flow::invoke(*cached, core::Context::background(), "input", out));

    REQUIRE(out == "result:input");
    REQUIRE(reported.size() == 1);
    REQUIRE(reported[0].is(errc::cache_store_error));
}

TEST_CASE("Cache - custom key function", "[cache]") {
    std::atomic<int> calls{0};
    Cache cache;
    auto by_request_id = [](const Request& req) { return std::string(req.context->request_id()); };
    auto cached = cache.cache_with_key(counting_echo(calls), 10s, by_request_id);

    auto ctx = core::Context::with_request_id(core::Context::background(), "user-42");

    std::string first;
    std::string second;
    REQUIRE_FALSE(flow::invoke(*cached, ctx, "one", first));
    // Same key, different input: served from the cache
    REQUIRE_FALSE(flow::invoke(*cached, ctx, "two", second));

    REQUIRE(first == "result:one");
    REQUIRE(second == "result:one");
    REQUIRE(calls.load() == 1);
    REQUIRE(cache.exists("user-42"));
}

TEST_CASE("Cache - direct store access", "[cache]") {
    Cache cache;

    REQUIRE_FALSE(cache.set("k", "v", 10s));
    REQUIRE(cache.get("k") == std::optional<std::string>("v"));
    REQUIRE(cache.list_keys() == std::vector<std::string>{"k"});

    REQUIRE_FALSE(cache.remove("k"));
    REQUIRE_FALSE(cache.exists("k"));

    REQUIRE_FALSE(cache.set("k", "v", 10s));
    REQUIRE_FALSE(cache.clear());
    REQUIRE(cache.list_keys().empty());
}
