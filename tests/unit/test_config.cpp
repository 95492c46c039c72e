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

// Unit tests for the configuration layer

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "control/config.hpp"

using namespace sluice::control;

namespace {

bool contains_message(const std::vector<std::string>& messages, std::string_view needle) {
    for (const auto& message : messages) {
        if (message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

}  // namespace

TEST_CASE("Config defaults", "[control][config]") {
    Config config;

    REQUIRE(config.flow.max_concurrent == 0);
    REQUIRE(config.retry.max_attempts == 3);
    REQUIRE(config.circuit_breaker.failure_threshold == 5);
    REQUIRE(config.circuit_breaker.open_timeout_ms == 30000);
    REQUIRE(config.rate_limit.rate == 100);
    REQUIRE(config.batch.separator == sluice::ctrl::kDefaultBatchSeparator);
    REQUIRE(config.cache.ttl_ms == 300000);
    REQUIRE(config.logging.level == "info");

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE(result.errors.empty());
    REQUIRE(result.warnings.empty());
}

TEST_CASE("Config JSON deserialization", "[control][config]") {
    const char* json = R"({
        "flow": {"max_concurrent": -1, "cpu_multiplier": 8},
        "retry": {"max_attempts": 5},
        "batch": {"max_size": 32, "separator": "|"},
        "logging": {"level": "debug", "rotation": {"max_files": 3}}
    })";

    auto maybe_config = ConfigLoader::load_from_json(json);
    REQUIRE(maybe_config.has_value());
    const auto& config = *maybe_config;

    REQUIRE(config.flow.max_concurrent == -1);
    REQUIRE(config.flow.cpu_multiplier == 8);
    REQUIRE(config.retry.max_attempts == 5);
    REQUIRE(config.retry.base_delay_ms == 100);  // Absent field keeps its default
    REQUIRE(config.batch.max_size == 32);
    REQUIRE(config.batch.separator == "|");
    REQUIRE(config.logging.level == "debug");
    REQUIRE(config.logging.rotation.max_files == 3);
    REQUIRE(config.logging.rotation.max_size_mb == 100);

    // Absent sections keep their defaults
    REQUIRE(config.rate_limit.rate == 100);
    REQUIRE(config.cache.sweep_interval_ms == 300000);
}

TEST_CASE("Config JSON round trip", "[control][config]") {
    Config config;
    config.rate_limit.rate = 7;
    config.cache.ttl_ms = 1234;

    std::string json = ConfigLoader::to_json(config);
    REQUIRE(json.find("\"rate_limit\"") != std::string::npos);

    auto parsed = ConfigLoader::load_from_json(json);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->rate_limit.rate == 7);
    REQUIRE(parsed->cache.ttl_ms == 1234);
}

TEST_CASE("Config rejects malformed input", "[control][config]") {
    REQUIRE_FALSE(ConfigLoader::load_from_json("{not json").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"retry": {"max_attempts": "three"}})").has_value());
    REQUIRE_FALSE(ConfigLoader::load_from_json(R"({"retry": {"max_attempts": 0}})").has_value());
}

TEST_CASE("Config validation errors", "[control][config]") {
    Config config;

    SECTION("flow") {
        config.flow.max_concurrent = -2;
        config.flow.cpu_multiplier = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE_FALSE(result.valid);
        REQUIRE(contains_message(result.errors, "flow.max_concurrent"));
        REQUIRE(contains_message(result.errors, "flow.cpu_multiplier"));
    }

    SECTION("retry") {
        config.retry.max_attempts = -1;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "retry.max_attempts must be > 0"));
    }

    SECTION("circuit breaker") {
        config.circuit_breaker.failure_threshold = 0;
        config.circuit_breaker.open_timeout_ms = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.errors.size() == 2);
    }

    SECTION("rate limit") {
        config.rate_limit.rate = 0;
        config.rate_limit.per_ms = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "rate_limit.rate"));
        REQUIRE(contains_message(result.errors, "rate_limit.per_ms"));
    }

    SECTION("batch") {
        config.batch.max_size = 0;
        config.batch.separator.clear();
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "batch.max_size"));
        REQUIRE(contains_message(result.errors, "batch.separator"));
    }

    SECTION("cache") {
        config.cache.sweep_interval_ms = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(contains_message(result.errors, "cache.sweep_interval_ms"));
    }

    SECTION("logging") {
        config.logging.level = "chatty";
        config.logging.format = "xml";
        config.logging.rotation.max_size_mb = 0;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.errors.size() == 3);
    }
}

TEST_CASE("Config accepts log levels in any case", "[control][config]") {
    Config config;

    for (const char* level : {"DEBUG", "Info", "WARN", "Warning", "error"}) {
        config.logging.level = level;
        auto result = ConfigLoader::validate(config);
        REQUIRE(result.valid);
        REQUIRE(result.errors.empty());
    }

    config.logging.level = "LOUD";
    REQUIRE_FALSE(ConfigLoader::validate(config).valid);
}

TEST_CASE("Config validation warnings", "[control][config]") {
    Config config;
    config.retry.max_attempts = 50;
    config.cache.ttl_ms = 0;

    auto result = ConfigLoader::validate(config);
    REQUIRE(result.valid);
    REQUIRE(contains_message(result.warnings, "retry.max_attempts is very large"));
    REQUIRE(contains_message(result.warnings, "cache.ttl_ms is 0"));
}

TEST_CASE("Config load from file", "[control][config]") {
    auto path = std::filesystem::temp_directory_path() / "sluice_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"rate_limit": {"rate": 25, "per_ms": 500}})";
    }

    auto config = ConfigLoader::load_from_file(path.string());
    std::filesystem::remove(path);

    REQUIRE(config.has_value());
    REQUIRE(config->rate_limit.rate == 25);
    REQUIRE(config->rate_limit.per_ms == 500);

    REQUIRE_FALSE(ConfigLoader::load_from_file("/nonexistent/sluice.json").has_value());
}

TEST_CASE("Config section conversions", "[control][config]") {
    Config config;
    config.flow.max_concurrent = 4;
    config.retry.max_attempts = 6;
    config.retry.base_delay_ms = 25;
    config.circuit_breaker.failure_threshold = 2;
    config.circuit_breaker.open_timeout_ms = 1500;
    config.batch.max_size = 16;
    config.batch.max_wait_ms = 40;
    config.cache.sweep_interval_ms = 60000;
    config.rate_limit.rate = 10;
    config.rate_limit.per_ms = 250;

    auto flow_config = to_flow_config(config.flow);
    REQUIRE(flow_config.max_concurrent == 4);
    REQUIRE(flow_config.cpu_multiplier == 50);

    auto retry_config = to_retry_config(config.retry);
    REQUIRE(retry_config.max_attempts == 6);
    REQUIRE(retry_config.base_delay == std::chrono::milliseconds(25));

    auto fallback_config = to_fallback_config(config.circuit_breaker);
    REQUIRE(fallback_config.breaker.failure_threshold == 2);
    REQUIRE(fallback_config.breaker.open_timeout_ms == 1500);

    auto batch_config = to_batch_config(config.batch);
    REQUIRE(batch_config.max_size == 16);
    REQUIRE(batch_config.max_wait == std::chrono::milliseconds(40));
    REQUIRE(batch_config.separator == sluice::ctrl::kDefaultBatchSeparator);

    auto store_options = to_memory_store_options(config.cache);
    REQUIRE(store_options.sweep_interval == std::chrono::minutes(1));

    config.cache.ttl_ms = 2500;
    REQUIRE(to_cache_ttl(config.cache) == std::chrono::milliseconds(2500));

    auto limiter = make_rate_limiter(config.rate_limit);
    REQUIRE(limiter->valid());
    REQUIRE(limiter->rate() == 10);
    REQUIRE(limiter->per() == std::chrono::milliseconds(250));
}
