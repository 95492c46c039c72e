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

// Sluice Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../cache/memory_store.hpp"
#include "../ctrl/batch.hpp"
#include "../ctrl/fallback.hpp"
#include "../ctrl/rate_limit.hpp"
#include "../ctrl/retry.hpp"
#include "../flow/flow.hpp"

namespace sluice::control {

/// Pipeline engine settings
struct FlowSection {
    int max_concurrent = 0;    // 0 = unlimited, -1 = cpu_count * cpu_multiplier
    int cpu_multiplier = 50;
};

/// Retry settings
struct RetrySection {
    int max_attempts = 3;
    uint32_t base_delay_ms = 100;  // Doubles after every failed attempt
};

/// Circuit breaker settings (one breaker per fallback handler)
struct CircuitBreakerSection {
    uint32_t failure_threshold = 5;  // Consecutive failures to open circuit
    uint32_t open_timeout_ms = 30000;  // Time before OPEN → HALF_OPEN (30s)
};

/// Rate limiter settings
struct RateLimitSection {
    int rate = 100;         // Operations allowed per window
    uint32_t per_ms = 1000;  // Window length
};

/// Batching settings
struct BatchSection {
    uint32_t max_size = 10;
    uint32_t max_wait_ms = 100;
    std::string separator{ctrl::kDefaultBatchSeparator};
};

/// Cache settings
struct CacheSection {
    uint32_t ttl_ms = 300000;              // Entry lifetime (5 minutes)
    uint32_t sweep_interval_ms = 300000;   // Background sweep period (5 minutes)
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";   // debug, info, warning, error
    std::string format = "text";  // json, text
    std::string output;           // Log directory, empty = console

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Sluice configuration
struct Config {
    FlowSection flow;
    RetrySection retry;
    CircuitBreakerSection circuit_breaker;
    RateLimitSection rate_limit;
    BatchSection batch;
    CacheSection cache;
    LogConfig logging;
};

// Custom from_json functions to handle missing fields with defaults

inline void from_json(const nlohmann::json& j, FlowSection& f) {
    f.max_concurrent = j.value("max_concurrent", 0);
    f.cpu_multiplier = j.value("cpu_multiplier", 50);
}

inline void to_json(nlohmann::json& j, const FlowSection& f) {
    j = nlohmann::json{{"max_concurrent", f.max_concurrent}, {"cpu_multiplier", f.cpu_multiplier}};
}

inline void from_json(const nlohmann::json& j, RetrySection& r) {
    r.max_attempts = j.value("max_attempts", 3);
    r.base_delay_ms = j.value("base_delay_ms", 100u);
}

inline void to_json(nlohmann::json& j, const RetrySection& r) {
    j = nlohmann::json{{"max_attempts", r.max_attempts}, {"base_delay_ms", r.base_delay_ms}};
}

inline void from_json(const nlohmann::json& j, CircuitBreakerSection& c) {
    c.failure_threshold = j.value("failure_threshold", 5u);
    c.open_timeout_ms = j.value("open_timeout_ms", 30000u);
}

inline void to_json(nlohmann::json& j, const CircuitBreakerSection& c) {
    j = nlohmann::json{{"failure_threshold", c.failure_threshold},
                       {"open_timeout_ms", c.open_timeout_ms}};
}

inline void from_json(const nlohmann::json& j, RateLimitSection& r) {
    r.rate = j.value("rate", 100);
    r.per_ms = j.value("per_ms", 1000u);
}

inline void to_json(nlohmann::json& j, const RateLimitSection& r) {
    j = nlohmann::json{{"rate", r.rate}, {"per_ms", r.per_ms}};
}

inline void from_json(const nlohmann::json& j, BatchSection& b) {
    b.max_size = j.value("max_size", 10u);
    b.max_wait_ms = j.value("max_wait_ms", 100u);
    b.separator = j.value("separator", std::string(ctrl::kDefaultBatchSeparator));
}

inline void to_json(nlohmann::json& j, const BatchSection& b) {
    j = nlohmann::json{
        {"max_size", b.max_size}, {"max_wait_ms", b.max_wait_ms}, {"separator", b.separator}};
}

inline void from_json(const nlohmann::json& j, CacheSection& c) {
    c.ttl_ms = j.value("ttl_ms", 300000u);
    c.sweep_interval_ms = j.value("sweep_interval_ms", 300000u);
}

inline void to_json(nlohmann::json& j, const CacheSection& c) {
    j = nlohmann::json{{"ttl_ms", c.ttl_ms}, {"sweep_interval_ms", c.sweep_interval_ms}};
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("text"));
    l.output = j.value("output", std::string());
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get() instead of value() so absent sections keep their defaults
    if (j.contains("flow")) {
        j.at("flow").get_to(c.flow);
    }
    if (j.contains("retry")) {
        j.at("retry").get_to(c.retry);
    }
    if (j.contains("circuit_breaker")) {
        j.at("circuit_breaker").get_to(c.circuit_breaker);
    }
    if (j.contains("rate_limit")) {
        j.at("rate_limit").get_to(c.rate_limit);
    }
    if (j.contains("batch")) {
        j.at("batch").get_to(c.batch);
    }
    if (j.contains("cache")) {
        j.at("cache").get_to(c.cache);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{};
    j["flow"] = c.flow;
    j["retry"] = c.retry;
    j["circuit_breaker"] = c.circuit_breaker;
    j["rate_limit"] = c.rate_limit;
    j["batch"] = c.batch;
    j["cache"] = c.cache;
    j["logging"] = c.logging;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Convert configuration to JSON string
    [[nodiscard]] static std::string to_json(const Config& config);
};

// Section → component parameter conversions

[[nodiscard]] flow::FlowConfig to_flow_config(const FlowSection& section);
[[nodiscard]] ctrl::RetryConfig to_retry_config(const RetrySection& section);
[[nodiscard]] ctrl::FallbackConfig to_fallback_config(const CircuitBreakerSection& section);
[[nodiscard]] ctrl::BatchConfig to_batch_config(const BatchSection& section);
[[nodiscard]] cache::MemoryStoreOptions to_memory_store_options(const CacheSection& section);
/// Entry lifetime for cache::Cache::cache()
[[nodiscard]] std::chrono::milliseconds to_cache_ttl(const CacheSection& section);

/// Limiter shareable between rate_limit() handlers
[[nodiscard]] std::shared_ptr<ctrl::RateLimiter> make_rate_limiter(const RateLimitSection& section);

}  // namespace sluice::control
