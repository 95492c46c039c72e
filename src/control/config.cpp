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

// Sluice Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>

#include "../core/logging.hpp"

namespace sluice::control {

namespace {

// Retry counts beyond this mostly multiply latency (backoff doubles every attempt)
constexpr int kRetryAttemptsWarningThreshold = 10;

// Case-insensitive, matching logging::parse_level
bool is_known_level(std::string_view level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "debug" || lower == "info" || lower == "warning" || lower == "warn" ||
           lower == "error";
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    // Read file contents
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        LOG_ERROR(logging::get_logger(), "Cannot open configuration file: {}", path_str);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string json = buffer.str();

    return load_from_json(json);
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    Config config;

    try {
        auto j = nlohmann::json::parse(json);
        config = j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR(logging::get_logger(), "JSON parsing error: {}", e.what());
        return std::nullopt;
    }

    // Validate configuration
    auto validation = validate(config);
    for (const auto& warning : validation.warnings) {
        LOG_WARNING(logging::get_logger(), "Configuration warning: {}", warning);
    }

    if (validation.has_errors()) {
        for (const auto& error : validation.errors) {
            LOG_ERROR(logging::get_logger(), "Configuration error: {}", error);
        }
        return std::nullopt;
    }

    return config;
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    // Flow
    if (config.flow.max_concurrent < -1) {
        result.add_error(fmt::format(
            "flow.max_concurrent must be -1 (auto), 0 (unlimited) or positive, got {}",
            config.flow.max_concurrent));
    }
    if (config.flow.cpu_multiplier <= 0) {
        result.add_error("flow.cpu_multiplier must be > 0");
    }

    // Retry
    if (config.retry.max_attempts <= 0) {
        result.add_error(
            fmt::format("retry.max_attempts must be > 0, got {}", config.retry.max_attempts));
    } else if (config.retry.max_attempts > kRetryAttemptsWarningThreshold) {
        result.add_warning(fmt::format("retry.max_attempts is very large ({}); backoff doubles per attempt",
                                       config.retry.max_attempts));
    }

    // Circuit breaker
    if (config.circuit_breaker.failure_threshold == 0) {
        result.add_error("circuit_breaker.failure_threshold must be > 0");
    }
    if (config.circuit_breaker.open_timeout_ms == 0) {
        result.add_error("circuit_breaker.open_timeout_ms must be > 0");
    }

    // Rate limit
    if (config.rate_limit.rate <= 0) {
        result.add_error(
            fmt::format("rate_limit.rate must be > 0, got {}", config.rate_limit.rate));
    }
    if (config.rate_limit.per_ms == 0) {
        result.add_error("rate_limit.per_ms must be > 0");
    }

    // Batch
    if (config.batch.max_size == 0) {
        result.add_error("batch.max_size must be > 0");
    }
    if (config.batch.separator.empty()) {
        result.add_error("batch.separator cannot be empty");
    }

    // Cache
    if (config.cache.ttl_ms == 0) {
        result.add_warning("cache.ttl_ms is 0; entries expire immediately");
    }
    if (config.cache.sweep_interval_ms == 0) {
        result.add_error("cache.sweep_interval_ms must be > 0");
    }

    // Logging
    if (!is_known_level(config.logging.level)) {
        result.add_error("logging.level must be one of debug, info, warning, error (got '" +
                         config.logging.level + "')");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("logging.format must be 'json' or 'text' (got '" + config.logging.format +
                         "')");
    }
    if (config.logging.rotation.max_size_mb == 0) {
        result.add_error("logging.rotation.max_size_mb must be > 0");
    }

    return result;
}

std::string ConfigLoader::to_json(const Config& config) {
    nlohmann::json j = config;
    return j.dump(2);  // 2-space indentation
}

// Section conversions

flow::FlowConfig to_flow_config(const FlowSection& section) {
    flow::FlowConfig config;
    config.max_concurrent = section.max_concurrent;
    config.cpu_multiplier = section.cpu_multiplier;
    return config;
}

ctrl::RetryConfig to_retry_config(const RetrySection& section) {
    ctrl::RetryConfig config;
    config.max_attempts = section.max_attempts;
    config.base_delay = std::chrono::milliseconds(section.base_delay_ms);
    return config;
}

ctrl::FallbackConfig to_fallback_config(const CircuitBreakerSection& section) {
    ctrl::FallbackConfig config;
    config.breaker.failure_threshold = section.failure_threshold;
    config.breaker.open_timeout_ms = section.open_timeout_ms;
    return config;
}

ctrl::BatchConfig to_batch_config(const BatchSection& section) {
    ctrl::BatchConfig config;
    config.max_size = section.max_size;
    config.max_wait = std::chrono::milliseconds(section.max_wait_ms);
    config.separator = section.separator;
    return config;
}

cache::MemoryStoreOptions to_memory_store_options(const CacheSection& section) {
    cache::MemoryStoreOptions options;
    options.sweep_interval = std::chrono::milliseconds(section.sweep_interval_ms);
    return options;
}

std::chrono::milliseconds to_cache_ttl(const CacheSection& section) {
    return std::chrono::milliseconds(section.ttl_ms);
}

std::shared_ptr<ctrl::RateLimiter> make_rate_limiter(const RateLimitSection& section) {
    return std::make_shared<ctrl::RateLimiter>(section.rate,
                                               std::chrono::milliseconds(section.per_ms));
}

}  // namespace sluice::control
