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

// Sluice Logging - Implementation

#include "logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iterator>
#include <mutex>
#include <random>
#include <system_error>

#include "../control/config.hpp"

namespace sluice::logging {

namespace {

std::atomic<quill::Logger*> g_logger{nullptr};
std::once_flag g_backend_once;
std::mutex g_init_mutex;

constexpr const char* kLoggerName = "sluice";
constexpr const char* kDefaultLoggerName = "sluice_default";  // Before init_logger()

// Generate base UUID v4 (called once per thread)
std::string generate_base_uuid() {
    // XOR combines hardware randomness with timestamp for thread-unique seed
    std::mt19937 rng(std::random_device{}() ^
                     static_cast<uint32_t>(
                         std::chrono::steady_clock::now().time_since_epoch().count()));
    std::uniform_int_distribution<uint32_t> dist;

    std::array<uint8_t, 16> uuid_bytes{};
    for (size_t i = 0; i < uuid_bytes.size(); i += 4) {
        uint32_t random_val = dist(rng);
        uuid_bytes[i] = static_cast<uint8_t>(random_val & 0xFF);
        uuid_bytes[i + 1] = static_cast<uint8_t>((random_val >> 8) & 0xFF);
        uuid_bytes[i + 2] = static_cast<uint8_t>((random_val >> 16) & 0xFF);
        uuid_bytes[i + 3] = static_cast<uint8_t>((random_val >> 24) & 0xFF);
    }

    // Version 4, RFC4122 variant
    uuid_bytes[6] = (uuid_bytes[6] & 0x0F) | 0x40;
    uuid_bytes[8] = (uuid_bytes[8] & 0x3F) | 0x80;

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < uuid_bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        fmt::format_to(std::back_inserter(out), "{:02x}", uuid_bytes[i]);
    }
    return out;
}

quill::Logger* create_console_logger(const char* name, quill::LogLevel level) {
    auto sink = quill::Frontend::create_or_get_sink<quill::ConsoleSink>("sluice_console");
    quill::Logger* logger = quill::Frontend::create_or_get_logger(name, std::move(sink));
    logger->set_log_level(level);
    return logger;
}

}  // namespace

void init_logging_system() {
    std::call_once(g_backend_once, [] { quill::Backend::start(); });
}

quill::Logger* init_logger(const control::LogConfig& log_config) {
    init_logging_system();

    std::lock_guard<std::mutex> lock(g_init_mutex);

    quill::Logger* logger = nullptr;

    std::error_code ec;
    if (!log_config.output.empty()) {
        std::filesystem::create_directories(log_config.output, ec);
    }

    if (log_config.output.empty() || ec) {
        logger = create_console_logger(kLoggerName, parse_level(log_config.level));
        if (ec) {
            LOG_WARNING(logger, "Cannot create log directory {}, logging to console: {}",
                        log_config.output, ec.message());
        }
    } else {
        quill::RotatingFileSinkConfig config;
        config.set_rotation_max_file_size(log_config.rotation.max_size_mb * 1'000'000ULL);
        config.set_max_backup_files(log_config.rotation.max_files);
        config.set_open_mode('a');

        if (log_config.format == "json") {
            auto json_sink = quill::Frontend::create_or_get_sink<quill::RotatingJsonFileSink>(
                fmt::format("{}/sluice.json", log_config.output), config);
            logger = quill::Frontend::create_or_get_logger(kLoggerName, std::move(json_sink));
        } else {
            auto file_sink = quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
                fmt::format("{}/sluice.log", log_config.output), config);
            logger = quill::Frontend::create_or_get_logger(kLoggerName, std::move(file_sink));
        }

        logger->set_log_level(parse_level(log_config.level));
    }

    g_logger.store(logger, std::memory_order_release);
    return logger;
}

void shutdown_logging() {
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        logger->flush_log();
    }
    quill::Backend::stop();
}

quill::Logger* get_logger() {
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        return logger;
    }

    init_logging_system();

    std::lock_guard<std::mutex> lock(g_init_mutex);
    if (auto* logger = g_logger.load(std::memory_order_acquire)) {
        return logger;
    }
    auto* logger = create_console_logger(kDefaultLoggerName, quill::LogLevel::Warning);
    g_logger.store(logger, std::memory_order_release);
    return logger;
}

quill::LogLevel parse_level(std::string_view level) {
    std::string level_lower{level};
    std::transform(level_lower.begin(), level_lower.end(), level_lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (level_lower == "debug") {
        return quill::LogLevel::Debug;
    }
    if (level_lower == "info") {
        return quill::LogLevel::Info;
    }
    if (level_lower == "warning" || level_lower == "warn") {
        return quill::LogLevel::Warning;
    }
    if (level_lower == "error") {
        return quill::LogLevel::Error;
    }
    return quill::LogLevel::Info;
}

std::string generate_request_id() {
    // Format: {base_uuid}#{counter}
    static thread_local std::string base_uuid = generate_base_uuid();
    static thread_local uint64_t counter = 0;

    return fmt::format("{}#{}", base_uuid, counter++);
}

bool is_valid_request_id(std::string_view id) {
    size_t hash_pos = id.rfind('#');
    if (hash_pos == std::string_view::npos) {
        return false;
    }

    std::string_view uuid_part = id.substr(0, hash_pos);
    std::string_view counter_part = id.substr(hash_pos + 1);

    // 8-4-4-4-12 with hyphens
    if (uuid_part.length() != 36) {
        return false;
    }
    if (uuid_part[8] != '-' || uuid_part[13] != '-' || uuid_part[18] != '-' ||
        uuid_part[23] != '-') {
        return false;
    }

    // Version 4, RFC4122 variant
    if (uuid_part[14] != '4') {
        return false;
    }
    char variant = uuid_part[19];
    if (variant != '8' && variant != '9' && variant != 'a' && variant != 'b' &&
        variant != 'A' && variant != 'B') {
        return false;
    }

    auto is_hex = [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };
    for (size_t i = 0; i < uuid_part.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            continue;
        }
        if (!is_hex(uuid_part[i])) {
            return false;
        }
    }

    if (counter_part.empty()) {
        return false;
    }
    return std::all_of(counter_part.begin(), counter_part.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace sluice::logging
