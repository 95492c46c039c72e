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

// Sluice Logging - Header
// Process-wide quill logger, level parsing and request id generation

#pragma once

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/Logger.h>
#include <quill/LogMacros.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>
#include <quill/sinks/RotatingJsonFileSink.h>

#include <string>
#include <string_view>

// Forward declaration to avoid circular dependency
namespace sluice::control {
struct LogConfig;
}

namespace sluice::logging {

// Start the quill backend thread (idempotent)
void init_logging_system();

// Build the "sluice" logger from config and make it the process logger
quill::Logger* init_logger(const sluice::control::LogConfig& config);

// Flush and stop the backend (called at exit)
void shutdown_logging();

// Process logger. Falls back to a console logger at warning level when
// init_logger() was never called, so library code can always log.
quill::Logger* get_logger();

// Parse "debug", "info", "warning"/"warn", "error" (case-insensitive);
// anything else maps to info
quill::LogLevel parse_level(std::string_view level);

// Request id: UUID v4 base (once per thread) + "#counter"
std::string generate_request_id();

// Validate request id format ({uuid}#{counter})
bool is_valid_request_id(std::string_view id);

// Structured failure logging with correlation ids
#define SLUICE_LOG_FAILURE(logger, message, request_id, error)                          \
    LOG_WARNING(logger, "{}: request_id={}, error_code={}, error_detail={}", message, \
                request_id, (error).code().value(), (error).what())

}  // namespace sluice::logging
