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

// Sluice Inspect - Header
// Pass-through handlers that log what flows through a pipeline stage

#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../flow/handler.hpp"

namespace sluice::inspect {

/// Structured key/value attached to an inspection record
struct LogField {
    std::string key;
    std::string value;
};

/// Destination for inspection records
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void log(const flow::ContextPtr& ctx, std::string_view message,
                     const std::vector<LogField>& fields) = 0;
};

/// Sink writing info-level records to the sluice quill logger
class QuillSink : public LogSink {
public:
    void log(const flow::ContextPtr& ctx, std::string_view message,
             const std::vector<LogField>& fields) override;
};

/// Shared QuillSink used by the free functions below
[[nodiscard]] std::shared_ptr<LogSink> default_sink();

/// Printable text is returned as is, anything else as a short hex summary
[[nodiscard]] std::string format_preview(std::string_view data);

/// Choose the duration field name and value (microseconds under 10ms, seconds from 1s)
[[nodiscard]] LogField format_duration(std::chrono::nanoseconds elapsed);

/// Builds inspection handlers bound to one sink.
/// Every handler passes its input through unchanged; a throwing sink is
/// logged and ignored.
class Inspector {
public:
    explicit Inspector(std::shared_ptr<LogSink> sink);

    /// Buffer everything, log total_bytes and the full content
    [[nodiscard]] flow::HandlerPtr print(std::string prefix) const;

    /// Log a preview of the first `bytes` bytes, then stream the rest
    [[nodiscard]] flow::HandlerPtr head(std::string prefix, size_t bytes) const;

    /// Log every chunk (up to chunk_size bytes) as it streams
    [[nodiscard]] flow::HandlerPtr chunks(std::string prefix, size_t chunk_size) const;

    /// Wrap handler and log its duration, bytes read and throughput
    [[nodiscard]] flow::HandlerPtr timing(std::string prefix, flow::HandlerPtr handler) const;

private:
    std::shared_ptr<LogSink> sink_;
};

[[nodiscard]] flow::HandlerPtr print(std::string prefix);
[[nodiscard]] flow::HandlerPtr head(std::string prefix, size_t bytes);
[[nodiscard]] flow::HandlerPtr chunks(std::string prefix, size_t chunk_size);
[[nodiscard]] flow::HandlerPtr timing(std::string prefix, flow::HandlerPtr handler);

}  // namespace sluice::inspect
