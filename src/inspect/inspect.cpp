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

// Sluice Inspect - Implementation

#include "inspect.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iterator>
#include <span>

#include "../core/logging.hpp"

namespace sluice::inspect {

using flow::Error;
using flow::Request;
using flow::Response;

namespace {

constexpr size_t kBinaryPreviewBytes = 20;

/// Length of the UTF-8 sequence starting with lead, 0 if lead is not a valid lead byte
size_t utf8_sequence_length(uint8_t lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return lead >= 0xC2 ? 2 : 0;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return lead <= 0xF4 ? 4 : 0;
    return 0;
}

bool is_printable(std::string_view data) noexcept {
    size_t i = 0;
    while (i < data.size()) {
        auto c = static_cast<uint8_t>(data[i]);
        size_t len = utf8_sequence_length(c);
        if (len == 0 || i + len > data.size()) {
            return false;
        }
        if (len == 1) {
            bool whitespace = c == '\t' || c == '\n' || c == '\r';
            if ((c < 0x20 || c == 0x7F) && !whitespace) {
                return false;
            }
        } else {
            for (size_t k = 1; k < len; ++k) {
                if ((static_cast<uint8_t>(data[i + k]) & 0xC0) != 0x80) {
                    return false;
                }
            }
        }
        i += len;
    }
    return true;
}

std::string hex(std::string_view data) {
    std::string out;
    out.reserve(data.size() * 2);
    for (char c : data) {
        fmt::format_to(std::back_inserter(out), "{:02x}", static_cast<uint8_t>(c));
    }
    return out;
}

/// Counts bytes pulled through the wrapped reader
class CountingReader final : public core::Reader {
public:
    explicit CountingReader(core::Reader& inner) : inner_(inner) {}

    [[nodiscard]] Error read(std::span<uint8_t> buf, size_t& n) override {
        auto err = inner_.read(buf, n);
        count_ += n;
        return err;
    }

    [[nodiscard]] size_t count() const noexcept { return count_; }

private:
    core::Reader& inner_;
    size_t count_ = 0;
};

void emit(LogSink& sink, const flow::ContextPtr& ctx, std::string_view message,
          const std::vector<LogField>& fields) {
    try {
        sink.log(ctx, message, fields);
    } catch (const std::exception& e) {
        LOG_WARNING(logging::get_logger(), "Inspect sink failed: message={}, error={}", message,
                    e.what());
    } catch (...) {
        LOG_WARNING(logging::get_logger(),
                    "Inspect sink failed: message={}, error=non-standard exception", message);
    }
}

Error require_streams(const Request& req, const Response& res) {
    if (req.data == nullptr || res.data == nullptr) {
        return Error(core::errc::invalid_argument, "inspect requires input and output streams");
    }
    return {};
}

}  // namespace

void QuillSink::log(const flow::ContextPtr& ctx, std::string_view message,
                    const std::vector<LogField>& fields) {
    std::string rendered;
    for (const auto& field : fields) {
        fmt::format_to(std::back_inserter(rendered), " {}={}", field.key, field.value);
    }

    std::string_view request_id = ctx ? ctx->request_id() : std::string_view{};
    LOG_INFO(logging::get_logger(), "{}{} request_id={}", message, rendered, request_id);
}

std::shared_ptr<LogSink> default_sink() {
    static const std::shared_ptr<LogSink> sink = std::make_shared<QuillSink>();
    return sink;
}

std::string format_preview(std::string_view data) {
    if (data.empty()) {
        return "<empty>";
    }
    if (is_printable(data)) {
        return std::string(data);
    }
    if (data.size() > kBinaryPreviewBytes) {
        return fmt::format("binary data ({} bytes): {}...", data.size(),
                           hex(data.substr(0, kBinaryPreviewBytes)));
    }
    return fmt::format("binary data: {}", hex(data));
}

LogField format_duration(std::chrono::nanoseconds elapsed) {
    using std::chrono::duration_cast;

    if (elapsed < std::chrono::milliseconds(10)) {
        return {"duration_us",
                fmt::format("{}", duration_cast<std::chrono::microseconds>(elapsed).count())};
    }
    if (elapsed >= std::chrono::seconds(1)) {
        return {"duration_s",
                fmt::format("{:.3f}", std::chrono::duration<double>(elapsed).count())};
    }
    return {"duration_ms",
            fmt::format("{}", duration_cast<std::chrono::milliseconds>(elapsed).count())};
}

Inspector::Inspector(std::shared_ptr<LogSink> sink) : sink_(std::move(sink)) {}

flow::HandlerPtr Inspector::print(std::string prefix) const {
    return flow::make_handler(
        [sink = sink_, prefix = std::move(prefix)](Request& req, Response& res) -> Error {
            std::string data;
            if (auto err = flow::read_all(req, data)) {
                return err;
            }

            emit(*sink, req.context, fmt::format("[{}]", prefix),
                 {{"total_bytes", std::to_string(data.size())}, {"content", data}});
            return flow::write_all(res, data);
        },
        "inspect.print");
}

flow::HandlerPtr Inspector::head(std::string prefix, size_t bytes) const {
    return flow::make_handler(
        [sink = sink_, prefix = std::move(prefix), bytes](Request& req, Response& res) -> Error {
            if (auto err = require_streams(req, res)) {
                return err;
            }

            // Collect up to `bytes` bytes (or end of stream) before logging
            std::string first(bytes, '\0');
            size_t filled = 0;
            while (filled < bytes) {
                size_t n = 0;
                auto buf = std::span<uint8_t>(reinterpret_cast<uint8_t*>(first.data()) + filled,
                                              bytes - filled);
                if (auto err = req.data->read(buf, n)) {
                    return err;
                }
                if (n == 0) {
                    break;
                }
                filled += n;
            }
            first.resize(filled);

            emit(*sink, req.context, fmt::format("[{}]", prefix),
                 {{"preview", format_preview(first)}});

            if (auto err = flow::write_all(res, first)) {
                return err;
            }
            return core::copy(*res.data, *req.data);
        },
        "inspect.head");
}

flow::HandlerPtr Inspector::chunks(std::string prefix, size_t chunk_size) const {
    return flow::make_handler(
        [sink = sink_, prefix = std::move(prefix),
         chunk_size = std::max<size_t>(chunk_size, 1)](Request& req, Response& res) -> Error {
            if (auto err = require_streams(req, res)) {
                return err;
            }

            std::vector<uint8_t> buf(chunk_size);
            size_t chunk_num = 0;
            size_t total_bytes = 0;

            while (true) {
                size_t n = 0;
                if (auto err = req.data->read(buf, n)) {
                    return err;
                }
                if (n == 0) {
                    return {};
                }

                ++chunk_num;
                total_bytes += n;
                auto chunk = std::span<const uint8_t>(buf.data(), n);
                emit(*sink, req.context, fmt::format("[{}] Chunk {}", prefix, chunk_num),
                     {{"chunk_num", std::to_string(chunk_num)},
                      {"chunk_size", std::to_string(n)},
                      {"total_bytes", std::to_string(total_bytes)},
                      {"data", format_preview(core::as_string_view(chunk))}});

                if (auto err = res.data->write(chunk)) {
                    return err;
                }
            }
        },
        "inspect.chunks");
}

flow::HandlerPtr Inspector::timing(std::string prefix, flow::HandlerPtr handler) const {
    return flow::make_handler(
        [sink = sink_, prefix = std::move(prefix),
         handler = std::move(handler)](Request& req, Response& res) -> Error {
            if (req.data == nullptr) {
                return Error(core::errc::invalid_argument, "inspect requires an input stream");
            }

            auto start = std::chrono::steady_clock::now();

            CountingReader counted(*req.data);
            Request wrapped{req.context, &counted};
            auto err = flow::call_handler(*handler, wrapped, res);

            auto elapsed = std::chrono::steady_clock::now() - start;
            std::vector<LogField> fields{format_duration(elapsed),
                                         {"bytes", std::to_string(counted.count())}};
            double seconds = std::chrono::duration<double>(elapsed).count();
            if (counted.count() > 0 && seconds > 0) {
                fields.push_back({"bytes_per_sec",
                                  fmt::format("{:.1f}", static_cast<double>(counted.count()) / seconds)});
            }
            emit(*sink, req.context, fmt::format("[{}] completed", prefix), fields);

            return err;
        },
        "inspect.timing");
}

flow::HandlerPtr print(std::string prefix) {
    return Inspector(default_sink()).print(std::move(prefix));
}

flow::HandlerPtr head(std::string prefix, size_t bytes) {
    return Inspector(default_sink()).head(std::move(prefix), bytes);
}

flow::HandlerPtr chunks(std::string prefix, size_t chunk_size) {
    return Inspector(default_sink()).chunks(std::move(prefix), chunk_size);
}

flow::HandlerPtr timing(std::string prefix, flow::HandlerPtr handler) {
    return Inspector(default_sink()).timing(std::move(prefix), std::move(handler));
}

}  // namespace sluice::inspect
