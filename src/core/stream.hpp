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

// Sluice Streams - Header
// Byte stream interfaces and in-memory readers/writers

#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace sluice::core {

/// Default chunk size for stream copies
constexpr size_t kCopyBufferSize = 32 * 1024;

/// Readable byte stream
class Reader {
public:
    virtual ~Reader() = default;

    /// Read up to buf.size() bytes into buf (buf must not be empty).
    /// Sets n to the number of bytes read; n == 0 with no error means end of stream.
    [[nodiscard]] virtual Error read(std::span<uint8_t> buf, size_t& n) = 0;
};

/// Writable byte stream
class Writer {
public:
    virtual ~Writer() = default;

    /// Write all of data or fail
    [[nodiscard]] virtual Error write(std::span<const uint8_t> data) = 0;
};

/// Reader over an owned byte string
class StringReader final : public Reader {
public:
    explicit StringReader(std::string data) : data_(std::move(data)) {}

    [[nodiscard]] Error read(std::span<uint8_t> buf, size_t& n) override;

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - offset_; }

private:
    std::string data_;
    size_t offset_ = 0;
};

/// Reader over borrowed bytes (caller keeps them alive)
class BytesReader final : public Reader {
public:
    explicit BytesReader(std::string_view data) : data_(data) {}

    [[nodiscard]] Error read(std::span<uint8_t> buf, size_t& n) override;

private:
    std::string_view data_;
};

/// Writer appending to an owned byte string
class StringWriter final : public Writer {
public:
    StringWriter() = default;

    [[nodiscard]] Error write(std::span<const uint8_t> data) override;

    [[nodiscard]] const std::string& str() const noexcept { return data_; }
    [[nodiscard]] std::string take() noexcept { return std::move(data_); }
    [[nodiscard]] size_t size() const noexcept { return data_.size(); }

private:
    std::string data_;
};

/// Copy everything from src to dst. Returns the first read or write error.
[[nodiscard]] Error copy(Writer& dst, Reader& src, size_t* copied = nullptr);

/// Read src to end of stream, appending to out
[[nodiscard]] Error read_all(Reader& src, std::string& out);

[[nodiscard]] Error write_all(Writer& dst, std::string_view data);

/// Read and discard src to end of stream
[[nodiscard]] Error drain(Reader& src);

[[nodiscard]] inline std::span<const uint8_t> as_bytes(std::string_view data) noexcept {
    return {reinterpret_cast<const uint8_t*>(data.data()), data.size()};
}

[[nodiscard]] inline std::string_view as_string_view(std::span<const uint8_t> data) noexcept {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

}  // namespace sluice::core
