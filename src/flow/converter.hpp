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

// Sluice Converters - Header
// Typed input sources and output destinations at the flow boundary

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../core/error.hpp"
#include "../core/stream.hpp"

namespace sluice::flow {

using core::Error;

/// Turns a typed value into a readable stream (structured formats etc.)
class InputConverter {
public:
    virtual ~InputConverter() = default;

    [[nodiscard]] virtual Error to_reader(std::unique_ptr<core::Reader>& out) = 0;
};

/// Turns the final stream back into a typed value
class OutputConverter {
public:
    virtual ~OutputConverter() = default;

    [[nodiscard]] virtual Error from_reader(core::Reader& reader) = 0;
};

/// Flow input: owned bytes, a caller-owned or shared reader, or a custom converter.
///
/// A borrowed reader or converter must stay valid until any read in flight
/// when a run is aborted has returned (for example by closing it); no
/// further calls are made after the abort.
class Input {
public:
    Input(std::string data);                   // NOLINT(google-explicit-constructor)
    Input(std::string_view data);              // NOLINT(google-explicit-constructor)
    Input(const char* data);                   // NOLINT(google-explicit-constructor)
    Input(const std::vector<uint8_t>& data);   // NOLINT(google-explicit-constructor)
    Input(core::Reader& reader);               // NOLINT(google-explicit-constructor)
    Input(std::shared_ptr<core::Reader> reader);  // NOLINT(google-explicit-constructor)
    Input(InputConverter& converter);          // NOLINT(google-explicit-constructor)

    /// Open the input as a stream. Called once per run.
    [[nodiscard]] Error open(std::shared_ptr<core::Reader>& out);

    /// True if the opened stream touches caller-owned objects
    [[nodiscard]] bool borrowed() const noexcept {
        return kind_ == Kind::Reader || kind_ == Kind::Converter;
    }

private:
    enum class Kind : uint8_t { Bytes, Reader, SharedReader, Converter };

    Kind kind_;
    std::string bytes_;
    core::Reader* reader_ = nullptr;
    std::shared_ptr<core::Reader> shared_reader_;
    InputConverter* converter_ = nullptr;
};

/// Flow output: an in-memory destination, a caller-owned writer, or a custom converter.
/// After an aborted run a write already in flight on a caller-owned writer
/// may still complete; the writer must stay valid until it returns.
class Output {
public:
    Output(std::string& out);             // NOLINT(google-explicit-constructor)
    Output(std::vector<uint8_t>& out);    // NOLINT(google-explicit-constructor)
    Output(core::Writer& writer);         // NOLINT(google-explicit-constructor)
    Output(OutputConverter& converter);   // NOLINT(google-explicit-constructor)

    /// Drain reader into the destination. In-memory destinations are staged
    /// into `staging` and only published by commit() once the run succeeded.
    [[nodiscard]] Error collect(core::Reader& reader, std::string& staging);

    /// Publish staged bytes (no-op for writers and converters)
    void commit(std::string staging);

private:
    enum class Kind : uint8_t { String, Vector, Writer, Converter };

    Kind kind_;
    std::string* string_ = nullptr;
    std::vector<uint8_t>* vector_ = nullptr;
    core::Writer* writer_ = nullptr;
    OutputConverter* converter_ = nullptr;
};

}  // namespace sluice::flow
