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

// Sluice Converters - Implementation

#include "converter.hpp"

namespace sluice::flow {

Input::Input(std::string data) : kind_(Kind::Bytes), bytes_(std::move(data)) {}

Input::Input(std::string_view data) : kind_(Kind::Bytes), bytes_(data) {}

Input::Input(const char* data) : kind_(Kind::Bytes), bytes_(data != nullptr ? data : "") {}

Input::Input(const std::vector<uint8_t>& data)
    : kind_(Kind::Bytes)
    , bytes_(data.begin(), data.end()) {}

Input::Input(core::Reader& reader) : kind_(Kind::Reader), reader_(&reader) {}

Input::Input(std::shared_ptr<core::Reader> reader)
    : kind_(Kind::SharedReader)
    , shared_reader_(std::move(reader)) {}

Input::Input(InputConverter& converter) : kind_(Kind::Converter), converter_(&converter) {}

Error Input::open(std::shared_ptr<core::Reader>& out) {
    switch (kind_) {
        case Kind::Bytes:
            out = std::make_shared<core::StringReader>(std::move(bytes_));
            return {};

        case Kind::Reader:
            // Non-owning: the caller keeps the reader alive for the run
            out = std::shared_ptr<core::Reader>(reader_, [](core::Reader*) {});
            return {};

        case Kind::SharedReader:
            if (!shared_reader_) {
                return Error(core::errc::invalid_argument, "input reader is null");
            }
            out = shared_reader_;
            return {};

        case Kind::Converter: {
            std::unique_ptr<core::Reader> reader;
            if (auto err = converter_->to_reader(reader)) {
                return core::wrap(std::move(err), "input conversion failed");
            }
            if (!reader) {
                return Error(core::errc::invalid_argument, "input converter produced no reader");
            }
            out = std::move(reader);
            return {};
        }
    }
    return Error(core::errc::invalid_argument, "unsupported input type");
}

Output::Output(std::string& out) : kind_(Kind::String), string_(&out) {}

Output::Output(std::vector<uint8_t>& out) : kind_(Kind::Vector), vector_(&out) {}

Output::Output(core::Writer& writer) : kind_(Kind::Writer), writer_(&writer) {}

Output::Output(OutputConverter& converter) : kind_(Kind::Converter), converter_(&converter) {}

Error Output::collect(core::Reader& reader, std::string& staging) {
    switch (kind_) {
        case Kind::String:
        case Kind::Vector:
            return core::read_all(reader, staging);

        case Kind::Writer:
            return core::copy(*writer_, reader);

        case Kind::Converter:
            if (auto err = converter_->from_reader(reader)) {
                return core::wrap(std::move(err), "output conversion failed");
            }
            return {};
    }
    return Error(core::errc::invalid_argument, "unsupported output type");
}

void Output::commit(std::string staging) {
    switch (kind_) {
        case Kind::String:
            *string_ = std::move(staging);
            break;
        case Kind::Vector:
            vector_->assign(staging.begin(), staging.end());
            break;
        case Kind::Writer:
        case Kind::Converter:
            break;
    }
}

}  // namespace sluice::flow
