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

// Sluice Streams - Implementation

#include "stream.hpp"

#include <algorithm>
#include <array>
#include <cstring>

namespace sluice::core {

Error StringReader::read(std::span<uint8_t> buf, size_t& n) {
    n = std::min(buf.size(), data_.size() - offset_);
    if (n > 0) {
        std::memcpy(buf.data(), data_.data() + offset_, n);
        offset_ += n;
    }
    return {};
}

Error BytesReader::read(std::span<uint8_t> buf, size_t& n) {
    n = std::min(buf.size(), data_.size());
    if (n > 0) {
        std::memcpy(buf.data(), data_.data(), n);
        data_.remove_prefix(n);
    }
    return {};
}

Error StringWriter::write(std::span<const uint8_t> data) {
    data_.append(reinterpret_cast<const char*>(data.data()), data.size());
    return {};
}

Error copy(Writer& dst, Reader& src, size_t* copied) {
    std::array<uint8_t, kCopyBufferSize> buffer{};
    size_t total = 0;

    while (true) {
        size_t n = 0;
        if (auto err = src.read(buffer, n)) {
            if (copied != nullptr) {
                *copied = total;
            }
            return err;
        }
        if (n == 0) {
            break;  // End of stream
        }
        if (auto err = dst.write(std::span<const uint8_t>(buffer.data(), n))) {
            if (copied != nullptr) {
                *copied = total;
            }
            return err;
        }
        total += n;
    }

    if (copied != nullptr) {
        *copied = total;
    }
    return {};
}

Error read_all(Reader& src, std::string& out) {
    std::array<uint8_t, kCopyBufferSize> buffer{};

    while (true) {
        size_t n = 0;
        if (auto err = src.read(buffer, n)) {
            return err;
        }
        if (n == 0) {
            return {};
        }
        out.append(reinterpret_cast<const char*>(buffer.data()), n);
    }
}

Error write_all(Writer& dst, std::string_view data) {
    if (data.empty()) {
        return {};
    }
    return dst.write(as_bytes(data));
}

Error drain(Reader& src) {
    std::array<uint8_t, kCopyBufferSize> buffer{};

    while (true) {
        size_t n = 0;
        if (auto err = src.read(buffer, n)) {
            return err;
        }
        if (n == 0) {
            return {};
        }
    }
}

}  // namespace sluice::core
