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

// Sluice Pipe - Implementation

#include "pipe.hpp"

#include <algorithm>
#include <cstring>

namespace sluice::core {

Error PipeState::write(std::span<const uint8_t> data) {
    std::lock_guard<std::mutex> write_lock(write_mutex_);
    std::unique_lock<std::mutex> lock(mutex_);

    if (read_closed_) {
        return read_err_;
    }
    if (write_closed_) {
        return Error(errc::closed_pipe);
    }
    if (data.empty()) {
        return {};
    }

    pending_ = data;
    cv_.notify_all();

    // Hand-off: block until readers consumed everything or the pipe closed
    cv_.wait(lock, [this] { return pending_.empty() || read_closed_ || write_closed_; });

    if (!pending_.empty()) {
        pending_ = {};
        return read_closed_ ? read_err_ : Error(errc::closed_pipe);
    }
    return {};
}

Error PipeState::read(std::span<uint8_t> buf, size_t& n) {
    n = 0;
    if (buf.empty()) {
        return {};
    }

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !pending_.empty() || write_closed_ || read_closed_; });

    if (read_closed_) {
        return Error(errc::closed_pipe);
    }

    if (!pending_.empty()) {
        n = std::min(buf.size(), pending_.size());
        std::memcpy(buf.data(), pending_.data(), n);
        pending_ = pending_.subspan(n);
        if (pending_.empty()) {
            cv_.notify_all();  // Release the blocked writer
        }
        return {};
    }

    // Writer closed and nothing pending
    return write_err_;
}

void PipeState::close_write(Error err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (write_closed_) {
        return;
    }
    write_closed_ = true;
    write_err_ = std::move(err);
    cv_.notify_all();
}

void PipeState::close_read(Error err) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_closed_) {
        return;
    }
    read_closed_ = true;
    read_err_ = err ? std::move(err) : Error(errc::closed_pipe);
    cv_.notify_all();
}

Pipe make_pipe() {
    auto state = std::make_shared<PipeState>();
    return Pipe{std::make_shared<PipeReader>(state), std::make_shared<PipeWriter>(state)};
}

}  // namespace sluice::core
