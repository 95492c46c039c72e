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

// Sluice Pipe - Header
// Synchronous zero-capacity byte pipe connecting two pipeline stages

#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <span>
#include <utility>

#include "stream.hpp"

namespace sluice::core {

/// Shared state of one pipe.
///
/// A write publishes its span and blocks until readers have consumed every
/// byte, so a slow reader throttles the writer (no internal buffering).
/// Writes are serialized; reads see bytes in write order.
class PipeState {
public:
    PipeState() = default;

    // Non-copyable, non-movable
    PipeState(const PipeState&) = delete;
    PipeState& operator=(const PipeState&) = delete;

    [[nodiscard]] Error write(std::span<const uint8_t> data);
    [[nodiscard]] Error read(std::span<uint8_t> buf, size_t& n);

    /// Writer side close. Reads drain pending bytes then see `err`
    /// (end of stream when err is success).
    void close_write(Error err = {});

    /// Reader side close. Pending and future writes fail with `err`
    /// (errc::closed_pipe when err is success).
    void close_read(Error err = {});

private:
    std::mutex write_mutex_;  // Serializes concurrent writers

    std::mutex mutex_;
    std::condition_variable cv_;
    std::span<const uint8_t> pending_;
    bool write_closed_ = false;
    bool read_closed_ = false;
    Error write_err_;
    Error read_err_;
};

/// Read end of a pipe
class PipeReader final : public Reader {
public:
    explicit PipeReader(std::shared_ptr<PipeState> state) : state_(std::move(state)) {}
    ~PipeReader() override = default;

    // Non-copyable, movable
    PipeReader(const PipeReader&) = delete;
    PipeReader& operator=(const PipeReader&) = delete;
    PipeReader(PipeReader&&) noexcept = default;
    PipeReader& operator=(PipeReader&&) noexcept = default;

    [[nodiscard]] Error read(std::span<uint8_t> buf, size_t& n) override {
        return state_->read(buf, n);
    }

    void close(Error err = {}) { state_->close_read(std::move(err)); }

private:
    std::shared_ptr<PipeState> state_;
};

/// Write end of a pipe (closes the pipe on destruction)
class PipeWriter final : public Writer {
public:
    explicit PipeWriter(std::shared_ptr<PipeState> state) : state_(std::move(state)) {}
    ~PipeWriter() override {
        if (state_) {
            state_->close_write();
        }
    }

    // Non-copyable, movable
    PipeWriter(const PipeWriter&) = delete;
    PipeWriter& operator=(const PipeWriter&) = delete;
    PipeWriter(PipeWriter&&) noexcept = default;
    PipeWriter& operator=(PipeWriter&&) noexcept = default;

    [[nodiscard]] Error write(std::span<const uint8_t> data) override {
        return state_->write(data);
    }

    void close(Error err = {}) { state_->close_write(std::move(err)); }

private:
    std::shared_ptr<PipeState> state_;
};

/// Connected pipe ends
struct Pipe {
    std::shared_ptr<PipeReader> reader;
    std::shared_ptr<PipeWriter> writer;
};

[[nodiscard]] Pipe make_pipe();

}  // namespace sluice::core
