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

// Sluice Batch - Implementation

#include "batch.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "../core/logging.hpp"

namespace sluice::ctrl {

using core::errc;
using flow::Error;

namespace {

/// One caller's slot in a batch; the loop fills it exactly once
struct PendingRequest {
    std::string input;
    flow::ContextPtr context;

    std::mutex mutex;
    std::condition_variable cv;
    bool ready = false;
    std::string output;
    Error err;

    void deliver(std::string data, Error error) {
        std::lock_guard<std::mutex> lock(mutex);
        if (ready) {
            return;
        }
        ready = true;
        output = std::move(data);
        err = std::move(error);
        cv.notify_all();
    }
};

using PendingPtr = std::shared_ptr<PendingRequest>;

}  // namespace

struct BatchHandler::State {
    HandlerPtr handler;
    BatchConfig config;
    size_t queue_capacity = 0;

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<PendingPtr> queue;  // Submitted, not yet taken into a window
    bool stopping = false;

    std::atomic<uint64_t> batches{0};

    /// Combined calls run under this context; stop() cancels it
    core::ContextPtr context = core::Context::with_cancel(core::Context::background());

    void flush(std::vector<PendingPtr>& window);
};

std::vector<std::string> split_batch(std::string_view data, std::string_view separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        parts.emplace_back(data);
        return parts;
    }

    size_t start = 0;
    while (true) {
        size_t pos = data.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(data.substr(start));
            return parts;
        }
        parts.emplace_back(data.substr(start, pos - start));
        start = pos + separator.size();
    }
}

void BatchHandler::State::flush(std::vector<PendingPtr>& window) {
    // Callers that already gave up are left out of the combined call
    std::erase_if(window, [](const PendingPtr& pending) {
        if (!pending->context->done()) {
            return false;
        }
        pending->deliver({}, pending->context->err());
        return true;
    });
    if (window.empty()) {
        return;
    }

    size_t total_size = (window.size() - 1) * config.separator.size();
    for (const auto& pending : window) {
        total_size += pending->input.size();
    }

    std::string combined;
    combined.reserve(total_size);
    for (size_t i = 0; i < window.size(); ++i) {
        if (i > 0) {
            combined += config.separator;
        }
        combined += window[i]->input;
    }

    auto* logger = logging::get_logger();
    batches.fetch_add(1, std::memory_order_relaxed);
    LOG_DEBUG(logger, "Flushing batch: requests={}, bytes={}", window.size(), combined.size());

    std::string output;
    auto err = flow::invoke(*handler, context, combined, output);

    if (err) {
        if (context->done()) {
            err = core::wrap(std::move(err), errc::batch_closed, "batcher stopped during flush");
        }
        for (auto& pending : window) {
            pending->deliver({}, err);
        }
        return;
    }

    auto parts = split_batch(output, config.separator);
    if (parts.size() != window.size()) {
        LOG_WARNING(logger, "Batch response splitting failed: expected {} parts, got {}",
                    window.size(), parts.size());
        window.front()->deliver(std::move(output), {});
        for (size_t i = 1; i < window.size(); ++i) {
            window[i]->deliver({}, Error(errc::batch_split_failed));
        }
        return;
    }

    for (size_t i = 0; i < window.size(); ++i) {
        window[i]->deliver(std::move(parts[i]), {});
    }
}

void BatchHandler::run_loop(const std::shared_ptr<State>& state) {
    std::vector<PendingPtr> window;
    std::optional<std::chrono::steady_clock::time_point> flush_at;  // Unarmed while window is empty

    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        auto has_work = [&state] { return state->stopping || !state->queue.empty(); };
        if (flush_at) {
            state->cv.wait_until(lock, *flush_at, has_work);
        } else {
            state->cv.wait(lock, has_work);
        }

        if (state->stopping) {
            break;
        }

        while (!state->queue.empty()) {
            window.push_back(std::move(state->queue.front()));
            state->queue.pop_front();
            state->cv.notify_all();  // Queue space freed

            if (window.size() == 1) {
                flush_at = std::chrono::steady_clock::now() + state->config.max_wait;
            }

            if (window.size() >= state->config.max_size) {
                flush_at.reset();
                lock.unlock();
                state->flush(window);
                window.clear();
                lock.lock();
            }
        }

        if (flush_at && std::chrono::steady_clock::now() >= *flush_at) {
            flush_at.reset();
            lock.unlock();
            state->flush(window);
            window.clear();
            lock.lock();
        }
    }

    // Shutting down: nobody will process what is left
    std::deque<PendingPtr> leftover;
    leftover.swap(state->queue);
    lock.unlock();

    for (auto& pending : window) {
        pending->deliver({}, Error(errc::batch_closed));
    }
    for (auto& pending : leftover) {
        pending->deliver({}, Error(errc::batch_closed));
    }
}

BatchHandler::BatchHandler(HandlerPtr handler, BatchConfig config)
    : state_(std::make_shared<State>()) {
    state_->handler = std::move(handler);
    state_->config = std::move(config);
    state_->config.max_size = std::max<size_t>(state_->config.max_size, 1);
    state_->config.max_wait = std::max(state_->config.max_wait, std::chrono::milliseconds(0));
    state_->queue_capacity = state_->config.max_size * 2;

    worker_ = std::thread(run_loop, state_);
}

BatchHandler::~BatchHandler() {
    stop();
}

void BatchHandler::stop() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->stopping = true;
        state_->cv.notify_all();
    }
    state_->context->cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

uint64_t BatchHandler::batches_flushed() const noexcept {
    return state_->batches.load(std::memory_order_relaxed);
}

const BatchConfig& BatchHandler::config() const noexcept {
    return state_->config;
}

Error BatchHandler::serve_flow(flow::Request& req, flow::Response& res) {
    auto ctx = req.context ? req.context : core::Context::background();

    auto pending = std::make_shared<PendingRequest>();
    pending->context = ctx;
    if (auto err = flow::read_all(req, pending->input)) {
        return err;
    }

    // Submit (bounded queue: blocks while the loop is behind)
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        bool admitted = ctx->wait_on(state_, lock, state_->cv, [this] {
            return state_->stopping || state_->queue.size() < state_->queue_capacity;
        });
        if (!admitted) {
            return ctx->err();
        }
        if (state_->stopping) {
            return Error(errc::batch_closed);
        }
        state_->queue.push_back(pending);
        state_->cv.notify_all();
    }

    // Await this request's share of the batch
    std::string output;
    {
        std::unique_lock<std::mutex> lock(pending->mutex);
        if (!ctx->wait_on(pending, lock, pending->cv, [&pending] { return pending->ready; })) {
            return ctx->err();
        }
        if (pending->err) {
            return pending->err;
        }
        output = std::move(pending->output);
    }

    return flow::write_all(res, output);
}

std::shared_ptr<BatchHandler> batch(HandlerPtr handler, size_t max_size,
                                    std::chrono::milliseconds max_wait) {
    BatchConfig config;
    config.max_size = max_size;
    config.max_wait = max_wait;
    return batch(std::move(handler), std::move(config));
}

std::shared_ptr<BatchHandler> batch(HandlerPtr handler, BatchConfig config) {
    return std::make_shared<BatchHandler>(std::move(handler), std::move(config));
}

}  // namespace sluice::ctrl
