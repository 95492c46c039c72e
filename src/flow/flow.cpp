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

// Sluice Flow - Implementation

#include "flow.hpp"

#include <fmt/format.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <system_error>
#include <thread>

#include "../core/core.hpp"
#include "../core/logging.hpp"
#include "../core/pipe.hpp"

namespace sluice::flow {

/// Counting gate on handler tasks shared by every run of one flow.
/// A run takes the slots for all its stages at once, so stages never hold
/// a slot while waiting for a downstream stage to obtain one.
class ConcurrencyLimiter : public std::enable_shared_from_this<ConcurrencyLimiter> {
public:
    explicit ConcurrencyLimiter(size_t limit) : limit_(limit) {}

    /// Block until `count` slots are free together; false if the context finished first
    [[nodiscard]] bool acquire(const core::Context& ctx, size_t count) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!ctx.wait_on(shared_from_this(), lock, cv_,
                         [this, count] { return in_use_ + count <= limit_; })) {
            return false;
        }
        in_use_ += count;
        return true;
    }

    void release(size_t count = 1) {
        std::lock_guard<std::mutex> lock(mutex_);
        in_use_ -= count;
        cv_.notify_all();
    }

    [[nodiscard]] size_t limit() const noexcept { return limit_; }

private:
    const size_t limit_;
    size_t in_use_ = 0;
    std::mutex mutex_;
    std::condition_variable cv_;
};

namespace {

/// State of one run, shared with every task it spawns
struct RunState {
    std::mutex mutex;
    std::condition_variable cv;

    size_t pending_handlers = 0;
    bool failed = false;
    Error first_error;

    bool collector_done = false;
    Error collector_error;
    std::string staging;

    /// Set once run() has given up; borrowed streams are not touched after this
    std::atomic<bool> aborted{false};

    /// pipes[0] feeds handler 0, pipes[i + 1] carries handler i's output
    std::vector<core::Pipe> pipes;

    void report_error(Error err) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!failed) {
            failed = true;
            first_error = std::move(err);
        }
        cv.notify_all();
    }

    /// Close both ends of every pipe so blocked stages return
    void close_all(const Error& err) {
        for (auto& pipe : pipes) {
            pipe.writer->close(err);
            pipe.reader->close(err);
        }
    }
};

/// Stops delegating to a caller-owned reader once the run is aborted
class AbortableReader final : public core::Reader {
public:
    AbortableReader(std::shared_ptr<core::Reader> inner, std::shared_ptr<RunState> state)
        : inner_(std::move(inner)), state_(std::move(state)) {}

    [[nodiscard]] Error read(std::span<uint8_t> buf, size_t& n) override {
        if (state_->aborted.load(std::memory_order_acquire)) {
            n = 0;
            return Error(core::errc::cancelled, "flow run aborted");
        }
        return inner_->read(buf, n);
    }

private:
    std::shared_ptr<core::Reader> inner_;
    std::shared_ptr<RunState> state_;
};

void run_handler(const std::shared_ptr<RunState>& state, size_t index, const HandlerPtr& handler,
                 const ContextPtr& ctx, const std::shared_ptr<ConcurrencyLimiter>& limiter) {
    auto& input = state->pipes[index].reader;
    auto& output = state->pipes[index + 1].writer;

    Request req{ctx, input.get()};
    Response res{output.get()};
    auto err = call_handler(*handler, req, res);
    if (limiter) {
        limiter->release();
    }

    if (err) {
        state->report_error(err);
    }

    // Downstream sees end of stream whichever way the handler returned
    output->close();

    if (err) {
        input->close(err);
    } else if (auto drain_err = core::drain(*input)) {
        // Upstream failed after this stage finished; it reports its own error
        LOG_DEBUG(logging::get_logger(), "Stage {} input ended with error: request_id={}, error={}",
                  index, ctx->request_id(), drain_err.what());
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    --state->pending_handlers;
    state->cv.notify_all();
}

}  // namespace

Flow::Flow() : Flow(FlowConfig{}) {}

Flow::Flow(FlowConfig config) : config_(config) {
    size_t limit = 0;
    if (config_.max_concurrent > 0) {
        limit = static_cast<size_t>(config_.max_concurrent);
    } else if (config_.max_concurrent == kConcurrencyAuto) {
        int multiplier = config_.cpu_multiplier > 0 ? config_.cpu_multiplier : kDefaultCpuMultiplier;
        limit = static_cast<size_t>(core::get_cpu_count()) * static_cast<size_t>(multiplier);
    }

    if (limit > 0) {
        limiter_ = std::make_shared<ConcurrencyLimiter>(limit);
    }
}

Flow& Flow::use(HandlerPtr handler) {
    handlers_.push_back(std::move(handler));
    return *this;
}

Flow& Flow::use(HandlerFunc func, std::string name) {
    return use(make_handler(std::move(func), std::move(name)));
}

size_t Flow::concurrency_limit() const noexcept {
    return limiter_ ? limiter_->limit() : 0;
}

Error Flow::run(const ContextPtr& parent, Input input, Output output) {
    ContextPtr ctx = parent ? parent : core::Context::background();
    if (ctx->request_id().empty()) {
        ctx = core::Context::with_request_id(ctx, logging::generate_request_id());
    }

    if (ctx->done()) {
        return ctx->err();
    }

    if (limiter_ && handlers_.size() > limiter_->limit()) {
        return Error(core::errc::invalid_config,
                     fmt::format("concurrency limit {} is below the {} handlers of one run",
                                 limiter_->limit(), handlers_.size()))
            .with_ids(ctx->trace_id(), ctx->request_id());
    }

    std::shared_ptr<core::Reader> source;
    if (auto err = input.open(source)) {
        return err.with_ids(ctx->trace_id(), ctx->request_id());
    }

    // No handlers: identity
    if (handlers_.empty()) {
        std::string staging;
        if (auto err = output.collect(*source, staging)) {
            return err.with_ids(ctx->trace_id(), ctx->request_id());
        }
        output.commit(std::move(staging));
        return {};
    }

    if (limiter_ && !limiter_->acquire(*ctx, handlers_.size())) {
        return ctx->err();
    }

    auto state = std::make_shared<RunState>();
    state->pending_handlers = handlers_.size();
    state->pipes.reserve(handlers_.size() + 1);
    for (size_t i = 0; i <= handlers_.size(); ++i) {
        state->pipes.push_back(core::make_pipe());
    }

    if (input.borrowed()) {
        source = std::make_shared<AbortableReader>(std::move(source), state);
    }
    auto sink = std::make_shared<Output>(std::move(output));

    std::vector<std::thread> workers;
    workers.reserve(handlers_.size());
    std::thread feeder;
    std::thread collector;

    // Tasks own everything they touch, so an aborted run returns without
    // waiting for them; the pipes are closed to unblock them
    auto abort = [&](Error err) {
        state->aborted.store(true, std::memory_order_release);
        state->close_all(err);
        if (feeder.joinable()) {
            feeder.detach();
        }
        if (collector.joinable()) {
            collector.detach();
        }
        for (auto& worker : workers) {
            worker.detach();
        }
        err.with_ids(ctx->trace_id(), ctx->request_id());
        LOG_DEBUG(logging::get_logger(), "Flow run aborted: request_id={}, error={}",
                  ctx->request_id(), err.what());
        return err;
    };

    size_t started = 0;
    try {
        for (; started < handlers_.size(); ++started) {
            workers.emplace_back(run_handler, state, started, handlers_[started], ctx, limiter_);
        }

        feeder = std::thread([state, source] {
            auto& writer = state->pipes.front().writer;
            if (auto err = core::copy(*writer, *source)) {
                writer->close(err);
            } else {
                writer->close();
            }
        });

        collector = std::thread([state, sink] {
            auto& reader = state->pipes.back().reader;
            auto err = sink->collect(*reader, state->staging);
            if (err) {
                reader->close(err);
            } else if (auto drain_err = core::drain(*reader)) {
                err = std::move(drain_err);
            }

            std::lock_guard<std::mutex> lock(state->mutex);
            state->collector_done = true;
            state->collector_error = std::move(err);
            state->cv.notify_all();
        });
    } catch (const std::system_error& e) {
        // Slots of stages that never started
        if (limiter_) {
            limiter_->release(handlers_.size() - started);
        }
        return abort(Error(e.code(), "failed to start pipeline task"));
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        ctx->wait_on(state, lock, state->cv, [&state] {
            return state->failed || (state->collector_done && state->collector_error) ||
                   (state->pending_handlers == 0 && state->collector_done);
        });
    }

    // Cancellation wins over a result that arrived at the same time
    Error result;
    if (ctx->done()) {
        result = ctx->err();
    } else {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->failed) {
            result = state->first_error;
        } else if (state->collector_error) {
            result = state->collector_error;
        }
    }

    if (result) {
        return abort(std::move(result));
    }

    for (auto& worker : workers) {
        worker.join();
    }
    feeder.join();
    collector.join();

    sink->commit(std::move(state->staging));
    return {};
}

Error Flow::serve_flow(Request& req, Response& res) {
    if (req.data == nullptr || res.data == nullptr) {
        return Error(core::errc::invalid_argument, "flow requires input and output streams");
    }
    return run(req.context, Input(*req.data), Output(*res.data));
}

}  // namespace sluice::flow
