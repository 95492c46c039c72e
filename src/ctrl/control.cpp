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

// Sluice Control Helpers - Implementation

#include "control.hpp"

#include <fmt/format.h>

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "../core/logging.hpp"

namespace sluice::ctrl {

using core::errc;
using flow::Error;
using flow::HandlerFunc;
using flow::Request;
using flow::Response;

namespace {

Error copy_through(Request& req, Response& res) {
    if (req.data == nullptr || res.data == nullptr) {
        return Error(errc::invalid_argument, "pass-through requires input and output streams");
    }
    return core::copy(*res.data, *req.data);
}

/// Writes every chunk to several destinations in order
class MultiWriter final : public core::Writer {
public:
    explicit MultiWriter(std::vector<core::Writer*> writers) : writers_(std::move(writers)) {}

    [[nodiscard]] Error write(std::span<const uint8_t> data) override {
        for (auto* writer : writers_) {
            if (auto err = writer->write(data)) {
                return err;
            }
        }
        return {};
    }

private:
    std::vector<core::Writer*> writers_;
};

/// Shared between a parallel() call and its branch tasks
struct ParallelState {
    std::string input;

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> outputs;
    size_t remaining = 0;
    Error first_err;
};

/// Shared between a timeout() call and its task
struct TimeoutState {
    std::string input;

    std::mutex mutex;
    std::condition_variable cv;
    bool finished = false;
    std::string output;
    Error err;
};

}  // namespace

HandlerPtr pass_through() {
    return flow::make_handler(copy_through, "pass_through");
}

HandlerPtr branch(BranchPredicate pred, HandlerPtr if_handler, HandlerPtr else_handler) {
    return flow::make_handler(
        [pred = std::move(pred), if_handler = std::move(if_handler),
         else_handler = std::move(else_handler)](Request& req, Response& res) -> Error {
            std::string input;
            if (auto err = flow::read_all(req, input)) {
                return err;
            }

            core::BytesReader replay(input);
            Request routed{req.context, &replay};
            auto& target = pred(input) ? if_handler : else_handler;
            return target->serve_flow(routed, res);
        },
        "branch");
}

HandlerPtr tee(std::vector<core::Writer*> writers) {
    return flow::make_handler(
        [writers = std::move(writers)](Request& req, Response& res) -> Error {
            if (req.data == nullptr || res.data == nullptr) {
                return Error(errc::invalid_argument, "tee requires input and output streams");
            }

            auto destinations = writers;
            destinations.push_back(res.data);
            MultiWriter fan_out(std::move(destinations));
            return core::copy(fan_out, *req.data);
        },
        "tee");
}

HandlerPtr parallel(std::vector<HandlerPtr> handlers) {
    return flow::make_handler(
        [handlers = std::move(handlers)](Request& req, Response& res) -> Error {
            if (handlers.empty()) {
                return copy_through(req, res);
            }

            auto parent = req.context ? req.context : core::Context::background();
            auto state = std::make_shared<ParallelState>();
            if (auto err = flow::read_all(req, state->input)) {
                return err;
            }
            state->outputs.resize(handlers.size());
            state->remaining = handlers.size();

            // Siblings are cancelled as soon as one branch fails
            auto ctx = core::Context::with_cancel(parent);

            for (size_t i = 0; i < handlers.size(); ++i) {
                std::thread([state, ctx, handler = handlers[i], i] {
                    std::string output;
                    auto err = flow::invoke(*handler, ctx, state->input, output);

                    std::lock_guard<std::mutex> lock(state->mutex);
                    if (err && !state->first_err) {
                        state->first_err = std::move(err);
                        ctx->cancel();
                    } else if (!err) {
                        state->outputs[i] = std::move(output);
                    }
                    --state->remaining;
                    state->cv.notify_all();
                }).detach();
            }

            std::string combined;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                bool settled = parent->wait_on(state, lock, state->cv, [&state] {
                    return state->first_err || state->remaining == 0;
                });
                if (!settled) {
                    ctx->cancel();
                    return parent->err();
                }
                if (state->first_err) {
                    return state->first_err;
                }

                for (size_t i = 0; i < state->outputs.size(); ++i) {
                    if (i > 0) {
                        combined += kParallelSeparator;
                    }
                    combined += state->outputs[i];
                }
            }

            return flow::write_all(res, combined);
        },
        "parallel");
}

HandlerPtr timeout(HandlerPtr handler, std::chrono::milliseconds limit) {
    return flow::make_handler(
        [handler = std::move(handler), limit](Request& req, Response& res) -> Error {
            auto parent = req.context ? req.context : core::Context::background();
            auto state = std::make_shared<TimeoutState>();
            if (auto err = flow::read_all(req, state->input)) {
                return err;
            }

            auto ctx = core::Context::with_timeout(parent, limit);

            std::thread([state, ctx, handler] {
                std::string output;
                auto err = flow::invoke(*handler, ctx, state->input, output);

                std::lock_guard<std::mutex> lock(state->mutex);
                state->finished = true;
                state->output = std::move(output);
                state->err = std::move(err);
                state->cv.notify_all();
            }).detach();

            std::string output;
            {
                std::unique_lock<std::mutex> lock(state->mutex);
                if (!ctx->wait_on(state, lock, state->cv, [&state] { return state->finished; })) {
                    // Let the abandoned task observe the end of its budget
                    ctx->cancel();
                    if (parent->done()) {
                        return parent->err();
                    }
                    LOG_WARNING(logging::get_logger(),
                                "Handler '{}' timed out: request_id={}, limit_ms={}",
                                handler->name(), parent->request_id(), limit.count());
                    return Error(errc::timeout,
                                 fmt::format("handler timeout after {}ms", limit.count()),
                                 Error(errc::deadline_exceeded));
                }
                if (state->err) {
                    return state->err;
                }
                output = std::move(state->output);
            }

            return flow::write_all(res, output);
        },
        "timeout");
}

HandlerPtr chain(std::vector<HandlerPtr> handlers) {
    return flow::make_handler(
        [handlers = std::move(handlers)](Request& req, Response& res) -> Error {
            if (handlers.empty()) {
                return copy_through(req, res);
            }

            std::string current;
            if (auto err = flow::read_all(req, current)) {
                return err;
            }

            for (size_t i = 0; i + 1 < handlers.size(); ++i) {
                std::string next;
                if (auto err = flow::invoke(*handlers[i], req.context, current, next)) {
                    return err;
                }
                current = std::move(next);
            }

            core::BytesReader last_input(current);
            Request last{req.context, &last_input};
            return flow::call_handler(*handlers.back(), last, res);
        },
        "chain");
}

}  // namespace sluice::ctrl
