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

// Sluice Context - Implementation

#include "context.hpp"

namespace sluice::core {

namespace {

// Sleeper state shared with the cancellation callback
struct Sleeper {
    std::mutex mutex;
    std::condition_variable cv;
};

}  // namespace

void Context::Subscription::reset() {
    for (auto& [weak, id] : entries_) {
        if (auto ctx = weak.lock()) {
            ctx->remove_callback(id);
        }
    }
    entries_.clear();
}

Context::Context(ContextPtr parent, std::optional<Clock::time_point> deadline)
    : parent_(std::move(parent))
    , deadline_(deadline) {}

ContextPtr Context::background() {
    return ContextPtr(new Context(nullptr, std::nullopt));
}

ContextPtr Context::with_cancel(const ContextPtr& parent) {
    return ContextPtr(new Context(parent, std::nullopt));
}

ContextPtr Context::with_timeout(const ContextPtr& parent, Clock::duration timeout) {
    return with_deadline(parent, Clock::now() + timeout);
}

ContextPtr Context::with_deadline(const ContextPtr& parent, Clock::time_point deadline) {
    return ContextPtr(new Context(parent, deadline));
}

ContextPtr Context::with_trace_id(const ContextPtr& parent, std::string trace_id) {
    ContextPtr ctx(new Context(parent, std::nullopt));
    ctx->trace_id_ = std::move(trace_id);
    return ctx;
}

ContextPtr Context::with_request_id(const ContextPtr& parent, std::string request_id) {
    ContextPtr ctx(new Context(parent, std::nullopt));
    ctx->request_id_ = std::move(request_id);
    return ctx;
}

void Context::cancel() {
    if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already cancelled
    }

    // Run callbacks outside the lock: they take their owners' mutexes
    std::map<uint64_t, Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks.swap(callbacks_);
    }

    for (auto& [id, callback] : callbacks) {
        callback();
    }
}

bool Context::done() const noexcept {
    auto now = Clock::now();
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (c->cancelled_.load(std::memory_order_acquire)) {
            return true;
        }
        if (c->deadline_ && now >= *c->deadline_) {
            return true;
        }
    }
    return false;
}

Error Context::err() const {
    auto now = Clock::now();
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (c->cancelled_.load(std::memory_order_acquire)) {
            return Error(errc::cancelled).with_ids(trace_id(), request_id());
        }
        if (c->deadline_ && now >= *c->deadline_) {
            return Error(errc::deadline_exceeded).with_ids(trace_id(), request_id());
        }
    }
    return {};
}

std::optional<Context::Clock::time_point> Context::deadline() const noexcept {
    std::optional<Clock::time_point> earliest;
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (c->deadline_ && (!earliest || *c->deadline_ < *earliest)) {
            earliest = c->deadline_;
        }
    }
    return earliest;
}

Error Context::wait_for(Clock::duration duration) const {
    auto sleeper = std::make_shared<Sleeper>();
    std::unique_lock<std::mutex> lock(sleeper->mutex);

    // Never satisfied: returns when the context finishes or the sleep elapses
    wait_on(sleeper, lock, sleeper->cv, [] { return false; }, Clock::now() + duration);

    return err();
}

Context::Subscription Context::on_done(Callback callback) const {
    Subscription subscription;
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        subscription.entries_.emplace_back(c->weak_from_this(), c->add_callback(callback));
    }
    return subscription;
}

std::string_view Context::trace_id() const noexcept {
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (!c->trace_id_.empty()) {
            return c->trace_id_;
        }
    }
    return {};
}

std::string_view Context::request_id() const noexcept {
    for (const Context* c = this; c != nullptr; c = c->parent_.get()) {
        if (!c->request_id_.empty()) {
            return c->request_id_;
        }
    }
    return {};
}

uint64_t Context::add_callback(Callback callback) const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_callback_id_++;
    callbacks_.emplace(id, std::move(callback));
    return id;
}

void Context::remove_callback(uint64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

}  // namespace sluice::core
