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

// Sluice Context - Header
// Cancellation token with deadlines, parent chaining and correlation ids

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "error.hpp"

namespace sluice::core {

class Context;
using ContextPtr = std::shared_ptr<Context>;

/// Request-scoped cancellation and metadata.
///
/// A context is done once it (or any ancestor) has been cancelled or its
/// deadline (or any ancestor's) has passed. Contexts are immutable apart
/// from cancellation, so one instance can be shared by every stage of a run.
///
/// Cancellation callbacks registered through on_done() run on the thread
/// calling cancel(). Deadlines do not fire callbacks; waiters bound their
/// waits with deadline() instead.
class Context : public std::enable_shared_from_this<Context> {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    /// RAII handle for a cancellation callback (unregisters on destruction)
    class Subscription {
    public:
        Subscription() = default;
        ~Subscription() { reset(); }

        // Non-copyable, movable
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        Subscription(Subscription&& other) noexcept : entries_(std::move(other.entries_)) {}
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                entries_ = std::move(other.entries_);
            }
            return *this;
        }

        void reset();

    private:
        friend class Context;
        std::vector<std::pair<std::weak_ptr<const Context>, uint64_t>> entries_;
    };

    ~Context() = default;

    // Non-copyable, non-movable (always shared)
    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /// Fresh root context, never done unless cancelled
    [[nodiscard]] static ContextPtr background();

    [[nodiscard]] static ContextPtr with_cancel(const ContextPtr& parent);
    [[nodiscard]] static ContextPtr with_timeout(const ContextPtr& parent, Clock::duration timeout);
    [[nodiscard]] static ContextPtr with_deadline(const ContextPtr& parent, Clock::time_point deadline);
    [[nodiscard]] static ContextPtr with_trace_id(const ContextPtr& parent, std::string trace_id);
    [[nodiscard]] static ContextPtr with_request_id(const ContextPtr& parent, std::string request_id);

    /// Cancel this context and, transitively, every context derived from it
    void cancel();

    [[nodiscard]] bool done() const noexcept;

    /// errc::cancelled or errc::deadline_exceeded once done, success otherwise
    [[nodiscard]] Error err() const;

    /// Earliest deadline along the parent chain
    [[nodiscard]] std::optional<Clock::time_point> deadline() const noexcept;

    /// Sleep for the given duration unless the context finishes first.
    /// Returns the context error if interrupted.
    [[nodiscard]] Error wait_for(Clock::duration duration) const;

    /// Register a callback fired when this context or an ancestor is cancelled.
    /// The callback is never invoked from inside on_done(), even when the
    /// context is already done; check done() after subscribing.
    [[nodiscard]] Subscription on_done(Callback callback) const;

    /// Trace id of the nearest ancestor that set one
    [[nodiscard]] std::string_view trace_id() const noexcept;

    /// Request id of the nearest ancestor that set one
    [[nodiscard]] std::string_view request_id() const noexcept;

    /// Wait on cv until pred() holds, the context finishes or `until` passes.
    ///
    /// The mutex owned by `lock` and `cv` must be members of *owner, which
    /// keeps them alive for a cancel() racing with the end of the wait.
    /// Returns true once pred() holds, false otherwise.
    template <typename Owner, typename Predicate>
    bool wait_on(const std::shared_ptr<Owner>& owner, std::unique_lock<std::mutex>& lock,
                 std::condition_variable& cv, Predicate pred,
                 std::optional<Clock::time_point> until = std::nullopt) const {
        auto subscription = on_done([weak = std::weak_ptr<Owner>(owner), mutex = lock.mutex(),
                                     signal = &cv] {
            if (auto strong = weak.lock()) {
                std::lock_guard<std::mutex> guard(*mutex);
                signal->notify_all();
            }
        });

        auto limit = deadline();
        if (until && (!limit || *until < *limit)) {
            limit = until;
        }

        while (true) {
            if (pred()) {
                return true;
            }
            if (done()) {
                return false;
            }
            if (limit) {
                if (Clock::now() >= *limit) {
                    return pred();
                }
                cv.wait_until(lock, *limit);
            } else {
                cv.wait(lock);
            }
        }
    }

private:
    Context(ContextPtr parent, std::optional<Clock::time_point> deadline);

    [[nodiscard]] uint64_t add_callback(Callback callback) const;
    void remove_callback(uint64_t id) const;

    const ContextPtr parent_;
    const std::optional<Clock::time_point> deadline_;
    std::string trace_id_;
    std::string request_id_;

    std::atomic<bool> cancelled_{false};

    mutable std::mutex mutex_;
    mutable std::map<uint64_t, Callback> callbacks_;
    mutable uint64_t next_callback_id_ = 1;
};

}  // namespace sluice::core
