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

// Sluice Memory Store - Header
// In-process TTL store with lazy expiry and a periodic background sweep

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

#include "../core/containers.hpp"
#include "store.hpp"

namespace sluice::cache {

/// Memory store options
struct MemoryStoreOptions {
    /// Interval between sweeps of expired entries (independent of entry ttls)
    std::chrono::milliseconds sweep_interval{std::chrono::minutes(5)};
};

/// Default cache store.
///
/// Entries are owned copies in a mutex-guarded map. Reads check expiry
/// lazily; a background thread additionally reclaims expired entries every
/// sweep_interval until stop() or destruction.
class MemoryStore : public CacheStore {
public:
    MemoryStore();
    explicit MemoryStore(MemoryStoreOptions options);
    ~MemoryStore() override;

    // Non-copyable, non-movable (owns the sweep thread)
    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) override;
    [[nodiscard]] core::Error set(std::string_view key, std::string_view data,
                                  std::chrono::milliseconds ttl) override;
    [[nodiscard]] core::Error remove(std::string_view key) override;
    [[nodiscard]] core::Error clear() override;
    [[nodiscard]] bool exists(std::string_view key) override;
    [[nodiscard]] std::vector<std::string> list() override;

    /// Remove expired entries now, returns how many were removed
    size_t sweep();

    /// Number of stored entries, including expired ones not yet swept
    [[nodiscard]] size_t size() const;

    /// Stop the background sweep (idempotent)
    void stop();

    [[nodiscard]] const MemoryStoreOptions& options() const noexcept { return options_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string data;
        Clock::time_point created;
        std::chrono::milliseconds ttl;

        [[nodiscard]] bool expired(Clock::time_point now) const noexcept { return now - created > ttl; }
    };

    void sweep_loop();

    const MemoryStoreOptions options_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, Entry> entries_;

    // Sweep thread and its stop signal
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
    bool stopping_ = false;
    std::thread sweep_thread_;
};

}  // namespace sluice::cache
