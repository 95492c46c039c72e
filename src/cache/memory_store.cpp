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

// Sluice Memory Store - Implementation

#include "memory_store.hpp"

#include <algorithm>

#include "../core/logging.hpp"

namespace sluice::cache {

MemoryStore::MemoryStore() : MemoryStore(MemoryStoreOptions{}) {}

MemoryStore::MemoryStore(MemoryStoreOptions options)
    : options_{std::max(options.sweep_interval, std::chrono::milliseconds(1))} {
    sweep_thread_ = std::thread([this] { sweep_loop(); });
}

MemoryStore::~MemoryStore() {
    stop();
}

std::optional<std::string> MemoryStore::get(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end() || it->second.expired(Clock::now())) {
        return std::nullopt;
    }
    return it->second.data;
}

core::Error MemoryStore::set(std::string_view key, std::string_view data,
                             std::chrono::milliseconds ttl) {
    Entry entry{std::string(data), Clock::now(), ttl};

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.insert_or_assign(std::string(key), std::move(entry));
    return {};
}

core::Error MemoryStore::remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(std::string(key));
    return {};
}

core::Error MemoryStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    return {};
}

bool MemoryStore::exists(std::string_view key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(std::string(key));
    return it != entries_.end() && !it->second.expired(Clock::now());
}

std::vector<std::string> MemoryStore::list() {
    std::vector<std::string> keys;
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    keys.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        if (!entry.expired(now)) {
            keys.push_back(key);
        }
    }
    return keys;
}

size_t MemoryStore::sweep() {
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> expired;
    for (const auto& [key, entry] : entries_) {
        if (entry.expired(now)) {
            expired.push_back(key);
        }
    }
    for (const auto& key : expired) {
        entries_.erase(key);
    }
    return expired.size();
}

size_t MemoryStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemoryStore::stop() {
    {
        std::lock_guard<std::mutex> lock(sweep_mutex_);
        stopping_ = true;
    }
    sweep_cv_.notify_all();

    if (sweep_thread_.joinable()) {
        sweep_thread_.join();
    }
}

void MemoryStore::sweep_loop() {
    std::unique_lock<std::mutex> lock(sweep_mutex_);
    while (!sweep_cv_.wait_for(lock, options_.sweep_interval, [this] { return stopping_; })) {
        lock.unlock();
        size_t removed = sweep();
        if (removed > 0) {
            LOG_DEBUG(logging::get_logger(), "Cache sweep removed {} expired entries", removed);
        }
        lock.lock();
    }
}

}  // namespace sluice::cache
