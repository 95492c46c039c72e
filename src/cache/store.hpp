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

// Sluice Cache Store - Header
// Pluggable key/value backend consumed by the cache middleware

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/error.hpp"

namespace sluice::cache {

/// Cache backing store.
///
/// Implementations must be safe for concurrent use and must never return a
/// partially written entry. An entry whose age exceeds its ttl is gone as far
/// as get(), exists() and list() are concerned.
class CacheStore {
public:
    virtual ~CacheStore() = default;

    /// Stored payload, or nullopt when absent or expired
    [[nodiscard]] virtual std::optional<std::string> get(std::string_view key) = 0;

    /// Store a copy of data under key, replacing any previous entry
    [[nodiscard]] virtual core::Error set(std::string_view key, std::string_view data,
                                          std::chrono::milliseconds ttl) = 0;

    [[nodiscard]] virtual core::Error remove(std::string_view key) = 0;

    [[nodiscard]] virtual core::Error clear() = 0;

    [[nodiscard]] virtual bool exists(std::string_view key) = 0;

    /// Keys of all live entries (unordered)
    [[nodiscard]] virtual std::vector<std::string> list() = 0;
};

}  // namespace sluice::cache
