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

// Sluice Cache - Header
// Content-addressed memoization of handler output with per-entry TTL

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../flow/handler.hpp"
#include "store.hpp"

namespace sluice::cache {

/// Lowercase hex SHA-256 of data (64 characters)
[[nodiscard]] std::string sha256_hex(std::string_view data);

/// Derives a cache key from a request without consuming its input
using KeyFunc = std::function<std::string(const flow::Request&)>;

/// Receives store failures that did not fail the request
using ErrorCallback = std::function<void(const core::Error&)>;

/// Cache middleware factory bound to one store.
///
/// On a hit the stored bytes are written to the output and the wrapped
/// handler is skipped. On a miss the handler runs into a buffer; only a
/// successful output is stored, then written. A failed store write is
/// logged, passed to the on_error callback and otherwise ignored.
///
/// Handlers created by a Cache keep its store alive.
class Cache {
public:
    /// Cache over a new MemoryStore with default options
    Cache();
    explicit Cache(std::shared_ptr<CacheStore> store);

    /// Memoize handler keyed by the SHA-256 of the whole input
    [[nodiscard]] flow::HandlerPtr cache(flow::HandlerPtr handler, std::chrono::milliseconds ttl);

    /// Memoize handler under a caller-chosen key (input is read only on a miss)
    [[nodiscard]] flow::HandlerPtr cache_with_key(flow::HandlerPtr handler,
                                                  std::chrono::milliseconds ttl, KeyFunc key_fn);

    /// Install the store failure callback (applies to handlers already created)
    void on_error(ErrorCallback callback);

    [[nodiscard]] std::optional<std::string> get(std::string_view key);
    [[nodiscard]] core::Error set(std::string_view key, std::string_view data,
                                  std::chrono::milliseconds ttl);
    [[nodiscard]] core::Error remove(std::string_view key);
    [[nodiscard]] core::Error clear();
    [[nodiscard]] bool exists(std::string_view key);
    [[nodiscard]] std::vector<std::string> list_keys();

    [[nodiscard]] CacheStore& store() noexcept;

private:
    struct State;
    std::shared_ptr<State> state_;
};

}  // namespace sluice::cache
