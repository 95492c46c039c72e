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

// Sluice Cache - Implementation

#include "cache.hpp"

#include <openssl/evp.h>

#include <array>
#include <mutex>

#include "../core/logging.hpp"
#include "memory_store.hpp"

namespace sluice::cache {

using core::Error;

struct Cache::State {
    std::shared_ptr<CacheStore> store;

    std::mutex mutex;
    ErrorCallback on_error;

    /// Serve from the store or run handler on input and store the result
    Error serve(flow::Handler& handler, const flow::ContextPtr& ctx, const std::string& key,
                std::chrono::milliseconds ttl, std::string_view input, flow::Response& res);

    void report(const Error& err);
};

std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len, EVP_sha256(), nullptr) != 1) {
        return {};
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

void Cache::State::report(const Error& err) {
    LOG_WARNING(logging::get_logger(), "Cache write failed: {}", err.what());

    ErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex);
        callback = on_error;
    }
    if (callback) {
        callback(err);
    }
}

Error Cache::State::serve(flow::Handler& handler, const flow::ContextPtr& ctx,
                          const std::string& key, std::chrono::milliseconds ttl,
                          std::string_view input, flow::Response& res) {
    std::string output;
    if (auto err = flow::invoke(handler, ctx, input, output)) {
        return err;
    }

    if (auto err = store->set(key, output, ttl)) {
        report(core::wrap(std::move(err), "cache write failed"));
    }

    return flow::write_all(res, output);
}

Cache::Cache() : Cache(std::make_shared<MemoryStore>()) {}

Cache::Cache(std::shared_ptr<CacheStore> store) : state_(std::make_shared<State>()) {
    state_->store = std::move(store);
}

flow::HandlerPtr Cache::cache(flow::HandlerPtr handler, std::chrono::milliseconds ttl) {
    return flow::make_handler(
        [state = state_, handler = std::move(handler), ttl](flow::Request& req,
                                                            flow::Response& res) -> Error {
            std::string input;
            if (auto err = flow::read_all(req, input)) {
                return err;
            }

            auto key = sha256_hex(input);
            if (key.empty()) {
                // Digest unavailable: serve uncached
                core::BytesReader replay(input);
                flow::Request direct{req.context, &replay};
                return flow::call_handler(*handler, direct, res);
            }
            if (auto cached = state->store->get(key)) {
                return flow::write_all(res, *cached);
            }
            return state->serve(*handler, req.context, key, ttl, input, res);
        },
        "cache");
}

flow::HandlerPtr Cache::cache_with_key(flow::HandlerPtr handler, std::chrono::milliseconds ttl,
                                       KeyFunc key_fn) {
    return flow::make_handler(
        [state = state_, handler = std::move(handler), ttl,
         key_fn = std::move(key_fn)](flow::Request& req, flow::Response& res) -> Error {
            auto key = key_fn(req);
            if (auto cached = state->store->get(key)) {
                return flow::write_all(res, *cached);
            }

            std::string input;
            if (auto err = flow::read_all(req, input)) {
                return err;
            }
            return state->serve(*handler, req.context, key, ttl, input, res);
        },
        "cache");
}

void Cache::on_error(ErrorCallback callback) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->on_error = std::move(callback);
}

std::optional<std::string> Cache::get(std::string_view key) {
    return state_->store->get(key);
}

Error Cache::set(std::string_view key, std::string_view data, std::chrono::milliseconds ttl) {
    return state_->store->set(key, data, ttl);
}

Error Cache::remove(std::string_view key) {
    return state_->store->remove(key);
}

Error Cache::clear() {
    return state_->store->clear();
}

bool Cache::exists(std::string_view key) {
    return state_->store->exists(key);
}

std::vector<std::string> Cache::list_keys() {
    return state_->store->list();
}

CacheStore& Cache::store() noexcept {
    return *state_->store;
}

}  // namespace sluice::cache
