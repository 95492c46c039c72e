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

// Sluice Error - Implementation

#include "error.hpp"

#include <fmt/format.h>

#include <iterator>

namespace sluice::core {

namespace {

class SluiceCategory final : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "sluice"; }

    [[nodiscard]] std::string message(int value) const override {
        return std::string(to_string(static_cast<errc>(value)));
    }
};

}  // namespace

const std::error_category& sluice_category() noexcept {
    static const SluiceCategory category;
    return category;
}

Error::Error(errc code) : Error(make_error_code(code)) {}

Error::Error(std::error_code code) : code_(code), message_(code ? code.message() : std::string{}) {}

Error::Error(std::error_code code, std::string message)
    : code_(code)
    , message_(std::move(message)) {}

Error::Error(std::error_code code, std::string message, Error cause)
    : code_(code)
    , message_(std::move(message)) {
    if (cause) {
        trace_id_ = cause.trace_id_;
        request_id_ = cause.request_id_;
        cause_ = std::make_shared<const Error>(std::move(cause));
    }
}

const Error& Error::root_cause() const noexcept {
    const Error* current = this;
    while (current->cause_) {
        current = current->cause_.get();
    }
    return *current;
}

std::string Error::what() const {
    if (!code_) {
        return {};
    }

    std::string out = message_.empty() ? code_.message() : message_;
    for (const Error* c = cause_.get(); c != nullptr; c = c->cause_.get()) {
        fmt::format_to(std::back_inserter(out), ": {}",
                       c->message_.empty() ? c->code_.message() : c->message_);
    }
    return out;
}

bool Error::is(std::error_code code) const noexcept {
    for (const Error* c = this; c != nullptr; c = c->cause_.get()) {
        if (c->code_ == code) {
            return true;
        }
    }
    return false;
}

Error& Error::with_ids(std::string_view trace_id, std::string_view request_id) {
    if (!trace_id.empty()) {
        trace_id_ = std::string(trace_id);
    }
    if (!request_id.empty()) {
        request_id_ = std::string(request_id);
    }
    return *this;
}

Error wrap(Error cause, std::string message) {
    auto code = cause.code();
    return Error(code, std::move(message), std::move(cause));
}

Error wrap(Error cause, errc code, std::string message) {
    return Error(make_error_code(code), std::move(message), std::move(cause));
}

}  // namespace sluice::core
