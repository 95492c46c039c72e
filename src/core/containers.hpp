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

// Sluice Containers - Header
// Hash container aliases used by stores and registries

#pragma once

#include <ankerl/unordered_dense.h>

namespace sluice::core {

// Dense open-addressing maps: contiguous storage, fast iteration for sweeps
// and key listing. Iterators invalidate on insertion like std::vector.
//
// Usage:
//   sluice::core::fast_map<std::string, Entry> entries;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace sluice::core
