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

// Sluice Core - Header
// CPU count detection used to size automatic concurrency limits

#pragma once

#include <cstdint>

namespace sluice::core {

/// Number of CPUs this process may run on (affinity-aware on Linux, at least 1)
[[nodiscard]] uint32_t get_cpu_count();

} // namespace sluice::core
