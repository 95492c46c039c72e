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

// Sluice Core - Implementation

#include "core.hpp"

#ifdef __linux__
#include <sched.h>
#endif

#include <thread>

namespace sluice::core {

uint32_t get_cpu_count() {
#ifdef __linux__
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    if (sched_getaffinity(0, sizeof(cpu_set_t), &cpuset) == 0) {
        int count = CPU_COUNT(&cpuset);
        if (count > 0) {
            return static_cast<uint32_t>(count);
        }
    }
#endif

    uint32_t count = std::thread::hardware_concurrency();
    return count > 0 ? count : 1;
}

} // namespace sluice::core
