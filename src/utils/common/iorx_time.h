/*
 * SPDX-FileCopyrightText: Copyright (c) 2025-2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#ifndef IORX_SRC_UTILS_COMMON_IORX_TIME_H
#define IORX_SRC_UTILS_COMMON_IORX_TIME_H

#include <chrono>

namespace iorxTime {

using steadyClock = std::chrono::steady_clock;

// Monotonic clock reading in seconds; only differences are meaningful
inline double
getSec() {
    return std::chrono::duration<double>(steadyClock::now().time_since_epoch()).count();
}

} // namespace iorxTime

#endif
