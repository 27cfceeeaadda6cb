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
#ifndef IORX_SRC_CORE_PHASE_TASK_REORDER_H
#define IORX_SRC_CORE_PHASE_TASK_REORDER_H

#include <cstdint>
#include <utility>
#include <vector>
#include "iorx_params.h"

namespace iorx {

inline uint64_t
lcgNext(uint64_t state) {
    return state * 6364136223846793005ULL + 1442695040888963407ULL;
}

// Deterministic Fisher-Yates shuffle driven by the LCG above
template<typename T>
void
lcgShuffle(std::vector<T> &values, uint64_t seed) {
    uint64_t state = seed;
    for (size_t i = values.size(); i > 1; i--) {
        state = lcgNext(state);
        const size_t j = (state >> 33) % i;
        std::swap(values[i - 1], values[j]);
    }
}

int
shiftSourceRank(int rank, int size, int offset);

// Permutation of [0, size) shared by every rank using the same seed
std::vector<int>
randomRankPermutation(int size, uint64_t seed);

// Rank whose data 'rank' accesses in 'phase'. Only read-type phases are
// reordered, every other phase maps a rank onto itself.
int
sourceRank(const iorxTestParams &params, int rank, int size, iorx_phase_t phase);

} // namespace iorx

#endif
