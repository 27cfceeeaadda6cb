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
#include "task_reorder.h"
#include <numeric>

namespace iorx {

int
shiftSourceRank(int rank, int size, int offset) {
    return ((rank + offset) % size + size) % size;
}

std::vector<int>
randomRankPermutation(int size, uint64_t seed) {
    std::vector<int> perm(size);
    std::iota(perm.begin(), perm.end(), 0);
    lcgShuffle(perm, seed);
    return perm;
}

int
sourceRank(const iorxTestParams &params, int rank, int size, iorx_phase_t phase) {
    const bool reordered = phase == IORX_PHASE_READ || phase == IORX_PHASE_MD_STAT ||
        phase == IORX_PHASE_MD_READ;
    if (!reordered || size <= 1) {
        return rank;
    }

    if (params.reorderTasks) {
        return shiftSourceRank(rank, size, params.taskPerNodeOffset);
    }

    if (params.reorderTasksRandom) {
        const uint64_t seed = static_cast<uint64_t>(params.reorderTasksRandomSeed) +
            static_cast<uint64_t>(phase);
        return randomRankPermutation(size, seed)[rank];
    }
    return rank;
}

} // namespace iorx
