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
#include "access_pattern.h"
#include "task_reorder.h"
#include <absl/strings/str_format.h>

namespace iorx {

std::string
testFilePath(const iorxTestParams &params, int file_rank) {
    if (!params.filePerProc) {
        return params.testFileName;
    }
    return absl::StrFormat("%s.%08d", params.testFileName, file_rank);
}

namespace {

std::vector<off_t>
randomBlockOffsets(const iorxTestParams &params, int pretend_rank, int size, uint64_t seed) {
    const uint64_t per_block = params.transfersPerBlock();
    std::vector<off_t> offsets;

    if (params.filePerProc) {
        for (uint64_t j = 0; j < per_block; j++) {
            offsets.push_back(j * params.transferSize);
        }
    } else {
        // Deal every transfer of the segment to a rank
        const uint64_t total = per_block * size;
        uint64_t state = seed;
        for (uint64_t x = 0; x < total; x++) {
            state = lcgNext(state);
            if (static_cast<int>((state >> 33) % size) != pretend_rank) {
                continue;
            }
            const uint64_t j = x % per_block;
            const uint64_t owner_block = x / per_block;
            offsets.push_back(j * params.transferSize + owner_block * params.blockSize);
        }
    }

    lcgShuffle(offsets, seed + pretend_rank);
    return offsets;
}

} // namespace

std::vector<off_t>
transferOffsets(const iorxTestParams &params, int pretend_rank, int size, uint64_t random_seed) {
    const uint64_t per_block = params.transfersPerBlock();
    const uint64_t segment_stride =
        params.filePerProc ? params.blockSize : params.blockSize * size;
    std::vector<off_t> offsets;

    if (params.randomOffset) {
        const std::vector<off_t> block =
            randomBlockOffsets(params, pretend_rank, size, random_seed);
        offsets.reserve(block.size() * params.segmentCount);
        for (uint32_t seg = 0; seg < params.segmentCount; seg++) {
            for (off_t base : block) {
                offsets.push_back(base + seg * segment_stride);
            }
        }
        return offsets;
    }

    const uint64_t rank_base = params.filePerProc ? 0 : pretend_rank * params.blockSize;
    offsets.reserve(per_block * params.segmentCount);
    for (uint32_t seg = 0; seg < params.segmentCount; seg++) {
        for (uint64_t j = 0; j < per_block; j++) {
            offsets.push_back(seg * segment_stride + rank_base + j * params.transferSize);
        }
    }
    return offsets;
}

uint64_t
expectedFileSize(const iorxTestParams &params, int size) {
    const uint64_t per_rank = params.blockSize * params.segmentCount;
    return params.filePerProc ? per_rank : per_rank * size;
}

} // namespace iorx
