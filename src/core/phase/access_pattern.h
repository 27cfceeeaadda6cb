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
#ifndef IORX_SRC_CORE_PHASE_ACCESS_PATTERN_H
#define IORX_SRC_CORE_PHASE_ACCESS_PATTERN_H

#include <string>
#include <vector>
#include <sys/types.h>
#include "iorx_params.h"

namespace iorx {

// Shared file name, or the per-process file of 'file_rank'
std::string
testFilePath(const iorxTestParams &params, int file_rank);

/**
 * Offsets accessed by 'pretend_rank' in issue order, all segments included.
 *
 * Sequential: shared file  seg * N * block + rank * block + j * xfer,
 *             per process  seg * block + j * xfer.
 * Random:     the transfers of a block (per process) or of a segment
 *             spread over all ranks (shared file) are dealt out with
 *             'random_seed' and shuffled; every rank derives the same
 *             assignment, so ranks may own different transfer counts.
 */
std::vector<off_t>
transferOffsets(const iorxTestParams &params, int pretend_rank, int size, uint64_t random_seed);

// Bytes the file(s) of a full, unstonewalled write phase hold
uint64_t
expectedFileSize(const iorxTestParams &params, int size);

} // namespace iorx

#endif
