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
#ifndef IORX_SRC_CORE_PHASE_MD_PHASE_H
#define IORX_SRC_CORE_PHASE_MD_PHASE_H

#include "common/aligned_buffer.h"
#include "iorx_results.h"
#include "phase_context.h"

/**
 * Metadata create, stat, read or remove phase of one rank. Items are
 * placed by the context's namer. Create honors the stonewall deadline and
 * its wear-out reduction; stat and read only visit items the source rank
 * created; remove deletes every item this rank created.
 */
class iorxMdPhase {
public:
    iorxMdPhase(iorxPhaseContext &ctx, iorx_phase_t phase);

    iorx_status_t
    execute(iorxPhaseResult &result);

private:
    iorxPhaseContext &ctx_;
    const iorxTestParams &params_;
    const iorx_phase_t phase_;
    const int rank_;
    iorx::alignedBuffer buffer_;
    uint64_t issued_ = 0;

    iorx_status_t
    processItem(uint64_t item, int owner, iorxPhaseResult &result);

    iorx_status_t
    createItem(const std::string &path, iorxPhaseResult &result);

    iorx_status_t
    readItem(const std::string &path, iorxPhaseResult &result);

    void
    runItems(uint64_t end, int owner, bool honor_deadline, iorxPhaseResult &result);
};

#endif
