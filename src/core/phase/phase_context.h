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
#ifndef IORX_SRC_CORE_PHASE_PHASE_CONTEXT_H
#define IORX_SRC_CORE_PHASE_PHASE_CONTEXT_H

#include <cstdint>
#include <vector>
#include "backend/backend_engine.h"
#include "iorx_md_namer.h"
#include "iorx_params.h"
#include "runtime/iorx_rt.h"

/**
 * What one rank needs to run the phases of one repetition. Everything but
 * the produced item counts is fixed for the whole run.
 */
struct iorxPhaseContext {
    const iorxTestParams &params;
    iorxRT &rt;
    iorxBackendEngine &engine;
    const iorxMdNamer &namer;

    uint32_t repetition = 0;
    // Random offset seed agreed on by all ranks
    uint64_t randomSeed = 0;
    double runStart = 0;

    // Items each rank wrote or created in this repetition, indexed by rank.
    // Empty while the producing phase did not run.
    std::vector<int64_t> writtenItems;
    std::vector<int64_t> createdItems;

    iorxPhaseContext(const iorxTestParams &p,
                     iorxRT &r,
                     iorxBackendEngine &e,
                     const iorxMdNamer &n)
        : params(p),
          rt(r),
          engine(e),
          namer(n) {}

    bool
    runDeadlineReached(double now) const {
        return params.maxTimeDuration > 0 && now - runStart >= params.maxTimeDuration;
    }
};

#endif
