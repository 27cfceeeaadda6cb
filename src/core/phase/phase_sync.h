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
#ifndef IORX_SRC_CORE_PHASE_PHASE_SYNC_H
#define IORX_SRC_CORE_PHASE_PHASE_SYNC_H

#include "iorx_params.h"
#include "iorx_results.h"
#include "runtime/iorx_rt.h"

// Outcome of a phase every rank agrees on
struct iorxPhaseDecision {
    bool abort = false;
    // Lowest failing rank and the status it reported
    int failedRank = -1;
    iorx_status_t failureStatus = IORX_SUCCESS;
    bool timedOut = false;
    uint32_t stonewalledRanks = 0;
};

namespace iorx {

// Reduces local outcomes so that every rank holds the same decision
iorx_status_t
agreeOnOutcome(iorxRT &rt,
               bool failed,
               iorx_status_t status,
               bool stonewalled,
               iorxPhaseDecision &decision);

/**
 * End of phase rendezvous. Every rank calls it whatever its local outcome:
 * an optional barrier, then a reduction of the failure flags so that all
 * ranks take the same abort decision, then a broadcast of the failure kind
 * from the lowest failing rank. Moves the result to Synchronized.
 */
iorx_status_t
synchronizePhase(iorxRT &rt,
                 const iorxTestParams &params,
                 iorxPhaseResult &result,
                 iorxPhaseDecision &decision);

} // namespace iorx

#endif
