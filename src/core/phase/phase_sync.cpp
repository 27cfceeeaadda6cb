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
#include "phase_sync.h"
#include "phase_state.h"
#include "common/iorx_log.h"
#include <absl/strings/str_format.h>

namespace iorx {

iorx_status_t
agreeOnOutcome(iorxRT &rt,
               bool failed,
               iorx_status_t status,
               bool stonewalled,
               iorxPhaseDecision &decision) {
    // Lowest failing rank maps to the highest value
    const int64_t local_max[3] = {
        failed ? 1 : 0,
        failed ? rt.getSize() - rt.getRank() : 0,
        status == IORX_ERR_TIMEOUT ? 1 : 0,
    };
    int64_t global_max[3];
    const int64_t local_sum = stonewalled ? 1 : 0;
    int64_t global_sum = 0;

    if (rt.allReduceInt(local_max, global_max, 3, IORX_REDUCE_MAX) != 0 ||
        rt.allReduceInt(&local_sum, &global_sum, 1, IORX_REDUCE_SUM) != 0) {
        IORX_ERROR << "Failure flag reduction failed on rank " << rt.getRank();
        return IORX_ERR_INTERNAL;
    }

    decision = iorxPhaseDecision();
    decision.abort = global_max[0] != 0;
    decision.timedOut = global_max[2] != 0;
    decision.stonewalledRanks = static_cast<uint32_t>(global_sum);

    if (decision.abort) {
        decision.failedRank = static_cast<int>(rt.getSize() - global_max[1]);
        int64_t kind = status;
        if (rt.broadcastInt(&kind, 1, decision.failedRank) != 0) {
            IORX_ERROR << "Failure kind broadcast failed on rank " << rt.getRank();
            return IORX_ERR_INTERNAL;
        }
        decision.failureStatus = static_cast<iorx_status_t>(kind);
    }
    return IORX_SUCCESS;
}

iorx_status_t
synchronizePhase(iorxRT &rt,
                 const iorxTestParams &params,
                 iorxPhaseResult &result,
                 iorxPhaseDecision &decision) {
    const std::string name = iorxEnumStrings::phaseStr(result.phase);

    if (params.interPhaseBarriers) {
        const std::string id = absl::StrFormat("%s-end-%d", name, result.repetition);
        if (rt.barrier(id) != 0) {
            IORX_ERROR << "Barrier " << id << " failed on rank " << rt.getRank();
            return IORX_ERR_INTERNAL;
        }
    }

    const iorx_status_t status = agreeOnOutcome(
        rt, result.failed, result.status, result.stonewallHit, decision);
    if (status != IORX_SUCCESS) {
        return status;
    }

    advancePhase(result, IORX_PHASE_SYNCHRONIZED);
    return IORX_SUCCESS;
}

} // namespace iorx
