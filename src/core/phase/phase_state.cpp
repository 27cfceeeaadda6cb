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
#include "phase_state.h"
#include "common/iorx_log.h"

namespace iorx {

bool
phaseTransitionAllowed(iorx_phase_state_t from, iorx_phase_state_t to) {
    switch (from) {
    case IORX_PHASE_NOT_STARTED:
        return to == IORX_PHASE_RUNNING;
    case IORX_PHASE_RUNNING:
        return to == IORX_PHASE_STONEWALL_HIT || to == IORX_PHASE_COMPLETED ||
            to == IORX_PHASE_FAILED;
    case IORX_PHASE_STONEWALL_HIT:
    case IORX_PHASE_COMPLETED:
    case IORX_PHASE_FAILED:
        return to == IORX_PHASE_SYNCHRONIZED;
    case IORX_PHASE_SYNCHRONIZED:
        return to == IORX_PHASE_DONE;
    case IORX_PHASE_DONE:
        return false;
    }
    return false;
}

void
advancePhase(iorxPhaseResult &result, iorx_phase_state_t to) {
    IORX_ASSERT(phaseTransitionAllowed(result.state, to))
        << iorxEnumStrings::phaseStr(result.phase) << ": "
        << iorxEnumStrings::phaseStateStr(result.state) << " -> "
        << iorxEnumStrings::phaseStateStr(to);
    IORX_TRACE << "Rank " << result.rank << " " << iorxEnumStrings::phaseStr(result.phase) << " "
               << iorxEnumStrings::phaseStateStr(to);
    result.state = to;
}

void
finishPhase(iorxPhaseResult &result) {
    if (result.failed) {
        advancePhase(result, IORX_PHASE_FAILED);
    } else if (result.stonewallHit) {
        advancePhase(result, IORX_PHASE_STONEWALL_HIT);
    } else {
        advancePhase(result, IORX_PHASE_COMPLETED);
    }
}

bool
recordStatus(iorxPhaseResult &result, iorx_status_t status, const iorxTestParams &params) {
    switch (status) {
    case IORX_SUCCESS:
    case IORX_IN_PROG:
        return false;
    case IORX_ERR_TIMEOUT:
    case IORX_ERR_CANCELED:
        if (result.status == IORX_SUCCESS) {
            result.status = status;
        }
        return false;
    case IORX_ERR_VERIFICATION_MISMATCH:
        if (!params.abortOnVerifyFailure) {
            return false;
        }
        break;
    default:
        break;
    }

    // The first fatal error wins over expected termination
    if (!result.failed) {
        result.failed = true;
        result.status = status;
    }
    return true;
}

} // namespace iorx
