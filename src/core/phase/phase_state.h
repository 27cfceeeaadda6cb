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
#ifndef IORX_SRC_CORE_PHASE_PHASE_STATE_H
#define IORX_SRC_CORE_PHASE_PHASE_STATE_H

#include "iorx_params.h"
#include "iorx_results.h"

namespace iorx {

// NotStarted -> Running -> (StonewallHit | Completed | Failed) ->
// Synchronized -> Done
bool
phaseTransitionAllowed(iorx_phase_state_t from, iorx_phase_state_t to);

void
advancePhase(iorxPhaseResult &result, iorx_phase_state_t to);

// Moves a running phase to its terminal local state
void
finishPhase(iorxPhaseResult &result);

// Records 'status' on the result. Returns true when it ends the phase as a
// failure; timeouts, cancellations and non fatal verification mismatches
// are expected termination.
bool
recordStatus(iorxPhaseResult &result, iorx_status_t status, const iorxTestParams &params);

} // namespace iorx

#endif
