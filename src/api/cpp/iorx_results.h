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
#ifndef _IORX_RESULTS_H
#define _IORX_RESULTS_H

#include <cstdint>
#include <vector>
#include "iorx_types.h"

/**
 * Counters of one phase on one rank. Times are steady clock seconds;
 * startTime/endTime bracket the whole phase, the *Time fields are the
 * open, transfer and close components.
 */
struct iorxPhaseResult {
    iorx_phase_t phase = IORX_PHASE_WRITE;
    int rank = 0;
    // Rank whose data or items were accessed, differs on reordered phases
    int sourceRank = 0;
    uint32_t repetition = 0;

    iorx_phase_state_t state = IORX_PHASE_NOT_STARTED;
    bool failed = false;
    // First fatal error, or IORX_ERR_TIMEOUT when the run deadline stopped
    // the phase
    iorx_status_t status = IORX_SUCCESS;

    uint64_t assignedItems = 0;
    uint64_t items = 0;
    uint64_t bytes = 0;
    uint64_t verifyFailures = 0;
    uint32_t maxInFlight = 0;

    bool stonewallHit = false;
    uint64_t stonewallItems = 0;
    double stonewallTime = 0;

    double startTime = 0;
    double endTime = 0;
    double openTime = 0;
    double xferTime = 0;
    double closeTime = 0;

    // Per item latency, zero while no item completed
    double minLatency = 0;
    double maxLatency = 0;

    double
    elapsed() const {
        return endTime - startTime;
    }

    void
    addLatency(double latency) {
        if (minLatency == 0 || latency < minLatency) {
            minLatency = latency;
        }
        if (latency > maxLatency) {
            maxLatency = latency;
        }
    }
};

struct iorxAggregateStat {
    double min = 0;
    double max = 0;
    double mean = 0;
    double stddev = 0;
    uint64_t count = 0;
};

/*** Cross-rank view of one phase of one repetition ***/
struct iorxPhaseSummary {
    iorx_phase_t phase = IORX_PHASE_WRITE;
    uint32_t repetition = 0;

    uint64_t totalBytes = 0;
    uint64_t totalItems = 0;
    uint64_t verifyFailures = 0;
    uint32_t stonewalledRanks = 0;
    bool timedOut = false;

    double span = 0;
    // Bytes per second over the span from earliest start to latest end
    double aggBandwidth = 0;
    // Items per second over the same span
    double aggRate = 0;
    double minLatency = 0;

    iorxAggregateStat bandwidth;
    iorxAggregateStat rate;
    iorxAggregateStat items;
    iorxAggregateStat elapsed;
    iorxAggregateStat openTime;
    iorxAggregateStat xferTime;
    iorxAggregateStat closeTime;

    // Items completed by each rank, indexed by rank
    std::vector<int64_t> rankItems;

    bool failed = false;
    int failedRank = -1;
    iorx_status_t failureStatus = IORX_SUCCESS;

    iorxPhaseResult local;
};

/*** One phase kind over all repetitions ***/
struct iorxRunSummary {
    iorx_phase_t phase = IORX_PHASE_WRITE;
    uint32_t repetitions = 0;
    iorxAggregateStat bandwidth;
    iorxAggregateStat rate;
    iorxAggregateStat elapsed;
};

struct iorxRunResult {
    std::vector<iorxPhaseSummary> phases;
    std::vector<iorxRunSummary> summaries;

    int64_t randomSeed = 0;
    bool timedOut = false;

    bool aborted = false;
    iorx_phase_t abortPhase = IORX_PHASE_WRITE;
    int abortRank = -1;
    iorx_status_t abortStatus = IORX_SUCCESS;
};

#endif
