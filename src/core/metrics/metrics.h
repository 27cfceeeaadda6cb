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
#ifndef IORX_SRC_CORE_METRICS_METRICS_H
#define IORX_SRC_CORE_METRICS_METRICS_H

#include <vector>
#include "iorx_results.h"
#include "runtime/iorx_rt.h"

/**
 * One pass min/max/mean/stddev: keeps count, sum and sum of squares so that
 * partial accumulators of several ranks combine without a second pass.
 * The standard deviation is the population one.
 */
class iorxStatAccumulator {
public:
    void
    add(double value);

    void
    merge(const iorxStatAccumulator &other);

    iorxAggregateStat
    toStat() const;

    uint64_t
    count() const {
        return count_;
    }

private:
    friend iorx_status_t
    reduceAccumulators(iorxRT &rt, const std::vector<iorxStatAccumulator *> &accs);

    uint64_t count_ = 0;
    double sum_ = 0;
    double sumsq_ = 0;
    double min_ = 0;
    double max_ = 0;
};

// Combines the accumulators of all ranks in place with two collectives
iorx_status_t
reduceAccumulators(iorxRT &rt, const std::vector<iorxStatAccumulator *> &accs);

namespace iorx {

// Folds the phase results of all ranks into 'summary'. Collective.
iorx_status_t
summarizePhase(iorxRT &rt, const iorxPhaseResult &result, iorxPhaseSummary &summary);

// Aggregate bandwidth and rate of each phase kind over the repetitions
std::vector<iorxRunSummary>
summarizeRepetitions(const std::vector<iorxPhaseSummary> &phases);

} // namespace iorx

#endif
