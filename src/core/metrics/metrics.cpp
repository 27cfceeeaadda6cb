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
#include "metrics.h"
#include "common/iorx_log.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

void
iorxStatAccumulator::add(double value) {
    if (count_ == 0) {
        min_ = max_ = value;
    } else {
        min_ = std::min(min_, value);
        max_ = std::max(max_, value);
    }
    count_++;
    sum_ += value;
    sumsq_ += value * value;
}

void
iorxStatAccumulator::merge(const iorxStatAccumulator &other) {
    if (other.count_ == 0) {
        return;
    }
    if (count_ == 0) {
        *this = other;
        return;
    }
    min_ = std::min(min_, other.min_);
    max_ = std::max(max_, other.max_);
    count_ += other.count_;
    sum_ += other.sum_;
    sumsq_ += other.sumsq_;
}

iorxAggregateStat
iorxStatAccumulator::toStat() const {
    iorxAggregateStat stat;
    stat.count = count_;
    if (count_ == 0) {
        return stat;
    }

    stat.min = min_;
    stat.max = max_;
    stat.mean = sum_ / count_;
    const double variance = sumsq_ / count_ - stat.mean * stat.mean;
    stat.stddev = variance > 0 ? std::sqrt(variance) : 0;
    return stat;
}

iorx_status_t
reduceAccumulators(iorxRT &rt, const std::vector<iorxStatAccumulator *> &accs) {
    const size_t n = accs.size();
    constexpr double none = std::numeric_limits<double>::infinity();

    // Sums: count, sum, sumsq. Maxima: max and negated min, empty ones
    // contributing -inf.
    std::vector<double> local_sum(3 * n), global_sum(3 * n);
    std::vector<double> local_max(2 * n), global_max(2 * n);
    for (size_t i = 0; i < n; i++) {
        const iorxStatAccumulator &acc = *accs[i];
        local_sum[3 * i] = acc.count_;
        local_sum[3 * i + 1] = acc.sum_;
        local_sum[3 * i + 2] = acc.sumsq_;
        local_max[2 * i] = acc.count_ ? acc.max_ : -none;
        local_max[2 * i + 1] = acc.count_ ? -acc.min_ : -none;
    }

    if (rt.allReduceDouble(local_sum.data(), global_sum.data(), 3 * n, IORX_REDUCE_SUM) != 0 ||
        rt.allReduceDouble(local_max.data(), global_max.data(), 2 * n, IORX_REDUCE_MAX) != 0) {
        IORX_ERROR << "Statistics reduction failed on rank " << rt.getRank();
        return IORX_ERR_INTERNAL;
    }

    for (size_t i = 0; i < n; i++) {
        iorxStatAccumulator &acc = *accs[i];
        acc.count_ = static_cast<uint64_t>(global_sum[3 * i]);
        acc.sum_ = global_sum[3 * i + 1];
        acc.sumsq_ = global_sum[3 * i + 2];
        acc.max_ = acc.count_ ? global_max[2 * i] : 0;
        acc.min_ = acc.count_ ? -global_max[2 * i + 1] : 0;
    }
    return IORX_SUCCESS;
}

namespace iorx {

iorx_status_t
summarizePhase(iorxRT &rt, const iorxPhaseResult &result, iorxPhaseSummary &summary) {
    summary.phase = result.phase;
    summary.repetition = result.repetition;
    summary.local = result;

    const double elapsed = result.elapsed();
    iorxStatAccumulator bandwidth, rate, items, elapsed_acc, open_acc, xfer_acc, close_acc;
    bandwidth.add(elapsed > 0 ? result.bytes / elapsed : 0);
    rate.add(elapsed > 0 ? result.items / elapsed : 0);
    items.add(result.items);
    elapsed_acc.add(elapsed);
    open_acc.add(result.openTime);
    xfer_acc.add(result.xferTime);
    close_acc.add(result.closeTime);

    iorx_status_t status = reduceAccumulators(
        rt, {&bandwidth, &rate, &items, &elapsed_acc, &open_acc, &xfer_acc, &close_acc});
    if (status != IORX_SUCCESS) {
        return status;
    }

    summary.bandwidth = bandwidth.toStat();
    summary.rate = rate.toStat();
    summary.items = items.toStat();
    summary.elapsed = elapsed_acc.toStat();
    summary.openTime = open_acc.toStat();
    summary.xferTime = xfer_acc.toStat();
    summary.closeTime = close_acc.toStat();

    const int64_t local_totals[3] = {static_cast<int64_t>(result.bytes),
                                     static_cast<int64_t>(result.items),
                                     static_cast<int64_t>(result.verifyFailures)};
    int64_t totals[3];

    // Latest end, earliest start, lowest latency of the ranks that did work
    const double local_bounds[3] = {result.endTime,
                                    -result.startTime,
                                    result.items ? -result.minLatency :
                                                   -std::numeric_limits<double>::infinity()};
    double bounds[3];

    if (rt.allReduceInt(local_totals, totals, 3, IORX_REDUCE_SUM) != 0 ||
        rt.allReduceDouble(local_bounds, bounds, 3, IORX_REDUCE_MAX) != 0 ||
        allGatherInt(rt, result.items, summary.rankItems) != 0) {
        IORX_ERROR << "Phase summary reduction failed on rank " << rt.getRank();
        return IORX_ERR_INTERNAL;
    }

    summary.totalBytes = totals[0];
    summary.totalItems = totals[1];
    summary.verifyFailures = totals[2];
    summary.span = bounds[0] + bounds[1];
    summary.minLatency = std::isfinite(bounds[2]) ? -bounds[2] : 0;
    if (summary.span > 0) {
        summary.aggBandwidth = summary.totalBytes / summary.span;
        summary.aggRate = summary.totalItems / summary.span;
    }
    return IORX_SUCCESS;
}

std::vector<iorxRunSummary>
summarizeRepetitions(const std::vector<iorxPhaseSummary> &phases) {
    struct accumulators {
        iorxStatAccumulator bandwidth;
        iorxStatAccumulator rate;
        iorxStatAccumulator elapsed;
    };
    std::map<iorx_phase_t, accumulators> by_phase;

    for (const auto &phase : phases) {
        auto &acc = by_phase[phase.phase];
        acc.bandwidth.add(phase.aggBandwidth);
        acc.rate.add(phase.aggRate);
        acc.elapsed.add(phase.span);
    }

    std::vector<iorxRunSummary> summaries;
    for (const auto &entry : by_phase) {
        iorxRunSummary summary;
        summary.phase = entry.first;
        summary.repetitions = entry.second.bandwidth.count();
        summary.bandwidth = entry.second.bandwidth.toStat();
        summary.rate = entry.second.rate.toStat();
        summary.elapsed = entry.second.elapsed.toStat();
        summaries.push_back(summary);
    }
    return summaries;
}

} // namespace iorx
