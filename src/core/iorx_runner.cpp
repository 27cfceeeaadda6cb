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
#include "iorx.h"
#include "plugin_manager.h"
#include "metrics/metrics.h"
#include "phase/access_pattern.h"
#include "phase/io_phase.h"
#include "phase/md_phase.h"
#include "phase/phase_context.h"
#include "phase/phase_state.h"
#include "phase/phase_sync.h"
#include "common/iorx_log.h"
#include "common/iorx_time.h"
#include <absl/strings/str_format.h>
#include <chrono>

namespace {

constexpr double MiB = 1024.0 * 1024.0;

bool
isIoPhase(iorx_phase_t phase) {
    return phase == IORX_PHASE_WRITE || phase == IORX_PHASE_READ;
}

void
recordAbort(iorxRunResult &result, iorx_phase_t phase, const iorxPhaseDecision &decision) {
    result.aborted = true;
    result.abortPhase = phase;
    result.abortRank = decision.failedRank;
    result.abortStatus = decision.failureStatus;
}

} // namespace

iorxBenchRunner::iorxBenchRunner(const iorxTestParams &params, iorxRT &rt)
    : params_(params),
      rt_(rt),
      namer_(std::make_shared<iorxFlatMdNamer>(params.mdTestDir, params.mdUniqueDirPerTask)) {}

iorxBenchRunner::~iorxBenchRunner() = default;

void
iorxBenchRunner::setMdNamer(std::shared_ptr<const iorxMdNamer> namer) {
    namer_ = std::move(namer);
}

iorx_status_t
iorxBenchRunner::barrier(const std::string &id) {
    if (rt_.barrier(id) != 0) {
        IORX_ERROR << "Barrier " << id << " failed on rank " << rt_.getRank();
        return IORX_ERR_INTERNAL;
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxBenchRunner::setup(iorxRunResult &result) {
    // Same parameters everywhere, so every rank takes the same decision
    iorx_status_t status = params_.validate();
    if (status != IORX_SUCCESS) {
        return status;
    }

    iorxBackendInitParams init_params;
    init_params.customParams = params_.backendParams;
    init_params.queueDepth = params_.queueDepth;
    init_params.rank = rt_.getRank();

    status = iorxPluginManager::getInstance().createEngine(params_.api, init_params, engine_);

    iorxPhaseDecision decision;
    IORX_LOG_AND_RETURN_IF_ERROR(
        iorx::agreeOnOutcome(rt_, status != IORX_SUCCESS, status, false, decision),
        "Backend agreement");
    if (decision.abort) {
        if (rt_.getRank() == 0) {
            IORX_ERROR << absl::StrFormat("Backend %s unusable on rank %d: %s",
                                          params_.api,
                                          decision.failedRank,
                                          iorxEnumStrings::statusStr(decision.failureStatus));
        }
        engine_.reset();
        return decision.failureStatus;
    }

    // A negative seed lets rank 0 pick one; the offsets of the write and
    // read phases of shared files depend on it
    int64_t seed = params_.randomSeed;
    if (seed < 0 && rt_.getRank() == 0) {
        seed = std::chrono::steady_clock::now().time_since_epoch().count() & 0x7fffffff;
    }
    if (rt_.broadcastInt(&seed, 1, 0) != 0) {
        IORX_ERROR << "Random seed broadcast failed on rank " << rt_.getRank();
        return IORX_ERR_INTERNAL;
    }
    result.randomSeed = seed;
    return IORX_SUCCESS;
}

iorx_status_t
iorxBenchRunner::runPhase(iorxPhaseContext &ctx,
                          iorx_phase_t phase,
                          iorxRunResult &result,
                          bool &stop) {
    iorxPhaseResult local;
    iorx_status_t status = isIoPhase(phase) ? iorxIoPhase(ctx, phase).execute(local) :
                                              iorxMdPhase(ctx, phase).execute(local);
    if (status != IORX_SUCCESS) {
        return status;
    }

    iorxPhaseDecision decision;
    IORX_LOG_AND_RETURN_IF_ERROR(iorx::synchronizePhase(rt_, params_, local, decision),
                                 "Phase synchronization");

    iorxPhaseSummary summary;
    IORX_LOG_AND_RETURN_IF_ERROR(iorx::summarizePhase(rt_, local, summary), "Phase summary");
    iorx::advancePhase(local, IORX_PHASE_DONE);

    summary.local = local;
    summary.failed = decision.abort;
    summary.failedRank = decision.failedRank;
    summary.failureStatus = decision.failureStatus;
    summary.timedOut = decision.timedOut;
    summary.stonewalledRanks = decision.stonewalledRanks;

    if (phase == IORX_PHASE_WRITE) {
        ctx.writtenItems = summary.rankItems;
    } else if (phase == IORX_PHASE_MD_CREATE) {
        ctx.createdItems = summary.rankItems;
    }

    if (rt_.getRank() == 0) {
        IORX_INFO << absl::StrFormat(
            "%s rep %d: %d items, %.2f MiB/s, %.2f ops/s, %.6f s, %d stonewalled",
            iorxEnumStrings::phaseStr(phase),
            ctx.repetition,
            summary.totalItems,
            summary.aggBandwidth / MiB,
            summary.aggRate,
            summary.span,
            summary.stonewalledRanks);
        if (summary.verifyFailures) {
            IORX_WARN << absl::StrFormat("%s rep %d: %d items failed verification",
                                         iorxEnumStrings::phaseStr(phase),
                                         ctx.repetition,
                                         summary.verifyFailures);
        }
    }
    result.phases.push_back(summary);

    if (decision.abort) {
        if (rt_.getRank() == 0) {
            IORX_ERROR << absl::StrFormat("%s failed on rank %d: %s, aborting the run",
                                          iorxEnumStrings::phaseStr(phase),
                                          decision.failedRank,
                                          iorxEnumStrings::statusStr(decision.failureStatus));
        }
        recordAbort(result, phase, decision);
        stop = true;
    } else if (decision.timedOut) {
        result.timedOut = true;
        stop = true;
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxBenchRunner::setupMdTree(iorxPhaseContext &ctx,
                             iorxRunResult &result,
                             bool &root_created,
                             bool &stop) {
    iorx_status_t status = IORX_SUCCESS;
    root_created = false;

    if (rt_.getRank() == 0) {
        status = engine_->mkdir(namer_->rootDirectory(), 0775);
        root_created = status == IORX_SUCCESS;
        if (status == IORX_ERR_ALREADY_EXISTS) {
            status = IORX_SUCCESS;
        }
    }
    IORX_LOG_AND_RETURN_IF_ERROR(barrier("md-setup-root"), "Metadata setup");

    for (const auto &dir : namer_->ownedDirectories(rt_.getRank())) {
        if (status != IORX_SUCCESS) {
            break;
        }
        status = engine_->mkdir(dir, 0775);
        if (status == IORX_ERR_ALREADY_EXISTS) {
            status = IORX_SUCCESS;
        }
    }

    if (status != IORX_SUCCESS) {
        IORX_ERROR << "Rank " << rt_.getRank() << " failed to prepare metadata directories: "
                   << iorxEnumStrings::statusStr(status);
    }

    iorxPhaseDecision decision;
    IORX_LOG_AND_RETURN_IF_ERROR(
        iorx::agreeOnOutcome(rt_, status != IORX_SUCCESS, status, false, decision),
        "Metadata setup agreement");
    if (decision.abort) {
        recordAbort(result, IORX_PHASE_MD_CREATE, decision);
        stop = true;
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxBenchRunner::teardownMdTree(iorxPhaseContext &ctx, bool root_created) {
    const auto dirs = namer_->ownedDirectories(rt_.getRank());
    for (auto it = dirs.rbegin(); it != dirs.rend(); ++it) {
        iorx_status_t status = engine_->rmdir(*it);
        if (status != IORX_SUCCESS) {
            IORX_WARN << "Failed to remove " << *it << ": " << iorxEnumStrings::statusStr(status);
        }
    }
    IORX_LOG_AND_RETURN_IF_ERROR(barrier("md-teardown"), "Metadata teardown");

    if (root_created) {
        iorx_status_t status = engine_->rmdir(namer_->rootDirectory());
        if (status != IORX_SUCCESS) {
            IORX_WARN << "Failed to remove " << namer_->rootDirectory() << ": "
                      << iorxEnumStrings::statusStr(status);
        }
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxBenchRunner::removeTestFiles(iorxPhaseContext &ctx) {
    IORX_LOG_AND_RETURN_IF_ERROR(barrier(absl::StrFormat("cleanup-%d", ctx.repetition)),
                                 "Cleanup");

    if (params_.filePerProc || rt_.getRank() == 0) {
        const std::string path = iorx::testFilePath(params_, rt_.getRank());
        iorx_status_t status = engine_->remove(path);
        if (status != IORX_SUCCESS && status != IORX_ERR_NOT_FOUND) {
            IORX_WARN << "Failed to remove " << path << ": " << iorxEnumStrings::statusStr(status);
        }
    }

    return barrier(absl::StrFormat("cleanup-done-%d", ctx.repetition));
}

iorx_status_t
iorxBenchRunner::run(iorxRunResult &result) {
    result = iorxRunResult();

    iorx_status_t status = setup(result);
    if (status != IORX_SUCCESS) {
        return status;
    }

    iorxPhaseContext ctx(params_, rt_, *engine_, *namer_);
    ctx.randomSeed = static_cast<uint64_t>(result.randomSeed);
    ctx.runStart = iorxTime::getSec();

    bool stop = false;
    for (uint32_t rep = 0; rep < params_.repetitions && !stop; rep++) {
        ctx.repetition = rep;
        ctx.writtenItems.clear();
        ctx.createdItems.clear();

        if (params_.writeFile && !stop) {
            IORX_LOG_AND_RETURN_IF_ERROR(runPhase(ctx, IORX_PHASE_WRITE, result, stop), "Write");
        }
        if (params_.readFile && !stop) {
            IORX_LOG_AND_RETURN_IF_ERROR(runPhase(ctx, IORX_PHASE_READ, result, stop), "Read");
        }
        if (params_.hasIoPhases() && !params_.keepFile && !result.aborted) {
            IORX_LOG_AND_RETURN_IF_ERROR(removeTestFiles(ctx), "Cleanup");
        }

        if (!params_.hasMdPhases() || stop) {
            continue;
        }

        bool root_created = false;
        IORX_LOG_AND_RETURN_IF_ERROR(setupMdTree(ctx, result, root_created, stop),
                                     "Metadata setup");

        const std::pair<bool, iorx_phase_t> md_phases[] = {
            {params_.mdCreate, IORX_PHASE_MD_CREATE},
            {params_.mdStat, IORX_PHASE_MD_STAT},
            {params_.mdRead, IORX_PHASE_MD_READ},
            {params_.mdRemove, IORX_PHASE_MD_REMOVE},
        };
        for (const auto &md_phase : md_phases) {
            if (md_phase.first && !stop) {
                IORX_LOG_AND_RETURN_IF_ERROR(runPhase(ctx, md_phase.second, result, stop),
                                             "Metadata phase");
            }
        }

        if (params_.mdRemove && !result.aborted) {
            IORX_LOG_AND_RETURN_IF_ERROR(teardownMdTree(ctx, root_created), "Metadata teardown");
        }
    }

    result.summaries = iorx::summarizeRepetitions(result.phases);
    return result.aborted ? result.abortStatus : IORX_SUCCESS;
}
