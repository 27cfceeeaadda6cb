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
#include "phase/access_pattern.h"
#include "common.h"
#include "iorx_test_utils.h"

#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <mutex>

namespace gtest {
namespace runner {

namespace {

// Forwards to a thread runtime and records the barriers it enters
class recordingRT : public iorxRT {
public:
    explicit recordingRT(iorxRT &inner) : inner_(inner) {
        setRank(inner.getRank());
        setSize(inner.getSize());
    }

    int
    barrier(const std::string &barrier_id) override {
        barriers.push_back(barrier_id);
        return inner_.barrier(barrier_id);
    }

    int
    broadcastInt(int64_t *buffer, size_t count, int root_rank) override {
        return inner_.broadcastInt(buffer, count, root_rank);
    }

    int
    allReduceDouble(const double *local_value,
                    double *global_value,
                    size_t count,
                    iorx_reduce_op_t op) override {
        return inner_.allReduceDouble(local_value, global_value, count, op);
    }

    int
    allReduceInt(const int64_t *local_value,
                 int64_t *global_value,
                 size_t count,
                 iorx_reduce_op_t op) override {
        return inner_.allReduceInt(local_value, global_value, count, op);
    }

    std::vector<std::string> barriers;

private:
    iorxRT &inner_;
};

struct rankOutcome {
    iorx_status_t status = IORX_ERR_INTERNAL;
    iorxRunResult result;
    std::vector<std::string> barriers;
};

std::vector<rankOutcome>
runJob(const iorxTestParams &params, int ranks) {
    std::vector<rankOutcome> outcomes(ranks);
    runOnRanks(ranks, [&](iorxRT &rt) {
        recordingRT recorder(rt);
        iorxBenchRunner runner(params, recorder);
        rankOutcome &outcome = outcomes[rt.getRank()];
        outcome.status = runner.run(outcome.result);
        outcome.barriers = recorder.barriers;
    });
    return outcomes;
}

const iorxPhaseSummary *
findPhase(const iorxRunResult &result, iorx_phase_t phase, uint32_t rep = 0) {
    for (const auto &summary : result.phases) {
        if (summary.phase == phase && summary.repetition == rep) {
            return &summary;
        }
    }
    return nullptr;
}

size_t
indexOf(const std::vector<std::string> &ids, const std::string &id) {
    return std::find(ids.begin(), ids.end(), id) - ids.begin();
}

} // namespace

TEST(benchRunner, SingleRankWriteRead) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.checkRead = true;

    const auto outcomes = runJob(params, 1);
    const iorxRunResult &result = outcomes[0].result;
    ASSERT_EQ(outcomes[0].status, IORX_SUCCESS);
    EXPECT_FALSE(result.aborted);
    EXPECT_FALSE(result.timedOut);
    EXPECT_EQ(result.randomSeed, 7);

    ASSERT_EQ(result.phases.size(), 2U);
    for (iorx_phase_t phase : {IORX_PHASE_WRITE, IORX_PHASE_READ}) {
        const iorxPhaseSummary *summary = findPhase(result, phase);
        ASSERT_NE(summary, nullptr);
        EXPECT_EQ(summary->totalItems, 4U);
        EXPECT_EQ(summary->totalBytes, 1048576U);
        EXPECT_EQ(summary->verifyFailures, 0U);
        EXPECT_FALSE(summary->failed);
        EXPECT_EQ(summary->local.state, IORX_PHASE_DONE);
        EXPECT_EQ(summary->local.maxInFlight, 1U);
        EXPECT_GT(summary->aggBandwidth, 0);
    }
    EXPECT_EQ(result.summaries.size(), 2U);
    EXPECT_FALSE(std::filesystem::exists(params.testFileName));
}

TEST(benchRunner, FilePerProcessPipelined) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.filePerProc = true;
    params.queueDepth = 4;
    params.segmentCount = 2;
    params.checkRead = true;
    params.reorderTasks = true;
    params.backendParams["io_queue"] = "THREADPOOL";

    constexpr int ranks = 4;
    const auto outcomes = runJob(params, ranks);

    for (int rank = 0; rank < ranks; rank++) {
        const rankOutcome &outcome = outcomes[rank];
        ASSERT_EQ(outcome.status, IORX_SUCCESS) << "rank " << rank;

        const iorxPhaseSummary *write = findPhase(outcome.result, IORX_PHASE_WRITE);
        const iorxPhaseSummary *read = findPhase(outcome.result, IORX_PHASE_READ);
        ASSERT_NE(write, nullptr);
        ASSERT_NE(read, nullptr);
        EXPECT_EQ(write->totalItems, 8U * ranks);
        EXPECT_EQ(write->totalBytes, 2U * ranks * 1024 * 1024);
        EXPECT_LE(write->local.maxInFlight, 4U);
        EXPECT_GE(write->local.maxInFlight, 1U);
        EXPECT_EQ(read->totalItems, 8U * ranks);
        EXPECT_EQ(read->verifyFailures, 0U);
        EXPECT_EQ(read->local.sourceRank, (rank + 1) % ranks);

        // Every rank walks the same barriers in the same order
        EXPECT_EQ(outcome.barriers, outcomes[0].barriers);
        EXPECT_LT(indexOf(outcome.barriers, "write-end-0"),
                  indexOf(outcome.barriers, "read-end-0"));
        EXPECT_LT(indexOf(outcome.barriers, "read-end-0"),
                  indexOf(outcome.barriers, "cleanup-0"));
        EXPECT_LT(indexOf(outcome.barriers, "cleanup-0"), outcome.barriers.size());

        EXPECT_FALSE(std::filesystem::exists(iorx::testFilePath(params, rank)));
    }
}

TEST(benchRunner, KeepFileAndRepetitions) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.keepFile = true;
    params.repetitions = 3;

    const auto outcomes = runJob(params, 2);
    const iorxRunResult &result = outcomes[0].result;
    ASSERT_EQ(outcomes[0].status, IORX_SUCCESS);
    EXPECT_EQ(result.phases.size(), 6U);
    ASSERT_EQ(result.summaries.size(), 2U);
    EXPECT_EQ(result.summaries[0].repetitions, 3U);
    EXPECT_EQ(result.summaries[1].repetitions, 3U);
    EXPECT_EQ(std::filesystem::file_size(params.testFileName), 2U * 1024 * 1024);
    EXPECT_EQ(indexOf(outcomes[0].barriers, "cleanup-0"), outcomes[0].barriers.size());
}

TEST(benchRunner, StonewalledWriteCapsRead) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.deadlineForStonewalling = 1e-9;
    params.segmentCount = 64;
    params.checkRead = true;

    const auto outcomes = runJob(params, 2);
    for (const auto &outcome : outcomes) {
        ASSERT_EQ(outcome.status, IORX_SUCCESS);
        const iorxPhaseSummary *write = findPhase(outcome.result, IORX_PHASE_WRITE);
        const iorxPhaseSummary *read = findPhase(outcome.result, IORX_PHASE_READ);
        ASSERT_NE(write, nullptr);
        ASSERT_NE(read, nullptr);
        EXPECT_EQ(write->stonewalledRanks, 2U);
        EXPECT_LT(write->totalItems, 2U * 64 * 4);
        const int source = read->local.sourceRank;
        EXPECT_EQ(read->local.assignedItems, static_cast<uint64_t>(write->rankItems[source]));
        EXPECT_EQ(read->verifyFailures, 0U);
    }
}

TEST(benchRunner, RunTimeLimitStopsTheRun) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.maxTimeDuration = 1e-9;
    params.repetitions = 5;

    const auto outcomes = runJob(params, 2);
    const iorxRunResult &result = outcomes[0].result;
    EXPECT_EQ(outcomes[0].status, IORX_SUCCESS);
    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.aborted);
    ASSERT_EQ(result.phases.size(), 1U);
    EXPECT_TRUE(result.phases[0].timedOut);
    EXPECT_EQ(result.phases[0].local.status, IORX_ERR_TIMEOUT);
}

TEST(benchRunner, FailureOnOneRankAbortsAll) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.filePerProc = true;

    // Rank 1 cannot create its file
    std::filesystem::create_directory(iorx::testFilePath(params, 1));

    LogIgnoreGuard lig_open("Rank 1 failed to create");
    LogIgnoreGuard lig_abort("write failed on rank 1");
    const auto outcomes = runJob(params, 3);

    for (const auto &outcome : outcomes) {
        EXPECT_LT(outcome.status, 0);
        EXPECT_TRUE(outcome.result.aborted);
        EXPECT_EQ(outcome.result.abortPhase, IORX_PHASE_WRITE);
        EXPECT_EQ(outcome.result.abortRank, 1);
        EXPECT_EQ(outcome.result.abortStatus, outcome.status);
        ASSERT_EQ(outcome.result.phases.size(), 1U);
        EXPECT_TRUE(outcome.result.phases[0].failed);
        EXPECT_EQ(outcome.result.phases[0].failedRank, 1);
    }
    EXPECT_EQ(lig_open.getIgnoredCount(), 1U);
    EXPECT_EQ(lig_abort.getIgnoredCount(), 1U);

    // Files are kept after an abort
    EXPECT_TRUE(std::filesystem::exists(iorx::testFilePath(params, 0)));
}

TEST(benchRunner, FailureAbortsAllWithoutPhaseBarriers) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.filePerProc = true;
    params.interPhaseBarriers = false;

    std::filesystem::create_directory(iorx::testFilePath(params, 2));

    LogIgnoreGuard lig_open("Rank 2 failed to create");
    LogIgnoreGuard lig_abort("write failed on rank 2");
    const auto outcomes = runJob(params, 3);

    for (const auto &outcome : outcomes) {
        EXPECT_LT(outcome.status, 0);
        EXPECT_TRUE(outcome.result.aborted);
        EXPECT_EQ(outcome.result.abortPhase, IORX_PHASE_WRITE);
        EXPECT_EQ(outcome.result.abortRank, 2);
        ASSERT_EQ(outcome.result.phases.size(), 1U);
        EXPECT_EQ(outcome.result.phases[0].failedRank, 2);
        EXPECT_EQ(indexOf(outcome.barriers, "write-end-0"), outcome.barriers.size());
    }
    EXPECT_EQ(lig_open.getIgnoredCount(), 1U);
    EXPECT_EQ(lig_abort.getIgnoredCount(), 1U);
}

TEST(benchRunner, NativeBackendWriteFailure) {
    ensureTestMemBackend();

    iorxTestParams params;
    params.api = GetTestMemBackendName();
    params.testFileName = "/mem/testFile";
    params.backendParams["fail_writes"] = "1";

    LogIgnoreGuard lig("write failed on rank 0");
    const auto outcomes = runJob(params, 1);
    EXPECT_EQ(outcomes[0].status, IORX_ERR_INTERNAL);
    EXPECT_TRUE(outcomes[0].result.aborted);
    EXPECT_EQ(outcomes[0].result.abortStatus, IORX_ERR_INTERNAL);
    EXPECT_EQ(outcomes[0].result.phases.size(), 1U);
    EXPECT_EQ(lig.getIgnoredCount(), 1U);
}

TEST(benchRunner, NativeBackendRun) {
    ensureTestMemBackend();

    iorxTestParams params;
    params.api = GetTestMemBackendName();
    params.testFileName = "/mem/testFile";
    params.filePerProc = true;
    params.queueDepth = 3;
    params.checkWrite = true;
    params.checkRead = true;
    params.mdItems = 6;
    params.mdTestDir = "/mem/md";
    params.mdUniqueDirPerTask = true;
    params.mdWriteBytes = 128;
    params.mdReadBytes = 128;
    params.mdRead = true;

    const auto outcomes = runJob(params, 2);
    for (const auto &outcome : outcomes) {
        ASSERT_EQ(outcome.status, IORX_SUCCESS);
        ASSERT_EQ(outcome.result.phases.size(), 6U);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_WRITE)->totalItems, 8U);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_READ)->verifyFailures, 0U);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_CREATE)->totalItems, 12U);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_READ)->totalBytes, 12U * 128);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_REMOVE)->totalItems, 12U);
    }
}

TEST(benchRunner, MetadataOnSharedDirectory) {
    ScopedTempDir dir;
    iorxTestParams params = smallIoParams(dir.path());
    params.writeFile = false;
    params.readFile = false;
    params.mdItems = 8;
    params.reorderTasksRandom = true;
    params.reorderTasksRandomSeed = 3;

    constexpr int ranks = 3;
    const auto outcomes = runJob(params, ranks);
    for (const auto &outcome : outcomes) {
        ASSERT_EQ(outcome.status, IORX_SUCCESS);
        ASSERT_EQ(outcome.result.phases.size(), 3U);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_CREATE)->totalItems, 8U * ranks);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_STAT)->totalItems, 8U * ranks);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_REMOVE)->totalItems, 8U * ranks);
        EXPECT_EQ(findPhase(outcome.result, IORX_PHASE_MD_READ), nullptr);
        EXPECT_LT(indexOf(outcome.barriers, "md-setup-root"),
                  indexOf(outcome.barriers, "md-create-end-0"));
        EXPECT_LT(indexOf(outcome.barriers, "md-remove-end-0"),
                  indexOf(outcome.barriers, "md-teardown"));
    }
    EXPECT_FALSE(std::filesystem::exists(params.mdTestDir));
}

TEST(benchRunner, InvalidConfiguration) {
    iorxTestParams params;
    params.blockSize = 1000;
    params.transferSize = 300;

    LogIgnoreGuard lig("Invalid test parameters");
    const auto outcomes = runJob(params, 2);
    for (const auto &outcome : outcomes) {
        EXPECT_EQ(outcome.status, IORX_ERR_CONFIGURATION);
        EXPECT_TRUE(outcome.result.phases.empty());
    }
    EXPECT_EQ(lig.getIgnoredCount(), 2U);
}

TEST(benchRunner, UnknownBackend) {
    iorxTestParams params;
    params.api = "NO_SUCH_BACKEND";

    LogIgnoreGuard lig_missing("is not registered");
    LogIgnoreGuard lig_unusable("Backend NO_SUCH_BACKEND unusable on rank 0");
    const auto outcomes = runJob(params, 2);
    for (const auto &outcome : outcomes) {
        EXPECT_EQ(outcome.status, IORX_ERR_NOT_FOUND);
        EXPECT_TRUE(outcome.result.phases.empty());
    }
    EXPECT_EQ(lig_missing.getIgnoredCount(), 2U);
    EXPECT_EQ(lig_unusable.getIgnoredCount(), 1U);
}

} // namespace runner
} // namespace gtest
