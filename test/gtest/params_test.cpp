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
#include "iorx_params.h"
#include "common.h"

#include <gtest/gtest.h>
#include <functional>

namespace gtest {
namespace params {

TEST(testParams, DefaultsAreValid) {
    iorxTestParams params;
    EXPECT_EQ(params.validate(), IORX_SUCCESS);
    EXPECT_EQ(params.transfersPerBlock(), 4U);
    EXPECT_TRUE(params.hasIoPhases());
    EXPECT_FALSE(params.hasMdPhases());
    EXPECT_EQ(params.dataPacketType, IORX_PACKET_OFFSET);
    EXPECT_EQ(params.queueDepth, 1U);
    EXPECT_TRUE(params.interPhaseBarriers);
}

struct invalidCase {
    const char *name;
    std::function<void(iorxTestParams &)> apply;
};

class invalidParamsTest : public ::testing::TestWithParam<invalidCase> {};

TEST_P(invalidParamsTest, Rejected) {
    iorxTestParams params;
    GetParam().apply(params);

    LogIgnoreGuard lig("Invalid test parameters");
    EXPECT_EQ(params.validate(), IORX_ERR_CONFIGURATION);
    EXPECT_EQ(lig.getIgnoredCount(), 1U);
}

INSTANTIATE_TEST_SUITE_P(
    params,
    invalidParamsTest,
    ::testing::Values(
        invalidCase{"NoBackend", [](iorxTestParams &p) { p.api.clear(); }},
        invalidCase{"ZeroTransfer", [](iorxTestParams &p) { p.transferSize = 0; }},
        invalidCase{"UnevenBlock", [](iorxTestParams &p) { p.blockSize = 1000000; }},
        invalidCase{"ZeroSegments", [](iorxTestParams &p) { p.segmentCount = 0; }},
        invalidCase{"UnalignedDirectIo",
                    [](iorxTestParams &p) {
                        p.directIo = true;
                        p.blockSize = 3000;
                        p.transferSize = 1000;
                    }},
        invalidCase{"ZeroRepetitions", [](iorxTestParams &p) { p.repetitions = 0; }},
        invalidCase{"ZeroDepth", [](iorxTestParams &p) { p.queueDepth = 0; }},
        invalidCase{"NegativeDeadline",
                    [](iorxTestParams &p) { p.deadlineForStonewalling = -1; }},
        invalidCase{"BothReorders",
                    [](iorxTestParams &p) {
                        p.reorderTasks = true;
                        p.reorderTasksRandom = true;
                    }},
        invalidCase{"NoPhase",
                    [](iorxTestParams &p) {
                        p.writeFile = false;
                        p.readFile = false;
                    }},
        invalidCase{"DirsWithData",
                    [](iorxTestParams &p) {
                        p.mdItems = 4;
                        p.mdDirsOnly = true;
                        p.mdWriteBytes = 10;
                    }},
        invalidCase{"NodeWithData",
                    [](iorxTestParams &p) {
                        p.mdItems = 4;
                        p.mdMakeNode = true;
                        p.mdWriteBytes = 10;
                    }},
        invalidCase{"ReadBeyondWritten",
                    [](iorxTestParams &p) {
                        p.mdItems = 4;
                        p.mdRead = true;
                        p.mdWriteBytes = 4;
                        p.mdReadBytes = 8;
                    }}),
    [](const ::testing::TestParamInfo<invalidCase> &info) { return info.param.name; });

TEST(testParams, MetadataOnly) {
    iorxTestParams params;
    params.writeFile = false;
    params.readFile = false;
    params.transferSize = 0;
    params.mdItems = 10;
    EXPECT_EQ(params.validate(), IORX_SUCCESS);
}

TEST(testParams, FsyncPerWriteWithoutWrite) {
    iorxTestParams params;
    params.writeFile = false;
    params.fsyncPerWrite = true;

    LogIgnoreGuard lig("fsyncPerWrite has no effect");
    EXPECT_EQ(params.validate(), IORX_SUCCESS);
    EXPECT_EQ(lig.getIgnoredCount(), 1U);
}

} // namespace params
} // namespace gtest
