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
#include "phase/xfer_pipeline.h"
#include "phase/data_pattern.h"
#include "posix_backend.h"
#include "common.h"

#include <gtest/gtest.h>
#include <set>

namespace gtest {
namespace xfer_pipeline {

class xferPipelineTest : public testing::TestWithParam<uint32_t> {
protected:
    static constexpr size_t xferSize = 8192;
    static constexpr uint64_t numXfers = 16;

    ScopedTempDir dir_;
    std::unique_ptr<iorxPosixEngine> engine_;
    std::unique_ptr<iorxBackendFileH> handle_;

    void
    SetUp() override {
        iorxBackendInitParams params;
        params.queueDepth = GetParam();
        params.customParams["io_queue"] = "THREADPOOL";
        engine_ = std::make_unique<iorxPosixEngine>(&params);
        ASSERT_FALSE(engine_->getInitErr());
        ASSERT_EQ(engine_->create(dir_.file("pipeline"), IORX_O_RDWR, handle_), IORX_SUCCESS);
    }

    void
    TearDown() override {
        if (handle_) {
            EXPECT_EQ(engine_->close(*handle_), IORX_SUCCESS);
        }
    }

    // Pushes numXfers transfers through the window, returns their completions
    std::vector<iorxXferCompletion>
    runAll(iorxXferPipeline &pipeline, iorx_xfer_op_t op) {
        std::vector<iorxXferCompletion> done;
        for (uint64_t i = 0; i < numXfers; i++) {
            size_t slot;
            EXPECT_EQ(pipeline.acquire(slot, done), IORX_SUCCESS);
            EXPECT_LE(pipeline.outstanding(), GetParam());

            const off_t offset = i * xferSize;
            if (op == IORX_WRITE) {
                iorx::fillPattern(pipeline.buffer(slot), xferSize, 0, 0);
                iorx::stampPattern(
                    pipeline.buffer(slot), xferSize, offset, 0, IORX_PACKET_OFFSET);
            }
            EXPECT_EQ(pipeline.submit(slot, op, offset, done), IORX_SUCCESS);
        }
        pipeline.drain(done);
        return done;
    }
};

TEST_P(xferPipelineTest, WindowIsBounded) {
    iorxXferPipeline pipeline(*engine_, *handle_, GetParam(), xferSize);
    EXPECT_EQ(pipeline.slots(), GetParam());

    const std::vector<iorxXferCompletion> done = runAll(pipeline, IORX_WRITE);
    ASSERT_EQ(done.size(), numXfers);
    EXPECT_EQ(pipeline.outstanding(), 0U);
    EXPECT_GE(pipeline.maxOutstanding(), 1U);
    EXPECT_LE(pipeline.maxOutstanding(), GetParam());

    std::set<off_t> offsets;
    for (const auto &completion : done) {
        EXPECT_EQ(completion.status, IORX_SUCCESS);
        EXPECT_EQ(completion.bytes, xferSize);
        EXPECT_GE(completion.latency, 0);
        EXPECT_LT(completion.slot, pipeline.slots());
        offsets.insert(completion.offset);
    }
    EXPECT_EQ(offsets.size(), numXfers);
}

TEST_P(xferPipelineTest, ReadBackThroughWindow) {
    {
        iorxXferPipeline writer(*engine_, *handle_, GetParam(), xferSize);
        runAll(writer, IORX_WRITE);
    }

    iorxXferPipeline reader(*engine_, *handle_, GetParam(), xferSize);
    std::vector<iorxXferCompletion> done;
    for (uint64_t i = 0; i < numXfers; i++) {
        size_t slot;
        ASSERT_EQ(reader.acquire(slot, done), IORX_SUCCESS);
        ASSERT_EQ(reader.submit(slot, IORX_READ, i * xferSize, done), IORX_SUCCESS);

        // Completed slots are only reused by the next acquire
        for (const auto &completion : done) {
            EXPECT_EQ(iorx::verifyPattern(reader.buffer(completion.slot),
                                          xferSize,
                                          completion.offset,
                                          0,
                                          0,
                                          IORX_PACKET_OFFSET),
                      0U);
        }
        done.clear();
    }
    reader.drain(done);
    for (const auto &completion : done) {
        EXPECT_EQ(completion.status, IORX_SUCCESS);
    }
}

TEST_P(xferPipelineTest, CancelAllReapsEverything) {
    iorxXferPipeline pipeline(*engine_, *handle_, GetParam(), xferSize);
    std::vector<iorxXferCompletion> done;

    for (uint32_t i = 0; i < GetParam(); i++) {
        size_t slot;
        ASSERT_EQ(pipeline.acquire(slot, done), IORX_SUCCESS);
        ASSERT_EQ(pipeline.submit(slot, IORX_WRITE, i * xferSize, done), IORX_SUCCESS);
    }

    pipeline.cancelAll(done);
    EXPECT_EQ(pipeline.outstanding(), 0U);
    EXPECT_EQ(done.size(), GetParam());
    for (const auto &completion : done) {
        EXPECT_TRUE(completion.status == IORX_SUCCESS || completion.status == IORX_ERR_CANCELED)
            << iorxEnumStrings::statusStr(completion.status);
    }
    EXPECT_EQ(handle_->inFlight(), 0U);
}

INSTANTIATE_TEST_SUITE_P(depth, xferPipelineTest, testing::Values(1U, 2U, 4U));

} // namespace xfer_pipeline
} // namespace gtest
