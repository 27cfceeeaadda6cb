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
#include "posix_backend.h"
#include "plugin_manager.h"
#include "common.h"
#include "common/aligned_buffer.h"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstring>
#include <thread>
#include <sys/stat.h>

namespace gtest {
namespace posix {

namespace {

mode_t
currentUmask() {
    const mode_t mask = umask(0);
    umask(mask);
    return mask;
}

iorxXferReq
writeReq(iorx::alignedBuffer &buffer, off_t offset) {
    iorxXferReq req;
    req.op = IORX_WRITE;
    req.buf = buffer.data();
    req.len = buffer.size();
    req.offset = offset;
    return req;
}

// Submits one request from another thread while the window is full; it may
// only return once the caller reaps @p pending
void
expectSubmitWaitsForPoll(iorxPosixEngine &engine,
                         iorxBackendFileH &handle,
                         iorx::alignedBuffer &buffer,
                         off_t offset,
                         iorx_req_id_t pending) {
    std::atomic<bool> submitted{false};
    iorx_req_id_t id = 0;
    iorx_status_t status = IORX_ERR_INTERNAL;
    std::thread submitter([&]() {
        status = engine.xferSubmit(handle, writeReq(buffer, offset), id);
        submitted = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(submitted.load());

    size_t bytes = 0;
    EXPECT_EQ(engine.poll(pending, true, bytes), IORX_SUCCESS);
    submitter.join();
    ASSERT_EQ(status, IORX_SUCCESS);
    EXPECT_TRUE(submitted.load());

    EXPECT_EQ(engine.poll(id, true, bytes), IORX_SUCCESS);
    EXPECT_EQ(bytes, buffer.size());
}

} // namespace

class posixEngineTest : public testing::TestWithParam<std::string> {
protected:
    static constexpr size_t xferSize = 4096;
    static constexpr uint32_t depth = 4;

    ScopedTempDir dir_;
    std::unique_ptr<iorxPosixEngine> engine_;

    void
    SetUp() override {
        iorxBackendInitParams params;
        params.customParams["io_queue"] = GetParam();
        params.customParams["num_workers"] = "2";
        params.queueDepth = depth;
        engine_ = std::make_unique<iorxPosixEngine>(&params);
        ASSERT_FALSE(engine_->getInitErr());
        ASSERT_EQ(engine_->getIoQueueType(), GetParam());
    }

    std::unique_ptr<iorxBackendFileH>
    createFile(const std::string &name) {
        std::unique_ptr<iorxBackendFileH> handle;
        EXPECT_EQ(engine_->create(dir_.file(name), IORX_O_RDWR | IORX_O_TRUNC, handle),
                  IORX_SUCCESS);
        return handle;
    }
};

TEST_P(posixEngineTest, SubmitAndPollWindow) {
    auto handle = createFile("data");
    ASSERT_TRUE(handle);

    std::vector<iorx::alignedBuffer> buffers;
    std::vector<iorx_req_id_t> ids(depth);
    for (uint32_t i = 0; i < depth; i++) {
        buffers.emplace_back(xferSize);
        std::memset(buffers[i].data(), 'a' + i, xferSize);

        iorxXferReq req;
        req.op = IORX_WRITE;
        req.buf = buffers[i].data();
        req.len = xferSize;
        req.offset = i * xferSize;
        ASSERT_EQ(engine_->xferSubmit(*handle, req, ids[i]), IORX_SUCCESS);
    }

    for (uint32_t i = 0; i < depth; i++) {
        size_t bytes = 0;
        EXPECT_EQ(engine_->poll(ids[i], true, bytes), IORX_SUCCESS);
        EXPECT_EQ(bytes, xferSize);
    }
    EXPECT_LE(engine_->getMaxInFlight(), depth);
    EXPECT_GE(engine_->getMaxInFlight(), 1U);
    EXPECT_EQ(handle->inFlight(), 0U);

    iorx::alignedBuffer check(xferSize);
    for (uint32_t i = 0; i < depth; i++) {
        iorxXferReq req;
        req.op = IORX_READ;
        req.buf = check.data();
        req.len = xferSize;
        req.offset = i * xferSize;

        size_t bytes = 0;
        ASSERT_EQ(engine_->xferSync(*handle, req, bytes), IORX_SUCCESS);
        ASSERT_EQ(bytes, xferSize);
        EXPECT_EQ(std::memcmp(check.data(), buffers[i].data(), xferSize), 0) << "block " << i;
    }

    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);

    iorxStatInfo info;
    ASSERT_EQ(engine_->stat(dir_.file("data"), info), IORX_SUCCESS);
    EXPECT_EQ(info.size, depth * xferSize);
}

TEST_P(posixEngineTest, PollOfUnknownRequest) {
    size_t bytes = 0;
    EXPECT_EQ(engine_->poll(12345, false, bytes), IORX_ERR_NOT_FOUND);
}

TEST_P(posixEngineTest, CloseWithRequestsInFlight) {
    auto handle = createFile("busy");
    ASSERT_TRUE(handle);

    iorx::alignedBuffer buffer(xferSize);
    iorxXferReq req;
    req.op = IORX_WRITE;
    req.buf = buffer.data();
    req.len = xferSize;

    iorx_req_id_t id;
    ASSERT_EQ(engine_->xferSubmit(*handle, req, id), IORX_SUCCESS);
    {
        LogIgnoreGuard lig("requests in flight");
        EXPECT_EQ(engine_->close(*handle), IORX_ERR_INTERNAL);
        EXPECT_EQ(lig.getIgnoredCount(), 1U);
    }

    size_t bytes = 0;
    EXPECT_EQ(engine_->poll(id, true, bytes), IORX_SUCCESS);
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);
}

TEST_P(posixEngineTest, SubmitWaitsWhileWindowIsFull) {
    auto handle = createFile("full");
    ASSERT_TRUE(handle);

    std::vector<iorx::alignedBuffer> buffers;
    std::vector<iorx_req_id_t> ids(depth);
    for (uint32_t i = 0; i <= depth; i++) {
        buffers.emplace_back(xferSize);
    }
    for (uint32_t i = 0; i < depth; i++) {
        ASSERT_EQ(engine_->xferSubmit(*handle, writeReq(buffers[i], i * xferSize), ids[i]),
                  IORX_SUCCESS);
    }

    expectSubmitWaitsForPoll(*engine_, *handle, buffers[depth], depth * xferSize, ids[0]);

    for (uint32_t i = 1; i < depth; i++) {
        size_t bytes = 0;
        EXPECT_EQ(engine_->poll(ids[i], true, bytes), IORX_SUCCESS);
    }
    EXPECT_EQ(engine_->getMaxInFlight(), depth);
    EXPECT_EQ(handle->inFlight(), 0U);
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);
}

TEST_P(posixEngineTest, FailedRequestReleasesHandle) {
    auto handle = createFile("readonly");
    ASSERT_TRUE(handle);
    ASSERT_EQ(engine_->close(*handle), IORX_SUCCESS);
    ASSERT_EQ(engine_->open(dir_.file("readonly"), IORX_O_RDONLY, handle), IORX_SUCCESS);

    iorx::alignedBuffer buffer(xferSize);
    iorx_req_id_t id;
    ASSERT_EQ(engine_->xferSubmit(*handle, writeReq(buffer, 0), id), IORX_SUCCESS);
    EXPECT_EQ(handle->inFlight(), 1U);

    size_t bytes = 0;
    {
        LogIgnoreGuard lig("failed after");
        EXPECT_EQ(engine_->poll(id, true, bytes), IORX_ERR_CONFIGURATION);
        EXPECT_EQ(lig.getIgnoredCount(), 1U);
    }
    EXPECT_EQ(handle->inFlight(), 0U);
    EXPECT_EQ(engine_->poll(id, true, bytes), IORX_ERR_NOT_FOUND);
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);
}

INSTANTIATE_TEST_SUITE_P(ioQueue, posixEngineTest, testing::Values("THREADPOOL", "POSIXAIO"));

class posixEngineSyncTest : public testing::Test {
protected:
    ScopedTempDir dir_;
    std::unique_ptr<iorxPosixEngine> engine_;

    void
    SetUp() override {
        iorxBackendInitParams params;
        engine_ = std::make_unique<iorxPosixEngine>(&params);
        ASSERT_FALSE(engine_->getInitErr());
        ASSERT_EQ(engine_->getQueueDepth(), 1U);
    }
};

TEST_F(posixEngineSyncTest, OpenMissingFile) {
    std::unique_ptr<iorxBackendFileH> handle;
    EXPECT_EQ(engine_->open(dir_.file("missing"), IORX_O_RDONLY, handle), IORX_ERR_NOT_FOUND);
    EXPECT_FALSE(handle);
    EXPECT_EQ(engine_->remove(dir_.file("missing")), IORX_ERR_NOT_FOUND);
}

TEST_F(posixEngineSyncTest, ExclusiveCreate) {
    std::unique_ptr<iorxBackendFileH> handle;
    const std::string path = dir_.file("excl");
    ASSERT_EQ(engine_->create(path, IORX_O_WRONLY | IORX_O_EXCL, handle), IORX_SUCCESS);
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);

    std::unique_ptr<iorxBackendFileH> again;
    EXPECT_EQ(engine_->create(path, IORX_O_WRONLY | IORX_O_EXCL, again), IORX_ERR_ALREADY_EXISTS);

    iorxStatInfo info;
    ASSERT_EQ(engine_->stat(path, info), IORX_SUCCESS);
    EXPECT_TRUE(S_ISREG(info.mode));
    EXPECT_EQ(info.mode & 0777, 0664U & ~currentUmask());
}

TEST_F(posixEngineSyncTest, ReadPastEndIsPartial) {
    const std::string path = dir_.file("short");
    std::unique_ptr<iorxBackendFileH> handle;
    ASSERT_EQ(engine_->create(path, IORX_O_RDWR, handle), IORX_SUCCESS);

    char data[100] = {};
    iorxXferReq req;
    req.op = IORX_WRITE;
    req.buf = data;
    req.len = sizeof(data);

    size_t bytes = 0;
    ASSERT_EQ(engine_->xferSync(*handle, req, bytes), IORX_SUCCESS);

    char out[200];
    req.op = IORX_READ;
    req.buf = out;
    req.len = sizeof(out);
    {
        LogIgnoreGuard lig("POSIX READ");
        EXPECT_EQ(engine_->xferSync(*handle, req, bytes), IORX_ERR_PARTIAL_TRANSFER);
    }
    EXPECT_EQ(bytes, sizeof(data));
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);
}

TEST_F(posixEngineSyncTest, UseAfterClose) {
    std::unique_ptr<iorxBackendFileH> handle;
    ASSERT_EQ(engine_->create(dir_.file("closed"), IORX_O_RDWR, handle), IORX_SUCCESS);
    ASSERT_EQ(engine_->close(*handle), IORX_SUCCESS);

    LogIgnoreGuard lig("on closed handle");
    EXPECT_EQ(engine_->fsync(*handle), IORX_ERR_INTERNAL);
    EXPECT_EQ(engine_->close(*handle), IORX_ERR_INTERNAL);
    EXPECT_EQ(lig.getIgnoredCount(), 2U);
}

TEST_F(posixEngineSyncTest, DirectoriesAndNodes) {
    const std::string sub = dir_.file("sub");
    EXPECT_EQ(engine_->mkdir(sub, 0775), IORX_SUCCESS);
    EXPECT_EQ(engine_->mkdir(sub, 0775), IORX_ERR_ALREADY_EXISTS);

    iorxStatInfo info;
    ASSERT_EQ(engine_->stat(sub, info), IORX_SUCCESS);
    EXPECT_TRUE(S_ISDIR(info.mode));

    const std::string node = sub + "/node";
    EXPECT_EQ(engine_->mknod(node), IORX_SUCCESS);
    EXPECT_EQ(engine_->mknod(node), IORX_ERR_ALREADY_EXISTS);
    EXPECT_EQ(engine_->rename(node, sub + "/moved"), IORX_SUCCESS);
    EXPECT_EQ(engine_->stat(node, info), IORX_ERR_NOT_FOUND);
    ASSERT_EQ(engine_->stat(sub + "/moved", info), IORX_SUCCESS);
    EXPECT_EQ(info.size, 0U);

    EXPECT_EQ(engine_->remove(sub + "/moved"), IORX_SUCCESS);
    EXPECT_EQ(engine_->rmdir(sub), IORX_SUCCESS);
    EXPECT_EQ(engine_->rmdir(sub), IORX_ERR_NOT_FOUND);
}

TEST_F(posixEngineSyncTest, InlineSubmission) {
    std::unique_ptr<iorxBackendFileH> handle;
    ASSERT_EQ(engine_->create(dir_.file("inline"), IORX_O_RDWR, handle), IORX_SUCCESS);

    char data[512] = {1};
    iorxXferReq req;
    req.op = IORX_WRITE;
    req.buf = data;
    req.len = sizeof(data);

    iorx_req_id_t id;
    ASSERT_EQ(engine_->xferSubmit(*handle, req, id), IORX_SUCCESS);
    EXPECT_EQ(engine_->cancel(id), IORX_SUCCESS);

    size_t bytes = 0;
    EXPECT_EQ(engine_->poll(id, false, bytes), IORX_SUCCESS);
    EXPECT_EQ(bytes, sizeof(data));
    EXPECT_EQ(engine_->poll(id, false, bytes), IORX_ERR_NOT_FOUND);
    EXPECT_EQ(engine_->getMaxInFlight(), 1U);
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);
}

TEST_F(posixEngineSyncTest, InlineWindowOfOne) {
    std::unique_ptr<iorxBackendFileH> handle;
    ASSERT_EQ(engine_->create(dir_.file("window"), IORX_O_RDWR, handle), IORX_SUCCESS);

    iorx::alignedBuffer first(512);
    iorx::alignedBuffer second(512);
    iorx_req_id_t id;
    ASSERT_EQ(engine_->xferSubmit(*handle, writeReq(first, 0), id), IORX_SUCCESS);

    expectSubmitWaitsForPoll(*engine_, *handle, second, 512, id);
    EXPECT_EQ(engine_->getMaxInFlight(), 1U);
    EXPECT_EQ(handle->inFlight(), 0U);
    EXPECT_EQ(engine_->close(*handle), IORX_SUCCESS);
}

TEST_F(posixEngineSyncTest, DirectOpenRejected) {
    // procfs files refuse O_DIRECT with EINVAL
    std::unique_ptr<iorxBackendFileH> handle;
    LogIgnoreGuard lig("Direct I/O is not supported");
    EXPECT_EQ(engine_->open("/proc/self/status", IORX_O_RDONLY | IORX_O_DIRECT, handle),
              IORX_ERR_NOT_SUPPORTED);
    EXPECT_FALSE(handle);
    EXPECT_EQ(lig.getIgnoredCount(), 1U);
}

TEST(posixEngineThreadPool, CancelWithdrawsQueuedRequest) {
    ScopedTempDir dir;
    iorxBackendInitParams params;
    params.customParams["io_queue"] = "THREADPOOL";
    params.customParams["num_workers"] = "1";
    params.queueDepth = 2;
    iorxPosixEngine engine(&params);
    ASSERT_FALSE(engine.getInitErr());

    std::unique_ptr<iorxBackendFileH> handle;
    ASSERT_EQ(engine.create(dir.file("cancel"), IORX_O_RDWR | IORX_O_TRUNC, handle),
              IORX_SUCCESS);

    // The single worker is busy with the large write while the second waits
    iorx::alignedBuffer large(64 * 1024 * 1024);
    iorx::alignedBuffer small(4096);
    std::memset(large.data(), 'x', large.size());

    iorx_req_id_t busy;
    iorx_req_id_t queued;
    ASSERT_EQ(engine.xferSubmit(*handle, writeReq(large, 0), busy), IORX_SUCCESS);
    ASSERT_EQ(engine.xferSubmit(*handle, writeReq(small, large.size()), queued), IORX_SUCCESS);
    EXPECT_EQ(engine.cancel(queued), IORX_SUCCESS);

    size_t bytes = 1;
    EXPECT_EQ(engine.poll(queued, true, bytes), IORX_ERR_CANCELED);
    EXPECT_EQ(bytes, 0U);
    EXPECT_EQ(handle->inFlight(), 1U);

    EXPECT_EQ(engine.poll(busy, true, bytes), IORX_SUCCESS);
    EXPECT_EQ(bytes, large.size());
    EXPECT_EQ(handle->inFlight(), 0U);
    EXPECT_EQ(engine.close(*handle), IORX_SUCCESS);

    iorxStatInfo info;
    ASSERT_EQ(engine.stat(dir.file("cancel"), info), IORX_SUCCESS);
    EXPECT_EQ(info.size, large.size());
}

TEST(posixEngineRegistry, UnknownIoQueue) {
    LogIgnoreGuard lig_type("Unknown POSIX io queue type");
    LogIgnoreGuard lig_init("Failed to initialize backend POSIX");

    iorxBackendInitParams params;
    params.customParams["io_queue"] = "URING";
    std::unique_ptr<iorxBackendEngine> engine;

    EXPECT_EQ(iorxPluginManager::getInstance().createEngine("POSIX", params, engine),
              IORX_ERR_CONFIGURATION);
    EXPECT_FALSE(engine);
    EXPECT_EQ(lig_type.getIgnoredCount(), 1U);
}

TEST(posixEngineRegistry, MalformedWorkerCount) {
    LogIgnoreGuard lig("Invalid POSIX backend parameter");

    iorxBackendInitParams params;
    params.customParams["num_workers"] = "many";
    iorxPosixEngine engine(&params);
    EXPECT_TRUE(engine.getInitErr());
}

} // namespace posix
} // namespace gtest
