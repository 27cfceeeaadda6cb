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

#include "io_queue.h"
#include "common/iorx_log.h"
#include <absl/strings/str_format.h>
#include <deque>
#include <thread>

struct iorxThreadPoolIO : public iorxPosixIO {
    bool started = false;
};

class iorxPosixIOQueueThreadPool : public iorxPosixIOQueueImpl<iorxThreadPoolIO> {
public:
    iorxPosixIOQueueThreadPool(uint32_t queue_depth, uint32_t num_workers);
    virtual ~iorxPosixIOQueueThreadPool() override;

    virtual iorx_status_t
    submit(int fd, const iorxXferReq &req, void *ctx, iorx_req_id_t &id) override;
    virtual iorx_status_t
    poll(iorx_req_id_t id, bool block, size_t &bytes, void *&ctx) override;
    virtual iorx_status_t
    cancel(iorx_req_id_t id) override;

private:
    void
    workerLoop();

    std::deque<iorxThreadPoolIO *> ios_to_submit_;
    std::condition_variable work_cv_;
    std::vector<std::thread> workers_;
    bool stop_ = false;
};

iorxPosixIOQueueThreadPool::iorxPosixIOQueueThreadPool(uint32_t queue_depth,
                                                       uint32_t num_workers)
    : iorxPosixIOQueueImpl<iorxThreadPoolIO>(queue_depth, num_workers) {
    workers_.reserve(num_workers_);
    for (uint32_t i = 0; i < num_workers_; i++) {
        workers_.emplace_back(&iorxPosixIOQueueThreadPool::workerLoop, this);
    }
    IORX_DEBUG << absl::StrFormat(
        "Thread pool io queue: depth %u, %u workers", queue_depth_, num_workers_);
}

iorxPosixIOQueueThreadPool::~iorxPosixIOQueueThreadPool() {
    {
        std::lock_guard<std::mutex> lk(lock_);
        stop_ = true;
        for (auto *io : ios_to_submit_) {
            io->status = IORX_ERR_CANCELED;
            io->done = true;
        }
        ios_to_submit_.clear();
    }
    work_cv_.notify_all();
    for (auto &worker : workers_) {
        worker.join();
    }
}

void
iorxPosixIOQueueThreadPool::workerLoop() {
    std::unique_lock<std::mutex> lk(lock_);
    while (true) {
        work_cv_.wait(lk, [this] { return stop_ || !ios_to_submit_.empty(); });
        if (ios_to_submit_.empty()) {
            return;
        }

        iorxThreadPoolIO *io = ios_to_submit_.front();
        ios_to_submit_.pop_front();
        io->started = true;

        const int fd = io->fd;
        const iorxXferReq req = io->req;
        lk.unlock();

        size_t bytes = 0;
        const iorx_status_t status = iorxPosixTransfer(fd, req, bytes);

        lk.lock();
        io->bytes = bytes;
        io->status = io->cancel_requested ? IORX_ERR_CANCELED : status;
        io->done = true;
        done_cv_.notify_all();
    }
}

iorx_status_t
iorxPosixIOQueueThreadPool::submit(int fd,
                                    const iorxXferReq &req,
                                    void *ctx,
                                    iorx_req_id_t &id) {
    std::unique_lock<std::mutex> lk(lock_);
    iorxThreadPoolIO *io = acquireEntry(lk, fd, req, ctx);
    io->started = false;
    trackEntry(io);
    ios_to_submit_.push_back(io);
    id = io->id;
    lk.unlock();

    work_cv_.notify_one();
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixIOQueueThreadPool::poll(iorx_req_id_t id,
                                  bool block,
                                  size_t &bytes,
                                  void *&ctx) {
    std::unique_lock<std::mutex> lk(lock_);
    iorxThreadPoolIO *io = findEntry(id);
    if (!io) {
        IORX_DEBUG << "Poll of unknown request " << id;
        return IORX_ERR_NOT_FOUND;
    }

    if (!io->done) {
        if (!block) {
            return IORX_IN_PROG;
        }
        done_cv_.wait(lk, [io] { return io->done; });
    }

    bytes = io->bytes;
    ctx = io->ctx;
    const iorx_status_t status = io->status;
    releaseEntry(io);
    return status;
}

// Queued requests are withdrawn; running ones complete but report
// IORX_ERR_CANCELED. Finished requests keep their result.
iorx_status_t
iorxPosixIOQueueThreadPool::cancel(iorx_req_id_t id) {
    std::lock_guard<std::mutex> lk(lock_);
    iorxThreadPoolIO *io = findEntry(id);
    if (!io) {
        return IORX_ERR_NOT_FOUND;
    }

    if (io->done) {
        return IORX_SUCCESS;
    }

    if (!io->started) {
        auto it = std::find(ios_to_submit_.begin(), ios_to_submit_.end(), io);
        if (it != ios_to_submit_.end()) {
            ios_to_submit_.erase(it);
        }
        io->status = IORX_ERR_CANCELED;
        io->done = true;
        done_cv_.notify_all();
        return IORX_SUCCESS;
    }

    io->cancel_requested = true;
    return IORX_SUCCESS;
}

std::unique_ptr<iorxPosixIOQueue>
iorxPosixIOQueueThreadPoolCreate(uint32_t queue_depth, uint32_t num_workers) {
    return std::make_unique<iorxPosixIOQueueThreadPool>(queue_depth, num_workers);
}
