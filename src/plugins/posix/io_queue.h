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
#ifndef POSIX_IO_QUEUE_H
#define POSIX_IO_QUEUE_H

#include <stdint.h>
#include <algorithm>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <vector>
#include "iorx_types.h"

/**
 * Moves the whole request with positioned I/O, continuing after short
 * transfers. End of file on read and repeated zero-length writes are
 * reported as IORX_ERR_PARTIAL_TRANSFER with @p bytes set to what was moved.
 */
iorx_status_t
iorxPosixTransfer(int fd, const iorxXferReq &req, size_t &bytes);

/**
 * Bounded window of asynchronous requests. At most queue_depth requests are
 * outstanding (submitted and not yet reaped by poll); submit() blocks while
 * the window is full.
 */
class iorxPosixIOQueue {
public:
    using iorxPosixIOQueueCreateFn =
        std::function<std::unique_ptr<iorxPosixIOQueue>(uint32_t queue_depth,
                                                        uint32_t num_workers)>;

    iorxPosixIOQueue(uint32_t queue_depth, uint32_t num_workers)
        : queue_depth_(normalizedQueueDepth(queue_depth)),
          num_workers_(normalizedNumWorkers(num_workers, queue_depth_)) {}

    virtual ~iorxPosixIOQueue() {}

    // @p ctx is handed back by the poll() that reaps the request, whatever
    // its status; it is left untouched while the request runs or when the
    // id is unknown
    virtual iorx_status_t
    submit(int fd, const iorxXferReq &req, void *ctx, iorx_req_id_t &id) = 0;
    virtual iorx_status_t
    poll(iorx_req_id_t id, bool block, size_t &bytes, void *&ctx) = 0;
    virtual iorx_status_t
    cancel(iorx_req_id_t id) = 0;

    // Requests submitted and not yet reaped
    virtual uint32_t
    inFlight() const = 0;
    // High-water mark of inFlight() over the queue lifetime
    virtual uint32_t
    maxInFlight() const = 0;

    uint32_t
    getQueueDepth() const {
        return queue_depth_;
    }

    uint32_t
    getNumWorkers() const {
        return num_workers_;
    }

    static std::unique_ptr<iorxPosixIOQueue>
    instantiate(std::string_view io_queue_type, uint32_t queue_depth, uint32_t num_workers);
    static std::string_view
    getDefaultIoQueueType(void);
    static bool
    isSupportedIoQueueType(std::string_view io_queue_type);

protected:
    static uint32_t
    normalizedQueueDepth(uint32_t queue_depth) {
        return std::clamp(queue_depth, MIN_QUEUE_DEPTH, MAX_QUEUE_DEPTH);
    }

    static uint32_t
    normalizedNumWorkers(uint32_t num_workers, uint32_t queue_depth) {
        if (num_workers == 0) {
            num_workers = queue_depth;
        }
        return std::clamp(num_workers, MIN_NUM_WORKERS, std::min(queue_depth, MAX_NUM_WORKERS));
    }

    const uint32_t queue_depth_;
    const uint32_t num_workers_;
    static const uint32_t MIN_QUEUE_DEPTH;
    static const uint32_t MAX_QUEUE_DEPTH;
    static const uint32_t MIN_NUM_WORKERS;
    static const uint32_t MAX_NUM_WORKERS;
};

// Bookkeeping shared by all request types
struct iorxPosixIO {
    iorx_req_id_t id = 0;
    int fd = -1;
    iorxXferReq req;
    void *ctx = nullptr;
    iorx_status_t status = IORX_IN_PROG;
    size_t bytes = 0;
    bool done = false;
    bool cancel_requested = false;
};

template<typename Entry> class iorxPosixIOQueueImpl : public iorxPosixIOQueue {
public:
    iorxPosixIOQueueImpl(uint32_t queue_depth, uint32_t num_workers)
        : iorxPosixIOQueue(queue_depth, num_workers),
          ios_(queue_depth_) {
        for (auto &io : ios_) {
            free_ios_.push_back(&io);
        }
    }

    uint32_t
    inFlight() const override {
        std::lock_guard<std::mutex> lk(lock_);
        return static_cast<uint32_t>(ios_in_flight_.size());
    }

    uint32_t
    maxInFlight() const override {
        std::lock_guard<std::mutex> lk(lock_);
        return max_in_flight_;
    }

protected:
    // Takes a free entry, waiting for a slot while the window is full
    Entry *
    acquireEntry(std::unique_lock<std::mutex> &lk, int fd, const iorxXferReq &req, void *ctx) {
        free_cv_.wait(lk, [this] { return !free_ios_.empty(); });

        Entry *io = free_ios_.front();
        free_ios_.pop_front();

        static_cast<iorxPosixIO &>(*io) = iorxPosixIO();
        io->id = next_id_++;
        io->fd = fd;
        io->req = req;
        io->ctx = ctx;
        return io;
    }

    // Makes an acquired entry visible to poll()/cancel()
    void
    trackEntry(Entry *io) {
        ios_in_flight_[io->id] = io;
        max_in_flight_ =
            std::max(max_in_flight_, static_cast<uint32_t>(ios_in_flight_.size()));
    }

    void
    releaseEntry(Entry *io) {
        ios_in_flight_.erase(io->id);
        free_ios_.push_back(io);
        free_cv_.notify_one();
    }

    Entry *
    findEntry(iorx_req_id_t id) {
        auto it = ios_in_flight_.find(id);
        return it == ios_in_flight_.end() ? nullptr : it->second;
    }

    std::vector<Entry> ios_;
    std::list<Entry *> free_ios_;
    std::unordered_map<iorx_req_id_t, Entry *> ios_in_flight_;
    uint32_t max_in_flight_ = 0;
    iorx_req_id_t next_id_ = 1;

    mutable std::mutex lock_;
    std::condition_variable free_cv_;
    std::condition_variable done_cv_;
};

#endif // POSIX_IO_QUEUE_H
