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
#ifndef IORX_SRC_CORE_PHASE_XFER_PIPELINE_H
#define IORX_SRC_CORE_PHASE_XFER_PIPELINE_H

#include <deque>
#include <vector>
#include "backend/backend_engine.h"
#include "common/aligned_buffer.h"

struct iorxXferCompletion {
    size_t slot = 0;
    off_t offset = 0;
    iorx_status_t status = IORX_SUCCESS;
    size_t bytes = 0;
    double latency = 0;
};

/**
 * Bounded window of transfers of one rank against one handle. Holds one
 * buffer per slot; a slot is busy from submit() until its completion is
 * handed out. With a depth of 1 transfers run synchronously through
 * xferSync() and complete inside submit().
 */
class iorxXferPipeline {
public:
    iorxXferPipeline(iorxBackendEngine &engine,
                     iorxBackendFileH &handle,
                     uint32_t depth,
                     size_t xfer_size);
    ~iorxXferPipeline();

    iorxXferPipeline(const iorxXferPipeline &) = delete;
    iorxXferPipeline &
    operator=(const iorxXferPipeline &) = delete;

    // Hands out a free slot. When the window is full the oldest request is
    // reaped first and its completion appended to 'done'.
    iorx_status_t
    acquire(size_t &slot, std::vector<iorxXferCompletion> &done);

    // Issues the transfer of an acquired slot. Synchronous completions are
    // appended to 'done'; an error return means nothing was issued.
    iorx_status_t
    submit(size_t slot,
           iorx_xfer_op_t op,
           off_t offset,
           std::vector<iorxXferCompletion> &done);

    // Waits for every outstanding request
    void
    drain(std::vector<iorxXferCompletion> &done);

    // Cancels every outstanding request, then reaps them
    void
    cancelAll(std::vector<iorxXferCompletion> &done);

    void *
    buffer(size_t slot) const {
        return buffers_[slot].data();
    }

    size_t
    slots() const {
        return buffers_.size();
    }

    uint32_t
    outstanding() const {
        return inflight_.size();
    }

    uint32_t
    maxOutstanding() const {
        return max_outstanding_;
    }

private:
    struct inflightReq {
        size_t slot;
        iorx_req_id_t id;
        off_t offset;
        double submitted;
    };

    iorxBackendEngine &engine_;
    iorxBackendFileH &handle_;
    const uint32_t depth_;
    const size_t xfer_size_;

    std::vector<iorx::alignedBuffer> buffers_;
    std::vector<size_t> free_slots_;
    std::deque<inflightReq> inflight_;
    uint32_t max_outstanding_ = 0;

    void
    reapOldest(std::vector<iorxXferCompletion> &done);
};

#endif
