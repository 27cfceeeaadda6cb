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
#include "xfer_pipeline.h"
#include "common/iorx_log.h"
#include "common/iorx_time.h"
#include <absl/strings/str_format.h>
#include <algorithm>

iorxXferPipeline::iorxXferPipeline(iorxBackendEngine &engine,
                                   iorxBackendFileH &handle,
                                   uint32_t depth,
                                   size_t xfer_size)
    : engine_(engine),
      handle_(handle),
      depth_(depth < 1 ? 1 : depth),
      xfer_size_(xfer_size) {
    buffers_.reserve(depth_);
    for (uint32_t i = 0; i < depth_; i++) {
        buffers_.emplace_back(xfer_size_);
        free_slots_.push_back(depth_ - 1 - i);
    }
}

iorxXferPipeline::~iorxXferPipeline() {
    if (inflight_.empty()) {
        return;
    }

    IORX_DEBUG << "Abandoning " << inflight_.size() << " outstanding transfers";
    std::vector<iorxXferCompletion> ignored;
    cancelAll(ignored);
}

iorx_status_t
iorxXferPipeline::acquire(size_t &slot, std::vector<iorxXferCompletion> &done) {
    if (free_slots_.empty()) {
        reapOldest(done);
    }

    if (free_slots_.empty()) {
        IORX_ERROR << "Transfer window of " << depth_ << " has no free slot";
        return IORX_ERR_INTERNAL;
    }

    slot = free_slots_.back();
    free_slots_.pop_back();
    return IORX_SUCCESS;
}

iorx_status_t
iorxXferPipeline::submit(size_t slot,
                         iorx_xfer_op_t op,
                         off_t offset,
                         std::vector<iorxXferCompletion> &done) {
    iorxXferReq req;
    req.op = op;
    req.buf = buffers_[slot].data();
    req.len = xfer_size_;
    req.offset = offset;

    const double start = iorxTime::getSec();

    if (depth_ == 1) {
        iorxXferCompletion completion;
        completion.slot = slot;
        completion.offset = offset;
        completion.status = engine_.xferSync(handle_, req, completion.bytes);
        completion.latency = iorxTime::getSec() - start;

        max_outstanding_ = std::max<uint32_t>(max_outstanding_, 1);
        free_slots_.push_back(slot);
        done.push_back(completion);
        return IORX_SUCCESS;
    }

    iorx_req_id_t id;
    iorx_status_t status = engine_.xferSubmit(handle_, req, id);
    if (status != IORX_SUCCESS) {
        free_slots_.push_back(slot);
        return status;
    }

    inflight_.push_back({slot, id, offset, start});
    max_outstanding_ = std::max<uint32_t>(max_outstanding_, inflight_.size());
    return IORX_SUCCESS;
}

void
iorxXferPipeline::reapOldest(std::vector<iorxXferCompletion> &done) {
    if (inflight_.empty()) {
        return;
    }

    const inflightReq req = inflight_.front();
    inflight_.pop_front();

    iorxXferCompletion completion;
    completion.slot = req.slot;
    completion.offset = req.offset;
    completion.status = engine_.poll(req.id, true, completion.bytes);
    completion.latency = iorxTime::getSec() - req.submitted;

    if (completion.status == IORX_IN_PROG) {
        IORX_ERROR << absl::StrFormat("Blocking poll of request %d returned in progress", req.id);
        completion.status = IORX_ERR_INTERNAL;
    }

    free_slots_.push_back(req.slot);
    done.push_back(completion);
}

void
iorxXferPipeline::drain(std::vector<iorxXferCompletion> &done) {
    while (!inflight_.empty()) {
        reapOldest(done);
    }
}

void
iorxXferPipeline::cancelAll(std::vector<iorxXferCompletion> &done) {
    for (const auto &req : inflight_) {
        iorx_status_t status = engine_.cancel(req.id);
        if (status != IORX_SUCCESS) {
            IORX_DEBUG << "Cancel of request " << req.id << ": "
                       << iorxEnumStrings::statusStr(status);
        }
    }
    drain(done);
}
