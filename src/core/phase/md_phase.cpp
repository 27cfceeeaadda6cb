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
#include "md_phase.h"
#include "phase_state.h"
#include "task_reorder.h"
#include "common/iorx_log.h"
#include "common/iorx_time.h"
#include <absl/strings/str_format.h>
#include <algorithm>

namespace {

constexpr mode_t mdDirMode = 0775;

size_t
bufferSize(const iorxTestParams &params) {
    return std::max<uint64_t>({params.mdWriteBytes, params.mdReadBytes, 1});
}

} // namespace

iorxMdPhase::iorxMdPhase(iorxPhaseContext &ctx, iorx_phase_t phase)
    : ctx_(ctx),
      params_(ctx.params),
      phase_(phase),
      rank_(ctx.rt.getRank()),
      buffer_(bufferSize(ctx.params)) {
    IORX_ASSERT(phase >= IORX_PHASE_MD_CREATE && phase <= IORX_PHASE_MD_REMOVE);

    // Same fill as the classic metadata benchmark: byte i holds i % 256
    auto *bytes = buffer_.as<uint8_t>();
    for (size_t i = 0; i < buffer_.size(); i++) {
        bytes[i] = static_cast<uint8_t>(i % 256);
    }
}

iorx_status_t
iorxMdPhase::createItem(const std::string &path, iorxPhaseResult &result) {
    if (params_.mdDirsOnly) {
        return ctx_.engine.mkdir(path, mdDirMode);
    }

    if (params_.mdMakeNode) {
        return ctx_.engine.mknod(path);
    }

    std::unique_ptr<iorxBackendFileH> handle;
    iorx_status_t status =
        ctx_.engine.create(path, IORX_O_WRONLY | IORX_O_CREAT | IORX_O_EXCL, handle);
    if (status != IORX_SUCCESS) {
        return status;
    }

    if (params_.mdWriteBytes > 0) {
        iorxXferReq req;
        req.op = IORX_WRITE;
        req.buf = buffer_.data();
        req.len = params_.mdWriteBytes;
        req.offset = 0;

        size_t bytes = 0;
        status = ctx_.engine.xferSync(*handle, req, bytes);
        result.bytes += bytes;
    }

    const iorx_status_t close_status = ctx_.engine.close(*handle);
    return status != IORX_SUCCESS ? status : close_status;
}

iorx_status_t
iorxMdPhase::readItem(const std::string &path, iorxPhaseResult &result) {
    std::unique_ptr<iorxBackendFileH> handle;
    iorx_status_t status = ctx_.engine.open(path, IORX_O_RDONLY, handle);
    if (status != IORX_SUCCESS) {
        return status;
    }

    if (params_.mdReadBytes > 0) {
        iorxXferReq req;
        req.op = IORX_READ;
        req.buf = buffer_.data();
        req.len = params_.mdReadBytes;
        req.offset = 0;

        size_t bytes = 0;
        status = ctx_.engine.xferSync(*handle, req, bytes);
        result.bytes += bytes;
    }

    const iorx_status_t close_status = ctx_.engine.close(*handle);
    return status != IORX_SUCCESS ? status : close_status;
}

iorx_status_t
iorxMdPhase::processItem(uint64_t item, int owner, iorxPhaseResult &result) {
    const std::string path = ctx_.namer.itemPath(owner, item, params_.mdDirsOnly);

    switch (phase_) {
    case IORX_PHASE_MD_CREATE:
        return createItem(path, result);
    case IORX_PHASE_MD_STAT: {
        iorxStatInfo info;
        return ctx_.engine.stat(path, info);
    }
    case IORX_PHASE_MD_READ:
        return readItem(path, result);
    case IORX_PHASE_MD_REMOVE:
        return params_.mdDirsOnly ? ctx_.engine.rmdir(path) : ctx_.engine.remove(path);
    default:
        return IORX_ERR_INTERNAL;
    }
}

void
iorxMdPhase::runItems(uint64_t end, int owner, bool honor_deadline, iorxPhaseResult &result) {
    const double deadline = honor_deadline ? params_.deadlineForStonewalling : 0;
    const double start = iorxTime::getSec();

    while (issued_ < end) {
        const double now = iorxTime::getSec();
        if (phase_ != IORX_PHASE_MD_REMOVE && ctx_.runDeadlineReached(now)) {
            IORX_INFO << "Rank " << rank_ << " reached the run time limit";
            iorx::recordStatus(result, IORX_ERR_TIMEOUT, params_);
            result.stonewallHit = true;
            break;
        }
        if (deadline > 0 && now - start >= deadline) {
            result.stonewallHit = true;
            result.stonewallItems = result.items;
            result.stonewallTime = now - start;
            break;
        }

        const iorx_status_t status = processItem(issued_, owner, result);
        issued_++;
        if (status != IORX_SUCCESS) {
            IORX_ERROR << absl::StrFormat("Rank %d: %s of item %d failed: %s",
                                          rank_,
                                          iorxEnumStrings::phaseStr(phase_),
                                          issued_ - 1,
                                          iorxEnumStrings::statusStr(status));
            iorx::recordStatus(result, status, params_);
            break;
        }

        result.addLatency(iorxTime::getSec() - now);
        result.items++;
    }
}

iorx_status_t
iorxMdPhase::execute(iorxPhaseResult &result) {
    result.phase = phase_;
    result.rank = rank_;
    result.repetition = ctx_.repetition;
    result.sourceRank = iorx::sourceRank(params_, rank_, ctx_.rt.getSize(), phase_);
    issued_ = 0;

    // Stat and read visit the source's items, remove the rank's own ones
    const int owner = phase_ == IORX_PHASE_MD_REMOVE ? rank_ : result.sourceRank;
    uint64_t assigned = params_.mdItems;
    if (phase_ != IORX_PHASE_MD_CREATE && !ctx_.createdItems.empty()) {
        assigned = std::min<uint64_t>(assigned, ctx_.createdItems[owner]);
    }
    if (phase_ == IORX_PHASE_MD_READ && params_.mdDirsOnly) {
        assigned = 0;
    }
    result.assignedItems = assigned;

    iorx::advancePhase(result, IORX_PHASE_RUNNING);
    result.startTime = iorxTime::getSec();

    runItems(assigned, owner, phase_ != IORX_PHASE_MD_REMOVE, result);

    if (phase_ == IORX_PHASE_MD_CREATE && params_.deadlineForStonewalling > 0 &&
        params_.stonewallWearOut) {
        const int64_t local = result.items;
        int64_t target = 0;
        if (ctx_.rt.allReduceInt(&local, &target, 1, IORX_REDUCE_MAX) != 0) {
            IORX_ERROR << "Stonewall wear-out reduction failed on rank " << rank_;
            return IORX_ERR_INTERNAL;
        }
        if (!result.failed && static_cast<uint64_t>(target) > issued_) {
            runItems(std::min<uint64_t>(target, assigned), owner, false, result);
        }
    }

    result.endTime = iorxTime::getSec();
    result.xferTime = result.endTime - result.startTime;
    iorx::finishPhase(result);
    return IORX_SUCCESS;
}
