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
#include "io_phase.h"
#include "access_pattern.h"
#include "data_pattern.h"
#include "phase_state.h"
#include "task_reorder.h"
#include "xfer_pipeline.h"
#include "common/aligned_buffer.h"
#include "common/iorx_log.h"
#include "common/iorx_time.h"
#include <absl/strings/str_format.h>
#include <algorithm>

iorxIoPhase::iorxIoPhase(iorxPhaseContext &ctx, iorx_phase_t phase)
    : ctx_(ctx),
      params_(ctx.params),
      phase_(phase),
      is_write_(phase == IORX_PHASE_WRITE),
      rank_(ctx.rt.getRank()),
      size_(ctx.rt.getSize()) {
    IORX_ASSERT(phase == IORX_PHASE_WRITE || phase == IORX_PHASE_READ);
}

iorx_status_t
iorxIoPhase::barrier(const char *what) const {
    const std::string id = absl::StrFormat(
        "%s-%s-%d", iorxEnumStrings::phaseStr(phase_), what, ctx_.repetition);
    if (ctx_.rt.barrier(id) != 0) {
        IORX_ERROR << "Barrier " << id << " failed on rank " << rank_;
        return IORX_ERR_INTERNAL;
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxIoPhase::abandon(std::unique_ptr<iorxBackendFileH> &handle,
                     iorx_status_t status,
                     const char *what) {
    IORX_ERROR << what << ": " << iorxEnumStrings::statusStr(status);
    if (handle && handle->isOpen()) {
        const iorx_status_t close_status = ctx_.engine.close(*handle);
        if (close_status != IORX_SUCCESS) {
            IORX_DEBUG << absl::StrFormat("Rank %d could not close %s after a failed %s: %s",
                                          rank_,
                                          handle->getPath(),
                                          what,
                                          iorxEnumStrings::statusStr(close_status));
        }
    }
    return status;
}

void
iorxIoPhase::openFile(const std::string &path,
                      iorxPhaseResult &result,
                      std::unique_ptr<iorxBackendFileH> &handle,
                      bool create) {
    iorx_open_flags_t flags = is_write_ ? IORX_O_RDWR : IORX_O_RDONLY;
    if (params_.directIo) {
        flags |= IORX_O_DIRECT;
    }

    const double start = iorxTime::getSec();
    iorx_status_t status;
    if (create) {
        flags |= IORX_O_CREAT;
        if (!params_.useExistingTestFile) {
            flags |= IORX_O_TRUNC;
        }
        status = ctx_.engine.create(path, flags, handle);
    } else {
        status = ctx_.engine.open(path, flags, handle);
    }
    result.openTime += iorxTime::getSec() - start;

    if (status != IORX_SUCCESS) {
        IORX_ERROR << absl::StrFormat("Rank %d failed to %s %s: %s",
                                      rank_,
                                      create ? "create" : "open",
                                      path,
                                      iorxEnumStrings::statusStr(status));
        iorx::recordStatus(result, status, params_);
        handle.reset();
    }
}

void
iorxIoPhase::processCompletions(const std::vector<iorxXferCompletion> &done,
                                const iorxXferPipeline &pipeline,
                                iorxBackendFileH &handle,
                                iorxPhaseResult &result) {
    for (const auto &completion : done) {
        if (completion.status != IORX_SUCCESS) {
            iorx::recordStatus(result, completion.status, params_);
            continue;
        }

        result.addLatency(completion.latency);
        result.bytes += completion.bytes;
        result.items++;

        if (!is_write_ && params_.checkRead) {
            const size_t errors = iorx::verifyPattern(pipeline.buffer(completion.slot),
                                                      completion.bytes,
                                                      completion.offset,
                                                      params_.dataSeed,
                                                      pretend_rank_,
                                                      params_.dataPacketType);
            if (errors) {
                IORX_DEBUG << absl::StrFormat("Rank %d: %d corrupted words at offset %d",
                                              rank_,
                                              errors,
                                              completion.offset);
                result.verifyFailures++;
                iorx::recordStatus(result, IORX_ERR_VERIFICATION_MISMATCH, params_);
            }
        }

        if (is_write_ && params_.fsyncPerWrite) {
            iorx::recordStatus(result, ctx_.engine.fsync(handle), params_);
        }
    }
}

void
iorxIoPhase::transfer(iorxBackendFileH &handle,
                      const std::vector<off_t> &offsets,
                      uint64_t end,
                      bool honor_deadline,
                      iorxPhaseResult &result) {
    iorxXferPipeline pipeline(ctx_.engine, handle, params_.queueDepth, params_.transferSize);
    if (is_write_) {
        for (size_t slot = 0; slot < pipeline.slots(); slot++) {
            iorx::fillPattern(
                pipeline.buffer(slot), params_.transferSize, params_.dataSeed, pretend_rank_);
        }
    }

    const iorx_xfer_op_t op = is_write_ ? IORX_WRITE : IORX_READ;
    const double deadline = honor_deadline ? params_.deadlineForStonewalling : 0;
    bool stonewalled = false;
    std::vector<iorxXferCompletion> done;

    while (issued_ < end && !result.failed) {
        const double now = iorxTime::getSec();
        if (ctx_.runDeadlineReached(now)) {
            IORX_INFO << "Rank " << rank_ << " reached the run time limit";
            iorx::recordStatus(result, IORX_ERR_TIMEOUT, params_);
            stonewalled = true;
            break;
        }
        if (deadline > 0 && now - xfer_start_ >= deadline) {
            stonewalled = true;
            break;
        }

        size_t slot;
        done.clear();
        iorx_status_t status = pipeline.acquire(slot, done);
        processCompletions(done, pipeline, handle, result);
        if (status != IORX_SUCCESS) {
            iorx::recordStatus(result, status, params_);
            break;
        }
        if (result.failed) {
            break;
        }

        if (is_write_) {
            iorx::stampPattern(pipeline.buffer(slot),
                               params_.transferSize,
                               offsets[issued_],
                               pretend_rank_,
                               params_.dataPacketType);
        }

        done.clear();
        status = pipeline.submit(slot, op, offsets[issued_], done);
        if (status != IORX_SUCCESS) {
            iorx::recordStatus(result, status, params_);
            break;
        }
        issued_++;
        processCompletions(done, pipeline, handle, result);
    }

    done.clear();
    if (result.failed) {
        pipeline.cancelAll(done);
    } else {
        pipeline.drain(done);
    }
    processCompletions(done, pipeline, handle, result);

    result.maxInFlight = std::max(result.maxInFlight, pipeline.maxOutstanding());
    if (stonewalled && !result.stonewallHit) {
        result.stonewallHit = true;
        result.stonewallItems = result.items;
        result.stonewallTime = iorxTime::getSec() - xfer_start_;
    }
}

void
iorxIoPhase::checkWrittenData(const std::string &path,
                              const std::vector<off_t> &offsets,
                              iorxPhaseResult &result) {
    iorx_open_flags_t flags = IORX_O_RDONLY;
    if (params_.directIo) {
        flags |= IORX_O_DIRECT;
    }

    std::unique_ptr<iorxBackendFileH> handle;
    iorx_status_t status = ctx_.engine.open(path, flags, handle);
    if (status != IORX_SUCCESS) {
        iorx::recordStatus(result, status, params_);
        return;
    }

    iorx::alignedBuffer buffer(params_.transferSize);
    for (uint64_t i = 0; i < result.items && !result.failed; i++) {
        iorxXferReq req;
        req.op = IORX_READ;
        req.buf = buffer.data();
        req.len = params_.transferSize;
        req.offset = offsets[i];

        size_t bytes = 0;
        status = ctx_.engine.xferSync(*handle, req, bytes);
        if (status != IORX_SUCCESS) {
            iorx::recordStatus(result, status, params_);
            break;
        }

        if (iorx::verifyPattern(buffer.data(),
                                bytes,
                                offsets[i],
                                params_.dataSeed,
                                pretend_rank_,
                                params_.dataPacketType)) {
            result.verifyFailures++;
            iorx::recordStatus(result, IORX_ERR_VERIFICATION_MISMATCH, params_);
        }
    }

    iorx::recordStatus(result, ctx_.engine.close(*handle), params_);
}

iorx_status_t
iorxIoPhase::checkFileSize(const std::string &path, iorxPhaseResult &result) {
    // Sizes are only comparable once every rank closed its file
    IORX_LOG_AND_RETURN_IF_ERROR(barrier("size"), "File size barrier");

    int64_t size = 0;
    if (!result.failed) {
        iorxStatInfo info;
        if (ctx_.engine.stat(path, info) == IORX_SUCCESS) {
            size = static_cast<int64_t>(info.size);
        }
    }

    const int64_t local_sum[2] = {size, static_cast<int64_t>(result.bytes)};
    const int64_t local_max[3] = {
        (result.failed || result.stonewallHit) ? 1 : 0, size, -size};
    int64_t sum[2];
    int64_t max[3];
    if (ctx_.rt.allReduceInt(local_sum, sum, 2, IORX_REDUCE_SUM) != 0 ||
        ctx_.rt.allReduceInt(local_max, max, 3, IORX_REDUCE_MAX) != 0) {
        IORX_ERROR << "File size reduction failed on rank " << rank_;
        return IORX_ERR_INTERNAL;
    }

    if (rank_ != 0 || max[0]) {
        return IORX_SUCCESS;
    }

    if (params_.filePerProc) {
        if (sum[0] < sum[1]) {
            IORX_WARN << absl::StrFormat(
                "Aggregate file size %d is below the %d bytes written", sum[0], sum[1]);
        }
        return IORX_SUCCESS;
    }

    const int64_t min_size = -max[2];
    if (min_size != max[1]) {
        IORX_WARN << absl::StrFormat(
            "Inconsistent file size across ranks: min %d, max %d", min_size, max[1]);
    }
    if (min_size < sum[1]) {
        IORX_WARN << absl::StrFormat(
            "File size %d is below the %d bytes written", min_size, sum[1]);
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxIoPhase::execute(iorxPhaseResult &result) {
    result.phase = phase_;
    result.rank = rank_;
    result.repetition = ctx_.repetition;
    result.sourceRank = iorx::sourceRank(params_, rank_, size_, phase_);
    pretend_rank_ = is_write_ ? rank_ : result.sourceRank;
    issued_ = 0;

    const std::vector<off_t> offsets =
        iorx::transferOffsets(params_, pretend_rank_, size_, ctx_.randomSeed);
    uint64_t assigned = offsets.size();
    if (!is_write_ && !ctx_.writtenItems.empty()) {
        assigned = std::min<uint64_t>(assigned, ctx_.writtenItems[pretend_rank_]);
    }
    result.assignedItems = assigned;

    const std::string path = iorx::testFilePath(params_, pretend_rank_);
    iorx::advancePhase(result, IORX_PHASE_RUNNING);
    result.startTime = iorxTime::getSec();

    if (params_.intraTestBarriers) {
        IORX_LOG_AND_RETURN_IF_ERROR(barrier("pre-open"), "Intra-test barrier");
    }

    std::unique_ptr<iorxBackendFileH> handle;
    const bool creator = is_write_ && (params_.filePerProc || rank_ == 0);
    if (creator) {
        openFile(path, result, handle, true);
    }
    iorx_status_t status;
    if (is_write_ && !params_.filePerProc) {
        // The shared file exists once rank 0 is past this point
        status = barrier("open");
        if (status != IORX_SUCCESS) {
            return abandon(handle, status, "Entry barrier");
        }
    }
    if (!creator) {
        openFile(path, result, handle, false);
    }

    if (params_.intraTestBarriers) {
        status = barrier("transfer");
        if (status != IORX_SUCCESS) {
            return abandon(handle, status, "Intra-test barrier");
        }
    }

    xfer_start_ = iorxTime::getSec();
    if (handle) {
        transfer(*handle, offsets, assigned, true, result);
    }

    if (is_write_ && params_.deadlineForStonewalling > 0 && params_.stonewallWearOut) {
        const int64_t local = result.items;
        int64_t target = 0;
        if (ctx_.rt.allReduceInt(&local, &target, 1, IORX_REDUCE_MAX) != 0) {
            return abandon(handle, IORX_ERR_INTERNAL, "Stonewall wear-out reduction");
        }
        if (handle && !result.failed && static_cast<uint64_t>(target) > issued_) {
            IORX_DEBUG << absl::StrFormat(
                "Rank %d wearing out from %d to %d items", rank_, issued_, target);
            transfer(*handle, offsets, std::min<uint64_t>(target, assigned), false, result);
        }
    }
    result.xferTime = iorxTime::getSec() - xfer_start_;

    if (params_.intraTestBarriers) {
        status = barrier("close");
        if (status != IORX_SUCCESS) {
            return abandon(handle, status, "Intra-test barrier");
        }
    }

    if (handle) {
        const double start = iorxTime::getSec();
        if (is_write_ && params_.fsync && !result.failed) {
            iorx::recordStatus(result, ctx_.engine.fsync(*handle), params_);
        }
        iorx::recordStatus(result, ctx_.engine.close(*handle), params_);
        result.closeTime = iorxTime::getSec() - start;
    }
    result.endTime = iorxTime::getSec();

    if (is_write_) {
        if (params_.checkWrite && handle && !result.failed) {
            checkWrittenData(path, offsets, result);
        }
        IORX_LOG_AND_RETURN_IF_ERROR(checkFileSize(path, result), "File size check");
    }

    iorx::finishPhase(result);
    return IORX_SUCCESS;
}
