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
#ifndef IORX_SRC_CORE_PHASE_IO_PHASE_H
#define IORX_SRC_CORE_PHASE_IO_PHASE_H

#include <memory>
#include <string>
#include <vector>
#include "iorx_results.h"
#include "phase_context.h"

class iorxXferPipeline;
struct iorxXferCompletion;

/**
 * Write or read phase of one rank. Local failures end up in the phase
 * result; execute() itself only fails when a collective call failed, in
 * which case ranks can no longer be kept in step.
 *
 * Collectives issued, identical on every rank whatever happens locally:
 * entry barrier (shared file writes), intra-test barriers, the stonewall
 * wear-out reduction and the barrier plus reductions of the file size check
 * of write phases.
 */
class iorxIoPhase {
public:
    iorxIoPhase(iorxPhaseContext &ctx, iorx_phase_t phase);

    iorx_status_t
    execute(iorxPhaseResult &result);

private:
    iorxPhaseContext &ctx_;
    const iorxTestParams &params_;
    const iorx_phase_t phase_;
    const bool is_write_;
    const int rank_;
    const int size_;
    int pretend_rank_ = 0;
    double xfer_start_ = 0;
    uint64_t issued_ = 0;

    iorx_status_t
    barrier(const char *what) const;

    // Error exit of a failed collective once the file may be open
    iorx_status_t
    abandon(std::unique_ptr<iorxBackendFileH> &handle, iorx_status_t status, const char *what);

    void
    openFile(const std::string &path,
             iorxPhaseResult &result,
             std::unique_ptr<iorxBackendFileH> &handle,
             bool create);

    void
    transfer(iorxBackendFileH &handle,
             const std::vector<off_t> &offsets,
             uint64_t end,
             bool honor_deadline,
             iorxPhaseResult &result);

    void
    processCompletions(const std::vector<iorxXferCompletion> &done,
                       const iorxXferPipeline &pipeline,
                       iorxBackendFileH &handle,
                       iorxPhaseResult &result);

    void
    checkWrittenData(const std::string &path,
                     const std::vector<off_t> &offsets,
                     iorxPhaseResult &result);

    iorx_status_t
    checkFileSize(const std::string &path, iorxPhaseResult &result);
};

#endif
