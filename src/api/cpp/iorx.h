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
#ifndef _IORX_H
#define _IORX_H

#include <memory>
#include "backend/backend_engine.h"
#include "iorx_md_namer.h"
#include "iorx_params.h"
#include "iorx_results.h"
#include "runtime/iorx_rt.h"

struct iorxPhaseContext;

/**
 * Runs the benchmark on one rank. Every rank of the job constructs its own
 * runner with the same parameters and calls run() concurrently; ranks only
 * meet in the collectives of 'rt'.
 */
class iorxBenchRunner {
public:
    iorxBenchRunner(const iorxTestParams &params, iorxRT &rt);
    ~iorxBenchRunner();

    iorxBenchRunner(const iorxBenchRunner &) = delete;
    iorxBenchRunner &
    operator=(const iorxBenchRunner &) = delete;

    // Places metadata items; a flat namer rooted at mdTestDir by default
    void
    setMdNamer(std::shared_ptr<const iorxMdNamer> namer);

    /**
     * Runs all repetitions. Returns IORX_SUCCESS when every phase completed,
     * stonewalled or stopped at the run time limit, the failure kind the
     * failing rank reported when the run was aborted, and
     * IORX_ERR_CONFIGURATION when parameters or backend are unusable.
     */
    iorx_status_t
    run(iorxRunResult &result);

private:
    const iorxTestParams params_;
    iorxRT &rt_;
    std::shared_ptr<const iorxMdNamer> namer_;
    std::unique_ptr<iorxBackendEngine> engine_;

    iorx_status_t
    setup(iorxRunResult &result);

    iorx_status_t
    runPhase(iorxPhaseContext &ctx, iorx_phase_t phase, iorxRunResult &result, bool &stop);

    iorx_status_t
    setupMdTree(iorxPhaseContext &ctx, iorxRunResult &result, bool &root_created, bool &stop);

    iorx_status_t
    teardownMdTree(iorxPhaseContext &ctx, bool root_created);

    iorx_status_t
    removeTestFiles(iorxPhaseContext &ctx);

    iorx_status_t
    barrier(const std::string &id);
};

#endif
