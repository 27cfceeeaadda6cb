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
#ifndef __WORKER_H
#define __WORKER_H

#include <memory>
#include <vector>
#include "iorx.h"
#include "runtime/iorx_rt.h"
#include "runtime/thread_rt.h"

/**
 * Runs one benchmark over all ranks of the configured runtime. With the
 * THREAD runtime every rank gets its own thread, runtime and runner; only
 * the result of rank 0 is kept for reporting.
 */
class iorxBenchWorker {
public:
    iorxBenchWorker();
    ~iorxBenchWorker();

    iorxBenchWorker(const iorxBenchWorker &) = delete;
    iorxBenchWorker &
    operator=(const iorxBenchWorker &) = delete;

    int
    loadPlugins();

    iorx_status_t
    run(iorxRunResult &result);

private:
    std::unique_ptr<iorxThreadRTGroup> group;
    std::vector<std::unique_ptr<iorxRT>> rts;

    static iorx_status_t
    runRank(iorxRT &rt, iorxRunResult &result);
};

#endif // __WORKER_H
