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
#include "worker.h"
#include "plugin_manager.h"
#include "runtime/null_rt.h"
#include "utils/utils.h"

#include <gflags/gflags.h>
#include <thread>

DECLARE_string(plugin_list);
DECLARE_string(plugin_dir);

iorxBenchWorker::iorxBenchWorker() {
    if (IORXBENCH_RT_NULL == iorxBenchConfig::runtime_type) {
        rts.push_back(std::make_unique<iorxNullRT>());
        return;
    }

    group = std::make_unique<iorxThreadRTGroup>(iorxBenchConfig::num_ranks);
    for (int rank = 0; rank < iorxBenchConfig::num_ranks; rank++) {
        rts.push_back(group->createRT(rank));
    }
}

// Runtimes reference the group and go first
iorxBenchWorker::~iorxBenchWorker() {
    rts.clear();
}

int
iorxBenchWorker::loadPlugins() {
    auto &plugin_manager = iorxPluginManager::getInstance();

    if (!FLAGS_plugin_dir.empty()) {
        plugin_manager.addPluginDirectory(FLAGS_plugin_dir);
    }
    if (!FLAGS_plugin_list.empty()) {
        plugin_manager.loadPluginsFromList(FLAGS_plugin_list);
    }

    iorxBackendKind kind;
    if (plugin_manager.getBackendKind(iorxBenchConfig::params.api, kind) != IORX_SUCCESS) {
        std::cerr << "Backend " << iorxBenchConfig::params.api << " is not available, known are:";
        for (const auto &name : plugin_manager.getBackendNames()) {
            std::cerr << " " << name;
        }
        std::cerr << std::endl;
        return -1;
    }
    return 0;
}

iorx_status_t
iorxBenchWorker::runRank(iorxRT &rt, iorxRunResult &result) {
    iorxBenchRunner runner(iorxBenchConfig::params, rt);
    return runner.run(result);
}

iorx_status_t
iorxBenchWorker::run(iorxRunResult &result) {
    if (rts.size() == 1) {
        return runRank(*rts.front(), result);
    }

    std::vector<iorxRunResult> results(rts.size());
    std::vector<iorx_status_t> statuses(rts.size(), IORX_SUCCESS);
    std::vector<std::thread> threads;

    for (size_t rank = 0; rank < rts.size(); rank++) {
        threads.emplace_back([this, rank, &results, &statuses]() {
            statuses[rank] = runRank(*rts[rank], results[rank]);
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    result = std::move(results.front());
    return statuses.front();
}
