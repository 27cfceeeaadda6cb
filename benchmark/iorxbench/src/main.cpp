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
#include <gflags/gflags.h>
#include <absl/log/initialize.h>
#include <absl/strings/match.h>

#include "common/iorx_log.h"
#include "utils/utils.h"
#include "worker/worker.h"

namespace {

// "--<backend>.<key>=<value>" options are not gflags, move them aside
std::vector<char *>
splitBackendArgs(int argc, char **argv) {
    std::vector<char *> rest;
    for (int i = 0; i < argc; i++) {
        const absl::string_view arg(argv[i]);
        const absl::string_view name = arg.substr(0, arg.find('='));
        if (i > 0 && absl::StartsWith(name, "--") && absl::StrContains(name, '.')) {
            iorxBenchConfig::backend_args.emplace_back(argv[i]);
        } else {
            rest.push_back(argv[i]);
        }
    }
    return rest;
}

} // namespace

int
main(int argc, char *argv[]) {
    std::vector<char *> args = splitBackendArgs(argc, argv);
    int gflags_argc = static_cast<int>(args.size());
    char **gflags_argv = args.data();

    gflags::SetUsageMessage("iorxbench [--<flag>=<value> ...] [--<backend>.<key>=<value> ...]");
    gflags::ParseCommandLineFlags(&gflags_argc, &gflags_argv, true);

    absl::InitializeLog();
    iorx::logInit();

    if (iorxBenchConfig::loadFromFlags() != 0) {
        return EXIT_FAILURE;
    }

    iorxBenchWorker worker;
    if (worker.loadPlugins() != 0) {
        return EXIT_FAILURE;
    }

    iorxBenchConfig::printConfig();

    iorxRunResult result;
    const iorx_status_t status = worker.run(result);
    if (status == IORX_ERR_CONFIGURATION && result.phases.empty()) {
        std::cerr << "Benchmark setup failed: " << iorxEnumStrings::statusStr(status)
                  << std::endl;
        return EXIT_FAILURE;
    }

    iorxBenchUtils::printSummaryHeader();
    for (const auto &phase : result.phases) {
        iorxBenchUtils::printPhase(phase);
    }
    iorxBenchUtils::printRunSummary(result);

    gflags::ShutDownCommandLineFlags();
    return status == IORX_SUCCESS ? EXIT_SUCCESS : EXIT_FAILURE;
}
