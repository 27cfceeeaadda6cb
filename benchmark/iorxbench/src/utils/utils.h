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
#ifndef __UTILS_H
#define __UTILS_H

#include <iostream>
#include <string>
#include <vector>
#include "iorx_params.h"
#include "iorx_results.h"

#define IORXBENCH_RT_NULL "NULL"
#define IORXBENCH_RT_THREAD "THREAD"

#define IORXBENCH_PACKET_OFFSET "OFFSET"
#define IORXBENCH_PACKET_TIMESTAMP "TIMESTAMP"

class iorxBenchConfig {
public:
    static std::string runtime_type;
    static int num_ranks;
    static iorxTestParams params;

    // Backend options in the "--<backend>.<key>=<value>" form, removed from
    // the command line before gflags parses it
    static std::vector<std::string> backend_args;

    static int
    loadFromFlags();
    static void
    printConfig();
    static void
    printOption(const std::string &desc, const std::string &value);
    static void
    printSeparator(const char sep);
};

class iorxBenchUtils {
public:
    static void
    printSummaryHeader();
    static void
    printPhase(const iorxPhaseSummary &summary);
    static void
    printRunSummary(const iorxRunResult &result);
};

#endif // __UTILS_H
