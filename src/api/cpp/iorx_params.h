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
#ifndef _IORX_PARAMS_H
#define _IORX_PARAMS_H

#include <cstdint>
#include <string>
#include "iorx_types.h"

/**
 * Parameters of a benchmark run. Filled once by the configuration layer and
 * shared read-only by every phase of the run.
 */
struct iorxTestParams {
    /*** Backend ***/
    iorx_backend_t api = "POSIX";
    iorx_b_params_t backendParams;

    /*** Data layout ***/
    std::string testFileName = "testFile";
    uint64_t blockSize = 1024 * 1024;
    uint64_t transferSize = 256 * 1024;
    uint32_t segmentCount = 1;
    uint32_t repetitions = 1;
    bool filePerProc = false;
    bool randomOffset = false;
    // Negative seed: rank 0 picks one and broadcasts it
    int64_t randomSeed = -1;

    /*** Task reordering for read phases ***/
    bool reorderTasks = false;
    int taskPerNodeOffset = 1;
    bool reorderTasksRandom = false;
    int64_t reorderTasksRandomSeed = 0;

    /*** Pipelining ***/
    uint32_t queueDepth = 1;
    bool directIo = false;

    /*** Time bounds, in seconds; 0 disables ***/
    double deadlineForStonewalling = 0;
    bool stonewallWearOut = false;
    double maxTimeDuration = 0;

    /*** Synchronization ***/
    bool interPhaseBarriers = true;
    bool intraTestBarriers = false;

    /*** I/O phases ***/
    bool writeFile = true;
    bool readFile = true;
    bool checkWrite = false;
    bool checkRead = false;
    iorx_packet_t dataPacketType = IORX_PACKET_OFFSET;
    uint64_t dataSeed = 0;
    bool abortOnVerifyFailure = false;
    bool keepFile = false;
    bool fsync = false;
    bool fsyncPerWrite = false;
    bool useExistingTestFile = false;

    /*** Metadata phases ***/
    uint64_t mdItems = 0;
    std::string mdTestDir = "./out";
    bool mdUniqueDirPerTask = false;
    bool mdDirsOnly = false;
    bool mdMakeNode = false;
    uint64_t mdWriteBytes = 0;
    uint64_t mdReadBytes = 0;
    bool mdCreate = true;
    bool mdStat = true;
    bool mdRead = false;
    bool mdRemove = true;

    [[nodiscard]] iorx_status_t
    validate() const;

    uint64_t
    transfersPerBlock() const {
        return blockSize / transferSize;
    }

    bool
    hasIoPhases() const {
        return writeFile || readFile;
    }

    bool
    hasMdPhases() const {
        return mdItems > 0;
    }
};

#endif
