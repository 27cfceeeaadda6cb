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
#include "iorx_params.h"
#include "common/iorx_log.h"
#include <absl/strings/str_format.h>

namespace {

constexpr uint64_t directIoAlignment = 512;

iorx_status_t
reject(const std::string &msg) {
    IORX_ERROR << "Invalid test parameters: " << msg;
    return IORX_ERR_CONFIGURATION;
}

} // namespace

iorx_status_t
iorxTestParams::validate() const {
    if (api.empty()) {
        return reject("no backend selected");
    }

    if (hasIoPhases()) {
        if (transferSize == 0 || blockSize == 0) {
            return reject("block and transfer size must be non-zero");
        }
        if (blockSize % transferSize != 0) {
            return reject(absl::StrFormat(
                "block size %d is not a multiple of transfer size %d", blockSize, transferSize));
        }
        if (segmentCount == 0) {
            return reject("segment count must be non-zero");
        }
        if (directIo && transferSize % directIoAlignment != 0) {
            return reject(absl::StrFormat("direct I/O needs a transfer size multiple of %d",
                                          directIoAlignment));
        }
        if (testFileName.empty()) {
            return reject("empty test file name");
        }
    }

    if (repetitions == 0) {
        return reject("repetitions must be non-zero");
    }
    if (queueDepth < 1) {
        return reject("queue depth must be at least 1");
    }
    if (deadlineForStonewalling < 0 || maxTimeDuration < 0) {
        return reject("time bounds must not be negative");
    }
    if (reorderTasks && reorderTasksRandom) {
        return reject("shift and random task reordering are mutually exclusive");
    }
    if (fsyncPerWrite && !writeFile) {
        IORX_WARN << "fsyncPerWrite has no effect without a write phase";
    }

    if (hasMdPhases()) {
        if (mdTestDir.empty()) {
            return reject("empty metadata test directory");
        }
        if (mdDirsOnly && (mdWriteBytes || mdReadBytes || mdMakeNode)) {
            return reject("directory items cannot carry data or be created with mknod");
        }
        if (mdMakeNode && mdWriteBytes) {
            return reject("items created with mknod cannot carry data");
        }
        if (mdReadBytes > mdWriteBytes && mdRead) {
            return reject(absl::StrFormat("metadata read of %d bytes exceeds the %d bytes written",
                                          mdReadBytes, mdWriteBytes));
        }
    }

    if (!hasIoPhases() && !hasMdPhases()) {
        return reject("no phase enabled");
    }
    return IORX_SUCCESS;
}
