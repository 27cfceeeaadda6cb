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

#include "io_queue.h"
#include "common/errno_status.h"
#include "common/iorx_log.h"
#include <absl/strings/str_format.h>
#include <errno.h>
#include <unistd.h>

namespace {
// Upper bound on consecutive interrupted or zero-length calls for one request
constexpr int maxRetry = 10000;
} // namespace

std::unique_ptr<iorxPosixIOQueue>
iorxPosixIOQueueThreadPoolCreate(uint32_t queue_depth, uint32_t num_workers);
std::unique_ptr<iorxPosixIOQueue>
iorxPosixIOQueueAIOCreate(uint32_t queue_depth, uint32_t num_workers);

static const struct {
    const char *name;
    iorxPosixIOQueue::iorxPosixIOQueueCreateFn createFn;
} factories[] = {
    {"THREADPOOL", iorxPosixIOQueueThreadPoolCreate},
    {"POSIXAIO", iorxPosixIOQueueAIOCreate},
};

const uint32_t iorxPosixIOQueue::MIN_QUEUE_DEPTH = 1;
const uint32_t iorxPosixIOQueue::MAX_QUEUE_DEPTH = 1024 * 64;
const uint32_t iorxPosixIOQueue::MIN_NUM_WORKERS = 1;
const uint32_t iorxPosixIOQueue::MAX_NUM_WORKERS = 256;

std::unique_ptr<iorxPosixIOQueue>
iorxPosixIOQueue::instantiate(std::string_view io_queue_type,
                              uint32_t queue_depth,
                              uint32_t num_workers) {
    for (const auto &factory : factories) {
        if (io_queue_type == factory.name) {
            return factory.createFn(queue_depth, num_workers);
        }
    }
    return nullptr;
}

std::string_view
iorxPosixIOQueue::getDefaultIoQueueType(void) {
    return "THREADPOOL";
}

bool
iorxPosixIOQueue::isSupportedIoQueueType(std::string_view io_queue_type) {
    for (const auto &factory : factories) {
        if (io_queue_type == factory.name) {
            return true;
        }
    }
    return false;
}

iorx_status_t
iorxPosixTransfer(int fd, const iorxXferReq &req, size_t &bytes) {
    char *ptr = static_cast<char *>(req.buf);
    int retries = 0;

    bytes = 0;
    while (bytes < req.len) {
        const size_t remaining = req.len - bytes;
        const off_t offset = req.offset + static_cast<off_t>(bytes);
        const ssize_t ret = req.op == IORX_READ ? ::pread(fd, ptr + bytes, remaining, offset) :
                                                  ::pwrite(fd, ptr + bytes, remaining, offset);
        if (ret < 0) {
            const int err = errno;
            if ((err == EINTR || err == EAGAIN) && ++retries < maxRetry) {
                continue;
            }
            return iorx::errnoToStatus(err);
        }

        if (ret == 0) {
            // End of file on read, or a medium that keeps refusing data
            if (req.op == IORX_READ || ++retries >= maxRetry) {
                return IORX_ERR_PARTIAL_TRANSFER;
            }
            continue;
        }

        bytes += static_cast<size_t>(ret);
        if (bytes < req.len) {
            IORX_TRACE << absl::StrFormat("Short %s at offset %d: %zu of %zu bytes",
                                          iorxEnumStrings::xferOpStr(req.op),
                                          offset,
                                          static_cast<size_t>(ret),
                                          remaining);
            if (++retries >= maxRetry) {
                return IORX_ERR_PARTIAL_TRANSFER;
            }
        }
    }

    return IORX_SUCCESS;
}
