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
#ifndef POSIX_BACKEND_H
#define POSIX_BACKEND_H

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <absl/strings/str_format.h>
#include "backend/backend_engine.h"
#include "io_queue.h"

class iorxPosixFileH : public iorxBackendFileH {
public:
    iorxPosixFileH(const std::string &path, int fd) : iorxBackendFileH(path), fd_(fd) {}

    int
    getFd() const {
        return fd_;
    }

private:
    const int fd_;
};

class iorxPosixEngine : public iorxBackendEngine {
private:
    // Completed inline submission, used when queue depth is 1
    struct inlineResult {
        iorx_status_t status;
        size_t bytes;
        iorxBackendFileH *owner;
    };

    const uint32_t queue_depth_;
    std::string io_queue_type_;
    std::unique_ptr<iorxPosixIOQueue> io_queue_;

    std::mutex inline_lock_;
    std::condition_variable inline_cv_;
    std::unordered_map<iorx_req_id_t, inlineResult> inline_results_;
    iorx_req_id_t next_inline_id_ = 1;
    uint32_t inline_max_in_flight_ = 0;

    iorx_status_t
    openFile(const std::string &path,
             iorx_open_flags_t flags,
             std::unique_ptr<iorxBackendFileH> &handle);

    iorxPosixFileH &
    castPosixHandle(iorxBackendFileH &handle) const;

public:
    iorxPosixEngine(const iorxBackendInitParams *init_params);
    virtual ~iorxPosixEngine() = default;

    const std::string &
    getIoQueueType() const {
        return io_queue_type_;
    }

    uint32_t
    getQueueDepth() const {
        return queue_depth_;
    }

    // High-water mark of outstanding asynchronous requests
    uint32_t
    getMaxInFlight() const;

    iorx_status_t
    create(const std::string &path,
           iorx_open_flags_t flags,
           std::unique_ptr<iorxBackendFileH> &handle) override;
    iorx_status_t
    open(const std::string &path,
         iorx_open_flags_t flags,
         std::unique_ptr<iorxBackendFileH> &handle) override;
    iorx_status_t
    close(iorxBackendFileH &handle) override;
    iorx_status_t
    remove(const std::string &path) override;
    iorx_status_t
    fsync(iorxBackendFileH &handle) override;

    iorx_status_t
    xferSync(iorxBackendFileH &handle, const iorxXferReq &req, size_t &bytes) override;
    iorx_status_t
    xferSubmit(iorxBackendFileH &handle, const iorxXferReq &req, iorx_req_id_t &id) override;
    iorx_status_t
    poll(iorx_req_id_t id, bool block, size_t &bytes) override;
    iorx_status_t
    cancel(iorx_req_id_t id) override;

    iorx_status_t
    mkdir(const std::string &path, mode_t mode) override;
    iorx_status_t
    rmdir(const std::string &path) override;
    iorx_status_t
    stat(const std::string &path, iorxStatInfo &info) override;
    iorx_status_t
    rename(const std::string &old_path, const std::string &new_path) override;
    iorx_status_t
    mknod(const std::string &path) override;

    class exception : public std::exception {
    private:
        const std::string msg_;
        const iorx_status_t code_;

    public:
        exception(const std::string &msg, iorx_status_t code) : msg_(msg), code_(code) {}

        const char *
        what() const noexcept override {
            return msg_.c_str();
        }

        iorx_status_t
        code() const noexcept {
            return code_;
        }
    };
};

#endif // POSIX_BACKEND_H
