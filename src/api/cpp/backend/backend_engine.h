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
#ifndef __BACKEND_ENGINE_H_
#define __BACKEND_ENGINE_H_

#include <atomic>
#include <memory>
#include <string>
#include "iorx_types.h"

struct iorxBackendInitParams {
    iorx_b_params_t customParams;
    uint32_t queueDepth = 1;
    // Owning rank, for logging only
    int rank = 0;
};

/**
 * Opaque, backend-owned reference to an open file. Owned by the phase of a
 * single rank. A handle is created by create()/open() and stays allocated
 * after close() so that late use can be detected and reported.
 */
class iorxBackendFileH {
public:
    explicit iorxBackendFileH(const std::string &path) : path_(path) {}

    virtual ~iorxBackendFileH() = default;

    iorxBackendFileH(const iorxBackendFileH &) = delete;
    iorxBackendFileH &
    operator=(const iorxBackendFileH &) = delete;

    const std::string &
    getPath() const {
        return path_;
    }

    bool
    isOpen() const {
        return open_;
    }

    uint32_t
    inFlight() const {
        return in_flight_.load();
    }

    void
    markClosed() {
        open_ = false;
    }

    void
    addInFlight() {
        in_flight_++;
    }

    void
    removeInFlight() {
        in_flight_--;
    }

private:
    const std::string path_;
    bool open_ = true;
    std::atomic<uint32_t> in_flight_{0};
};

/**
 * Capability contract of a storage backend. Every operation reports one of
 * the closed iorx_status_t kinds; no operation retries on behalf of the
 * caller.
 */
class iorxBackendEngine {
private:
    const iorx_backend_t backendType;

protected:
    bool initErr = false;
    const iorx_b_params_t customParams;

    // Validates a handle passed by the caller; logs and fails on closed ones
    iorx_status_t
    checkHandle(const iorxBackendFileH &handle, const char *op) const;

    // Common epilogue of a successful close()
    iorx_status_t
    checkClose(iorxBackendFileH &handle) const;

public:
    iorxBackendEngine(const iorx_backend_t &type, const iorxBackendInitParams *init_params)
        : backendType(type),
          customParams(init_params->customParams) {}

    iorxBackendEngine(iorxBackendEngine &&) = delete;
    iorxBackendEngine(const iorxBackendEngine &) = delete;

    void
    operator=(iorxBackendEngine &&) = delete;
    void
    operator=(const iorxBackendEngine &) = delete;

    virtual ~iorxBackendEngine() = default;

    bool
    getInitErr() const {
        return initErr;
    }

    const iorx_backend_t &
    getType() const {
        return backendType;
    }

    // File lifecycle
    virtual iorx_status_t
    create(const std::string &path,
           iorx_open_flags_t flags,
           std::unique_ptr<iorxBackendFileH> &handle) = 0;
    virtual iorx_status_t
    open(const std::string &path,
         iorx_open_flags_t flags,
         std::unique_ptr<iorxBackendFileH> &handle) = 0;
    virtual iorx_status_t
    close(iorxBackendFileH &handle) = 0;
    virtual iorx_status_t
    remove(const std::string &path) = 0;
    virtual iorx_status_t
    fsync(iorxBackendFileH &handle) = 0;

    // Blocking transfer, returns once the whole request is done
    virtual iorx_status_t
    xferSync(iorxBackendFileH &handle, const iorxXferReq &req, size_t &bytes) = 0;

    // Non-blocking submission path. poll() returns IORX_IN_PROG while the
    // request is pending, IORX_SUCCESS or an error once it is reaped.
    virtual iorx_status_t
    xferSubmit(iorxBackendFileH &handle, const iorxXferReq &req, iorx_req_id_t &id) = 0;
    virtual iorx_status_t
    poll(iorx_req_id_t id, bool block, size_t &bytes) = 0;
    virtual iorx_status_t
    cancel(iorx_req_id_t id) = 0;

    // Metadata
    virtual iorx_status_t
    mkdir(const std::string &path, mode_t mode) = 0;
    virtual iorx_status_t
    rmdir(const std::string &path) = 0;
    virtual iorx_status_t
    stat(const std::string &path, iorxStatInfo &info) = 0;
    virtual iorx_status_t
    rename(const std::string &old_path, const std::string &new_path) = 0;
    virtual iorx_status_t
    mknod(const std::string &path) = 0;
};

#endif
