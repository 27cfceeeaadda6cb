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
#ifndef IORX_SRC_CORE_NATIVE_NATIVE_BACKEND_H
#define IORX_SRC_CORE_NATIVE_NATIVE_BACKEND_H

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "backend/backend_engine.h"
#include "backend/backend_plugin.h"

namespace iorx {

// Translates a native slot result (0 or positive on success, -errno on
// failure) into the closed status set
iorx_status_t
nativeToStatus(int64_t code, const char *slot);

// Name of the first required slot left empty, nullptr when complete
const char *
findMissingNativeSlot(const iorxNativeBackendOps &ops);

} // namespace iorx

class iorxNativeFileH : public iorxBackendFileH {
public:
    iorxNativeFileH(const std::string &path, void *fh) : iorxBackendFileH(path), fh_(fh) {}

    void *
    getNative() const {
        return fh_;
    }

private:
    void *const fh_;
};

/**
 * Drives a backend implemented as a native function table through the
 * common engine interface. The table is copied at construction; no string
 * or buffer passed to a slot is referenced after the slot returns, except
 * transfer buffers of submitted requests which the caller keeps alive until
 * the request is reaped.
 */
class iorxNativeEngine : public iorxBackendEngine {
private:
    struct pendingReq {
        iorxBackendFileH *owner;
        size_t len;
    };

    // Keeps the module providing the table loaded; released last
    const std::shared_ptr<const void> module_;
    const iorxNativeBackendOps ops_;
    void *ctx_ = nullptr;

    std::mutex lock_;
    std::unordered_map<iorx_req_id_t, pendingReq> pending_;

    iorx_status_t
    openWith(int (*slot)(void *, const char *, uint32_t, void **),
             const char *slot_name,
             const std::string &path,
             iorx_open_flags_t flags,
             std::unique_ptr<iorxBackendFileH> &handle);

    iorxNativeFileH *
    castNativeHandle(iorxBackendFileH &handle, const char *op) const;

public:
    iorxNativeEngine(const iorx_backend_t &name,
                     const iorxNativeBackendOps &ops,
                     const iorxBackendInitParams *init_params,
                     std::shared_ptr<const void> module = nullptr);
    ~iorxNativeEngine();

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
};

#endif // IORX_SRC_CORE_NATIVE_NATIVE_BACKEND_H
