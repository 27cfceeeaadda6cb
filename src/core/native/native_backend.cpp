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

#include "native_backend.h"
#include "common/errno_status.h"
#include "common/iorx_log.h"

#include <absl/strings/str_format.h>
#include <utility>
#include <vector>

namespace iorx {

iorx_status_t
nativeToStatus(int64_t code, const char *slot) {
    if (code >= 0) {
        return IORX_SUCCESS;
    }

    if (code < -maxErrno) {
        IORX_ERROR << absl::StrFormat(
            "Native slot '%s' returned untranslatable code %d", slot, code);
        return IORX_ERR_INTERNAL;
    }

    return errnoToStatus(static_cast<int>(-code));
}

const char *
findMissingNativeSlot(const iorxNativeBackendOps &ops) {
    const struct {
        const char *name;
        bool present;
    } slots[] = {
        {"create", ops.create != nullptr},
        {"open", ops.open != nullptr},
        {"close", ops.close != nullptr},
        {"remove", ops.remove != nullptr},
        {"fsync", ops.fsync != nullptr},
        {"xfer_sync", ops.xfer_sync != nullptr},
        {"xfer_submit", ops.xfer_submit != nullptr},
        {"poll", ops.poll != nullptr},
        {"cancel", ops.cancel != nullptr},
        {"mkdir", ops.mkdir != nullptr},
        {"rmdir", ops.rmdir != nullptr},
        {"stat", ops.stat != nullptr},
        {"rename", ops.rename != nullptr},
        {"mknod", ops.mknod != nullptr},
    };

    for (const auto &slot : slots) {
        if (!slot.present) {
            return slot.name;
        }
    }
    return nullptr;
}

} // namespace iorx

iorxNativeEngine::iorxNativeEngine(const iorx_backend_t &name,
                                   const iorxNativeBackendOps &ops,
                                   const iorxBackendInitParams *init_params,
                                   std::shared_ptr<const void> module)
    : iorxBackendEngine(name, init_params),
      module_(std::move(module)),
      ops_(ops) {
    if (const char *missing = iorx::findMissingNativeSlot(ops_)) {
        IORX_ERROR << absl::StrFormat("Native backend %s has no '%s' slot", name, missing);
        initErr = true;
        return;
    }

    if (!ops_.init) {
        return;
    }

    std::vector<const char *> keys;
    std::vector<const char *> values;
    for (const auto &param : customParams) {
        keys.push_back(param.first.c_str());
        values.push_back(param.second.c_str());
    }

    ctx_ = ops_.init(keys.data(), values.data(), keys.size());
    if (!ctx_) {
        IORX_ERROR << absl::StrFormat("Native backend %s failed to initialize", name);
        initErr = true;
    }
}

iorxNativeEngine::~iorxNativeEngine() {
    if (!pending_.empty()) {
        IORX_WARN << absl::StrFormat("Native backend %s destroyed with %zu unreaped requests",
                                     getType(),
                                     pending_.size());
    }

    if (ops_.fini && ctx_) {
        ops_.fini(ctx_);
    }
}

iorxNativeFileH *
iorxNativeEngine::castNativeHandle(iorxBackendFileH &handle, const char *op) const {
    auto *native_handle = dynamic_cast<iorxNativeFileH *>(&handle);
    if (!native_handle) {
        IORX_ERROR << absl::StrFormat(
            "%s backend: %s on a handle of another backend", getType(), op);
        return nullptr;
    }

    if (checkHandle(handle, op) != IORX_SUCCESS) {
        return nullptr;
    }
    return native_handle;
}

iorx_status_t
iorxNativeEngine::openWith(int (*slot)(void *, const char *, uint32_t, void **),
                           const char *slot_name,
                           const std::string &path,
                           iorx_open_flags_t flags,
                           std::unique_ptr<iorxBackendFileH> &handle) {
    void *fh = nullptr;
    const iorx_status_t status =
        iorx::nativeToStatus(slot(ctx_, path.c_str(), flags, &fh), slot_name);
    if (status != IORX_SUCCESS) {
        return status;
    }

    handle = std::make_unique<iorxNativeFileH>(path, fh);
    return IORX_SUCCESS;
}

iorx_status_t
iorxNativeEngine::create(const std::string &path,
                         iorx_open_flags_t flags,
                         std::unique_ptr<iorxBackendFileH> &handle) {
    return openWith(ops_.create, "create", path, flags | IORX_O_CREAT, handle);
}

iorx_status_t
iorxNativeEngine::open(const std::string &path,
                       iorx_open_flags_t flags,
                       std::unique_ptr<iorxBackendFileH> &handle) {
    return openWith(ops_.open, "open", path, flags, handle);
}

iorx_status_t
iorxNativeEngine::close(iorxBackendFileH &handle) {
    auto *native_handle = dynamic_cast<iorxNativeFileH *>(&handle);
    if (!native_handle) {
        IORX_ERROR << absl::StrFormat("%s backend: close of a foreign handle", getType());
        return IORX_ERR_INTERNAL;
    }

    iorx_status_t status = checkClose(handle);
    if (status != IORX_SUCCESS) {
        return status;
    }

    handle.markClosed();
    return iorx::nativeToStatus(ops_.close(ctx_, native_handle->getNative()), "close");
}

iorx_status_t
iorxNativeEngine::remove(const std::string &path) {
    return iorx::nativeToStatus(ops_.remove(ctx_, path.c_str()), "remove");
}

iorx_status_t
iorxNativeEngine::fsync(iorxBackendFileH &handle) {
    auto *native_handle = castNativeHandle(handle, "fsync");
    if (!native_handle) {
        return IORX_ERR_INTERNAL;
    }
    return iorx::nativeToStatus(ops_.fsync(ctx_, native_handle->getNative()), "fsync");
}

iorx_status_t
iorxNativeEngine::xferSync(iorxBackendFileH &handle, const iorxXferReq &req, size_t &bytes) {
    auto *native_handle = castNativeHandle(handle, "transfer");
    if (!native_handle) {
        return IORX_ERR_INTERNAL;
    }

    const int64_t ret = ops_.xfer_sync(ctx_,
                                       native_handle->getNative(),
                                       req.op == IORX_WRITE,
                                       req.buf,
                                       req.len,
                                       req.offset);
    if (ret < 0) {
        bytes = 0;
        return iorx::nativeToStatus(ret, "xfer_sync");
    }

    bytes = static_cast<size_t>(ret);
    if (bytes > req.len) {
        IORX_ERROR << absl::StrFormat(
            "%s backend reported %zu bytes for a %zu byte transfer", getType(), bytes, req.len);
        return IORX_ERR_INTERNAL;
    }
    return bytes < req.len ? IORX_ERR_PARTIAL_TRANSFER : IORX_SUCCESS;
}

iorx_status_t
iorxNativeEngine::xferSubmit(iorxBackendFileH &handle, const iorxXferReq &req, iorx_req_id_t &id) {
    auto *native_handle = castNativeHandle(handle, "submit");
    if (!native_handle) {
        return IORX_ERR_INTERNAL;
    }

    uint64_t native_id = 0;
    const iorx_status_t status = iorx::nativeToStatus(ops_.xfer_submit(ctx_,
                                                                       native_handle->getNative(),
                                                                       req.op == IORX_WRITE,
                                                                       req.buf,
                                                                       req.len,
                                                                       req.offset,
                                                                       &native_id),
                                                      "xfer_submit");
    if (status != IORX_SUCCESS) {
        return status;
    }

    std::unique_lock<std::mutex> lk(lock_);
    if (!pending_.emplace(native_id, pendingReq{&handle, req.len}).second) {
        lk.unlock();
        IORX_ERROR << absl::StrFormat(
            "%s backend reused request id %d while it is in flight", getType(), native_id);

        // The buffer belongs to the caller again once submit returns, so
        // the rejected request is finished here
        uint64_t drained = 0;
        ops_.cancel(ctx_, native_id);
        if (ops_.poll(ctx_, native_id, 1, &drained) == IORX_NATIVE_PENDING) {
            IORX_ERROR << absl::StrFormat(
                "%s backend returned pending from a blocking poll of %d", getType(), native_id);
        }
        return IORX_ERR_INTERNAL;
    }

    handle.addInFlight();
    id = native_id;
    return IORX_SUCCESS;
}

iorx_status_t
iorxNativeEngine::poll(iorx_req_id_t id, bool block, size_t &bytes) {
    {
        std::lock_guard<std::mutex> lk(lock_);
        if (!pending_.count(id)) {
            return IORX_ERR_NOT_FOUND;
        }
    }

    uint64_t native_bytes = 0;
    const int ret = ops_.poll(ctx_, id, block, &native_bytes);
    if (ret == IORX_NATIVE_PENDING) {
        if (!block) {
            return IORX_IN_PROG;
        }
        IORX_ERROR << absl::StrFormat(
            "%s backend returned pending from a blocking poll of %d", getType(), id);
        return IORX_ERR_INTERNAL;
    }

    iorx_status_t status;
    if (ret > 0) {
        IORX_ERROR << absl::StrFormat(
            "Native slot 'poll' returned untranslatable code %d", ret);
        status = IORX_ERR_INTERNAL;
    } else {
        status = iorx::nativeToStatus(ret, "poll");
    }

    std::lock_guard<std::mutex> lk(lock_);
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return IORX_ERR_NOT_FOUND;
    }

    const size_t len = it->second.len;
    it->second.owner->removeInFlight();
    pending_.erase(it);

    bytes = static_cast<size_t>(native_bytes);
    if (status == IORX_SUCCESS && bytes < len) {
        status = IORX_ERR_PARTIAL_TRANSFER;
    }
    return status;
}

iorx_status_t
iorxNativeEngine::cancel(iorx_req_id_t id) {
    {
        std::lock_guard<std::mutex> lk(lock_);
        if (!pending_.count(id)) {
            return IORX_ERR_NOT_FOUND;
        }
    }
    return iorx::nativeToStatus(ops_.cancel(ctx_, id), "cancel");
}

iorx_status_t
iorxNativeEngine::mkdir(const std::string &path, mode_t mode) {
    return iorx::nativeToStatus(ops_.mkdir(ctx_, path.c_str(), mode), "mkdir");
}

iorx_status_t
iorxNativeEngine::rmdir(const std::string &path) {
    return iorx::nativeToStatus(ops_.rmdir(ctx_, path.c_str()), "rmdir");
}

iorx_status_t
iorxNativeEngine::stat(const std::string &path, iorxStatInfo &info) {
    iorxNativeStat st = {};
    const iorx_status_t status = iorx::nativeToStatus(ops_.stat(ctx_, path.c_str(), &st), "stat");
    if (status != IORX_SUCCESS) {
        return status;
    }

    info.size = st.size;
    info.mode = st.mode;
    info.nlink = st.nlink;
    info.uid = st.uid;
    info.gid = st.gid;
    info.atime = st.atime;
    info.mtime = st.mtime;
    info.ctime = st.ctime;
    return IORX_SUCCESS;
}

iorx_status_t
iorxNativeEngine::rename(const std::string &old_path, const std::string &new_path) {
    return iorx::nativeToStatus(ops_.rename(ctx_, old_path.c_str(), new_path.c_str()), "rename");
}

iorx_status_t
iorxNativeEngine::mknod(const std::string &path) {
    return iorx::nativeToStatus(ops_.mknod(ctx_, path.c_str()), "mknod");
}
