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

#include "posix_backend.h"
#include "common/configuration.h"
#include "common/errno_status.h"
#include "common/iorx_log.h"
#include <absl/strings/str_format.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cstring>

namespace {

constexpr mode_t createMode = 0664;

iorx_status_t
toPosixFlags(iorx_open_flags_t flags, int &posix_flags) {
    if (flags & IORX_O_RDWR) {
        posix_flags = O_RDWR;
    } else if (flags & IORX_O_WRONLY) {
        posix_flags = O_WRONLY;
    } else {
        posix_flags = O_RDONLY;
    }

    if (flags & IORX_O_APPEND) posix_flags |= O_APPEND;
    if (flags & IORX_O_CREAT) posix_flags |= O_CREAT;
    if (flags & IORX_O_TRUNC) posix_flags |= O_TRUNC;
    if (flags & IORX_O_EXCL) posix_flags |= O_EXCL;

    if (flags & IORX_O_DIRECT) {
#ifdef O_DIRECT
        posix_flags |= O_DIRECT;
#else
        IORX_ERROR << "Direct I/O is not available on this platform";
        return IORX_ERR_NOT_SUPPORTED;
#endif
    }
    return IORX_SUCCESS;
}

iorx_status_t
logPathError(const char *op, const std::string &path, int err) {
    const iorx_status_t status = iorx::errnoToStatus(err);
    IORX_DEBUG << absl::StrFormat("POSIX %s of %s failed: %s (%s)",
                                  op,
                                  path,
                                  strerror(err),
                                  iorxEnumStrings::statusStr(status));
    return status;
}

} // namespace

// -----------------------------------------------------------------------------
// POSIX Engine Implementation
// -----------------------------------------------------------------------------

iorxPosixEngine::iorxPosixEngine(const iorxBackendInitParams *init_params)
    : iorxBackendEngine("POSIX", init_params),
      queue_depth_(std::max(1u, init_params->queueDepth)) {
    uint32_t num_workers = 0;
    try {
        io_queue_type_ = iorx::config::getParamDefaulted<std::string>(
            customParams, "io_queue", std::string(iorxPosixIOQueue::getDefaultIoQueueType()));
        num_workers = iorx::config::getParamDefaulted<uint32_t>(customParams, "num_workers", 0);
    }
    catch (const std::exception &e) {
        IORX_ERROR << absl::StrFormat("Invalid POSIX backend parameter: %s", e.what());
        initErr = true;
        return;
    }

    if (!iorxPosixIOQueue::isSupportedIoQueueType(io_queue_type_)) {
        IORX_ERROR << absl::StrFormat("Unknown POSIX io queue type '%s'", io_queue_type_);
        initErr = true;
        return;
    }

    // A depth of one never overlaps requests: no queue and no workers
    if (queue_depth_ > 1) {
        io_queue_ = iorxPosixIOQueue::instantiate(io_queue_type_, queue_depth_, num_workers);
        if (!io_queue_) {
            IORX_ERROR << "Failed to initialize POSIX backend io queue";
            initErr = true;
            return;
        }
    }

    IORX_DEBUG << absl::StrFormat("POSIX backend initialized for rank %d: queue depth %u, %s",
                                  init_params->rank,
                                  queue_depth_,
                                  io_queue_ ? io_queue_type_ : std::string("synchronous"));
}

iorxPosixFileH &
iorxPosixEngine::castPosixHandle(iorxBackendFileH &handle) const {
    auto *posix_handle = dynamic_cast<iorxPosixFileH *>(&handle);
    if (!posix_handle) {
        throw exception("handle was not opened by the POSIX backend", IORX_ERR_INTERNAL);
    }
    return *posix_handle;
}

uint32_t
iorxPosixEngine::getMaxInFlight() const {
    return io_queue_ ? io_queue_->maxInFlight() : inline_max_in_flight_;
}

iorx_status_t
iorxPosixEngine::openFile(const std::string &path,
                          iorx_open_flags_t flags,
                          std::unique_ptr<iorxBackendFileH> &handle) {
    int posix_flags = 0;
    iorx_status_t status = toPosixFlags(flags, posix_flags);
    if (status != IORX_SUCCESS) {
        return status;
    }

    const int fd = ::open(path.c_str(), posix_flags, createMode);
    if (fd < 0) {
        const int err = errno;
        if ((flags & IORX_O_DIRECT) && err == EINVAL) {
            IORX_ERROR << absl::StrFormat("Direct I/O is not supported for %s", path);
            return IORX_ERR_NOT_SUPPORTED;
        }
        return logPathError("open", path, err);
    }

    handle = std::make_unique<iorxPosixFileH>(path, fd);
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixEngine::create(const std::string &path,
                        iorx_open_flags_t flags,
                        std::unique_ptr<iorxBackendFileH> &handle) {
    if (!(flags & (IORX_O_RDWR | IORX_O_WRONLY))) {
        flags |= IORX_O_RDWR;
    }
    return openFile(path, flags | IORX_O_CREAT, handle);
}

iorx_status_t
iorxPosixEngine::open(const std::string &path,
                      iorx_open_flags_t flags,
                      std::unique_ptr<iorxBackendFileH> &handle) {
    return openFile(path, flags, handle);
}

iorx_status_t
iorxPosixEngine::close(iorxBackendFileH &handle) {
    try {
        auto &posix_handle = castPosixHandle(handle);
        iorx_status_t status = checkClose(handle);
        if (status != IORX_SUCCESS) {
            return status;
        }

        // The descriptor is released even when close reports an error
        handle.markClosed();
        if (::close(posix_handle.getFd()) < 0) {
            return logPathError("close", handle.getPath(), errno);
        }
        return IORX_SUCCESS;
    }
    catch (const exception &e) {
        IORX_ERROR << e.what();
        return e.code();
    }
}

iorx_status_t
iorxPosixEngine::remove(const std::string &path) {
    if (::unlink(path.c_str()) < 0) {
        return logPathError("unlink", path, errno);
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixEngine::fsync(iorxBackendFileH &handle) {
    try {
        auto &posix_handle = castPosixHandle(handle);
        iorx_status_t status = checkHandle(handle, "fsync");
        if (status != IORX_SUCCESS) {
            return status;
        }

        if (::fsync(posix_handle.getFd()) < 0) {
            return logPathError("fsync", handle.getPath(), errno);
        }
        return IORX_SUCCESS;
    }
    catch (const exception &e) {
        IORX_ERROR << e.what();
        return e.code();
    }
}

iorx_status_t
iorxPosixEngine::xferSync(iorxBackendFileH &handle, const iorxXferReq &req, size_t &bytes) {
    try {
        auto &posix_handle = castPosixHandle(handle);
        iorx_status_t status = checkHandle(handle, "transfer");
        if (status != IORX_SUCCESS) {
            return status;
        }

        status = iorxPosixTransfer(posix_handle.getFd(), req, bytes);
        if (status != IORX_SUCCESS) {
            IORX_ERROR << absl::StrFormat("POSIX %s of %zu bytes at offset %d in %s: %s",
                                          iorxEnumStrings::xferOpStr(req.op),
                                          req.len,
                                          req.offset,
                                          handle.getPath(),
                                          iorxEnumStrings::statusStr(status));
        }
        return status;
    }
    catch (const exception &e) {
        IORX_ERROR << e.what();
        return e.code();
    }
}

iorx_status_t
iorxPosixEngine::xferSubmit(iorxBackendFileH &handle, const iorxXferReq &req, iorx_req_id_t &id) {
    try {
        auto &posix_handle = castPosixHandle(handle);
        iorx_status_t status = checkHandle(handle, "submit");
        if (status != IORX_SUCCESS) {
            return status;
        }

        // Counted first, the request may complete before submit() returns
        handle.addInFlight();
        if (io_queue_) {
            // May block until the window has room
            status = io_queue_->submit(posix_handle.getFd(), req, &handle, id);
            if (status != IORX_SUCCESS) {
                handle.removeInFlight();
            }
            return status;
        }

        // Unreaped inline results hold the window like queued requests do
        std::unique_lock<std::mutex> lk(inline_lock_);
        inline_cv_.wait(lk, [this] { return inline_results_.size() < queue_depth_; });

        size_t bytes = 0;
        status = iorxPosixTransfer(posix_handle.getFd(), req, bytes);

        id = next_inline_id_++;
        inline_results_[id] = {status, bytes, &handle};
        inline_max_in_flight_ =
            std::max(inline_max_in_flight_, static_cast<uint32_t>(inline_results_.size()));
        return IORX_SUCCESS;
    }
    catch (const exception &e) {
        IORX_ERROR << e.what();
        return e.code();
    }
}

iorx_status_t
iorxPosixEngine::poll(iorx_req_id_t id, bool block, size_t &bytes) {
    if (io_queue_) {
        void *ctx = nullptr;
        const iorx_status_t status = io_queue_->poll(id, block, bytes, ctx);
        if (!ctx) {
            // Still running, or an unknown id
            return status;
        }

        static_cast<iorxBackendFileH *>(ctx)->removeInFlight();
        if (status != IORX_SUCCESS && status != IORX_ERR_CANCELED) {
            IORX_ERROR << absl::StrFormat("POSIX request %d failed after %zu bytes: %s",
                                          id,
                                          bytes,
                                          iorxEnumStrings::statusStr(status));
        }
        return status;
    }

    std::lock_guard<std::mutex> lk(inline_lock_);
    auto it = inline_results_.find(id);
    if (it == inline_results_.end()) {
        return IORX_ERR_NOT_FOUND;
    }

    bytes = it->second.bytes;
    const iorx_status_t status = it->second.status;
    it->second.owner->removeInFlight();
    inline_results_.erase(it);
    inline_cv_.notify_one();
    return status;
}

iorx_status_t
iorxPosixEngine::cancel(iorx_req_id_t id) {
    if (io_queue_) {
        return io_queue_->cancel(id);
    }

    // Inline requests are already complete
    std::lock_guard<std::mutex> lk(inline_lock_);
    return inline_results_.count(id) ? IORX_SUCCESS : IORX_ERR_NOT_FOUND;
}

iorx_status_t
iorxPosixEngine::mkdir(const std::string &path, mode_t mode) {
    if (::mkdir(path.c_str(), mode) < 0) {
        return logPathError("mkdir", path, errno);
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixEngine::rmdir(const std::string &path) {
    if (::rmdir(path.c_str()) < 0) {
        return logPathError("rmdir", path, errno);
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixEngine::stat(const std::string &path, iorxStatInfo &info) {
    struct stat st;
    if (::stat(path.c_str(), &st) < 0) {
        return logPathError("stat", path, errno);
    }

    info.size = static_cast<uint64_t>(st.st_size);
    info.mode = st.st_mode;
    info.nlink = st.st_nlink;
    info.uid = st.st_uid;
    info.gid = st.st_gid;
    info.atime = st.st_atime;
    info.mtime = st.st_mtime;
    info.ctime = st.st_ctime;
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixEngine::rename(const std::string &old_path, const std::string &new_path) {
    if (::rename(old_path.c_str(), new_path.c_str()) < 0) {
        return logPathError("rename", old_path, errno);
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxPosixEngine::mknod(const std::string &path) {
    if (::mknod(path.c_str(), S_IFREG | S_IRUSR, 0) < 0) {
        return logPathError("mknod", path, errno);
    }
    return IORX_SUCCESS;
}
