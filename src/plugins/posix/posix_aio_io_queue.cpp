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
#include <aio.h>
#include <cstring>
#include <errno.h>

struct iorxPosixAioIO : public iorxPosixIO {
    struct aiocb aio_;
};

class iorxPosixIOQueueAIO : public iorxPosixIOQueueImpl<iorxPosixAioIO> {
public:
    iorxPosixIOQueueAIO(uint32_t queue_depth, uint32_t num_workers)
        : iorxPosixIOQueueImpl<iorxPosixAioIO>(queue_depth, num_workers) {}

    virtual ~iorxPosixIOQueueAIO() override;

    virtual iorx_status_t
    submit(int fd, const iorxXferReq &req, void *ctx, iorx_req_id_t &id) override;
    virtual iorx_status_t
    poll(iorx_req_id_t id, bool block, size_t &bytes, void *&ctx) override;
    virtual iorx_status_t
    cancel(iorx_req_id_t id) override;

protected:
    void
    complete(iorxPosixAioIO *io, int error);
};

iorxPosixIOQueueAIO::~iorxPosixIOQueueAIO() {
    std::lock_guard<std::mutex> lk(lock_);
    for (auto &entry : ios_in_flight_) {
        iorxPosixAioIO *io = entry.second;
        if (io->done) {
            continue;
        }
        aio_cancel(io->aio_.aio_fildes, &io->aio_);
        const struct aiocb *list[] = {&io->aio_};
        while (aio_error(&io->aio_) == EINPROGRESS) {
            aio_suspend(list, 1, nullptr);
        }
        aio_return(&io->aio_);
    }
}

iorx_status_t
iorxPosixIOQueueAIO::submit(int fd,
                             const iorxXferReq &req,
                             void *ctx,
                             iorx_req_id_t &id) {
    std::unique_lock<std::mutex> lk(lock_);
    iorxPosixAioIO *io = acquireEntry(lk, fd, req, ctx);

    memset(&io->aio_, 0, sizeof(io->aio_));
    io->aio_.aio_fildes = fd;
    io->aio_.aio_buf = req.buf;
    io->aio_.aio_nbytes = req.len;
    io->aio_.aio_offset = req.offset;

    const int ret = req.op == IORX_READ ? aio_read(&io->aio_) : aio_write(&io->aio_);
    if (ret < 0) {
        const int err = errno;
        IORX_ERROR << absl::StrFormat("aio submission failed: %s", strerror(err));
        free_ios_.push_back(io);
        free_cv_.notify_one();
        return iorx::errnoToStatus(err);
    }

    trackEntry(io);
    id = io->id;
    return IORX_SUCCESS;
}

void
iorxPosixIOQueueAIO::complete(iorxPosixAioIO *io, int error) {
    const ssize_t ret = aio_return(&io->aio_);
    io->done = true;

    if (io->cancel_requested || error == ECANCELED) {
        io->bytes = ret > 0 ? static_cast<size_t>(ret) : 0;
        io->status = IORX_ERR_CANCELED;
        return;
    }

    if (error != 0) {
        io->status = iorx::errnoToStatus(error);
        return;
    }

    io->bytes = static_cast<size_t>(ret);
    io->status = IORX_SUCCESS;
    if (io->bytes < io->req.len) {
        // Finish a short transfer in place
        iorxXferReq rest = io->req;
        rest.buf = static_cast<char *>(rest.buf) + io->bytes;
        rest.len -= io->bytes;
        rest.offset += static_cast<off_t>(io->bytes);

        size_t more = 0;
        io->status = iorxPosixTransfer(io->fd, rest, more);
        io->bytes += more;
    }
}

iorx_status_t
iorxPosixIOQueueAIO::poll(iorx_req_id_t id,
                           bool block,
                           size_t &bytes,
                           void *&ctx) {
    std::unique_lock<std::mutex> lk(lock_);
    iorxPosixAioIO *io = findEntry(id);
    if (!io) {
        IORX_DEBUG << "Poll of unknown request " << id;
        return IORX_ERR_NOT_FOUND;
    }

    while (!io->done) {
        const int error = aio_error(&io->aio_);
        if (error != EINPROGRESS) {
            complete(io, error);
            break;
        }

        if (!block) {
            return IORX_IN_PROG;
        }

        const struct aiocb *list[] = {&io->aio_};
        lk.unlock();
        aio_suspend(list, 1, nullptr);
        lk.lock();
    }

    bytes = io->bytes;
    ctx = io->ctx;
    const iorx_status_t status = io->status;
    releaseEntry(io);
    return status;
}

iorx_status_t
iorxPosixIOQueueAIO::cancel(iorx_req_id_t id) {
    std::lock_guard<std::mutex> lk(lock_);
    iorxPosixAioIO *io = findEntry(id);
    if (!io) {
        return IORX_ERR_NOT_FOUND;
    }

    if (io->done) {
        return IORX_SUCCESS;
    }

    switch (aio_cancel(io->aio_.aio_fildes, &io->aio_)) {
    case AIO_CANCELED:
    case AIO_NOTCANCELED:
        io->cancel_requested = true;
        return IORX_SUCCESS;
    case AIO_ALLDONE:
        return IORX_SUCCESS;
    default:
        IORX_ERROR << absl::StrFormat("aio_cancel failed: %s", strerror(errno));
        return IORX_ERR_INTERNAL;
    }
}

std::unique_ptr<iorxPosixIOQueue>
iorxPosixIOQueueAIOCreate(uint32_t queue_depth, uint32_t num_workers) {
    return std::make_unique<iorxPosixIOQueueAIO>(queue_depth, num_workers);
}
