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
#ifndef IORX_SRC_UTILS_COMMON_ERRNO_STATUS_H
#define IORX_SRC_UTILS_COMMON_ERRNO_STATUS_H

#include <cerrno>
#include "iorx_types.h"

namespace iorx {

// Largest value the kernel uses for an errno
constexpr int maxErrno = 4095;

/**
 * Maps an errno value (positive) onto the closed status set. Unknown values
 * map to IORX_ERR_INTERNAL.
 */
[[nodiscard]] inline iorx_status_t
errnoToStatus(int err) noexcept {
    switch (err) {
    case 0:
        return IORX_SUCCESS;
    case ENOENT:
    case ENOTDIR:
    case ENXIO:
        return IORX_ERR_NOT_FOUND;
    case EACCES:
    case EPERM:
    case EROFS:
        return IORX_ERR_PERMISSION_DENIED;
    case EEXIST:
        return IORX_ERR_ALREADY_EXISTS;
    case ENOSYS:
    case ENOTSUP:
#if EOPNOTSUPP != ENOTSUP
    case EOPNOTSUPP:
#endif
        return IORX_ERR_NOT_SUPPORTED;
    case ENOSPC:
    case EDQUOT:
    case EFBIG:
        return IORX_ERR_PARTIAL_TRANSFER;
    case ECANCELED:
        return IORX_ERR_CANCELED;
    case ETIMEDOUT:
        return IORX_ERR_TIMEOUT;
    case EINVAL:
    case ENAMETOOLONG:
    case EBADF:
        return IORX_ERR_CONFIGURATION;
    default:
        return IORX_ERR_INTERNAL;
    }
}

} // namespace iorx

#endif
