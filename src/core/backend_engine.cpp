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

#include "backend/backend_engine.h"
#include "common/iorx_log.h"

#include <absl/strings/str_format.h>

iorx_status_t
iorxBackendEngine::checkHandle(const iorxBackendFileH &handle, const char *op) const {
    if (!handle.isOpen()) {
        IORX_ERROR << absl::StrFormat(
            "%s backend: %s on closed handle of %s", backendType, op, handle.getPath());
        return IORX_ERR_INTERNAL;
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxBackendEngine::checkClose(iorxBackendFileH &handle) const {
    iorx_status_t status = checkHandle(handle, "close");
    if (status != IORX_SUCCESS) {
        return status;
    }

    if (handle.inFlight() > 0) {
        IORX_ERROR << absl::StrFormat("%s backend: close of %s with %u requests in flight",
                                      backendType,
                                      handle.getPath(),
                                      handle.inFlight());
        return IORX_ERR_INTERNAL;
    }
    return IORX_SUCCESS;
}
