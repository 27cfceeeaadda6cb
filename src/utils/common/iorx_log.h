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
#ifndef IORX_SRC_UTILS_COMMON_IORX_LOG_H
#define IORX_SRC_UTILS_COMMON_IORX_LOG_H

#include <absl/log/check.h>
#include <absl/log/log.h>
#include "iorx_types.h"

#define IORX_ERROR LOG(ERROR)
#define IORX_WARN LOG(WARNING)
#define IORX_INFO LOG(INFO)
#define IORX_DEBUG VLOG(1)
#define IORX_TRACE VLOG(2)

// Only for conditions that indicate a programming error
#define IORX_ASSERT(_cond_) CHECK(_cond_)

#define IORX_LOG_AND_RETURN_IF_ERROR(_status_, _msg_)                            \
    do {                                                                          \
        const iorx_status_t _s_ = (_status_);                                    \
        if (_s_ < IORX_SUCCESS) {                                                 \
            IORX_ERROR << _msg_ << ": " << iorxEnumStrings::statusStr(_s_);       \
            return _s_;                                                           \
        }                                                                         \
    } while (0)

namespace iorx {

// Applies IORX_LOG_LEVEL (ERROR, WARN, INFO, DEBUG, TRACE)
void
logInit();

} // namespace iorx

#endif
