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

#include "backend/backend_plugin.h"
#include "common/iorx_log.h"
#include "posix_backend.h"

std::unique_ptr<iorxBackendEngine>
iorxCreateStaticPosixEngine(const iorxBackendInitParams *init_params) {
    try {
        auto engine = std::make_unique<iorxPosixEngine>(init_params);
        if (engine->getInitErr()) {
            return nullptr;
        }
        return engine;
    }
    catch (const std::exception &e) {
        IORX_ERROR << "Failed to create POSIX engine: " << e.what();
        return nullptr;
    }
}
