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
#ifndef IORX_SRC_UTILS_COMMON_STR_TOOLS_H
#define IORX_SRC_UTILS_COMMON_STR_TOOLS_H

#include <string>
#include <vector>
#include "iorx_types.h"

namespace iorx {

/**
 * Collects backend options of the form "--<prefix>.<key>[=<value>]" into a
 * parameter map. The prefix match is case insensitive, a missing value is
 * stored as "1". Arguments without the prefix are returned in @p rest.
 */
iorx_status_t
parseBackendOptions(const std::string &prefix,
                    const std::vector<std::string> &args,
                    iorx_b_params_t &params,
                    std::vector<std::string> *rest = nullptr);

} // namespace iorx

#endif // IORX_SRC_UTILS_COMMON_STR_TOOLS_H
