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

#include "str_tools.h"
#include "iorx_log.h"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_format.h>
#include <absl/strings/string_view.h>

namespace iorx {

iorx_status_t
parseBackendOptions(const std::string &prefix,
                    const std::vector<std::string> &args,
                    iorx_b_params_t &params,
                    std::vector<std::string> *rest) {
    const std::string lead = "--" + absl::AsciiStrToLower(prefix) + ".";

    for (const auto &arg : args) {
        if (!absl::StartsWithIgnoreCase(arg, lead)) {
            if (rest) {
                rest->push_back(arg);
            }
            continue;
        }

        const absl::string_view option = absl::string_view(arg).substr(lead.size());
        const size_t eq = option.find('=');
        const absl::string_view key = option.substr(0, eq);
        if (key.empty()) {
            IORX_ERROR << absl::StrFormat("Malformed backend option '%s'", arg);
            return IORX_ERR_CONFIGURATION;
        }

        const std::string value =
            eq == absl::string_view::npos ? "1" : std::string(option.substr(eq + 1));
        params[std::string(key)] = value;
        IORX_DEBUG << absl::StrFormat("Backend option %s.%s=%s", prefix, key, value);
    }

    return IORX_SUCCESS;
}

} // namespace iorx
