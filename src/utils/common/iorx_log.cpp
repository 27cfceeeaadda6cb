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

#include "iorx_log.h"
#include "configuration.h"

#include <absl/log/globals.h>
#include <absl/log/log_severity.h>
#include <absl/strings/ascii.h>

namespace iorx {

void
logInit() {
    const auto level = config::getenvOptional("IORX_LOG_LEVEL");
    if (!level) {
        return;
    }

    const std::string name = absl::AsciiStrToUpper(*level);
    int verbosity = 0;
    absl::LogSeverityAtLeast severity = absl::LogSeverityAtLeast::kWarning;

    if (name == "ERROR") {
        severity = absl::LogSeverityAtLeast::kError;
    } else if (name == "WARN") {
        severity = absl::LogSeverityAtLeast::kWarning;
    } else if (name == "INFO") {
        severity = absl::LogSeverityAtLeast::kInfo;
    } else if (name == "DEBUG") {
        severity = absl::LogSeverityAtLeast::kInfo;
        verbosity = 1;
    } else if (name == "TRACE") {
        severity = absl::LogSeverityAtLeast::kInfo;
        verbosity = 2;
    } else {
        IORX_WARN << "Unknown IORX_LOG_LEVEL '" << *level << "', keeping defaults";
        return;
    }

    absl::SetMinLogLevel(severity);
    absl::SetGlobalVLogLevel(verbosity);
}

} // namespace iorx
