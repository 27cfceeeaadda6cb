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
#include "common.h"
#include "absl/log/log_sink_registry.h"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <stdlib.h>

namespace gtest {

ScopedTempDir::ScopedTempDir(const std::string &prefix) {
    std::string tmpl = (std::filesystem::temp_directory_path() / (prefix + ".XXXXXX")).string();
    if (mkdtemp(tmpl.data()) == nullptr) {
        throw std::runtime_error("mkdtemp failed for " + tmpl + ": " + strerror(errno));
    }
    path_ = tmpl;
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

namespace {

// Guards and messages are shared by all threads of the test binary
struct watchState {
    std::mutex lock;
    std::list<logExpectation> expected;
    std::vector<std::string> unexpected;
};

watchState &
state() {
    static watchState instance;
    return instance;
}

} // namespace

LogIgnoreGuard::LogIgnoreGuard(const std::string &rx) {
    auto &watch = state();
    const std::lock_guard<std::mutex> lk(watch.lock);
    // Innermost guard is matched first
    watch.expected.push_front({std::regex(rx, std::regex_constants::extended), 0});
    iter_ = watch.expected.begin();
}

LogIgnoreGuard::~LogIgnoreGuard() {
    auto &watch = state();
    const std::lock_guard<std::mutex> lk(watch.lock);
    watch.expected.erase(iter_);
}

size_t
LogIgnoreGuard::getIgnoredCount() const {
    auto &watch = state();
    const std::lock_guard<std::mutex> lk(watch.lock);
    return iter_->hits;
}

LogWatch::LogWatch() {
    absl::AddLogSink(this);
}

LogWatch::~LogWatch() {
    absl::RemoveLogSink(this);
}

void
LogWatch::Send(const absl::LogEntry &entry) {
    if (entry.log_severity() < absl::LogSeverity::kWarning) {
        return;
    }

    const std::string msg(entry.text_message());
    auto &watch = state();
    const std::lock_guard<std::mutex> lk(watch.lock);
    for (auto &guard : watch.expected) {
        if (std::regex_search(msg, guard.rx)) {
            guard.hits++;
            return;
        }
    }
    watch.unexpected.push_back(msg);
}

std::vector<std::string>
LogWatch::unexpected() {
    auto &watch = state();
    const std::lock_guard<std::mutex> lk(watch.lock);
    return watch.unexpected;
}

} // namespace gtest
