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
#ifndef TEST_GTEST_COMMON_H
#define TEST_GTEST_COMMON_H

#include <cstddef>
#include <list>
#include <mutex>
#include <regex>
#include <string>
#include <vector>
#include "absl/log/log_entry.h"
#include "absl/log/log_sink.h"

namespace gtest {

/**
 * Fresh directory under the system temporary directory, removed with its
 * content on destruction.
 */
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string &prefix = "iorx_test");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir &) = delete;
    ScopedTempDir &
    operator=(const ScopedTempDir &) = delete;

    const std::string &
    path() const {
        return path_;
    }

    std::string
    file(const std::string &name) const {
        return path_ + "/" + name;
    }

private:
    std::string path_;
};

struct logExpectation {
    std::regex rx;
    size_t hits = 0;
};

// Warnings and errors matching the expression are expected while in scope
class LogIgnoreGuard {
public:
    explicit LogIgnoreGuard(const std::string &rx);
    ~LogIgnoreGuard();

    LogIgnoreGuard(const LogIgnoreGuard &) = delete;
    LogIgnoreGuard &
    operator=(const LogIgnoreGuard &) = delete;

    [[nodiscard]] size_t
    getIgnoredCount() const;

private:
    std::list<logExpectation>::iterator iter_;
};

/**
 * Log sink installed for the whole test run. Warnings and errors no
 * LogIgnoreGuard expects are kept and reported at the end of the run.
 */
class LogWatch : public absl::LogSink {
public:
    LogWatch();
    ~LogWatch();

    LogWatch(const LogWatch &) = delete;
    LogWatch &
    operator=(const LogWatch &) = delete;

    void
    Send(const absl::LogEntry &entry) override;

    [[nodiscard]] static std::vector<std::string>
    unexpected();
};

} // namespace gtest

#endif /* TEST_GTEST_COMMON_H */
