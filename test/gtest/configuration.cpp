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
#include "common/configuration.h"
#include "common.h"

#include <gtest/gtest.h>
#include <stdlib.h>
#include <cstdint>
#include <string>

namespace gtest {
namespace config {

namespace {

const std::string variable = "IORX_CONFIG_TEST";

class configEnvTest : public testing::Test {
protected:
    void
    set(const std::string &value) {
        ASSERT_EQ(::setenv(variable.c_str(), value.c_str(), 1), 0);
    }

    void
    TearDown() override {
        ::unsetenv(variable.c_str());
    }
};

} // namespace

TEST_F(configEnvTest, SizeSuffixes) {
    set("4k");
    EXPECT_EQ(iorx::config::getValue<uint64_t>(variable), 4096U);
    set("256K");
    EXPECT_EQ(iorx::config::getValue<uint32_t>(variable), 256U * 1024);
    set("3m");
    EXPECT_EQ(iorx::config::getValue<size_t>(variable), 3U * 1024 * 1024);
    set("2G");
    EXPECT_EQ(iorx::config::getValue<uint64_t>(variable), 2ULL * 1024 * 1024 * 1024);
    set("0x10");
    EXPECT_EQ(iorx::config::getValue<uint32_t>(variable), 16U);

    // Scaling past the type is an error, as is a suffix on its own
    set("1m");
    EXPECT_THROW(iorx::config::getValue<uint16_t>(variable), std::runtime_error);
    set("k");
    EXPECT_THROW(iorx::config::getValue<uint32_t>(variable), std::runtime_error);
    set("12kb");
    EXPECT_THROW(iorx::config::getValue<uint32_t>(variable), std::runtime_error);
}

TEST_F(configEnvTest, FloatingPoint) {
    set("2.5");
    EXPECT_DOUBLE_EQ(iorx::config::getValue<double>(variable), 2.5);
    set("1e-3");
    EXPECT_DOUBLE_EQ(iorx::config::getValueDefaulted<double>(variable, 7.0), 1e-3);

    set("fast");
    double out = 0;
    EXPECT_EQ(iorx::config::getValueWithStatus(out, variable), IORX_ERR_CONFIGURATION);
    EXPECT_THROW(iorx::config::getValue<double>(variable), std::runtime_error);

    ::unsetenv(variable.c_str());
    EXPECT_EQ(iorx::config::getValueWithStatus(out, variable), IORX_ERR_NOT_FOUND);
    EXPECT_DOUBLE_EQ(iorx::config::getValueDefaulted<double>(variable, 7.0), 7.0);
}

TEST_F(configEnvTest, Switches) {
    for (const char *value : {"on", "YES", "Enable", "1"}) {
        set(value);
        EXPECT_TRUE(iorx::config::getValue<bool>(variable)) << value;
    }
    set("off");
    EXPECT_FALSE(iorx::config::getValue<bool>(variable));
    set("maybe");
    EXPECT_THROW(iorx::config::getValue<bool>(variable), std::runtime_error);
}

TEST(configParams, BackendParameters) {
    iorx_b_params_t params;
    params["io_queue"] = "POSIXAIO";
    params["num_workers"] = "8";
    params["window"] = "1m";
    params["direct"] = "no";
    params["broken"] = "eight";

    EXPECT_EQ(iorx::config::getParamDefaulted<std::string>(params, "io_queue", "THREADPOOL"),
              "POSIXAIO");
    EXPECT_EQ(iorx::config::getParamDefaulted<std::string>(params, "missing", "THREADPOOL"),
              "THREADPOOL");
    EXPECT_EQ(iorx::config::getParamDefaulted<uint32_t>(params, "num_workers", 0), 8U);
    EXPECT_EQ(iorx::config::getParamDefaulted<uint64_t>(params, "window", 0), 1024U * 1024);
    EXPECT_FALSE(iorx::config::getParamDefaulted<bool>(params, "direct", true));
    EXPECT_FALSE(iorx::config::getParamOptional<uint32_t>(params, "missing").has_value());
    EXPECT_THROW(iorx::config::getParamDefaulted<uint32_t>(params, "broken", 1),
                 std::runtime_error);
}

} // namespace config
} // namespace gtest
