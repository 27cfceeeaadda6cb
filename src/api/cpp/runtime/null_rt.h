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
#ifndef __NULL_RT_H
#define __NULL_RT_H

#include "runtime/iorx_rt.h"

// Single rank runtime; every collective is local
class iorxNullRT : public iorxRT {
public:
    iorxNullRT() {
        setSize(1);
        setRank(0);
    }

    int
    barrier(const std::string &barrier_id) override;
    int
    broadcastInt(int64_t *buffer, size_t count, int root_rank) override;
    int
    allReduceDouble(const double *local_value,
                    double *global_value,
                    size_t count,
                    iorx_reduce_op_t op) override;
    int
    allReduceInt(const int64_t *local_value,
                 int64_t *global_value,
                 size_t count,
                 iorx_reduce_op_t op) override;
};

#endif
