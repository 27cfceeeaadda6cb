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
#ifndef __IORX_RT_H
#define __IORX_RT_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "iorx_types.h"

/**
 * Collective communication layer used to coordinate ranks. All calls are
 * blocking collectives: every rank of the job must issue the same sequence
 * of calls. Return 0 on success.
 */
class iorxRT {
private:
    int rank = 0;
    int size = 1;

protected:
    void
    setRank(int r) {
        rank = r;
    }

    void
    setSize(int s) {
        size = s;
    }

public:
    virtual ~iorxRT() = default;

    int
    getRank() const {
        return rank;
    }

    int
    getSize() const {
        return size;
    }

    virtual int
    barrier(const std::string &barrier_id) = 0;
    virtual int
    broadcastInt(int64_t *buffer, size_t count, int root_rank) = 0;
    virtual int
    allReduceDouble(const double *local_value,
                    double *global_value,
                    size_t count,
                    iorx_reduce_op_t op) = 0;
    virtual int
    allReduceInt(const int64_t *local_value,
                 int64_t *global_value,
                 size_t count,
                 iorx_reduce_op_t op) = 0;
};

namespace iorx {

// Every rank ends up with the values of all ranks, indexed by rank
int
allGatherInt(iorxRT &rt, int64_t value, std::vector<int64_t> &out);

} // namespace iorx

#endif
