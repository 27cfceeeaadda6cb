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
#ifndef __THREAD_RT_H
#define __THREAD_RT_H

#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>
#include "runtime/iorx_rt.h"

class iorxThreadRT;

/**
 * Shared rendezvous of N ranks living on threads of one process. Ranks only
 * exchange data through the collectives of the iorxThreadRT objects created
 * from the group. The group must outlive all of them.
 */
class iorxThreadRTGroup {
public:
    explicit iorxThreadRTGroup(int size);

    iorxThreadRTGroup(const iorxThreadRTGroup &) = delete;
    iorxThreadRTGroup &
    operator=(const iorxThreadRTGroup &) = delete;

    std::unique_ptr<iorxThreadRT>
    createRT(int rank);

    int
    getSize() const {
        return size_;
    }

private:
    friend class iorxThreadRT;

    const int size_;
    std::mutex lock_;
    std::condition_variable cv_;
    int arrived_ = 0;
    uint64_t generation_ = 0;

    // One slot per rank, written by its owner between two rendezvous
    std::vector<std::vector<int64_t>> int_slots_;
    std::vector<std::vector<double>> double_slots_;

    void
    rendezvous();
};

class iorxThreadRT : public iorxRT {
public:
    iorxThreadRT(iorxThreadRTGroup &group, int rank);

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

private:
    iorxThreadRTGroup &group_;
};

#endif
