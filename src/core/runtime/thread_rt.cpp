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
#include "runtime/thread_rt.h"
#include "common/iorx_log.h"
#include <algorithm>

namespace {

template<typename T>
T
reduceOne(T a, T b, iorx_reduce_op_t op) {
    switch (op) {
    case IORX_REDUCE_SUM:
        return a + b;
    case IORX_REDUCE_MIN:
        return std::min(a, b);
    case IORX_REDUCE_MAX:
        return std::max(a, b);
    }
    return a;
}

template<typename T>
void
reduceSlots(const std::vector<std::vector<T>> &slots,
            T *global_value,
            size_t count,
            iorx_reduce_op_t op) {
    for (size_t i = 0; i < count; i++) {
        T acc = slots[0][i];
        for (size_t r = 1; r < slots.size(); r++) {
            acc = reduceOne(acc, slots[r][i], op);
        }
        global_value[i] = acc;
    }
}

} // namespace

iorxThreadRTGroup::iorxThreadRTGroup(int size)
    : size_(size),
      int_slots_(size),
      double_slots_(size) {
    IORX_ASSERT(size > 0);
}

std::unique_ptr<iorxThreadRT>
iorxThreadRTGroup::createRT(int rank) {
    IORX_ASSERT(rank >= 0 && rank < size_);
    return std::make_unique<iorxThreadRT>(*this, rank);
}

void
iorxThreadRTGroup::rendezvous() {
    std::unique_lock<std::mutex> lk(lock_);
    const uint64_t generation = generation_;

    if (++arrived_ == size_) {
        arrived_ = 0;
        generation_++;
        cv_.notify_all();
        return;
    }

    cv_.wait(lk, [&] { return generation_ != generation; });
}

iorxThreadRT::iorxThreadRT(iorxThreadRTGroup &group, int rank) : group_(group) {
    setRank(rank);
    setSize(group.getSize());
}

int
iorxThreadRT::barrier(const std::string &barrier_id) {
    IORX_TRACE << "Rank " << getRank() << " entering barrier " << barrier_id;
    group_.rendezvous();
    return 0;
}

int
iorxThreadRT::broadcastInt(int64_t *buffer, size_t count, int root_rank) {
    if (root_rank < 0 || root_rank >= getSize()) {
        IORX_ERROR << "Invalid broadcast root " << root_rank;
        return -1;
    }

    if (getRank() == root_rank) {
        group_.int_slots_[root_rank].assign(buffer, buffer + count);
    }
    group_.rendezvous();

    if (getRank() != root_rank) {
        const auto &slot = group_.int_slots_[root_rank];
        std::copy(slot.begin(), slot.begin() + std::min(count, slot.size()), buffer);
    }
    // Nobody may overwrite the root slot before every rank copied it
    group_.rendezvous();
    return 0;
}

int
iorxThreadRT::allReduceDouble(const double *local_value,
                              double *global_value,
                              size_t count,
                              iorx_reduce_op_t op) {
    group_.double_slots_[getRank()].assign(local_value, local_value + count);
    group_.rendezvous();
    reduceSlots(group_.double_slots_, global_value, count, op);
    group_.rendezvous();
    return 0;
}

int
iorxThreadRT::allReduceInt(const int64_t *local_value,
                           int64_t *global_value,
                           size_t count,
                           iorx_reduce_op_t op) {
    group_.int_slots_[getRank()].assign(local_value, local_value + count);
    group_.rendezvous();
    reduceSlots(group_.int_slots_, global_value, count, op);
    group_.rendezvous();
    return 0;
}
