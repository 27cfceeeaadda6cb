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
#include "runtime/null_rt.h"
#include <algorithm>

int
iorxNullRT::barrier(const std::string &barrier_id) {
    return 0;
}

int
iorxNullRT::broadcastInt(int64_t *buffer, size_t count, int root_rank) {
    return root_rank == 0 ? 0 : -1;
}

int
iorxNullRT::allReduceDouble(const double *local_value,
                            double *global_value,
                            size_t count,
                            iorx_reduce_op_t op) {
    std::copy(local_value, local_value + count, global_value);
    return 0;
}

int
iorxNullRT::allReduceInt(const int64_t *local_value,
                         int64_t *global_value,
                         size_t count,
                         iorx_reduce_op_t op) {
    std::copy(local_value, local_value + count, global_value);
    return 0;
}
