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
#include "runtime/iorx_rt.h"

namespace iorx {

int
allGatherInt(iorxRT &rt, int64_t value, std::vector<int64_t> &out) {
    out.assign(rt.getSize(), 0);

    for (int root = 0; root < rt.getSize(); root++) {
        int64_t slot = (root == rt.getRank()) ? value : 0;
        int ret = rt.broadcastInt(&slot, 1, root);
        if (ret != 0) {
            return ret;
        }
        out[root] = slot;
    }
    return 0;
}

} // namespace iorx
