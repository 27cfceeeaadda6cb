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
#include "iorx_md_namer.h"
#include <absl/strings/str_format.h>

iorxFlatMdNamer::iorxFlatMdNamer(const std::string &root, bool unique_dir_per_task)
    : root_(root),
      unique_dir_per_task_(unique_dir_per_task) {}

std::string
iorxFlatMdNamer::treeDirectory(int owner_rank) const {
    if (unique_dir_per_task_) {
        return absl::StrFormat("%s/mdtest_tree.%d.0", root_, owner_rank);
    }
    return absl::StrFormat("%s/mdtest_tree.0", root_);
}

std::vector<std::string>
iorxFlatMdNamer::ownedDirectories(int rank) const {
    if (unique_dir_per_task_ || rank == 0) {
        return {treeDirectory(rank)};
    }
    return {};
}

std::string
iorxFlatMdNamer::itemPath(int owner_rank, uint64_t item, bool is_dir) const {
    return absl::StrFormat(
        "%s/%s.mdtest.%d.%d", treeDirectory(owner_rank), is_dir ? "dir" : "file", owner_rank, item);
}
