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
#ifndef _IORX_MD_NAMER_H
#define _IORX_MD_NAMER_H

#include <cstdint>
#include <string>
#include <vector>

/**
 * Places the items of the metadata phases. The root directory is created
 * by rank 0; owned directories are created by their rank, in order, once
 * the root exists, and removed in reverse order after the remove phase.
 */
class iorxMdNamer {
public:
    virtual ~iorxMdNamer() = default;

    virtual std::string
    rootDirectory() const = 0;

    virtual std::vector<std::string>
    ownedDirectories(int rank) const = 0;

    virtual std::string
    itemPath(int owner_rank, uint64_t item, bool is_dir) const = 0;
};

// Every item of a rank in a single directory, shared or one per rank
class iorxFlatMdNamer : public iorxMdNamer {
public:
    iorxFlatMdNamer(const std::string &root, bool unique_dir_per_task);

    std::string
    rootDirectory() const override {
        return root_;
    }

    std::vector<std::string>
    ownedDirectories(int rank) const override;

    std::string
    itemPath(int owner_rank, uint64_t item, bool is_dir) const override;

private:
    const std::string root_;
    const bool unique_dir_per_task_;

    std::string
    treeDirectory(int owner_rank) const;
};

#endif
