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
#ifndef IORX_SRC_UTILS_COMMON_ALIGNED_BUFFER_H
#define IORX_SRC_UTILS_COMMON_ALIGNED_BUFFER_H

#include <cstdlib>
#include <cstring>
#include <memory>
#include <new>
#include <unistd.h>

namespace iorx {

/**
 * Page aligned heap buffer, suitable for O_DIRECT transfers.
 */
class alignedBuffer {
public:
    explicit alignedBuffer(size_t size) : size_(size), data_(allocate(size), &::free) {}

    alignedBuffer(alignedBuffer &&) = default;
    alignedBuffer &
    operator=(alignedBuffer &&) = default;

    void *
    data() const {
        return data_.get();
    }

    template<typename T>
    T *
    as() const {
        return static_cast<T *>(data_.get());
    }

    size_t
    size() const {
        return size_;
    }

    void
    clear() {
        memset(data_.get(), 0, size_);
    }

    static size_t
    pageSize() {
        static const size_t page = static_cast<size_t>(sysconf(_SC_PAGESIZE));
        return page;
    }

private:
    static void *
    allocate(size_t size) {
        void *ptr = nullptr;
        if (posix_memalign(&ptr, pageSize(), size ? size : pageSize()) != 0) {
            throw std::bad_alloc();
        }
        memset(ptr, 0, size);
        return ptr;
    }

    size_t size_;
    std::unique_ptr<void, decltype(&::free)> data_;
};

} // namespace iorx

#endif
