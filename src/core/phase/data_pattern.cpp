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
#include "data_pattern.h"
#include <cstring>

namespace iorx {

namespace {

uint64_t
baseWord(uint64_t seed, int rank, size_t i) {
    return (static_cast<uint64_t>(rank) << 32) | ((seed + i) & 0xffffffffULL);
}

uint64_t
stampWord(off_t offset, int rank, size_t k) {
    return (static_cast<uint64_t>(rank) << 32) |
        ((static_cast<uint64_t>(offset) * (k + 1)) & 0xffffffffULL);
}

uint64_t
loadWord(const void *buf, size_t i) {
    uint64_t word;
    std::memcpy(&word, static_cast<const char *>(buf) + i * sizeof(word), sizeof(word));
    return word;
}

void
storeWord(void *buf, size_t i, uint64_t word) {
    std::memcpy(static_cast<char *>(buf) + i * sizeof(word), &word, sizeof(word));
}

} // namespace

void
fillPattern(void *buf, size_t len, uint64_t seed, int rank) {
    const size_t words = len / sizeof(uint64_t);
    for (size_t i = 0; i < words; i++) {
        storeWord(buf, i, baseWord(seed, rank, i));
    }
}

void
stampPattern(void *buf, size_t len, off_t offset, int rank, iorx_packet_t type) {
    if (type != IORX_PACKET_OFFSET) {
        return;
    }

    const size_t words = len / sizeof(uint64_t);
    for (size_t pos = 0, k = 0; pos < words; pos += patternStampStride, k++) {
        storeWord(buf, pos, stampWord(offset, rank, k));
    }
}

size_t
verifyPattern(const void *buf,
              size_t len,
              off_t offset,
              uint64_t seed,
              int rank,
              iorx_packet_t type) {
    const size_t words = len / sizeof(uint64_t);
    size_t errors = 0;

    for (size_t i = 0; i < words; i++) {
        uint64_t expected;
        if (type == IORX_PACKET_OFFSET && i % patternStampStride == 0) {
            expected = stampWord(offset, rank, i / patternStampStride);
        } else {
            expected = baseWord(seed, rank, i);
        }

        if (loadWord(buf, i) != expected) {
            errors++;
        }
    }
    return errors;
}

} // namespace iorx
