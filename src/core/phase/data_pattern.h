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
#ifndef IORX_SRC_CORE_PHASE_DATA_PATTERN_H
#define IORX_SRC_CORE_PHASE_DATA_PATTERN_H

#include <cstddef>
#include <cstdint>
#include <sys/types.h>
#include "iorx_types.h"

namespace iorx {

// Words between two offset stamps of an IORX_PACKET_OFFSET buffer
constexpr size_t patternStampStride = 512;

// Base pattern: 64-bit word i is (rank << 32) | ((seed + i) & 0xffffffff)
void
fillPattern(void *buf, size_t len, uint64_t seed, int rank);

// Stamps the transfer offset into an offset packet before it is written
void
stampPattern(void *buf, size_t len, off_t offset, int rank, iorx_packet_t type);

// Number of 64-bit words differing from the pattern written at 'offset'
size_t
verifyPattern(const void *buf,
              size_t len,
              off_t offset,
              uint64_t seed,
              int rank,
              iorx_packet_t type);

} // namespace iorx

#endif
