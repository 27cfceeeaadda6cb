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
#ifndef _IORX_TYPES_H
#define _IORX_TYPES_H

#include <cstdint>
#include <map>
#include <string>
#include <sys/types.h>

/*** Forward declarations ***/
class iorxBackendEngine;
class iorxBackendFileH;

/*** Status codes returned by every backend operation ***/
enum iorx_status_t {
    IORX_IN_PROG = 1,
    IORX_SUCCESS = 0,
    IORX_ERR_NOT_FOUND = -1,
    IORX_ERR_PERMISSION_DENIED = -2,
    IORX_ERR_ALREADY_EXISTS = -3,
    IORX_ERR_NOT_SUPPORTED = -4,
    IORX_ERR_PARTIAL_TRANSFER = -5,
    IORX_ERR_VERIFICATION_MISMATCH = -6,
    IORX_ERR_CANCELED = -7,
    IORX_ERR_TIMEOUT = -8,
    IORX_ERR_CONFIGURATION = -9,
    IORX_ERR_INTERNAL = -10,
};

/*** Transfer direction ***/
enum iorx_xfer_op_t { IORX_READ, IORX_WRITE };

/*** Open flags, matching the classic aiori bit layout ***/
enum iorx_open_flag_t : uint32_t {
    IORX_O_RDONLY = 0x01,
    IORX_O_WRONLY = 0x02,
    IORX_O_RDWR = 0x04,
    IORX_O_APPEND = 0x08,
    IORX_O_CREAT = 0x10,
    IORX_O_TRUNC = 0x20,
    IORX_O_EXCL = 0x40,
    IORX_O_DIRECT = 0x80,
};

using iorx_open_flags_t = uint32_t;

/*** Data packet layout used for transfer verification ***/
enum iorx_packet_t { IORX_PACKET_TIMESTAMP, IORX_PACKET_OFFSET };

/*** Benchmark phase kinds ***/
enum iorx_phase_t {
    IORX_PHASE_WRITE,
    IORX_PHASE_READ,
    IORX_PHASE_MD_CREATE,
    IORX_PHASE_MD_STAT,
    IORX_PHASE_MD_READ,
    IORX_PHASE_MD_REMOVE,
    IORX_PHASE_MAX
};

enum iorx_phase_state_t {
    IORX_PHASE_NOT_STARTED,
    IORX_PHASE_RUNNING,
    IORX_PHASE_STONEWALL_HIT,
    IORX_PHASE_COMPLETED,
    IORX_PHASE_FAILED,
    IORX_PHASE_SYNCHRONIZED,
    IORX_PHASE_DONE
};

/*** Collective reduction operators ***/
enum iorx_reduce_op_t { IORX_REDUCE_SUM, IORX_REDUCE_MIN, IORX_REDUCE_MAX };

using iorx_req_id_t = uint64_t;
using iorx_backend_t = std::string;

/*** Backend specific parameters, e.g. "io_queue" -> "THREADPOOL" ***/
using iorx_b_params_t = std::map<std::string, std::string>;

namespace iorxEnumStrings {
std::string
statusStr(const iorx_status_t &status);
std::string
xferOpStr(const iorx_xfer_op_t &op);
std::string
phaseStr(const iorx_phase_t &phase);
std::string
phaseStateStr(const iorx_phase_state_t &state);
std::string
packetStr(const iorx_packet_t &packet);
} // namespace iorxEnumStrings

/*** Result of a stat call ***/
struct iorxStatInfo {
    uint64_t size = 0;
    uint32_t mode = 0;
    uint64_t nlink = 0;
    uint32_t uid = 0;
    uint32_t gid = 0;
    int64_t atime = 0;
    int64_t mtime = 0;
    int64_t ctime = 0;
};

/*** One transfer: the target handle is passed alongside ***/
struct iorxXferReq {
    iorx_xfer_op_t op = IORX_READ;
    void *buf = nullptr;
    size_t len = 0;
    off_t offset = 0;
};

#endif
