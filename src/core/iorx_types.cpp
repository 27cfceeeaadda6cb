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

#include "iorx_types.h"

std::string
iorxEnumStrings::statusStr(const iorx_status_t &status) {
    switch (status) {
    case IORX_IN_PROG:
        return "IN_PROG";
    case IORX_SUCCESS:
        return "SUCCESS";
    case IORX_ERR_NOT_FOUND:
        return "ERR_NOT_FOUND";
    case IORX_ERR_PERMISSION_DENIED:
        return "ERR_PERMISSION_DENIED";
    case IORX_ERR_ALREADY_EXISTS:
        return "ERR_ALREADY_EXISTS";
    case IORX_ERR_NOT_SUPPORTED:
        return "ERR_NOT_SUPPORTED";
    case IORX_ERR_PARTIAL_TRANSFER:
        return "ERR_PARTIAL_TRANSFER";
    case IORX_ERR_VERIFICATION_MISMATCH:
        return "ERR_VERIFICATION_MISMATCH";
    case IORX_ERR_CANCELED:
        return "ERR_CANCELED";
    case IORX_ERR_TIMEOUT:
        return "ERR_TIMEOUT";
    case IORX_ERR_CONFIGURATION:
        return "ERR_CONFIGURATION";
    case IORX_ERR_INTERNAL:
        return "ERR_INTERNAL";
    default:
        return "BAD_STATUS";
    }
}

std::string
iorxEnumStrings::xferOpStr(const iorx_xfer_op_t &op) {
    switch (op) {
    case IORX_READ:
        return "READ";
    case IORX_WRITE:
        return "WRITE";
    default:
        return "BAD_OP";
    }
}

std::string
iorxEnumStrings::phaseStr(const iorx_phase_t &phase) {
    switch (phase) {
    case IORX_PHASE_WRITE:
        return "write";
    case IORX_PHASE_READ:
        return "read";
    case IORX_PHASE_MD_CREATE:
        return "md-create";
    case IORX_PHASE_MD_STAT:
        return "md-stat";
    case IORX_PHASE_MD_READ:
        return "md-read";
    case IORX_PHASE_MD_REMOVE:
        return "md-remove";
    default:
        return "BAD_PHASE";
    }
}

std::string
iorxEnumStrings::phaseStateStr(const iorx_phase_state_t &state) {
    switch (state) {
    case IORX_PHASE_NOT_STARTED:
        return "NotStarted";
    case IORX_PHASE_RUNNING:
        return "Running";
    case IORX_PHASE_STONEWALL_HIT:
        return "StonewallHit";
    case IORX_PHASE_COMPLETED:
        return "Completed";
    case IORX_PHASE_FAILED:
        return "Failed";
    case IORX_PHASE_SYNCHRONIZED:
        return "Synchronized";
    case IORX_PHASE_DONE:
        return "Done";
    default:
        return "BAD_STATE";
    }
}

std::string
iorxEnumStrings::packetStr(const iorx_packet_t &packet) {
    switch (packet) {
    case IORX_PACKET_TIMESTAMP:
        return "timestamp";
    case IORX_PACKET_OFFSET:
        return "offset";
    default:
        return "BAD_PACKET";
    }
}
