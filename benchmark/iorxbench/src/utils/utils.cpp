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

#include <gflags/gflags.h>
#include <iomanip>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/str_format.h>

#include "common/str_tools.h"
#include "utils/utils.h"

/**********
 * iorxBench Config
 **********/
DEFINE_string(runtime_type,
              IORXBENCH_RT_THREAD,
              "Runtime type to use for communication [NULL, THREAD]");
DEFINE_int32(num_ranks, 1, "Number of ranks run as threads of this process (THREAD runtime)");
DEFINE_string(api, "POSIX", "Name of the storage backend [POSIX or a loaded plugin]");
DEFINE_string(plugin_list, "", "File of name=path lines naming native plugins to load");
DEFINE_string(plugin_dir, "", "Directory searched for libiorx_backend_<NAME>.so plugins");

// I/O test options
DEFINE_string(test_file, "testFile", "Test file name, suffixed by the rank in file-per-process");
DEFINE_uint64(block_size, 1024 * 1024, "Contiguous bytes each rank accesses per segment");
DEFINE_uint64(transfer_size, 256 * 1024, "Bytes of a single transfer, divides block_size");
DEFINE_uint32(segment_count, 1, "Number of segments");
DEFINE_uint32(repetitions, 1, "Number of repetitions of the enabled phases");
DEFINE_bool(file_per_proc, false, "One file per rank instead of a shared file");
DEFINE_bool(random_offset, false, "Access the transfers of a rank in random order");
DEFINE_int64(random_seed, -1, "Seed of the random offsets, negative lets rank 0 pick one");
DEFINE_bool(reorder_tasks, false, "Read the data of a shifted rank");
DEFINE_int32(task_per_node_offset, 1, "Rank shift used by reorder_tasks");
DEFINE_bool(reorder_tasks_random, false, "Read the data of a randomly chosen rank");
DEFINE_int64(reorder_tasks_random_seed, 0, "Seed of reorder_tasks_random");
DEFINE_uint32(queue_depth, 1, "Maximum in-flight transfers per rank");
DEFINE_bool(direct_io, false, "Open files with O_DIRECT");
DEFINE_double(stonewall_deadline, 0, "Seconds after which a phase stops issuing (0 disables)");
DEFINE_bool(stonewall_wear_out, false, "Continue stonewalled phases up to the max item count");
DEFINE_double(max_time, 0, "Run time limit in seconds (0 disables)");
DEFINE_bool(inter_phase_barriers, true, "Barrier between phases");
DEFINE_bool(intra_test_barriers, false, "Barriers before open, transfer and close");
DEFINE_bool(write, true, "Run the write phase");
DEFINE_bool(read, true, "Run the read phase");
DEFINE_bool(check_write, false, "Read back and verify after writing");
DEFINE_bool(check_read, false, "Verify the data of the read phase");
DEFINE_string(data_packet_type, IORXBENCH_PACKET_OFFSET, "Data pattern [OFFSET, TIMESTAMP]");
DEFINE_uint64(data_seed, 0, "Seed of the data pattern");
DEFINE_bool(abort_on_verify_failure, false, "Abort the run on a verification mismatch");
DEFINE_bool(keep_file, false, "Keep the test files after each repetition");
DEFINE_bool(fsync, false, "fsync before close in the write phase");
DEFINE_bool(fsync_per_write, false, "fsync after every write");
DEFINE_bool(use_existing_test_file, false, "Do not create or truncate the test file");

// Metadata test options
DEFINE_uint64(md_items, 0, "Metadata items per rank (0 disables the metadata phases)");
DEFINE_string(md_dir, "./out", "Root directory of the metadata phases");
DEFINE_bool(md_unique_dir, false, "One directory per rank");
DEFINE_bool(md_dirs_only, false, "Items are directories");
DEFINE_bool(md_make_node, false, "Create files with mknod");
DEFINE_uint64(md_write_bytes, 0, "Bytes written into each created file");
DEFINE_uint64(md_read_bytes, 0, "Bytes read from each file in the metadata read phase");
DEFINE_bool(md_create, true, "Run the metadata create phase");
DEFINE_bool(md_stat, true, "Run the metadata stat phase");
DEFINE_bool(md_read, false, "Run the metadata read phase");
DEFINE_bool(md_remove, true, "Run the metadata remove phase");

std::string iorxBenchConfig::runtime_type = "";
int iorxBenchConfig::num_ranks = 1;
iorxTestParams iorxBenchConfig::params;
std::vector<std::string> iorxBenchConfig::backend_args;

int
iorxBenchConfig::loadFromFlags() {
    runtime_type = absl::AsciiStrToUpper(FLAGS_runtime_type);
    num_ranks = FLAGS_num_ranks;

    if (runtime_type != IORXBENCH_RT_NULL && runtime_type != IORXBENCH_RT_THREAD) {
        std::cerr << "Invalid runtime: " << FLAGS_runtime_type << ". Must be one of [NULL, THREAD]"
                  << std::endl;
        return -1;
    }
    if (num_ranks < 1) {
        std::cerr << "num_ranks must be greater than 0" << std::endl;
        return -1;
    }
    if (runtime_type == IORXBENCH_RT_NULL && num_ranks != 1) {
        std::cout << "WARNING: NULL runtime runs a single rank, ignoring num_ranks=" << num_ranks
                  << std::endl;
        num_ranks = 1;
    }

    const std::string packet = absl::AsciiStrToUpper(FLAGS_data_packet_type);
    if (packet == IORXBENCH_PACKET_OFFSET) {
        params.dataPacketType = IORX_PACKET_OFFSET;
    } else if (packet == IORXBENCH_PACKET_TIMESTAMP) {
        params.dataPacketType = IORX_PACKET_TIMESTAMP;
    } else {
        std::cerr << "Invalid data packet type: " << FLAGS_data_packet_type
                  << ". Must be one of [OFFSET, TIMESTAMP]" << std::endl;
        return -1;
    }

    params.api = FLAGS_api;
    if (iorx::parseBackendOptions(params.api, backend_args, params.backendParams) !=
        IORX_SUCCESS) {
        return -1;
    }

    params.testFileName = FLAGS_test_file;
    params.blockSize = FLAGS_block_size;
    params.transferSize = FLAGS_transfer_size;
    params.segmentCount = FLAGS_segment_count;
    params.repetitions = FLAGS_repetitions;
    params.filePerProc = FLAGS_file_per_proc;
    params.randomOffset = FLAGS_random_offset;
    params.randomSeed = FLAGS_random_seed;
    params.reorderTasks = FLAGS_reorder_tasks;
    params.taskPerNodeOffset = FLAGS_task_per_node_offset;
    params.reorderTasksRandom = FLAGS_reorder_tasks_random;
    params.reorderTasksRandomSeed = FLAGS_reorder_tasks_random_seed;
    params.queueDepth = FLAGS_queue_depth;
    params.directIo = FLAGS_direct_io;
    params.deadlineForStonewalling = FLAGS_stonewall_deadline;
    params.stonewallWearOut = FLAGS_stonewall_wear_out;
    params.maxTimeDuration = FLAGS_max_time;
    params.interPhaseBarriers = FLAGS_inter_phase_barriers;
    params.intraTestBarriers = FLAGS_intra_test_barriers;
    params.writeFile = FLAGS_write;
    params.readFile = FLAGS_read;
    params.checkWrite = FLAGS_check_write;
    params.checkRead = FLAGS_check_read;
    params.dataSeed = FLAGS_data_seed;
    params.abortOnVerifyFailure = FLAGS_abort_on_verify_failure;
    params.keepFile = FLAGS_keep_file;
    params.fsync = FLAGS_fsync;
    params.fsyncPerWrite = FLAGS_fsync_per_write;
    params.useExistingTestFile = FLAGS_use_existing_test_file;

    params.mdItems = FLAGS_md_items;
    params.mdTestDir = FLAGS_md_dir;
    params.mdUniqueDirPerTask = FLAGS_md_unique_dir;
    params.mdDirsOnly = FLAGS_md_dirs_only;
    params.mdMakeNode = FLAGS_md_make_node;
    params.mdWriteBytes = FLAGS_md_write_bytes;
    params.mdReadBytes = FLAGS_md_read_bytes;
    params.mdCreate = FLAGS_md_create;
    params.mdStat = FLAGS_md_stat;
    params.mdRead = FLAGS_md_read;
    params.mdRemove = FLAGS_md_remove;

    return params.validate() == IORX_SUCCESS ? 0 : -1;
}

void
iorxBenchConfig::printOption(const std::string &desc, const std::string &value) {
    std::cout << std::left << std::setw(60) << desc << ": " << value << std::endl;
}

void
iorxBenchConfig::printSeparator(const char sep) {
    std::cout << std::string(120, sep) << std::endl;
}

void
iorxBenchConfig::printConfig() {
    printSeparator('*');
    std::cout << "IORXBench Configuration" << std::endl;
    printSeparator('*');
    printOption("Runtime (--runtime_type=[NULL,THREAD])", runtime_type);
    printOption("Num ranks (--num_ranks=N)", std::to_string(num_ranks));
    printOption("Backend (--api=name)", params.api);
    for (const auto &option : params.backendParams) {
        printOption(absl::StrFormat("Backend option (--%s.%s)", params.api, option.first),
                    option.second);
    }

    if (params.hasIoPhases()) {
        printOption("Test file (--test_file=path)", params.testFileName);
        printOption("Block size (--block_size=N)", std::to_string(params.blockSize));
        printOption("Transfer size (--transfer_size=N)", std::to_string(params.transferSize));
        printOption("Segment count (--segment_count=N)", std::to_string(params.segmentCount));
        printOption("File per process (--file_per_proc=[0,1])",
                    std::to_string(params.filePerProc));
        printOption("Random offset (--random_offset=[0,1])", std::to_string(params.randomOffset));
        printOption("Queue depth (--queue_depth=N)", std::to_string(params.queueDepth));
        printOption("Direct I/O (--direct_io=[0,1])", std::to_string(params.directIo));
        printOption("Phases (--write, --read)",
                    absl::StrFormat("write=%d read=%d", params.writeFile, params.readFile));
        printOption("Verify (--check_write, --check_read)",
                    absl::StrFormat("write=%d read=%d", params.checkWrite, params.checkRead));
        printOption("Data packet (--data_packet_type=[OFFSET,TIMESTAMP])",
                    iorxEnumStrings::packetStr(params.dataPacketType));
        if (params.reorderTasks) {
            printOption("Reorder tasks offset (--task_per_node_offset=N)",
                        std::to_string(params.taskPerNodeOffset));
        }
        if (params.reorderTasksRandom) {
            printOption("Reorder tasks random seed (--reorder_tasks_random_seed=N)",
                        std::to_string(params.reorderTasksRandomSeed));
        }
    }

    if (params.hasMdPhases()) {
        printOption("Metadata items (--md_items=N)", std::to_string(params.mdItems));
        printOption("Metadata directory (--md_dir=path)", params.mdTestDir);
        printOption("Unique directory per rank (--md_unique_dir=[0,1])",
                    std::to_string(params.mdUniqueDirPerTask));
        printOption("Directories only (--md_dirs_only=[0,1])", std::to_string(params.mdDirsOnly));
        printOption("Phases (--md_create, --md_stat, --md_read, --md_remove)",
                    absl::StrFormat("create=%d stat=%d read=%d remove=%d",
                                    params.mdCreate,
                                    params.mdStat,
                                    params.mdRead,
                                    params.mdRemove));
    }

    printOption("Repetitions (--repetitions=N)", std::to_string(params.repetitions));
    printOption("Stonewall deadline (--stonewall_deadline=sec)",
                absl::StrFormat("%g", params.deadlineForStonewalling));
    printOption("Run time limit (--max_time=sec)", absl::StrFormat("%g", params.maxTimeDuration));
    printSeparator('-');
    std::cout << std::endl;
}

/**********
 * iorxBench Utils
 **********/
namespace {

constexpr double MiB = 1024.0 * 1024.0;

} // namespace

void
iorxBenchUtils::printSummaryHeader() {
    std::cout << std::left << std::setw(12) << "Phase" << std::setw(6) << "Rep" << std::setw(16)
              << "Items" << std::setw(16) << "B/W (MiB/s)" << std::setw(16) << "Rate (ops/s)"
              << std::setw(14) << "Time (s)" << std::setw(16) << "Min Lat. (us)" << std::setw(12)
              << "Stonewall" << std::setw(10) << "Errors" << std::endl;
    iorxBenchConfig::printSeparator('-');
}

void
iorxBenchUtils::printPhase(const iorxPhaseSummary &summary) {
    std::cout << std::left << std::fixed << std::setprecision(2) << std::setw(12)
              << iorxEnumStrings::phaseStr(summary.phase) << std::setw(6) << summary.repetition
              << std::setw(16) << summary.totalItems << std::setw(16)
              << summary.aggBandwidth / MiB << std::setw(16) << summary.aggRate << std::setw(14)
              << std::setprecision(4) << summary.span << std::setw(16) << std::setprecision(1)
              << summary.minLatency * 1e6 << std::setw(12) << summary.stonewalledRanks
              << std::setw(10) << summary.verifyFailures << std::endl;
}

void
iorxBenchUtils::printRunSummary(const iorxRunResult &result) {
    std::cout << std::endl;
    std::cout << std::left << std::setw(12) << "Summary" << std::setw(6) << "Reps" << std::setw(16)
              << "Max (MiB/s)" << std::setw(16) << "Min (MiB/s)" << std::setw(16) << "Mean (MiB/s)"
              << std::setw(16) << "Stddev" << std::setw(16) << "Mean (ops/s)" << std::endl;
    iorxBenchConfig::printSeparator('-');
    for (const auto &summary : result.summaries) {
        std::cout << std::left << std::fixed << std::setprecision(2) << std::setw(12)
                  << iorxEnumStrings::phaseStr(summary.phase) << std::setw(6)
                  << summary.repetitions << std::setw(16) << summary.bandwidth.max / MiB
                  << std::setw(16) << summary.bandwidth.min / MiB << std::setw(16)
                  << summary.bandwidth.mean / MiB << std::setw(16)
                  << summary.bandwidth.stddev / MiB << std::setw(16) << summary.rate.mean
                  << std::endl;
    }

    if (result.timedOut) {
        std::cout << "Run stopped at the time limit" << std::endl;
    }
    if (result.aborted) {
        std::cout << absl::StrFormat("Run aborted in %s on rank %d: %s",
                                     iorxEnumStrings::phaseStr(result.abortPhase),
                                     result.abortRank,
                                     iorxEnumStrings::statusStr(result.abortStatus))
                  << std::endl;
    }
}
