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
#ifndef __BACKEND_PLUGIN_H
#define __BACKEND_PLUGIN_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
#include <memory>

class iorxBackendEngine;
struct iorxBackendInitParams;

// Creator of a backend compiled into the library
typedef std::unique_ptr<iorxBackendEngine> (*iorxBuiltinEngineCreatorFunc)(
    const iorxBackendInitParams *init_params);

extern "C" {
#endif

#define IORX_NATIVE_API_VERSION 1

// Returned by poll() while the request is still running
#define IORX_NATIVE_PENDING 1

#define IORX_NATIVE_PLUGIN_EXPORT __attribute__((visibility("default")))

struct iorxNativeStat {
    uint64_t size;
    uint32_t mode;
    uint64_t nlink;
    uint32_t uid;
    uint32_t gid;
    int64_t atime;
    int64_t mtime;
    int64_t ctime;
};

/*
 * Function table of a backend built outside of this library.
 *
 * Every slot returns 0 (or a byte count for xfer_sync) on success and a
 * negative errno value on failure. Strings and buffers are borrowed for the
 * duration of the call only; xfer_submit buffers stay valid until the
 * request is reaped by poll(). init/fini are optional, all other slots are
 * required.
 */
struct iorxNativeBackendOps {
    void *(*init)(const char *const *keys, const char *const *values, size_t count);
    void (*fini)(void *ctx);

    int (*create)(void *ctx, const char *path, uint32_t flags, void **fh);
    int (*open)(void *ctx, const char *path, uint32_t flags, void **fh);
    int (*close)(void *ctx, void *fh);
    int (*remove)(void *ctx, const char *path);
    int (*fsync)(void *ctx, void *fh);

    int64_t (*xfer_sync)(void *ctx, void *fh, int is_write, void *buf, uint64_t len, int64_t offset);
    int (*xfer_submit)(void *ctx,
                       void *fh,
                       int is_write,
                       void *buf,
                       uint64_t len,
                       int64_t offset,
                       uint64_t *req_id);
    int (*poll)(void *ctx, uint64_t req_id, int block, uint64_t *bytes);
    int (*cancel)(void *ctx, uint64_t req_id);

    int (*mkdir)(void *ctx, const char *path, uint32_t mode);
    int (*rmdir)(void *ctx, const char *path);
    int (*stat)(void *ctx, const char *path, struct iorxNativeStat *out);
    int (*rename)(void *ctx, const char *old_path, const char *new_path);
    int (*mknod)(void *ctx, const char *path);
};

// Entry point of a dynamically loaded native backend
struct iorxNativePlugin {
    int api_version;
    const char *name;
    struct iorxNativeBackendOps ops;
};

typedef const struct iorxNativePlugin *(*iorxNativePluginInitFunc)(void);

#ifdef __cplusplus
}
#endif

#endif // __BACKEND_PLUGIN_H
