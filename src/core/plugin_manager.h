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
#ifndef __PLUGIN_MANAGER_H
#define __PLUGIN_MANAGER_H

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "backend/backend_engine.h"
#include "backend/backend_plugin.h"

enum class iorxBackendKind { BUILTIN, NATIVE };

/**
 * A dynamically loaded native backend module. The library stays loaded as
 * long as its registration or an engine created from it is alive.
 */
class iorxNativeModuleHandle {
public:
    iorxNativeModuleHandle(void *handle, const iorxNativePlugin *plugin, const std::string &path);
    ~iorxNativeModuleHandle();

    iorxNativeModuleHandle(const iorxNativeModuleHandle &) = delete;
    iorxNativeModuleHandle &
    operator=(const iorxNativeModuleHandle &) = delete;

    const char *
    getName() const;

    const std::string &
    getPath() const {
        return path_;
    }

    const iorxNativeBackendOps &
    getOps() const {
        return plugin_->ops;
    }

private:
    void *handle_;
    const iorxNativePlugin *plugin_;
    const std::string path_;
};

// One registry entry: either a backend compiled in or a native table
struct iorxBackendRegistration {
    iorx_backend_t name;
    iorxBackendKind kind = iorxBackendKind::BUILTIN;
    iorxBuiltinEngineCreatorFunc createFunc = nullptr;
    iorxNativeBackendOps ops = {};
    std::shared_ptr<const iorxNativeModuleHandle> module;
};

class iorxPluginManager {
public:
    // Singleton instance accessor
    static iorxPluginManager &
    getInstance();

    iorxPluginManager(const iorxPluginManager &) = delete;
    iorxPluginManager &
    operator=(const iorxPluginManager &) = delete;

    // Registers a native table under a new name. A table with an empty
    // required slot or an already registered name is rejected.
    iorx_status_t
    registerNativeBackend(const iorx_backend_t &name, const iorxNativeBackendOps &ops);

    // Removes a native backend; built-in backends cannot be removed
    iorx_status_t
    unregisterBackend(const iorx_backend_t &name);

    // Loads a native module and registers it under 'name', or under the
    // name the module reports when 'name' is empty
    iorx_status_t
    loadNativePlugin(const std::string &plugin_path, const iorx_backend_t &name = "");

    void
    loadPluginsFromList(const std::string &filename);

    void
    addPluginDirectory(const std::string &directory);

    iorx_status_t
    createEngine(const iorx_backend_t &name,
                 const iorxBackendInitParams &init_params,
                 std::unique_ptr<iorxBackendEngine> &engine);

    iorx_status_t
    getBackendKind(const iorx_backend_t &name, iorxBackendKind &kind);

    std::vector<iorx_backend_t>
    getBackendNames();

private:
    std::map<iorx_backend_t, iorxBackendRegistration> backends_;
    std::vector<std::string> plugin_dirs_;
    std::mutex lock;

    void
    registerBuiltinBackends();
    void
    registerBuiltinBackend(const iorx_backend_t &name, iorxBuiltinEngineCreatorFunc creator);

    // Must be called with the lock held
    iorx_status_t
    addRegistration(iorxBackendRegistration &&reg);

    void
    discoverPluginsFromDir(const std::filesystem::path &dirpath);

    iorxPluginManager();
};

#endif // __PLUGIN_MANAGER_H
