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
#include "plugin_manager.h"
#include "native/native_backend.h"
#include "common/configuration.h"
#include "common/iorx_log.h"
#include <absl/strings/str_format.h>
#include <dlfcn.h>
#include <algorithm>
#include <fstream>
#include <utility>

using lock_guard = const std::lock_guard<std::mutex>;

constexpr const char *nativePluginPrefix = "libiorx_backend_";
constexpr const char *nativePluginSuffix = ".so";
constexpr const char *nativePluginInitSymbol = "iorx_native_plugin_init";

iorxNativeModuleHandle::iorxNativeModuleHandle(void *handle,
                                               const iorxNativePlugin *plugin,
                                               const std::string &path)
    : handle_(handle),
      plugin_(plugin),
      path_(path) {}

iorxNativeModuleHandle::~iorxNativeModuleHandle() {
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
        plugin_ = nullptr;
    }
}

const char *
iorxNativeModuleHandle::getName() const {
    if (plugin_ && plugin_->name) {
        return plugin_->name;
    }
    return "unknown";
}

namespace {

iorx_status_t
loadModule(const std::string &plugin_path, std::shared_ptr<const iorxNativeModuleHandle> &module) {
    void *handle = dlopen(plugin_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        IORX_ERROR << "Failed to load plugin from " << plugin_path << ": " << dlerror();
        return std::filesystem::exists(plugin_path) ? IORX_ERR_CONFIGURATION :
                                                      IORX_ERR_NOT_FOUND;
    }

    auto init = reinterpret_cast<iorxNativePluginInitFunc>(dlsym(handle, nativePluginInitSymbol));
    if (!init) {
        IORX_ERROR << "Failed to find " << nativePluginInitSymbol << " in " << plugin_path << ": "
                   << dlerror();
        dlclose(handle);
        return IORX_ERR_CONFIGURATION;
    }

    const iorxNativePlugin *plugin = init();
    if (!plugin) {
        IORX_ERROR << "Plugin initialization failed for " << plugin_path;
        dlclose(handle);
        return IORX_ERR_CONFIGURATION;
    }

    if (plugin->api_version != IORX_NATIVE_API_VERSION) {
        IORX_ERROR << "Plugin API version mismatch for " << plugin_path << ": expected "
                   << IORX_NATIVE_API_VERSION << ", got " << plugin->api_version;
        dlclose(handle);
        return IORX_ERR_CONFIGURATION;
    }

    module = std::make_shared<const iorxNativeModuleHandle>(handle, plugin, plugin_path);
    return IORX_SUCCESS;
}

std::map<iorx_backend_t, std::string>
loadPluginList(const std::string &filename) {
    std::map<iorx_backend_t, std::string> plugins;
    std::ifstream file(filename);

    if (!file.is_open()) {
        IORX_ERROR << "Failed to open plugin list file: " << filename;
        return plugins;
    }

    auto trim = [](std::string &s) {
        s.erase(0, s.find_first_not_of(" \t"));
        s.erase(s.find_last_not_of(" \t") + 1);
    };

    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            IORX_WARN << "Ignoring malformed plugin list line: " << line;
            continue;
        }

        std::string name = line.substr(0, pos);
        std::string path = line.substr(pos + 1);
        trim(name);
        trim(path);
        plugins[name] = path;
    }

    return plugins;
}

std::string
getPluginDir() {
    auto plugin_dir = iorx::config::getenvOptional("IORX_PLUGIN_DIR");
    if (plugin_dir) {
        return *plugin_dir;
    }

    // By default, use the plugin directory relative to the library
    Dl_info info;
    if (!dladdr(reinterpret_cast<void *>(&getPluginDir), &info) || !info.dli_fname) {
        IORX_DEBUG << "Failed to get plugin directory from dladdr";
        return "";
    }
    return (std::filesystem::path(info.dli_fname).parent_path() / "plugins").string();
}

bool
startsWith(const std::string &str, const std::string &prefix) {
    return str.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), str.begin());
}

bool
endsWith(const std::string &str, const std::string &suffix) {
    return str.size() >= suffix.size() && std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

} // namespace

iorxPluginManager::iorxPluginManager() {
    registerBuiltinBackends();

    auto plugin_list = iorx::config::getenvOptional("IORX_PLUGIN_LIST");
    if (plugin_list) {
        loadPluginsFromList(*plugin_list);
    }

    const std::string plugin_dir = getPluginDir();
    std::error_code ec;
    if (!plugin_dir.empty() && std::filesystem::is_directory(plugin_dir, ec)) {
        IORX_DEBUG << "Loading plugins from: " << plugin_dir;
        plugin_dirs_.push_back(plugin_dir);
        discoverPluginsFromDir(plugin_dir);
    }
}

iorxPluginManager &
iorxPluginManager::getInstance() {
    // Meyers singleton initialization is safe in multi-threaded environment.
    static iorxPluginManager instance;

    return instance;
}

iorx_status_t
iorxPluginManager::addRegistration(iorxBackendRegistration &&reg) {
    if (reg.name.empty()) {
        IORX_ERROR << "Cannot register a backend without a name";
        return IORX_ERR_CONFIGURATION;
    }

    if (backends_.count(reg.name)) {
        IORX_ERROR << "Backend " << reg.name << " is already registered";
        return IORX_ERR_CONFIGURATION;
    }

    if (reg.kind == iorxBackendKind::NATIVE) {
        if (const char *missing = iorx::findMissingNativeSlot(reg.ops)) {
            IORX_ERROR << absl::StrFormat(
                "Native backend %s rejected: required slot '%s' is empty", reg.name, missing);
            return IORX_ERR_CONFIGURATION;
        }
    }

    IORX_DEBUG << "Registered backend " << reg.name;
    const iorx_backend_t name = reg.name;
    backends_.emplace(name, std::move(reg));
    return IORX_SUCCESS;
}

void
iorxPluginManager::registerBuiltinBackend(const iorx_backend_t &name,
                                          iorxBuiltinEngineCreatorFunc creator) {
    lock_guard lg(lock);

    iorxBackendRegistration reg;
    reg.name = name;
    reg.kind = iorxBackendKind::BUILTIN;
    reg.createFunc = creator;
    addRegistration(std::move(reg));
}

iorx_status_t
iorxPluginManager::registerNativeBackend(const iorx_backend_t &name,
                                         const iorxNativeBackendOps &ops) {
    lock_guard lg(lock);

    iorxBackendRegistration reg;
    reg.name = name;
    reg.kind = iorxBackendKind::NATIVE;
    reg.ops = ops;
    return addRegistration(std::move(reg));
}

iorx_status_t
iorxPluginManager::unregisterBackend(const iorx_backend_t &name) {
    lock_guard lg(lock);

    auto it = backends_.find(name);
    if (it == backends_.end()) {
        return IORX_ERR_NOT_FOUND;
    }

    if (it->second.kind == iorxBackendKind::BUILTIN) {
        IORX_ERROR << "Built-in backend " << name << " cannot be unregistered";
        return IORX_ERR_NOT_SUPPORTED;
    }

    // A loaded module is closed once the last engine created from it is gone
    backends_.erase(it);
    return IORX_SUCCESS;
}

iorx_status_t
iorxPluginManager::loadNativePlugin(const std::string &plugin_path, const iorx_backend_t &name) {
    std::shared_ptr<const iorxNativeModuleHandle> module;
    iorx_status_t status = loadModule(plugin_path, module);
    if (status != IORX_SUCCESS) {
        return status;
    }

    iorxBackendRegistration reg;
    reg.name = name.empty() ? module->getName() : name;
    reg.kind = iorxBackendKind::NATIVE;
    reg.ops = module->getOps();
    reg.module = module;

    lock_guard lg(lock);
    status = addRegistration(std::move(reg));
    if (status == IORX_SUCCESS) {
        IORX_INFO << "Loaded native backend " << (name.empty() ? module->getName() : name)
                  << " from " << plugin_path;
    }
    return status;
}

void
iorxPluginManager::loadPluginsFromList(const std::string &filename) {
    for (const auto &pair : loadPluginList(filename)) {
        iorx_status_t status = loadNativePlugin(pair.second, pair.first);
        if (status != IORX_SUCCESS) {
            IORX_WARN << "Skipping plugin " << pair.first << ": "
                      << iorxEnumStrings::statusStr(status);
        }
    }
}

void
iorxPluginManager::addPluginDirectory(const std::string &directory) {
    if (directory.empty()) {
        IORX_ERROR << "Cannot add empty plugin directory";
        return;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        IORX_ERROR << "Plugin directory does not exist or is not readable: " << directory;
        return;
    }

    {
        lock_guard lg(lock);

        for (const auto &dir : plugin_dirs_) {
            if (dir == directory) {
                IORX_WARN << "Plugin directory already registered: " << directory;
                return;
            }
        }
        plugin_dirs_.push_back(directory);
    }

    discoverPluginsFromDir(directory);
}

void
iorxPluginManager::discoverPluginsFromDir(const std::filesystem::path &dirpath) {
    std::error_code ec;
    std::filesystem::directory_iterator dir_iter(dirpath, ec);
    if (ec) {
        IORX_ERROR << "Error accessing directory(" << dirpath << "): " << ec.message();
        return;
    }

    const std::string prefix = nativePluginPrefix;
    const std::string suffix = nativePluginSuffix;
    for (const auto &entry : dir_iter) {
        const std::string filename = entry.path().filename().string();
        if (!startsWith(filename, prefix) || !endsWith(filename, suffix)) {
            continue;
        }

        const iorx_backend_t name =
            filename.substr(prefix.size(), filename.size() - prefix.size() - suffix.size());
        {
            lock_guard lg(lock);
            if (backends_.count(name)) {
                IORX_DEBUG << "Backend " << name << " already registered, skipping "
                           << entry.path();
                continue;
            }
        }

        if (loadNativePlugin(entry.path().string(), name) == IORX_SUCCESS) {
            IORX_INFO << "Discovered and loaded backend plugin: " << name;
        }
    }
}

iorx_status_t
iorxPluginManager::createEngine(const iorx_backend_t &name,
                                const iorxBackendInitParams &init_params,
                                std::unique_ptr<iorxBackendEngine> &engine) {
    iorxBackendRegistration reg;
    {
        lock_guard lg(lock);
        auto it = backends_.find(name);
        if (it == backends_.end()) {
            IORX_ERROR << "Backend " << name << " is not registered";
            return IORX_ERR_NOT_FOUND;
        }
        reg = it->second;
    }

    if (reg.kind == iorxBackendKind::BUILTIN) {
        engine = reg.createFunc(&init_params);
    } else {
        engine = std::make_unique<iorxNativeEngine>(name, reg.ops, &init_params, reg.module);
        if (engine->getInitErr()) {
            engine.reset();
        }
    }

    if (!engine) {
        IORX_ERROR << "Failed to initialize backend " << name;
        return IORX_ERR_CONFIGURATION;
    }
    return IORX_SUCCESS;
}

iorx_status_t
iorxPluginManager::getBackendKind(const iorx_backend_t &name, iorxBackendKind &kind) {
    lock_guard lg(lock);

    auto it = backends_.find(name);
    if (it == backends_.end()) {
        return IORX_ERR_NOT_FOUND;
    }
    kind = it->second.kind;
    return IORX_SUCCESS;
}

std::vector<iorx_backend_t>
iorxPluginManager::getBackendNames() {
    lock_guard lg(lock);

    std::vector<iorx_backend_t> names;
    for (const auto &pair : backends_) {
        names.push_back(pair.first);
    }
    return names;
}

#define IORX_REGISTER_BUILTIN_BACKEND(name)                  \
    extern std::unique_ptr<iorxBackendEngine>                \
        iorxCreateStatic##name##Engine(const iorxBackendInitParams *); \
    registerBuiltinBackend(#name, iorxCreateStatic##name##Engine);

void
iorxPluginManager::registerBuiltinBackends() {
    IORX_REGISTER_BUILTIN_BACKEND(POSIX)
}
