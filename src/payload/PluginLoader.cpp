//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PluginLoader.cpp
// Purpose: Shared-object loading of plugin modules
//==========================================================================================================

#include <dlfcn.h>
#include <stdlib.h>
#include <limits.h>

#include "logging/Logger.h"
#include "payload/PluginExport.h"
#include "payload/PluginLoader.hpp"
#include "payload/errors/Errors.h"

namespace payload {

namespace {
std::string absolutePath(const std::string& path) {
    char resolved[PATH_MAX];
    if (::realpath(path.c_str(), resolved) != nullptr) {
        return std::string(resolved);
    }
    return path;
}

std::string lastDlError() {
    const char* err = ::dlerror();
    return err ? std::string(err) : std::string("unknown error");
}
} // namespace

PluginLoader::~PluginLoader() {
    close();
}

PluginLoader::PluginLoader(PluginLoader&& other) noexcept {
    *this = std::move(other);
}

PluginLoader& PluginLoader::operator=(PluginLoader&& other) noexcept {
    if (this != &other) {
        close();
        handle_ = other.handle_;
        path_ = std::move(other.path_);
        other.handle_ = nullptr;
    }
    return *this;
}

void PluginLoader::close() {
    if (handle_ != nullptr) {
        if (::dlclose(handle_) != 0) {
            LOG_WARN("PluginLoader: dlclose({}) failed: {}", path_, lastDlError());
        }
        handle_ = nullptr;
    }
}

PayloadPluginConfig PluginLoader::Load(const std::string& entryPath) {
    FUNC_SCOPE();
    close();
    path_ = absolutePath(entryPath);

    // Pathless names would go through the library search path; keep them relative to the cwd
    const std::string openPath = (path_.find('/') == std::string::npos) ? "./" + path_ : path_;
    handle_ = ::dlopen(openPath.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle_ == nullptr) {
        throw errors::ConfigError("Cannot load plugin at " + path_ + ": " + lastDlError());
    }

    ::dlerror();
    void* sym = ::dlsym(handle_, PAYLOAD_PLUGIN_ENTRY_SYMBOL);
    if (sym == nullptr) {
        const std::string err = lastDlError();
        close();
        throw errors::ConfigError("Plugin at " + path_ + " has no " PAYLOAD_PLUGIN_ENTRY_SYMBOL " export (" + err + ")");
    }

    auto entry = reinterpret_cast<PluginEntryFn>(sym);
    PayloadPluginConfig config;
    int rc = 0;
    try {
        rc = entry(&config);
    } catch (const std::exception& e) {
        const std::string msg = "Plugin at " + path_ + " failed to initialize: " + e.what();
        config.handlers.clear();
        close();
        throw errors::ConfigError(msg);
    }
    if (rc != 0) {
        // Handler objects live in the module; drop them before unloading it
        config.handlers.clear();
        close();
        throw errors::ConfigError("Plugin at " + path_ + " failed to initialize (code " + std::to_string(rc) + ")");
    }
    if (!config.metadata.IsObject()) {
        config.handlers.clear();
        close();
        throw errors::ConfigError("Plugin at " + path_ + " has no entry with metadata");
    }
    LOG_DEBUG("PluginLoader: loaded {} ({} handlers)", path_, config.handlers.size());
    return config;
}

} // namespace payload
