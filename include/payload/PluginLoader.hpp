//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PluginLoader.hpp
// Purpose: Opens a plugin module and obtains its PayloadPluginConfig
//==========================================================================================================
#pragma once

#include <string>

#include "payload/PluginConfig.h"

namespace payload {

//==========================================================================================================
// PluginLoader
// Purpose: dlopen() wrapper owning the module handle. Handlers returned by Load() run code inside the
//          module, so the loader must outlive every PayloadPlugin built from them.
//==========================================================================================================
class PluginLoader {
public:
    PluginLoader() = default;
    ~PluginLoader();

    PluginLoader(const PluginLoader&) = delete;
    PluginLoader& operator=(const PluginLoader&) = delete;
    PluginLoader(PluginLoader&& other) noexcept;
    PluginLoader& operator=(PluginLoader&& other) noexcept;

    //==========================================================================================================
    // Load
    // Purpose: Opens entryPath, resolves payload_plugin_entry and calls it.
    // Returns:
    //   The plugin config; throws errors::ConfigError when the module cannot be opened, exports no entry,
    //   reports failure, or yields no metadata object.
    //==========================================================================================================
    PayloadPluginConfig Load(const std::string& entryPath);

    bool IsLoaded() const { return handle_ != nullptr; }
    const std::string& Path() const { return path_; }

private:
    void close();

    void* handle_{nullptr};
    std::string path_;
};

} // namespace payload
