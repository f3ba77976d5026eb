//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PluginExport.h
// Purpose: Entry point a loadable plugin module exports to the host
//==========================================================================================================

#pragma once

#include "payload/PluginConfig.h"

// Symbol resolved by PluginLoader.
#define PAYLOAD_PLUGIN_ENTRY_SYMBOL "payload_plugin_entry"

#define PAYLOAD_PLUGIN_EXPORT extern "C" __attribute__((visibility("default")))

namespace payload {

//==========================================================================================================
// PluginEntryFn
// Purpose: Signature of payload_plugin_entry. Fills *out with the plugin's config and returns 0; any other
//          return value means the module could not provide a plugin.
//==========================================================================================================
using PluginEntryFn = int (*)(PayloadPluginConfig* out);

} // namespace payload
