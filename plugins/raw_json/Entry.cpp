//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Entry.cpp
// Purpose: Module entry point for junctionrelay.raw-json
//==========================================================================================================

#include "payload/PluginExport.h"
#include "raw_json/RawJsonPlugin.h"

PAYLOAD_PLUGIN_EXPORT int payload_plugin_entry(payload::PayloadPluginConfig* out) {
    if (out == nullptr) {
        return 1;
    }
    *out = payload::plugins::MakeRawJsonPlugin();
    return 0;
}
