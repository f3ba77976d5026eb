//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Entry.cpp
// Purpose: Module entry point for junctionrelay.xsd-protocol
//==========================================================================================================

#include "payload/PluginExport.h"
#include "xsd_protocol/XsdProtocolPlugin.h"

PAYLOAD_PLUGIN_EXPORT int payload_plugin_entry(payload::PayloadPluginConfig* out) {
    if (out == nullptr) {
        return 1;
    }
    *out = payload::plugins::MakeXsdProtocolPlugin();
    return 0;
}
