//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: NoEntryPlugin.cpp
// Purpose: Test module that exports no payload_plugin_entry symbol
//==========================================================================================================

#include "payload/PluginExport.h"

PAYLOAD_PLUGIN_EXPORT int payload_plugin_version() {
    return 1;
}
