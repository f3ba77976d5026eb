//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RawJsonPlugin.h
// Purpose: junctionrelay.raw-json: flat {sensorTag: value} JSON payload
//==========================================================================================================

#pragma once

#include "payload/PluginConfig.h"

namespace payload {
namespace plugins {

//==========================================================================================================
// MakeRawJsonPlugin
// Purpose: Descriptor plus handlers:
//   transform: { [timestamp], [screenId, sensorSource], <tag>: <value>... } as an application/json payload.
//              config.includeTimestamp and config.includeMetadata switch the optional members on.
//   getOutputSchema: description and example of the payload.
//==========================================================================================================
PayloadPluginConfig MakeRawJsonPlugin();

} // namespace plugins
} // namespace payload
