//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: XsdProtocolPlugin.h
// Purpose: junctionrelay.xsd-protocol: dictionarySensors/unmappedSensors payloads
//==========================================================================================================

#pragma once

#include "payload/PluginConfig.h"

namespace payload {
namespace plugins {

//==========================================================================================================
// MakeXsdProtocolPlugin
// Purpose: Descriptor plus handlers:
//   transform: { type:"xsd_sensor", screenId, dictionarySensors, unmappedSensors, sensorSource, timestamp }.
//              Entries get unit "", pollerSource "unknown" and rawLabel <tag> when those are missing or
//              empty; dictionary entries also get displayValue (the value as text) when missing.
//   validate: config.unmappedSensors, when present, must be an object.
//   getOutputSchema: description and example of the payload.
//==========================================================================================================
PayloadPluginConfig MakeXsdProtocolPlugin();

} // namespace plugins
} // namespace payload
