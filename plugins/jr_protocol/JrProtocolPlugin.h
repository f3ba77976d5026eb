//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JrProtocolPlugin.h
// Purpose: junctionrelay.jr-protocol: JR sensor/config payloads for LVGL, matrix and NeoPixel devices
//==========================================================================================================

#pragma once

#include "payload/PluginConfig.h"

namespace payload {
namespace plugins {

// Profile used when the host names none.
constexpr const char* JrDefaultProfile = "lvgl-grid";

//==========================================================================================================
// MakeJrProtocolPlugin
// Purpose: Descriptor plus handlers:
//   transform: { type:"sensor", screenId, profile, sensors:{ sensor_N: {...entry, sensorTag} }, timestamp }
//              with sensors numbered from 1 in ascending tag order.
//   transformConfig: { type:"config", profile, config }.
//   getOutputSchema: description and example for params.profile.
//==========================================================================================================
PayloadPluginConfig MakeJrProtocolPlugin();

} // namespace plugins
} // namespace payload
