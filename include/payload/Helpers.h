//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Helpers.h
// Purpose: Sensor dictionary helpers for plugin authors
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "payload/JSONRPCTypes.h"

namespace payload {

//==========================================================================================================
// BuildSensorArray
// Purpose: Flattens a sensor dictionary into an array of entries, each a copy of the sensor entry with a
//          "tag" member set to its key. Keeps the dictionary's order.
//==========================================================================================================
JSONValue BuildSensorArray(const JSONValue::Object& sensors);

//==========================================================================================================
// FormatValue
// Purpose: Display text for a sensor reading: "<value> <unit>", or just the value when unit is empty or
//          "N/A".
//==========================================================================================================
std::string FormatValue(const JSONValue& value, const std::string& unit = std::string());

//==========================================================================================================
// FilterSensorsByTags
// Purpose: Subset of sensors whose tags appear in tags. Unknown tags are ignored.
//==========================================================================================================
JSONValue::Object FilterSensorsByTags(const JSONValue::Object& sensors, const std::vector<std::string>& tags);

} // namespace payload
