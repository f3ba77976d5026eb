//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Helpers.cpp
// Purpose: Sensor dictionary helpers
//==========================================================================================================

#include <unordered_set>

#include "payload/Helpers.h"
#include "payload/typed/Json.h"

namespace payload {

JSONValue BuildSensorArray(const JSONValue::Object& sensors) {
    JSONValue::Array arr;
    arr.reserve(sensors.size());
    for (const auto& [tag, entry] : sensors) {
        JSONValue::Object item;
        if (entry && entry->IsObject()) {
            item = std::get<JSONValue::Object>(entry->value);
        }
        typed::setMember(item, "tag", JSONValue(tag));
        arr.push_back(std::make_shared<JSONValue>(std::move(item)));
    }
    return JSONValue{arr};
}

std::string FormatValue(const JSONValue& value, const std::string& unit) {
    std::string str = typed::toDisplayString(value);
    if (unit.empty() || unit == "N/A") {
        return str;
    }
    return str + " " + unit;
}

JSONValue::Object FilterSensorsByTags(const JSONValue::Object& sensors, const std::vector<std::string>& tags) {
    const std::unordered_set<std::string> wanted(tags.begin(), tags.end());
    JSONValue::Object result;
    for (const auto& [tag, entry] : sensors) {
        if (wanted.count(tag) != 0) {
            result[tag] = entry;
        }
    }
    return result;
}

} // namespace payload
