//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Plugin identifier validation and JSON forms of the protocol result shapes
//==========================================================================================================

#include <regex>

#include "payload/Protocol.h"
#include "payload/typed/Json.h"

namespace payload {

bool IsPluginPayloadName(const std::string& name) {
    static const std::regex pattern(PLUGIN_ID_PATTERN);
    return std::regex_match(name, pattern);
}

JSONValue HealthCheckResult::ToJSON() const {
    JSONValue::Object obj;
    typed::setMember(obj, "healthy", JSONValue(healthy));
    typed::setMember(obj, "uptime", JSONValue(uptime));
    return JSONValue{obj};
}

JSONValue TransformResult::ToJSON() const {
    JSONValue::Object obj;
    typed::setMember(obj, "payload", payload);
    typed::setMember(obj, "contentType", JSONValue(contentType));
    if (metadata.has_value()) {
        typed::setMember(obj, "metadata", metadata.value());
    }
    return JSONValue{obj};
}

JSONValue OutputSchema::ToJSON() const {
    JSONValue::Object obj;
    typed::setMember(obj, "description", JSONValue(description));
    typed::setMember(obj, "example", example);
    if (jsonSchema.has_value()) {
        typed::setMember(obj, "jsonSchema", jsonSchema.value());
    }
    return JSONValue{obj};
}

JSONValue ValidationResult::ToJSON() const {
    JSONValue::Object obj;
    typed::setMember(obj, "valid", JSONValue(valid));
    // errors is omitted on success
    if (!errors.empty()) {
        typed::setMember(obj, "errors", typed::makeStringArray(errors));
    }
    return JSONValue{obj};
}

} // namespace payload
