//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Payload plugin protocol constants and the result shapes exchanged with the host
//==========================================================================================================

#pragma once

#include "payload/JSONRPCTypes.h"
#include <optional>
#include <string>
#include <vector>

namespace payload {
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
// Payload plugin protocol version
constexpr const char* PROTOCOL_VERSION = "1.0.0";

// Namespaced plugin identifier: <namespace>.<name>, both lowercase kebab-case.
constexpr const char* PLUGIN_ID_PATTERN = "^[a-z][a-z0-9]*(-[a-z0-9]+)*\\.[a-z][a-z0-9]*(-[a-z0-9]+)*$";

//==========================================================================================================
// IsPluginPayloadName
// Purpose: True when name matches PLUGIN_ID_PATTERN (e.g. "acme.my-format").
//==========================================================================================================
bool IsPluginPayloadName(const std::string& name);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Answered by the runtime itself
    constexpr const char* GetMetadata = "getMetadata";
    constexpr const char* HealthCheck = "healthCheck";

    // Conventional handler names hosts call
    constexpr const char* Transform = "transform";
    constexpr const char* TransformConfig = "transformConfig";
    constexpr const char* GetOutputSchema = "getOutputSchema";
    constexpr const char* Validate = "validate";
}

///////////////////////////////////////// Result shapes ///////////////////////////////////////////
// healthCheck result
struct HealthCheckResult {
    bool healthy = true;
    int64_t uptime = 0; // whole seconds since start

    JSONValue ToJSON() const;
};

// Message type handler result
struct TransformResult {
    JSONValue payload;
    std::string contentType = "application/json";
    std::optional<JSONValue> metadata;

    JSONValue ToJSON() const;
};

// getOutputSchema result
struct OutputSchema {
    std::string description;
    JSONValue example;
    std::optional<JSONValue> jsonSchema;

    JSONValue ToJSON() const;
};

// validate result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;

    JSONValue ToJSON() const;
};

} // namespace payload
