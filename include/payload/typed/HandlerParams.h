//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandlerParams.h
// Purpose: Typed view of the params object hosts send to transform-style handlers
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "payload/JSONRPCTypes.h"

namespace payload {
namespace typed {

//==========================================================================================================
// HandlerContext
// Purpose: Host-provided call context.
// Fields:
//   screenId: Target screen identifier.
//   timestamp: Host clock in milliseconds.
//   sensorSource: Where the sensor data originated ("local" or "remote").
//   fullSync: Full sync rather than an incremental update.
//   messageType: Name of the handler being invoked.
//==========================================================================================================
struct HandlerContext {
    std::string screenId;
    int64_t timestamp{0};
    std::string sensorSource;
    bool fullSync{false};
    std::string messageType;
};

//==========================================================================================================
// HandlerParams
// Purpose: Input to every handler.
// Fields:
//   sensors: Flat sensor dictionary keyed by sensorTag; each value is a sensor entry object.
//   config: Plugin instance settings (object).
//   profile: Optional named preset within the protocol.
//   context: See HandlerContext.
//==========================================================================================================
struct HandlerParams {
    JSONValue::Object sensors;
    JSONValue config{JSONValue::Object{}};
    std::optional<std::string> profile;
    HandlerContext context;

    // Sensor tags in the order the host sent them.
    std::vector<std::string> Tags() const;
};

//==========================================================================================================
// ParseHandlerParams
// Purpose: Validates and extracts HandlerParams. Absent or null members take their defaults.
// Returns:
//   HandlerParams; throws errors::InvalidParamsError naming the offending member on a wrong shape.
//==========================================================================================================
HandlerParams ParseHandlerParams(const JSONValue& params);

} // namespace typed
} // namespace payload
