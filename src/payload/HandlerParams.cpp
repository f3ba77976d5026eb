//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandlerParams.cpp
// Purpose: Shape checks and extraction for handler params
//==========================================================================================================

#include <cmath>

#include "payload/errors/Errors.h"
#include "payload/typed/HandlerParams.h"
#include "payload/typed/Json.h"

namespace payload {
namespace typed {

namespace {
// Member or nullptr when absent or JSON null.
const JSONValue* presentMember(const JSONValue& obj, const std::string& key) {
    const JSONValue* m = findMember(obj, key);
    if (m == nullptr || m->IsNull()) {
        return nullptr;
    }
    return m;
}

std::string stringMember(const JSONValue& obj, const std::string& key, const std::string& where) {
    const JSONValue* m = presentMember(obj, key);
    if (m == nullptr) {
        return std::string();
    }
    if (!m->IsString()) {
        throw errors::InvalidParamsError(where + "." + key + " must be a string");
    }
    return std::get<std::string>(m->value);
}

int64_t timestampMember(const JSONValue& obj) {
    const JSONValue* m = presentMember(obj, "timestamp");
    if (m == nullptr) {
        return 0;
    }
    if (const auto* i = std::get_if<int64_t>(&m->value)) {
        return *i;
    }
    if (const auto* d = std::get_if<double>(&m->value)) {
        const double whole = std::floor(*d);
        // int64 range is [-2^63, 2^63); NaN fails both comparisons.
        if (!(whole >= -9223372036854775808.0 && whole < 9223372036854775808.0)) {
            throw errors::InvalidParamsError("context.timestamp is out of range");
        }
        return static_cast<int64_t>(whole);
    }
    throw errors::InvalidParamsError("context.timestamp must be a number");
}

HandlerContext parseContext(const JSONValue* ctx) {
    HandlerContext out;
    if (ctx == nullptr) {
        return out;
    }
    if (!ctx->IsObject()) {
        throw errors::InvalidParamsError("context must be an object");
    }
    out.screenId = stringMember(*ctx, "screenId", "context");
    out.timestamp = timestampMember(*ctx);
    out.sensorSource = stringMember(*ctx, "sensorSource", "context");
    out.messageType = stringMember(*ctx, "messageType", "context");
    if (const JSONValue* fs = presentMember(*ctx, "fullSync")) {
        if (!std::holds_alternative<bool>(fs->value)) {
            throw errors::InvalidParamsError("context.fullSync must be a boolean");
        }
        out.fullSync = std::get<bool>(fs->value);
    }
    return out;
}
} // namespace

std::vector<std::string> HandlerParams::Tags() const {
    std::vector<std::string> tags;
    tags.reserve(sensors.size());
    for (const auto& [tag, entry] : sensors) {
        tags.push_back(tag);
    }
    return tags;
}

HandlerParams ParseHandlerParams(const JSONValue& params) {
    if (!params.IsObject()) {
        throw errors::InvalidParamsError("params must be an object");
    }
    HandlerParams out;

    if (const JSONValue* sensors = presentMember(params, "sensors")) {
        if (!sensors->IsObject()) {
            throw errors::InvalidParamsError("sensors must be an object keyed by sensorTag");
        }
        for (const auto& [tag, entry] : std::get<JSONValue::Object>(sensors->value)) {
            if (!entry || !entry->IsObject()) {
                throw errors::InvalidParamsError("sensor '" + tag + "' must be an object");
            }
        }
        out.sensors = std::get<JSONValue::Object>(sensors->value);
    }

    if (const JSONValue* config = presentMember(params, "config")) {
        if (!config->IsObject()) {
            throw errors::InvalidParamsError("config must be an object");
        }
        out.config = *config;
    }

    if (const JSONValue* profile = presentMember(params, "profile")) {
        if (!profile->IsString()) {
            throw errors::InvalidParamsError("profile must be a string");
        }
        out.profile = std::get<std::string>(profile->value);
    }

    out.context = parseContext(presentMember(params, "context"));
    return out;
}

} // namespace typed
} // namespace payload
