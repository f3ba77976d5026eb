//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RawJsonPlugin.cpp
// Purpose: junctionrelay.raw-json handlers
//==========================================================================================================

#include "raw_json/RawJsonPlugin.h"

#include "payload/Protocol.h"
#include "payload/async/Task.h"
#include "payload/typed/HandlerParams.h"
#include "payload/typed/Json.h"

namespace payload {
namespace plugins {

namespace {
constexpr const char* kMetadata = R"({
  "payloadName": "junctionrelay.raw-json",
  "displayName": "Raw JSON",
  "description": "Pass-through flat sensor dictionary as JSON",
  "category": "Data",
  "emoji": "📋",
  "fields": { "configurable": ["includeTimestamp", "includeMetadata"] },
  "defaults": { "includeTimestamp": true, "includeMetadata": false },
  "outputContentType": "application/json",
  "outputDescription": "Flat JSON object with sensor tags as keys",
  "authorName": "JunctionRelay"
})";

async::Task<JSONValue> transform(JSONValue raw) {
    const typed::HandlerParams params = typed::ParseHandlerParams(raw);

    JSONValue::Object result;
    if (typed::isTruthy(typed::findMember(params.config, "includeTimestamp"))) {
        typed::setMember(result, "timestamp", JSONValue(params.context.timestamp));
    }
    if (typed::isTruthy(typed::findMember(params.config, "includeMetadata"))) {
        typed::setMember(result, "screenId", JSONValue(params.context.screenId));
        typed::setMember(result, "sensorSource", JSONValue(params.context.sensorSource));
    }
    for (const auto& [tag, entry] : params.sensors) {
        const JSONValue* value = typed::findMember(*entry, "value");
        typed::setMember(result, tag, value ? *value : JSONValue(nullptr));
    }

    TransformResult out;
    out.payload = JSONValue{result};
    co_return out.ToJSON();
}

async::Task<JSONValue> getOutputSchema(JSONValue) {
    OutputSchema schema;
    schema.description = "Flat JSON object with sensor tags as keys and raw values";
    schema.example = ParseJSON(R"({"timestamp":1771257808745,"cpu_usage_total":45.2,"gpu_temp":72})");
    co_return schema.ToJSON();
}
} // namespace

PayloadPluginConfig MakeRawJsonPlugin() {
    PayloadPluginConfig config;
    config.metadata = ParseJSON(kMetadata);
    config.handlers[Methods::Transform] = MakeHandler(transform);
    config.handlers[Methods::GetOutputSchema] = MakeHandler(getOutputSchema);
    return config;
}

} // namespace plugins
} // namespace payload
