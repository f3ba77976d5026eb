//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: XsdProtocolPlugin.cpp
// Purpose: junctionrelay.xsd-protocol handlers
//==========================================================================================================

#include "xsd_protocol/XsdProtocolPlugin.h"

#include "payload/Protocol.h"
#include "payload/async/Task.h"
#include "payload/errors/Errors.h"
#include "payload/typed/HandlerParams.h"
#include "payload/typed/Json.h"

namespace payload {
namespace plugins {

namespace {
constexpr const char* kMetadata = R"({
  "payloadName": "junctionrelay.xsd-protocol",
  "displayName": "XSD Protocol",
  "description": "XSD dictionarySensors format for device communication",
  "category": "Protocol",
  "emoji": "📡",
  "outputContentType": "application/json",
  "outputDescription": "XSD sensor payload with dictionarySensors/unmappedSensors structure",
  "authorName": "JunctionRelay",
  "fields": { "configurable": ["unmappedSensors"] }
})";

constexpr const char* kUnmappedSensorsError = "unmappedSensors must be a Record<string, SensorEntry> if provided";

// Member when truthy, otherwise fallback.
JSONValue memberOr(const JSONValue& entry, const std::string& key, const std::string& fallback) {
    const JSONValue* m = typed::findMember(entry, key);
    if (typed::isTruthy(m)) {
        return *m;
    }
    return JSONValue(fallback);
}

JSONValue::Object describeSensor(const std::string& key, const JSONValue& entry, bool withDisplayValue) {
    JSONValue::Object out;
    const JSONValue* value = typed::findMember(entry, "value");
    if (value != nullptr) {
        typed::setMember(out, "value", *value);
    }
    typed::setMember(out, "unit", memberOr(entry, "unit", ""));
    if (withDisplayValue) {
        const JSONValue* display = typed::findMember(entry, "displayValue");
        if (display != nullptr && !display->IsNull()) {
            typed::setMember(out, "displayValue", *display);
        } else {
            typed::setMember(out, "displayValue",
                             JSONValue(value ? typed::toDisplayString(*value) : std::string()));
        }
    }
    typed::setMember(out, "pollerSource", memberOr(entry, "pollerSource", "unknown"));
    typed::setMember(out, "rawLabel", memberOr(entry, "rawLabel", key));
    return out;
}

async::Task<JSONValue> transform(JSONValue raw) {
    const typed::HandlerParams params = typed::ParseHandlerParams(raw);

    JSONValue::Object dictionarySensors;
    for (const auto& [tag, entry] : params.sensors) {
        typed::setMember(dictionarySensors, tag, JSONValue{describeSensor(tag, *entry, true)});
    }

    JSONValue::Object unmappedSensors;
    const JSONValue* unmapped = typed::findMember(params.config, "unmappedSensors");
    if (typed::isTruthy(unmapped)) {
        if (!unmapped->IsObject()) {
            throw errors::InvalidParamsError(kUnmappedSensorsError);
        }
        for (const auto& [key, entry] : std::get<JSONValue::Object>(unmapped->value)) {
            const JSONValue empty{JSONValue::Object{}};
            const JSONValue& source = (entry && entry->IsObject()) ? *entry : empty;
            typed::setMember(unmappedSensors, key, JSONValue{describeSensor(key, source, false)});
        }
    }

    JSONValue::Object payload;
    typed::setMember(payload, "type", JSONValue("xsd_sensor"));
    typed::setMember(payload, "screenId", JSONValue(params.context.screenId));
    typed::setMember(payload, "dictionarySensors", JSONValue{dictionarySensors});
    typed::setMember(payload, "unmappedSensors", JSONValue{unmappedSensors});
    typed::setMember(payload, "sensorSource", JSONValue(params.context.sensorSource));
    typed::setMember(payload, "timestamp", JSONValue(params.context.timestamp));

    TransformResult out;
    out.payload = JSONValue{payload};
    co_return out.ToJSON();
}

// Checks the settings object the host sends as params; unmappedSensors sits at its top level.
async::Task<JSONValue> validate(JSONValue raw) {
    if (!raw.IsObject()) {
        throw errors::InvalidParamsError("params must be an object");
    }

    ValidationResult result;
    const JSONValue* unmapped = typed::findMember(raw, "unmappedSensors");
    if (unmapped != nullptr && !unmapped->IsObject()) {
        result.valid = false;
        result.errors.push_back(kUnmappedSensorsError);
    }
    co_return result.ToJSON();
}

async::Task<JSONValue> getOutputSchema(JSONValue) {
    OutputSchema schema;
    schema.description = "XSD sensor payload with dictionarySensors/unmappedSensors structure";
    schema.example = ParseJSON(R"({
      "type": "xsd_sensor",
      "screenId": "xsd",
      "dictionarySensors": {
        "cpu_usage_total": { "value": 45.2, "unit": "%", "displayValue": "45.2", "pollerSource": "psutil", "rawLabel": "usage_total" }
      },
      "unmappedSensors": {
        "gpu_temp": { "value": 72, "unit": "°C", "pollerSource": "nvidia-smi", "rawLabel": "GPU Temperature" }
      },
      "sensorSource": "local",
      "timestamp": 1771257808745
    })");
    co_return schema.ToJSON();
}
} // namespace

PayloadPluginConfig MakeXsdProtocolPlugin() {
    PayloadPluginConfig config;
    config.metadata = ParseJSON(kMetadata);
    config.handlers[Methods::Transform] = MakeHandler(transform);
    config.handlers[Methods::Validate] = MakeHandler(validate);
    config.handlers[Methods::GetOutputSchema] = MakeHandler(getOutputSchema);
    return config;
}

} // namespace plugins
} // namespace payload
