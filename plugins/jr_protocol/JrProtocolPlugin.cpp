//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JrProtocolPlugin.cpp
// Purpose: junctionrelay.jr-protocol handlers
//==========================================================================================================

#include "jr_protocol/JrProtocolPlugin.h"

#include "payload/Protocol.h"
#include "payload/async/Task.h"
#include "payload/typed/HandlerParams.h"
#include "payload/typed/Json.h"

namespace payload {
namespace plugins {

namespace {
constexpr const char* kMetadata = R"({
  "payloadName": "junctionrelay.jr-protocol",
  "displayName": "JR Protocol",
  "description": "JunctionRelay Server protocol for device communication",
  "category": "Protocol",
  "emoji": "🔌",
  "profiles": ["lvgl-grid", "lvgl-radio", "lvgl-plotter", "quad", "matrix", "neopixel"],
  "outputContentType": "application/json",
  "outputDescription": "JR sensor/config payload for LVGL, matrix, and NeoPixel devices",
  "authorName": "JunctionRelay"
})";

std::string profileOf(const typed::HandlerParams& params) {
    return params.profile.value_or(JrDefaultProfile);
}

async::Task<JSONValue> transform(JSONValue raw) {
    const typed::HandlerParams params = typed::ParseHandlerParams(raw);

    JSONValue::Object sensors;
    std::size_t index = 0;
    for (const auto& [tag, value] : params.sensors) {
        JSONValue::Object entry = std::get<JSONValue::Object>(value->value);
        typed::setMember(entry, "sensorTag", JSONValue(tag));
        typed::setMember(sensors, "sensor_" + std::to_string(++index), JSONValue{entry});
    }

    JSONValue::Object payload;
    typed::setMember(payload, "type", JSONValue("sensor"));
    typed::setMember(payload, "screenId", JSONValue(params.context.screenId));
    typed::setMember(payload, "profile", JSONValue(profileOf(params)));
    typed::setMember(payload, "sensors", JSONValue{sensors});
    typed::setMember(payload, "timestamp", JSONValue(params.context.timestamp));

    TransformResult out;
    out.payload = JSONValue{payload};
    co_return out.ToJSON();
}

async::Task<JSONValue> transformConfig(JSONValue raw) {
    const typed::HandlerParams params = typed::ParseHandlerParams(raw);

    JSONValue::Object payload;
    typed::setMember(payload, "type", JSONValue("config"));
    typed::setMember(payload, "profile", JSONValue(profileOf(params)));
    typed::setMember(payload, "config", params.config);

    TransformResult out;
    out.payload = JSONValue{payload};
    co_return out.ToJSON();
}

async::Task<JSONValue> getOutputSchema(JSONValue raw) {
    const typed::HandlerParams params = typed::ParseHandlerParams(raw);
    const std::string profile = profileOf(params);

    JSONValue::Object example;
    typed::setMember(example, "type", JSONValue("sensor"));
    typed::setMember(example, "screenId", JSONValue("default"));
    typed::setMember(example, "profile", JSONValue(profile));
    typed::setMember(example, "sensors", JSONValue(JSONValue::Object{}));
    typed::setMember(example, "timestamp", JSONValue(static_cast<int64_t>(0)));

    OutputSchema schema;
    schema.description = "JR Protocol output for " + profile + " profile";
    schema.example = JSONValue{example};
    co_return schema.ToJSON();
}
} // namespace

PayloadPluginConfig MakeJrProtocolPlugin() {
    PayloadPluginConfig config;
    config.metadata = ParseJSON(kMetadata);
    config.handlers[Methods::Transform] = MakeHandler(transform);
    config.handlers[Methods::TransformConfig] = MakeHandler(transformConfig);
    config.handlers[Methods::GetOutputSchema] = MakeHandler(getOutputSchema);
    return config;
}

} // namespace plugins
} // namespace payload
