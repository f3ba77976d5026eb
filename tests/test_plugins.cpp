//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_plugins.cpp
// Purpose: Bundled transform plugins: raw-json, jr-protocol and xsd-protocol handlers
//==========================================================================================================

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "jr_protocol/JrProtocolPlugin.h"
#include "raw_json/RawJsonPlugin.h"
#include "xsd_protocol/XsdProtocolPlugin.h"
#include "payload/MethodRegistry.h"
#include "payload/Protocol.h"
#include "payload/errors/Errors.h"
#include "TestJson.h"

using namespace payload;
using namespace payload::plugins;
using testjson::member;

namespace {

JSONValue call(const PayloadPluginConfig& cfg, const std::string& method, const std::string& params) {
    auto it = cfg.handlers.find(method);
    if (it == cfg.handlers.end()) {
        throw std::out_of_range("no handler " + method);
    }
    return it->second(ParseJSON(params)).get();
}

constexpr const char* kSensorParams = R"({
    "sensors": {
        "gpu_temp": {"value": 72, "unit": "°C", "pollerSource": "nvidia-smi", "rawLabel": "GPU Temperature"},
        "cpu_usage_total": {"value": 45.2, "unit": "%"}
    },
    "config": {},
    "context": {"screenId": "main", "timestamp": 1771257808745, "sensorSource": "local", "fullSync": false}
})";

} // namespace

TEST(BundledPlugins, DescriptorsRegister) {
    MethodRegistry raw(MakeRawJsonPlugin());
    EXPECT_EQ(raw.PayloadName(), "junctionrelay.raw-json");
    EXPECT_EQ(raw.DisplayName(), "Raw JSON");
    EXPECT_EQ(raw.MethodNames(), (std::vector<std::string>{"getMetadata", "getOutputSchema", "healthCheck", "transform"}));

    MethodRegistry jr(MakeJrProtocolPlugin());
    EXPECT_EQ(jr.PayloadName(), "junctionrelay.jr-protocol");
    EXPECT_NE(jr.Find(Methods::TransformConfig), nullptr);
    EXPECT_EQ(std::get<JSONValue::Array>(member(jr.Metadata(), "profiles").value).size(), 6u);

    MethodRegistry xsd(MakeXsdProtocolPlugin());
    EXPECT_EQ(xsd.PayloadName(), "junctionrelay.xsd-protocol");
    EXPECT_NE(xsd.Find(Methods::Validate), nullptr);
}

//------------------------------ raw-json ------------------------------

TEST(RawJsonPlugin, FlatValuesOnlyByDefault) {
    JSONValue out = call(MakeRawJsonPlugin(), Methods::Transform, kSensorParams);
    EXPECT_EQ(testjson::str(out, "contentType"), "application/json");
    const JSONValue& payload = member(out, "payload");
    EXPECT_EQ(testjson::objectSize(payload), 2u);
    EXPECT_EQ(testjson::integer(payload, "gpu_temp"), 72);
    EXPECT_DOUBLE_EQ(std::get<double>(member(payload, "cpu_usage_total").value), 45.2);
}

TEST(RawJsonPlugin, TimestampAndMetadataSwitches) {
    JSONValue out = call(MakeRawJsonPlugin(), Methods::Transform, R"({
        "sensors": {"fan": {"value": 1200}, "mute": {"unit": "x"}},
        "config": {"includeTimestamp": true, "includeMetadata": 1},
        "context": {"screenId": "s2", "timestamp": 99, "sensorSource": "remote"}
    })");
    const JSONValue& payload = member(out, "payload");
    EXPECT_EQ(testjson::integer(payload, "timestamp"), 99);
    EXPECT_EQ(testjson::str(payload, "screenId"), "s2");
    EXPECT_EQ(testjson::str(payload, "sensorSource"), "remote");
    EXPECT_EQ(testjson::integer(payload, "fan"), 1200);
    EXPECT_TRUE(member(payload, "mute").IsNull());
}

TEST(RawJsonPlugin, OutputSchema) {
    JSONValue out = call(MakeRawJsonPlugin(), Methods::GetOutputSchema, "{}");
    EXPECT_EQ(testjson::str(out, "description"), "Flat JSON object with sensor tags as keys and raw values");
    EXPECT_TRUE(member(out, "example").IsObject());
}

TEST(RawJsonPlugin, MalformedSensorsSurfaceAsInvalidParams) {
    auto cfg = MakeRawJsonPlugin();
    auto fut = cfg.handlers.at(Methods::Transform)(ParseJSON(R"({"sensors":[1,2]})"));
    EXPECT_THROW(fut.get(), errors::InvalidParamsError);
}

TEST(RawJsonPlugin, OutOfRangeTimestampIsInvalidParams) {
    auto cfg = MakeRawJsonPlugin();
    auto fut = cfg.handlers.at(Methods::Transform)(
        ParseJSON(R"({"config":{"includeTimestamp":true},"context":{"timestamp":1e300}})"));
    EXPECT_THROW(fut.get(), errors::InvalidParamsError);
}

//------------------------------ jr-protocol ------------------------------

TEST(JrProtocolPlugin, SensorsNumberedInHostOrder) {
    JSONValue out = call(MakeJrProtocolPlugin(), Methods::Transform, kSensorParams);
    const JSONValue& payload = member(out, "payload");
    EXPECT_EQ(testjson::str(payload, "type"), "sensor");
    EXPECT_EQ(testjson::str(payload, "screenId"), "main");
    EXPECT_EQ(testjson::str(payload, "profile"), JrDefaultProfile);
    EXPECT_EQ(testjson::integer(payload, "timestamp"), 1771257808745LL);

    const JSONValue& sensors = member(payload, "sensors");
    EXPECT_EQ(testjson::objectSize(sensors), 2u);
    const JSONValue& first = member(sensors, "sensor_1");
    EXPECT_EQ(testjson::str(first, "sensorTag"), "gpu_temp");
    EXPECT_EQ(testjson::str(first, "rawLabel"), "GPU Temperature");
    const JSONValue& second = member(sensors, "sensor_2");
    EXPECT_EQ(testjson::str(second, "sensorTag"), "cpu_usage_total");
    EXPECT_EQ(testjson::str(second, "unit"), "%");
}

TEST(JrProtocolPlugin, ProfileFromParams) {
    JSONValue out = call(MakeJrProtocolPlugin(), Methods::Transform, R"({"sensors":{},"profile":"neopixel"})");
    EXPECT_EQ(testjson::str(member(out, "payload"), "profile"), "neopixel");
    EXPECT_EQ(testjson::objectSize(member(member(out, "payload"), "sensors")), 0u);
}

TEST(JrProtocolPlugin, TransformConfigEchoesConfig) {
    JSONValue out = call(MakeJrProtocolPlugin(), Methods::TransformConfig,
                         R"({"config":{"rows":2,"cols":3},"profile":"quad"})");
    const JSONValue& payload = member(out, "payload");
    EXPECT_EQ(testjson::str(payload, "type"), "config");
    EXPECT_EQ(testjson::str(payload, "profile"), "quad");
    EXPECT_EQ(member(payload, "config"), ParseJSON(R"({"rows":2,"cols":3})"));
    EXPECT_EQ(testjson::str(out, "contentType"), "application/json");
}

TEST(JrProtocolPlugin, OutputSchemaNamesProfile) {
    JSONValue out = call(MakeJrProtocolPlugin(), Methods::GetOutputSchema, R"({"profile":"matrix"})");
    EXPECT_EQ(testjson::str(out, "description"), "JR Protocol output for matrix profile");
    EXPECT_EQ(testjson::str(member(out, "example"), "profile"), "matrix");

    JSONValue dflt = call(MakeJrProtocolPlugin(), Methods::GetOutputSchema, "{}");
    EXPECT_EQ(testjson::str(dflt, "description"), "JR Protocol output for lvgl-grid profile");
}

//------------------------------ xsd-protocol ------------------------------

TEST(XsdProtocolPlugin, DictionarySensorsGetDefaults) {
    JSONValue out = call(MakeXsdProtocolPlugin(), Methods::Transform, kSensorParams);
    const JSONValue& payload = member(out, "payload");
    EXPECT_EQ(testjson::str(payload, "type"), "xsd_sensor");
    EXPECT_EQ(testjson::str(payload, "screenId"), "main");
    EXPECT_EQ(testjson::str(payload, "sensorSource"), "local");
    EXPECT_EQ(testjson::integer(payload, "timestamp"), 1771257808745LL);
    EXPECT_EQ(testjson::objectSize(member(payload, "unmappedSensors")), 0u);

    const JSONValue& dict = member(payload, "dictionarySensors");
    const JSONValue& cpu = member(dict, "cpu_usage_total");
    EXPECT_EQ(testjson::str(cpu, "unit"), "%");
    EXPECT_EQ(testjson::str(cpu, "displayValue"), "45.2");
    EXPECT_EQ(testjson::str(cpu, "pollerSource"), "unknown");
    EXPECT_EQ(testjson::str(cpu, "rawLabel"), "cpu_usage_total");

    const JSONValue& gpu = member(dict, "gpu_temp");
    EXPECT_EQ(testjson::str(gpu, "displayValue"), "72");
    EXPECT_EQ(testjson::str(gpu, "pollerSource"), "nvidia-smi");
    EXPECT_EQ(testjson::str(gpu, "rawLabel"), "GPU Temperature");
}

TEST(XsdProtocolPlugin, ProvidedDisplayValueIsKept) {
    JSONValue out = call(MakeXsdProtocolPlugin(), Methods::Transform,
                         R"({"sensors":{"t":{"value":21.5,"unit":"","displayValue":"21.5 C"}}})");
    const JSONValue& t = member(member(member(out, "payload"), "dictionarySensors"), "t");
    EXPECT_EQ(testjson::str(t, "displayValue"), "21.5 C");
    EXPECT_EQ(testjson::str(t, "unit"), "");
}

TEST(XsdProtocolPlugin, UnmappedSensorsFromConfig) {
    JSONValue out = call(MakeXsdProtocolPlugin(), Methods::Transform, R"({
        "sensors": {},
        "config": {"unmappedSensors": {"gpu_temp": {"value": 72, "unit": "°C", "pollerSource": "nvidia-smi"}}}
    })");
    const JSONValue& gpu = member(member(member(out, "payload"), "unmappedSensors"), "gpu_temp");
    EXPECT_EQ(testjson::integer(gpu, "value"), 72);
    EXPECT_EQ(testjson::str(gpu, "pollerSource"), "nvidia-smi");
    EXPECT_EQ(testjson::str(gpu, "rawLabel"), "gpu_temp");
    EXPECT_FALSE(testjson::has(gpu, "displayValue"));
}

TEST(XsdProtocolPlugin, NonObjectUnmappedSensorsRejectedByTransform) {
    auto cfg = MakeXsdProtocolPlugin();
    auto fut = cfg.handlers.at(Methods::Transform)(ParseJSON(R"({"config":{"unmappedSensors":"all"}})"));
    EXPECT_THROW(fut.get(), errors::InvalidParamsError);
}

TEST(XsdProtocolPlugin, Validate) {
    auto cfg = MakeXsdProtocolPlugin();

    JSONValue ok = call(cfg, Methods::Validate, R"({"unmappedSensors":{"gpu_temp":{"value":72}}})");
    EXPECT_TRUE(testjson::boolean(ok, "valid"));
    EXPECT_FALSE(testjson::has(ok, "errors"));

    JSONValue absent = call(cfg, Methods::Validate, "{}");
    EXPECT_TRUE(testjson::boolean(absent, "valid"));

    // Only the top-level member is checked; other settings are not shape-checked here.
    JSONValue otherSettings = call(cfg, Methods::Validate, R"({"config":5,"profile":3})");
    EXPECT_TRUE(testjson::boolean(otherSettings, "valid"));

    for (const char* params : {R"({"unmappedSensors":5})", R"({"unmappedSensors":null})",
                               R"({"unmappedSensors":[]})", R"({"unmappedSensors":"all"})"}) {
        JSONValue bad = call(cfg, Methods::Validate, params);
        EXPECT_FALSE(testjson::boolean(bad, "valid")) << params;
        const auto& errs = std::get<JSONValue::Array>(member(bad, "errors").value);
        ASSERT_EQ(errs.size(), 1u) << params;
        EXPECT_EQ(std::get<std::string>(errs[0]->value),
                  "unmappedSensors must be a Record<string, SensorEntry> if provided");
    }
}

TEST(XsdProtocolPlugin, ValidateRequiresObjectParams) {
    auto cfg = MakeXsdProtocolPlugin();
    auto fut = cfg.handlers.at(Methods::Validate)(ParseJSON("[1]"));
    EXPECT_THROW(fut.get(), errors::InvalidParamsError);
}

TEST(XsdProtocolPlugin, OutputSchema) {
    JSONValue out = call(MakeXsdProtocolPlugin(), Methods::GetOutputSchema, "{}");
    EXPECT_EQ(testjson::str(out, "description"),
              "XSD sensor payload with dictionarySensors/unmappedSensors structure");
    EXPECT_EQ(testjson::str(member(out, "example"), "type"), "xsd_sensor");
}
