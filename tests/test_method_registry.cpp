//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_method_registry.cpp
// Purpose: Method table construction, descriptor validation, built-ins and uptime
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <stdexcept>

#include "payload/MethodRegistry.h"
#include "payload/Protocol.h"
#include "payload/async/Task.h"
#include "TestJson.h"

using namespace payload;

namespace {
PayloadPluginConfig configNamed(const std::string& payloadName) {
    PayloadPluginConfig cfg;
    JSONValue::Object meta;
    typed::setMember(meta, "payloadName", JSONValue(payloadName));
    cfg.metadata = JSONValue{meta};
    return cfg;
}

MethodHandler echoHandler() {
    return [](const JSONValue& params) { return async::makeReady(JSONValue(params)); };
}
} // namespace

TEST(PluginPayloadName, Pattern) {
    EXPECT_TRUE(IsPluginPayloadName("junctionrelay.jr-protocol"));
    EXPECT_TRUE(IsPluginPayloadName("acme.widget-v2"));
    EXPECT_TRUE(IsPluginPayloadName("a1.b2"));
    EXPECT_FALSE(IsPluginPayloadName("BadName"));
    EXPECT_FALSE(IsPluginPayloadName("nodot"));
    EXPECT_FALSE(IsPluginPayloadName("Acme.widget"));
    EXPECT_FALSE(IsPluginPayloadName("acme.widget.extra"));
    EXPECT_FALSE(IsPluginPayloadName("acme.-widget"));
    EXPECT_FALSE(IsPluginPayloadName("acme.widget-"));
    EXPECT_FALSE(IsPluginPayloadName("1acme.widget"));
    EXPECT_FALSE(IsPluginPayloadName(""));
}

TEST(MethodRegistry, RejectsBadPayloadName) {
    try {
        MethodRegistry reg(configNamed("BadName"));
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        const std::string msg = e.what();
        EXPECT_NE(msg.find("BadName"), std::string::npos);
        EXPECT_NE(msg.find("namespaced dot-notation"), std::string::npos);
    }
}

TEST(MethodRegistry, RejectsMissingOrNonObjectMetadata) {
    PayloadPluginConfig noName;
    noName.metadata = JSONValue(JSONValue::Object{});
    EXPECT_THROW(MethodRegistry{std::move(noName)}, std::invalid_argument);

    PayloadPluginConfig notObject;
    notObject.metadata = JSONValue(std::string("junctionrelay.raw-json"));
    EXPECT_THROW(MethodRegistry{std::move(notObject)}, std::invalid_argument);
}

TEST(MethodRegistry, AcceptsValidNameAndRegistersBuiltins) {
    auto cfg = configNamed("acme.widget-v2");
    cfg.handlers["transform"] = echoHandler();
    MethodRegistry reg(std::move(cfg));

    EXPECT_EQ(reg.PayloadName(), "acme.widget-v2");
    ASSERT_NE(reg.Find(Methods::GetMetadata), nullptr);
    ASSERT_NE(reg.Find(Methods::HealthCheck), nullptr);
    ASSERT_NE(reg.Find("transform"), nullptr);
    EXPECT_EQ(reg.Find("doesNotExist"), nullptr);

    EXPECT_TRUE(std::holds_alternative<BuiltinMethod>(*reg.Find(Methods::GetMetadata)));
    EXPECT_TRUE(std::holds_alternative<MethodHandler>(*reg.Find("transform")));

    const std::vector<std::string> expected{"getMetadata", "healthCheck", "transform"};
    EXPECT_EQ(reg.MethodNames(), expected);
}

TEST(MethodRegistry, HandlerMayNotShadowBuiltin) {
    auto cfg = configNamed("acme.widget");
    cfg.handlers[Methods::HealthCheck] = echoHandler();
    EXPECT_THROW(MethodRegistry{std::move(cfg)}, std::invalid_argument);

    auto cfg2 = configNamed("acme.widget");
    cfg2.handlers[Methods::GetMetadata] = echoHandler();
    EXPECT_THROW(MethodRegistry{std::move(cfg2)}, std::invalid_argument);
}

TEST(MethodRegistry, RejectsEmptyNameOrEmptyHandler) {
    auto cfg = configNamed("acme.widget");
    cfg.handlers[""] = echoHandler();
    EXPECT_THROW(MethodRegistry{std::move(cfg)}, std::invalid_argument);

    auto cfg2 = configNamed("acme.widget");
    cfg2.handlers["transform"] = MethodHandler{};
    EXPECT_THROW(MethodRegistry{std::move(cfg2)}, std::invalid_argument);
}

TEST(MethodRegistry, MetadataIsKeptVerbatim) {
    PayloadPluginConfig cfg;
    cfg.metadata = ParseJSON(R"({"payloadName":"acme.widget","displayName":"Widget","profiles":["a","b"],"x":{"y":null}})");
    const JSONValue original = cfg.metadata;
    MethodRegistry reg(std::move(cfg));
    EXPECT_EQ(reg.Metadata(), original);
    EXPECT_EQ(reg.DisplayName(), "Widget");
}

TEST(MethodRegistry, DisplayNameFallsBackToPayloadName) {
    MethodRegistry reg(configNamed("acme.widget"));
    EXPECT_EQ(reg.DisplayName(), "acme.widget");
}

TEST(MethodRegistry, UptimeIsWholeSecondsSinceStart) {
    const auto start = MethodRegistry::Clock::now() - std::chrono::milliseconds(2500);
    MethodRegistry reg(configNamed("acme.widget"), start);
    const int64_t up = reg.UptimeSeconds();
    EXPECT_GE(up, 2);
    EXPECT_LE(up, 3);

    HealthCheckResult h = reg.Health();
    EXPECT_TRUE(h.healthy);
    EXPECT_GE(h.uptime, 2);

    JSONValue j = h.ToJSON();
    EXPECT_TRUE(testjson::boolean(j, "healthy"));
    EXPECT_GE(testjson::integer(j, "uptime"), 2);
}

TEST(MethodRegistry, UptimeNeverNegative) {
    const auto future = MethodRegistry::Clock::now() + std::chrono::hours(1);
    MethodRegistry reg(configNamed("acme.widget"), future);
    EXPECT_EQ(reg.UptimeSeconds(), 0);
}

TEST(MethodRegistry, FreshRegistryReportsZeroUptime) {
    MethodRegistry reg(configNamed("acme.widget"));
    EXPECT_EQ(reg.Health().uptime, 0);
}
