//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRegistry.cpp
// Purpose: Method table construction, descriptor validation and health data
//==========================================================================================================

#include <algorithm>
#include <stdexcept>

#include "payload/MethodRegistry.h"
#include "payload/typed/Json.h"
#include "logging/Logger.h"

namespace payload {

MethodRegistry::MethodRegistry(PayloadPluginConfig config)
    : MethodRegistry(std::move(config), Clock::now()) {}

MethodRegistry::MethodRegistry(PayloadPluginConfig config, Clock::time_point startTime)
    : startTime_(startTime) {
    FUNC_SCOPE();
    payloadName_ = validateDescriptor(config.metadata);
    metadata_ = std::move(config.metadata);

    entries_.emplace(Methods::GetMetadata, BuiltinMethod::GetMetadata);
    entries_.emplace(Methods::HealthCheck, BuiltinMethod::HealthCheck);

    for (auto& [name, handler] : config.handlers) {
        if (name.empty()) {
            throw std::invalid_argument("Plugin '" + payloadName_ + "' registers a handler with an empty name");
        }
        if (!handler) {
            throw std::invalid_argument("Plugin '" + payloadName_ + "' registers an empty handler for '" + name + "'");
        }
        if (entries_.count(name) != 0) {
            throw std::invalid_argument("Plugin '" + payloadName_ + "' handler '" + name +
                                        "' would shadow a built-in method");
        }
        entries_.emplace(name, std::move(handler));
    }
    LOG_DEBUG("MethodRegistry: {} registered {} methods", payloadName_, entries_.size());
}

std::string MethodRegistry::validateDescriptor(const JSONValue& metadata) {
    if (!metadata.IsObject()) {
        throw std::invalid_argument("Plugin metadata must be a JSON object");
    }
    auto name = typed::getString(metadata, "payloadName");
    const std::string shown = name.value_or("");
    if (!name.has_value() || !IsPluginPayloadName(shown)) {
        throw std::invalid_argument("payloadName '" + shown +
                                    "' must be namespaced dot-notation (e.g. 'junctionrelay.jr-protocol')");
    }
    return shown;
}

const RegistryEntry* MethodRegistry::Find(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string MethodRegistry::DisplayName() const {
    auto display = typed::getString(metadata_, "displayName");
    if (display.has_value() && !display->empty()) {
        return display.value();
    }
    return payloadName_;
}

int64_t MethodRegistry::UptimeSeconds() const {
    auto elapsed = Clock::now() - startTime_;
    if (elapsed.count() < 0) {
        return 0;
    }
    return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
}

HealthCheckResult MethodRegistry::Health() const {
    HealthCheckResult r;
    r.healthy = true;
    r.uptime = UptimeSeconds();
    return r;
}

std::vector<std::string> MethodRegistry::MethodNames() const {
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace payload
