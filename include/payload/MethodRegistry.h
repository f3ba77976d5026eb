//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MethodRegistry.h
// Purpose: Immutable method table: runtime built-ins plus author handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "payload/PluginConfig.h"
#include "payload/Protocol.h"

namespace payload {

// Methods answered by the runtime itself.
enum class BuiltinMethod {
    GetMetadata,
    HealthCheck
};

// A registry entry is either a built-in or an author handler.
using RegistryEntry = std::variant<BuiltinMethod, MethodHandler>;

//==========================================================================================================
// MethodRegistry
// Purpose: Name -> entry table built once from the plugin config and never modified afterwards.
// Notes:
//   - Construction validates the descriptor and throws std::invalid_argument when payloadName is not a
//     namespaced identifier, when a handler is empty or unnamed, or when a handler uses a built-in name.
//   - Lookup is exact (no case folding or aliasing).
//   - The start time read by healthCheck is fixed at construction.
//==========================================================================================================
class MethodRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit MethodRegistry(PayloadPluginConfig config);
    MethodRegistry(PayloadPluginConfig config, Clock::time_point startTime);

    // Returns nullptr when name is not registered.
    const RegistryEntry* Find(const std::string& name) const;

    const JSONValue& Metadata() const { return metadata_; }
    const std::string& PayloadName() const { return payloadName_; }
    // displayName from the descriptor, or payloadName when absent.
    std::string DisplayName() const;

    Clock::time_point StartTime() const { return startTime_; }
    // Whole seconds since construction (floor).
    int64_t UptimeSeconds() const;
    HealthCheckResult Health() const;

    // All registered names, sorted.
    std::vector<std::string> MethodNames() const;

private:
    static std::string validateDescriptor(const JSONValue& metadata);

    JSONValue metadata_;
    std::string payloadName_;
    std::unordered_map<std::string, RegistryEntry> entries_;
    Clock::time_point startTime_;
};

} // namespace payload
