//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Json.h
// Purpose: Small builders and inspectors over JSONValue used by handlers and the runtime
//==========================================================================================================

#pragma once

#include <format>
#include <optional>
#include <string>
#include <vector>

#include "payload/JSONRPCTypes.h"

namespace payload {
namespace typed {

//------------------------------ Builders ------------------------------
inline void setMember(JSONValue::Object& obj, const std::string& key, JSONValue value) {
    obj[key] = std::make_shared<JSONValue>(std::move(value));
}

inline JSONValue makeString(const std::string& s) {
    return JSONValue(s);
}

inline JSONValue makeInt(int64_t v) {
    return JSONValue(v);
}

inline JSONValue makeStringArray(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    arr.reserve(items.size());
    for (const auto& s : items) {
        arr.push_back(std::make_shared<JSONValue>(s));
    }
    return JSONValue{arr};
}

//------------------------------ Inspectors ------------------------------
inline const JSONValue* findMember(const JSONValue& v, const std::string& key) {
    if (!v.IsObject()) return nullptr;
    const auto& o = std::get<JSONValue::Object>(v.value);
    auto it = o.find(key);
    if (it == o.end() || !it->second) return nullptr;
    return it->second.get();
}

inline std::optional<std::string> getString(const JSONValue& v, const std::string& key) {
    const JSONValue* m = findMember(v, key);
    if (!m || !m->IsString()) return std::nullopt;
    return std::get<std::string>(m->value);
}

inline std::optional<bool> getBool(const JSONValue& v, const std::string& key) {
    const JSONValue* m = findMember(v, key);
    if (!m || !std::holds_alternative<bool>(m->value)) return std::nullopt;
    return std::get<bool>(m->value);
}

inline bool isNumber(const JSONValue& v) {
    return std::holds_alternative<int64_t>(v.value) || std::holds_alternative<double>(v.value);
}

inline bool isArray(const JSONValue& v) {
    return std::holds_alternative<JSONValue::Array>(v.value);
}

// Loose truthiness used for optional config switches: false, 0, "", null and absent are off.
inline bool isTruthy(const JSONValue* v) {
    if (v == nullptr) return false;
    if (const auto* b = std::get_if<bool>(&v->value)) return *b;
    if (const auto* i = std::get_if<int64_t>(&v->value)) return *i != 0;
    if (const auto* d = std::get_if<double>(&v->value)) return *d != 0.0 && *d == *d;
    if (const auto* s = std::get_if<std::string>(&v->value)) return !s->empty();
    return !v->IsNull();
}

// Display text for a scalar the way a host renders it: strings bare, numbers shortest round-trip.
inline std::string toDisplayString(const JSONValue& v) {
    if (const auto* s = std::get_if<std::string>(&v.value)) return *s;
    if (const auto* i = std::get_if<int64_t>(&v.value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&v.value)) return std::format("{}", *d);
    if (const auto* b = std::get_if<bool>(&v.value)) return *b ? "true" : "false";
    if (v.IsNull()) return "null";
    return SerializeJSONValue(v);
}

} // namespace typed
} // namespace payload
