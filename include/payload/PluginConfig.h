//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PluginConfig.h
// Purpose: What a plugin author supplies: descriptor plus named handlers
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <string>
#include <unordered_map>

#include "payload/JSONRPCTypes.h"

namespace payload {

//==========================================================================================================
// MethodHandler
// Purpose: Asynchronous handler of one argument (the request params, an object unless the caller sent
//          something else). Fulfil the future with a JSON result, or fail it (or throw) to report an error.
//==========================================================================================================
using MethodHandler = std::function<std::future<JSONValue>(const JSONValue& params)>;

//==========================================================================================================
// PayloadPluginConfig
// Purpose: Plugin descriptor and handler map.
// Fields:
//   metadata: Descriptor returned verbatim by getMetadata; must carry a namespaced "payloadName".
//   handlers: Author methods keyed by exact wire name. Built-in names may not be used.
//==========================================================================================================
struct PayloadPluginConfig {
    JSONValue metadata;
    std::unordered_map<std::string, MethodHandler> handlers;
};

//==========================================================================================================
// MakeHandler
// Purpose: Adapts a coroutine (or anything returning async::Task<JSONValue>) into a MethodHandler.
//==========================================================================================================
template <typename Fn>
MethodHandler MakeHandler(Fn fn) {
    return [fn = std::move(fn)](const JSONValue& params) { return fn(params).toFuture(); };
}

} // namespace payload
