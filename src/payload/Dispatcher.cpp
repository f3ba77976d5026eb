//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.cpp
// Purpose: Per-line request resolution, invocation and failure classification
//==========================================================================================================

#include <chrono>
#include <format>
#include <future>
#include <type_traits>

#include "logging/Logger.h"
#include "payload/Dispatcher.h"
#include "payload/MessageCodec.h"

namespace payload {

namespace {
std::string describeId(const JSONRPCId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) {
        return "\"" + *s + "\"";
    }
    if (const auto* n = std::get_if<int64_t>(&id)) {
        return std::to_string(*n);
    }
    if (const auto* d = std::get_if<double>(&id)) {
        return std::format("{}", *d);
    }
    return "null";
}
} // namespace

Dispatcher::Dispatcher(const MethodRegistry& registry) : registry_(registry) {}

std::string Dispatcher::HandleLine(const std::string& line) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = codec::DecodeLine(line);
    } catch (const JSONParseError& e) {
        LOG_DEBUG("Dispatcher: parse error ({})", e.what());
        auto resp = CreateErrorResponse(FallbackResponseId, JSONRPCErrorCodes::ParseError, "Parse error");
        return codec::EncodeResponse(*resp);
    }

    JSONRPCRequest request;
    std::string reason;
    if (!RequestFromJSON(doc, request, reason)) {
        LOG_DEBUG("Dispatcher: invalid request id={} ({})", describeId(request.id), reason);
        auto resp = CreateErrorResponse(request.id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request: " + reason);
        return codec::EncodeResponse(*resp);
    }

    auto resp = Dispatch(request);
    return codec::EncodeResponse(*resp);
}

std::string Dispatcher::RejectOversizedLine(std::size_t discardedBytes) {
    LOG_WARN("Dispatcher: discarded oversized line ({} bytes)", discardedBytes);
    auto resp = CreateErrorResponse(FallbackResponseId, JSONRPCErrorCodes::ParseError, "Parse error",
                                    JSONValue(std::string("Line exceeds maximum length")));
    return codec::EncodeResponse(*resp);
}

std::unique_ptr<JSONRPCResponse> Dispatcher::Dispatch(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    const RegistryEntry* entry = registry_.Find(request.method);
    if (entry == nullptr) {
        LOG_DEBUG("Dispatcher: method not found '{}'", request.method);
        return CreateErrorResponse(request.id, JSONRPCErrorCodes::MethodNotFound,
                                   "Method not found: " + request.method);
    }

    const JSONValue params = request.params.value_or(JSONValue(JSONValue::Object{}));
    const auto started = std::chrono::steady_clock::now();
    CallOutcome outcome = Invoke(*entry, params);
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    if (auto* err = std::get_if<errors::PayloadError>(&outcome)) {
        LOG_DEBUG("Dispatcher: {} id={} failed code={} in {} ms: {}", request.method, describeId(request.id),
                  err->code, static_cast<long long>(elapsedMs), err->message);
        return errors::makeErrorResponse(request.id, *err);
    }
    LOG_DEBUG("Dispatcher: {} id={} ok in {} ms", request.method, describeId(request.id),
              static_cast<long long>(elapsedMs));
    return std::make_unique<JSONRPCResponse>(request.id, std::move(std::get<JSONValue>(outcome)));
}

CallOutcome Dispatcher::Invoke(const RegistryEntry& entry, const JSONValue& params) {
    return std::visit([this, &params](const auto& target) -> CallOutcome {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, BuiltinMethod>) {
            switch (target) {
                case BuiltinMethod::GetMetadata:
                    return registry_.Metadata();
                case BuiltinMethod::HealthCheck:
                    return registry_.Health().ToJSON();
            }
            return errors::makePayloadError(JSONRPCErrorCodes::InternalError, "Unknown built-in method");
        } else {
            try {
                std::future<JSONValue> pending = target(params);
                if (!pending.valid()) {
                    return errors::makePayloadError(JSONRPCErrorCodes::InternalError, "Null response from handler");
                }
                return pending.get();
            } catch (...) {
                return errors::ClassifyFailure(std::current_exception());
            }
        }
    }, entry);
}

} // namespace payload
