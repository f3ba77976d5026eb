//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error records, handler-facing exceptions and failure classification for payload plugins
//==========================================================================================================

#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include "payload/JSONRPCTypes.h"

namespace payload {
namespace errors {

// Categorization of the wire error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Server,
    Application,
};

// Typed error representation: the outcome record of a failed call.
struct PayloadError {
    int code{JSONRPCErrorCodes::ServerError};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Server};
};

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory for the protocol codes; Application for anything a handler chose itself.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::ServerError: return ErrorCategory::Server;
        default: return ErrorCategory::Application;
    }
}

// True for the codes the substrate itself emits for framing and routing faults.
inline bool isProtocolReservedCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError:
        case JSONRPCErrorCodes::InvalidRequest:
        case JSONRPCErrorCodes::MethodNotFound:
        case JSONRPCErrorCodes::InternalError:
            return true;
        default:
            return false;
    }
}

inline PayloadError makePayloadError(int code, std::string message,
                                     std::optional<JSONValue> data = std::nullopt) {
    PayloadError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

//==========================================================================================================
// PayloadException
// Purpose: Thrown by handlers to report a failure with an explicit wire code (and optional data).
//          Anything else a handler throws is classified as ServerError.
//==========================================================================================================
class PayloadException : public std::runtime_error {
public:
    PayloadException(int code, const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const noexcept { return code_; }
    const std::optional<JSONValue>& data() const noexcept { return data_; }

private:
    int code_;
    std::optional<JSONValue> data_;
};

// Shorthand for the parameter validation failure handlers report most often.
class InvalidParamsError : public PayloadException {
public:
    explicit InvalidParamsError(const std::string& message, std::optional<JSONValue> data = std::nullopt)
        : PayloadException(JSONRPCErrorCodes::InvalidParams, message, std::move(data)) {}
};

//==========================================================================================================
// TransportError / ConfigError
// Purpose: Faults of the line transport and of startup configuration. Never reach the wire.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// ClassifyFailure
// Purpose: Maps a failed handler invocation to its outcome record.
// Rules:
//   PayloadException     -> its own code, message and data (protocol-reserved codes are kept but logged)
//   other std::exception -> ServerError with what()
//   anything else        -> ServerError "Unknown handler failure"
// An empty message is replaced so the wire message is never empty.
//==========================================================================================================
PayloadError ClassifyFailure(std::exception_ptr failure);

// Create a JSONValue error object from a typed PayloadError.
inline JSONValue makeErrorValue(const PayloadError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from PayloadError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const PayloadError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to PayloadError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<PayloadError> payloadErrorFromErrorValue(const JSONValue& errVal) {
    if (!errVal.IsObject()) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end() || !itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) || !itMsg->second->IsString()) {
        return std::nullopt;
    }
    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }
    return makePayloadError(static_cast<int>(std::get<int64_t>(itCode->second->value)),
                            std::get<std::string>(itMsg->second->value), std::move(data));
}

} // namespace errors
} // namespace payload
