//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.cpp
// Purpose: Handler failure classification
//==========================================================================================================

#include "payload/errors/Errors.h"
#include "logging/Logger.h"

namespace payload {
namespace errors {

namespace {
std::string nonEmptyMessage(const char* what, const char* fallback) {
    if (what == nullptr || *what == '\0') {
        return fallback;
    }
    return what;
}
} // namespace

PayloadError ClassifyFailure(std::exception_ptr failure) {
    FUNC_SCOPE();
    if (!failure) {
        return makePayloadError(JSONRPCErrorCodes::InternalError, "Handler failed without an error");
    }
    try {
        std::rethrow_exception(failure);
    } catch (const PayloadException& e) {
        if (isProtocolReservedCode(e.code())) {
            LOG_WARN("Handler reported protocol-reserved code {} ({})", e.code(), e.what());
        }
        return makePayloadError(e.code(), nonEmptyMessage(e.what(), "Handler error"), e.data());
    } catch (const std::exception& e) {
        return makePayloadError(JSONRPCErrorCodes::ServerError, nonEmptyMessage(e.what(), "Handler error"));
    } catch (...) {
        LOG_WARN("Handler threw a non-standard exception");
        return makePayloadError(JSONRPCErrorCodes::ServerError, "Unknown handler failure");
    }
}

} // namespace errors
} // namespace payload
