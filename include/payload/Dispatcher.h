//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Dispatcher.h
// Purpose: Turns one inbound line into exactly one response line
//==========================================================================================================

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>

#include "payload/JSONRPCTypes.h"
#include "payload/MethodRegistry.h"
#include "payload/errors/Errors.h"

namespace payload {

// Id used when no request could be decoded from a line.
constexpr int64_t FallbackResponseId = 0;

// Outcome of a single method invocation: a result or a classified failure.
using CallOutcome = std::variant<JSONValue, errors::PayloadError>;

//==========================================================================================================
// Dispatcher
// Purpose: Decode -> resolve -> invoke -> encode for one line at a time.
// Notes:
//   - Handler failures are classified (errors::ClassifyFailure) and never propagate.
//   - The handler's future is waited on before returning, so responses follow input order.
//   - The registry must outlive the dispatcher.
//==========================================================================================================
class Dispatcher {
public:
    explicit Dispatcher(const MethodRegistry& registry);

    //==========================================================================================================
    // HandleLine
    // Purpose: Full per-line path.
    // Args:
    //   line: One inbound line without its terminator.
    // Returns:
    //   Encoded response line, '\n'-terminated.
    //==========================================================================================================
    std::string HandleLine(const std::string& line);

    //==========================================================================================================
    // RejectOversizedLine
    // Purpose: Answer for a line dropped by the transport for exceeding the size cap (ParseError, fallback id).
    //==========================================================================================================
    std::string RejectOversizedLine(std::size_t discardedBytes);

    //==========================================================================================================
    // Dispatch
    // Purpose: Resolve and invoke a validated request; the response carries the request id.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> Dispatch(const JSONRPCRequest& request);

    //==========================================================================================================
    // Invoke
    // Purpose: Run one registry entry with params and wait for its outcome.
    //==========================================================================================================
    CallOutcome Invoke(const RegistryEntry& entry, const JSONValue& params);

private:
    const MethodRegistry& registry_;
};

} // namespace payload
