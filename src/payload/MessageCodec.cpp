//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: Line decode/encode for the JSON-RPC wire
//==========================================================================================================

#include "payload/MessageCodec.h"
#include "logging/Logger.h"

namespace payload {
namespace codec {

JSONValue DecodeLine(const std::string& line) {
    FUNC_SCOPE();
    return ParseJSON(line);
}

std::string EncodeResponse(const JSONRPCResponse& response) {
    FUNC_SCOPE();
    std::string line;
    try {
        line = response.Serialize();
    } catch (const JSONSerializeError& e) {
        LOG_ERROR("MessageCodec: response not serializable ({}); answering InternalError", e.what());
        auto fallback = CreateErrorResponse(response.id, JSONRPCErrorCodes::InternalError,
                                            std::string("Internal error: ") + e.what());
        line = fallback->Serialize();
    }
    line.push_back(LineTerminator);
    return line;
}

} // namespace codec
} // namespace payload
