//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: One JSON-RPC envelope per newline-terminated line
//==========================================================================================================

#pragma once

#include <string>

#include "payload/JSONRPCTypes.h"

namespace payload {
namespace codec {

// Line terminator of the wire format.
constexpr char LineTerminator = '\n';

//==========================================================================================================
// DecodeLine
// Purpose: Parses one line (without its terminator) as a single JSON document. Envelope fields are not
//          checked here; see RequestFromJSON.
// Returns:
//   The parsed document; throws JSONParseError when the line is not exactly one valid document.
//==========================================================================================================
JSONValue DecodeLine(const std::string& line);

//==========================================================================================================
// EncodeResponse
// Purpose: Compact serialization of a response followed by exactly one '\n'.
// Notes:
//   When the result or error data cannot be represented in JSON, an InternalError response for the
//   same id is encoded instead; the failure is logged.
//==========================================================================================================
std::string EncodeResponse(const JSONRPCResponse& response);

} // namespace codec
} // namespace payload
