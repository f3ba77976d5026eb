//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineTransport.h
// Purpose: Line-oriented transport interface the plugin runtime reads requests from and writes responses to
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace payload {

// Default cap on one inbound line (terminator excluded).
constexpr std::size_t DefaultMaxLineBytes = 16u * 1024u * 1024u;

//==========================================================================================================
// InboundLine
// Purpose: One line read from the transport.
// Fields:
//   text: Line content without its '\n' (and without a trailing '\r').
//   discardedBytes: Non-zero when the line exceeded the size cap; text is then empty.
//==========================================================================================================
struct InboundLine {
    std::string text;
    std::size_t discardedBytes{0};

    bool Oversized() const { return discardedBytes > 0; }
};

//==========================================================================================================
// ILineTransport
// Purpose: Transport interface definitions.
//==========================================================================================================
class ILineTransport {
public:
    virtual ~ILineTransport() = default;

    //==========================================================================================================
    // Blocks until one line is available.
    // Returns:
    //   The line, or std::nullopt at end of stream or after Close(). A final unterminated line is still
    //   returned. Throws errors::TransportError on I/O failure.
    //==========================================================================================================
    virtual std::optional<InboundLine> ReadLine() = 0;

    //==========================================================================================================
    // Writes one already-terminated line in full. Throws errors::TransportError on I/O failure.
    //==========================================================================================================
    virtual void WriteLine(const std::string& line) = 0;

    //==========================================================================================================
    // Unblocks a pending ReadLine and makes later reads report end of stream. Safe from any thread.
    //==========================================================================================================
    virtual void Close() = 0;
};

} // namespace payload
