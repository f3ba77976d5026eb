//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryLineTransport.hpp
// Purpose: In-memory line transport for tests and embedding
//==========================================================================================================
#pragma once

#include "payload/LineTransport.h"
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace payload {

//==========================================================================================================
// InMemoryLineTransport
// Purpose: Scripted input and captured output without any file descriptors.
// Notes:
//   ReadLine blocks until a line is pushed, EndInput() is called, or Close() is called.
//==========================================================================================================
class InMemoryLineTransport : public ILineTransport {
public:
    InMemoryLineTransport();
    // Pre-loads lines and ends input after them.
    explicit InMemoryLineTransport(std::vector<std::string> lines);
    virtual ~InMemoryLineTransport();

    // Feed side
    void PushLine(std::string line);
    void PushOversized(std::size_t discardedBytes);
    void EndInput();

    // Output side: every line written so far, terminators included.
    std::vector<std::string> Written() const;
    // Waits until at least count lines were written; false on timeout.
    bool WaitForWrites(std::size_t count, std::chrono::milliseconds timeout) const;

    ////////////////////////////////////////// ILineTransport //////////////////////////////////////////
    std::optional<InboundLine> ReadLine() override;
    void WriteLine(const std::string& line) override;
    void Close() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace payload
