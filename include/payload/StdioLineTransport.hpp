//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioLineTransport.hpp
// Purpose: Concrete line transport over file descriptors (stdin/stdout by default)
//==========================================================================================================
#pragma once

#include "payload/LineTransport.h"
#include <memory>
#include <unistd.h>

namespace payload {

//==========================================================================================================
// StdioLineTransport
// Purpose: Reads '\n'-delimited lines from inFd and writes response lines to outFd.
// Notes:
//   - Reads wait on epoll with an eventfd so Close() can interrupt a blocked read. Descriptors epoll
//     refuses (regular files) are read with plain blocking reads.
//   - A line longer than maxLineBytes is dropped up to its newline and reported as oversized.
//   - The transport does not own or close the descriptors.
//==========================================================================================================
class StdioLineTransport : public ILineTransport {
public:
    explicit StdioLineTransport(int inFd = STDIN_FILENO, int outFd = STDOUT_FILENO,
                                std::size_t maxLineBytes = DefaultMaxLineBytes);
    virtual ~StdioLineTransport();

    StdioLineTransport(const StdioLineTransport&) = delete;
    StdioLineTransport& operator=(const StdioLineTransport&) = delete;

    ////////////////////////////////////////// ILineTransport //////////////////////////////////////////
    std::optional<InboundLine> ReadLine() override;
    void WriteLine(const std::string& line) override;
    void Close() override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace payload
