//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryLineTransport.cpp
// Purpose: In-memory line transport implementation
//==========================================================================================================

#include <condition_variable>
#include <deque>
#include <mutex>

#include "logging/Logger.h"
#include "payload/InMemoryLineTransport.hpp"
#include "payload/errors/Errors.h"

namespace payload {

class InMemoryLineTransport::Impl {
public:
    mutable std::mutex mutex;
    mutable std::condition_variable cvIn;
    mutable std::condition_variable cvOut;
    std::deque<InboundLine> pending;
    std::vector<std::string> written;
    bool inputEnded{false};
    bool closed{false};
};

InMemoryLineTransport::InMemoryLineTransport() : pImpl(std::make_unique<Impl>()) {}

InMemoryLineTransport::InMemoryLineTransport(std::vector<std::string> lines) : InMemoryLineTransport() {
    for (auto& l : lines) {
        pImpl->pending.push_back(InboundLine{std::move(l), 0});
    }
    pImpl->inputEnded = true;
}

InMemoryLineTransport::~InMemoryLineTransport() = default;

void InMemoryLineTransport::PushLine(std::string line) {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->pending.push_back(InboundLine{std::move(line), 0});
    }
    pImpl->cvIn.notify_all();
}

void InMemoryLineTransport::PushOversized(std::size_t discardedBytes) {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->pending.push_back(InboundLine{std::string(), discardedBytes});
    }
    pImpl->cvIn.notify_all();
}

void InMemoryLineTransport::EndInput() {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->inputEnded = true;
    }
    pImpl->cvIn.notify_all();
}

std::vector<std::string> InMemoryLineTransport::Written() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->written;
}

bool InMemoryLineTransport::WaitForWrites(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(pImpl->mutex);
    return pImpl->cvOut.wait_for(lk, timeout, [this, count]() { return pImpl->written.size() >= count; });
}

std::optional<InboundLine> InMemoryLineTransport::ReadLine() {
    std::unique_lock<std::mutex> lk(pImpl->mutex);
    pImpl->cvIn.wait(lk, [this]() { return pImpl->closed || pImpl->inputEnded || !pImpl->pending.empty(); });
    if (pImpl->closed || pImpl->pending.empty()) {
        return std::nullopt;
    }
    InboundLine line = std::move(pImpl->pending.front());
    pImpl->pending.pop_front();
    return line;
}

void InMemoryLineTransport::WriteLine(const std::string& line) {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->closed) {
            throw errors::TransportError("InMemoryLineTransport: write after close");
        }
        pImpl->written.push_back(line);
    }
    pImpl->cvOut.notify_all();
}

void InMemoryLineTransport::Close() {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->closed = true;
    }
    LOG_DEBUG("InMemoryLineTransport: closed");
    pImpl->cvIn.notify_all();
}

} // namespace payload
