//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PayloadPlugin.cpp
// Purpose: Plugin process lifecycle implementation
//==========================================================================================================

#include <cstdlib>
#include <iostream>

#include "logging/Logger.h"
#include "payload/MessageCodec.h"
#include "payload/PayloadPlugin.h"
#include "payload/SignalWatcher.hpp"
#include "payload/errors/Errors.h"

namespace payload {

const char* ToString(LifecycleState state) {
    switch (state) {
        case LifecycleState::Starting: return "Starting";
        case LifecycleState::Ready: return "Ready";
        case LifecycleState::ShuttingDown: return "ShuttingDown";
        case LifecycleState::Stopped: return "Stopped";
    }
    return "Unknown";
}

PayloadPlugin::PayloadPlugin(PayloadPluginConfig config)
    : registry_(std::move(config)),
      dispatcher_(registry_),
      exitFunction_([](int code) {
          std::cerr.flush();
          std::_Exit(code);
      }) {
    FUNC_SCOPE();
}

void PayloadPlugin::SetExitFunction(ExitFunction fn) {
    exitFunction_ = std::move(fn);
}

int PayloadPlugin::Run(ILineTransport& transport) {
    FUNC_SCOPE();
    LifecycleState expected = LifecycleState::Starting;
    if (!state_.compare_exchange_strong(expected, LifecycleState::Ready)) {
        LOG_ERROR("PayloadPlugin: Run() called in state {}", ToString(expected));
        return 1;
    }
    LOG_INFO("{} ready", registry_.DisplayName());

    int exitCode = 0;
    while (state_.load() == LifecycleState::Ready) {
        std::optional<InboundLine> line;
        try {
            line = transport.ReadLine();
        } catch (const errors::TransportError& e) {
            LOG_ERROR("PayloadPlugin: input failed: {}", e.what());
            exitCode = 1;
            break;
        }
        if (!line.has_value()) {
            LifecycleState ready = LifecycleState::Ready;
            if (state_.compare_exchange_strong(ready, LifecycleState::ShuttingDown)) {
                LOG_INFO("stdin closed, shutting down");
            }
            break;
        }
        try {
            processLine(line.value(), transport);
        } catch (const errors::TransportError& e) {
            LOG_ERROR("PayloadPlugin: output failed: {}", e.what());
            exitCode = 1;
            break;
        }
    }
    state_.store(LifecycleState::ShuttingDown);
    transport.Close();
    state_.store(LifecycleState::Stopped);
    return exitCode;
}

void PayloadPlugin::processLine(const InboundLine& line, ILineTransport& transport) {
    std::string out;
    try {
        out = line.Oversized() ? dispatcher_.RejectOversizedLine(line.discardedBytes)
                               : dispatcher_.HandleLine(line.text);
    } catch (const std::exception& e) {
        // Still answer so every input line gets exactly one response
        LOG_ERROR("Unhandled error: {}", e.what());
        auto resp = CreateErrorResponse(FallbackResponseId, JSONRPCErrorCodes::InternalError, "Internal error");
        out = codec::EncodeResponse(*resp);
    }
    transport.WriteLine(out);
}

void PayloadPlugin::OnTerminationSignal(int signo) {
    state_.store(LifecycleState::ShuttingDown);
    LOG_INFO("{} received, shutting down", SignalWatcher::SignalName(signo));
    if (exitFunction_) {
        exitFunction_(0);
    }
}

} // namespace payload
