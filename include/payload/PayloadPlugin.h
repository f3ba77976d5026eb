//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PayloadPlugin.h
// Purpose: Plugin process lifecycle: ready notice, read loop, end-of-input and signal shutdown
//==========================================================================================================

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "payload/Dispatcher.h"
#include "payload/LineTransport.h"
#include "payload/MethodRegistry.h"
#include "payload/PluginConfig.h"

namespace payload {

enum class LifecycleState {
    Starting,
    Ready,
    ShuttingDown,
    Stopped
};

const char* ToString(LifecycleState state);

//==========================================================================================================
// PayloadPlugin
// Purpose: One plugin instance. Owns the method registry (and so the start time) and the dispatcher, and
//          runs the one-line-in, one-line-out loop over a transport.
// Notes:
//   - Construction validates the descriptor and throws std::invalid_argument before any input is read.
//   - Run() returns 0 when input ends, 1 when the transport fails.
//   - OnTerminationSignal() logs the shutdown notice and calls the exit function right away; in-flight
//     work is not drained. The default exit function is std::_Exit.
//==========================================================================================================
class PayloadPlugin {
public:
    using ExitFunction = std::function<void(int exitCode)>;

    explicit PayloadPlugin(PayloadPluginConfig config);

    PayloadPlugin(const PayloadPlugin&) = delete;
    PayloadPlugin& operator=(const PayloadPlugin&) = delete;

    //==========================================================================================================
    // Run
    // Purpose: Ready notice, then read/dispatch/write until end of input. Leaving the loop passes through
    //          ShuttingDown, closes the transport, and ends in Stopped.
    // Args:
    //   transport: Line source and sink; must outlive the call.
    // Returns:
    //   Process exit code.
    //==========================================================================================================
    int Run(ILineTransport& transport);

    //==========================================================================================================
    // OnTerminationSignal
    // Purpose: Terminal path for SIGTERM/SIGINT. Safe to call from the signal watcher thread.
    //==========================================================================================================
    void OnTerminationSignal(int signo);

    // Replaces the exit path taken on a termination signal (tests).
    void SetExitFunction(ExitFunction fn);

    LifecycleState State() const { return state_.load(); }
    const MethodRegistry& Registry() const { return registry_; }

private:
    void processLine(const InboundLine& line, ILineTransport& transport);

    MethodRegistry registry_;
    Dispatcher dispatcher_;
    std::atomic<LifecycleState> state_{LifecycleState::Starting};
    ExitFunction exitFunction_;
};

} // namespace payload
