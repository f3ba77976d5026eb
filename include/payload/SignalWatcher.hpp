//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SignalWatcher.hpp
// Purpose: Delivers SIGTERM/SIGINT to a callback on a dedicated thread
//==========================================================================================================
#pragma once

#include <functional>
#include <memory>
#include <string>

namespace payload {

//==========================================================================================================
// SignalWatcher
// Purpose: Installs SIGTERM and SIGINT handlers that only wake a watcher thread (through an eventfd);
//          the watcher thread then runs the callback once, outside signal context.
// Notes:
//   - At most one watcher may be started per process at a time.
//   - Stop() (also run by the destructor) restores the previous dispositions and joins the thread.
//==========================================================================================================
class SignalWatcher {
public:
    using Callback = std::function<void(int signo)>;

    explicit SignalWatcher(Callback callback);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Throws std::system_error when the handlers or the watcher thread cannot be set up.
    void Start();
    void Stop();

    // "SIGTERM", "SIGINT" or "signal N".
    static std::string SignalName(int signo);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace payload
