//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: payload-rpc-host: loads a plugin module and serves it as JSON-RPC over stdin/stdout
//==========================================================================================================

#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <system_error>

#include "logging/Logger.h"
#include "payload/PayloadPlugin.h"
#include "payload/PluginLoader.hpp"
#include "payload/RuntimeConfig.h"
#include "payload/SignalWatcher.hpp"
#include "payload/StdioLineTransport.hpp"
#include "payload/errors/Errors.h"
#include "payload/version.h"

using namespace payload;

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::configureFromEnvironment();

    const std::string program = (argc > 0 && argv[0] != nullptr) ? argv[0] : "payload-rpc-host";
    RuntimeConfig cfg;
    try {
        cfg = ParseRuntimeConfig(argc, argv);
    } catch (const errors::ConfigError& e) {
        std::cerr << e.what() << "\n" << RuntimeUsage(program) << std::endl;
        return 1;
    }
    if (cfg.logLevel.has_value()) {
        Logger::setLogLevelFromString(cfg.logLevel.value());
    }
    LOG_DEBUG("payload-rpc-host {} (protocol {}) entry={} maxLineBytes={}",
              getVersionString(), PROTOCOL_VERSION, cfg.entryPath, cfg.maxLineBytes);

    // A closed stdout must surface as EPIPE on write, not kill the process
    if (std::signal(SIGPIPE, SIG_IGN) == SIG_ERR) {
        LOG_WARN("Cannot ignore SIGPIPE; a closed stdout will terminate the process");
    }

    // Declared before the plugin: handlers run code inside the loaded module
    PluginLoader loader;
    std::unique_ptr<PayloadPlugin> plugin;
    try {
        plugin = std::make_unique<PayloadPlugin>(loader.Load(cfg.entryPath));
    } catch (const errors::ConfigError& e) {
        LOG_ERROR("{}", e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid plugin descriptor: {}", e.what());
        return 1;
    }

    StdioLineTransport transport(STDIN_FILENO, STDOUT_FILENO, cfg.maxLineBytes);
    SignalWatcher watcher([&plugin](int signo) { plugin->OnTerminationSignal(signo); });
    try {
        watcher.Start();
    } catch (const std::system_error& e) {
        LOG_ERROR("Cannot watch termination signals: {}", e.what());
        return 1;
    }

    const int rc = plugin->Run(transport);
    watcher.Stop();
    return rc;
}
