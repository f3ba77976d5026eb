//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RuntimeConfig.cpp
// Purpose: Command line and environment parsing for the host executable
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "payload/RuntimeConfig.h"
#include "payload/errors/Errors.h"

namespace payload {

namespace {
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        const char* arg = argv[i];
        if (arg == nullptr) {
            continue;
        }
        std::string a = arg;
        std::size_t eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

static std::size_t parseSize(const std::string& what, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                      [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw errors::ConfigError(what + " must be a positive integer (got '" + value + "')");
    }
    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw errors::ConfigError(what + " is out of range (got '" + value + "')");
    }
    if (v == 0) {
        throw errors::ConfigError(what + " must be a positive integer (got '" + value + "')");
    }
    return static_cast<std::size_t>(v);
}
} // namespace

RuntimeConfig ParseRuntimeConfig(int argc, char** argv) {
    FUNC_SCOPE();
    RuntimeConfig cfg;

    for (std::size_t i = 1; i < static_cast<std::size_t>(argc); ++i) {
        if (argv[i] == nullptr) {
            continue;
        }
        const std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            const std::string key = a.substr(0, a.find('='));
            if (key != "--log-level" && key != "--max-line-bytes") {
                throw errors::ConfigError("Unknown option '" + a + "'");
            }
            if (a.find('=') == std::string::npos) {
                throw errors::ConfigError("Option '" + a + "' requires a value (" + a + "=VALUE)");
            }
        } else if (cfg.entryPath.empty()) {
            cfg.entryPath = a;
        } else {
            throw errors::ConfigError("Unexpected argument '" + a + "'");
        }
    }
    if (cfg.entryPath.empty()) {
        throw errors::ConfigError("Missing plugin entry path");
    }

    if (auto lvl = getArgValue(argc, argv, "--log-level"); lvl.has_value()) {
        if (!Logger::tryLevelFromString(lvl.value()).has_value()) {
            throw errors::ConfigError("Unknown log level '" + lvl.value() + "'");
        }
        cfg.logLevel = lvl;
    }

    const std::string envMax = GetEnvOrDefault("PAYLOAD_MAX_LINE_BYTES", "");
    if (!envMax.empty()) {
        cfg.maxLineBytes = parseSize("PAYLOAD_MAX_LINE_BYTES", envMax);
    }
    if (auto v = getArgValue(argc, argv, "--max-line-bytes"); v.has_value()) {
        cfg.maxLineBytes = parseSize("--max-line-bytes", v.value());
    }
    return cfg;
}

std::string RuntimeUsage(const std::string& program) {
    return "Usage: " + program + " <plugin-entry> [--log-level=LEVEL] [--max-line-bytes=N]";
}

} // namespace payload
