//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: RuntimeConfig.h
// Purpose: Host process configuration from the command line and PAYLOAD_* environment variables
//==========================================================================================================

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "payload/LineTransport.h"

namespace payload {

//==========================================================================================================
// RuntimeConfig
// Purpose: Settings of one payload-rpc-host process.
// Fields:
//   entryPath: Plugin module to load (first positional argument).
//   logLevel: --log-level=LEVEL; unset leaves the PAYLOAD_LOG_LEVEL choice in place.
//   maxLineBytes: --max-line-bytes=N, else PAYLOAD_MAX_LINE_BYTES, else DefaultMaxLineBytes.
//==========================================================================================================
struct RuntimeConfig {
    std::string entryPath;
    std::optional<std::string> logLevel;
    std::size_t maxLineBytes{DefaultMaxLineBytes};
};

//==========================================================================================================
// ParseRuntimeConfig
// Purpose: Builds the configuration; command-line options win over the environment.
// Returns:
//   RuntimeConfig; throws errors::ConfigError for a missing entry path, an unknown option, a bad log level
//   or a non-positive/non-numeric size.
//==========================================================================================================
RuntimeConfig ParseRuntimeConfig(int argc, char** argv);

// One-line usage text for the host executable.
std::string RuntimeUsage(const std::string& program);

} // namespace payload
