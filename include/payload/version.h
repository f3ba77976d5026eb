//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: version.h
// Purpose: Public version API for the payload plugin SDK (semantic version helpers).
//==========================================================================================================
#pragma once

#include <string>

namespace payload {

//==========================================================================================================
// VersionInfo
// Purpose: Semantic version components.
//==========================================================================================================
struct VersionInfo {
    int major;
    int minor;
    int patch;
};

//==========================================================================================================
// getVersion / getVersionString
// Purpose: SDK semantic version, as components or as "MAJOR.MINOR.PATCH". Independent of the wire
//          protocol version (PROTOCOL_VERSION in Protocol.h).
//==========================================================================================================
VersionInfo getVersion();
std::string getVersionString();

} // namespace payload
