//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handshake.h
// Purpose: initialize request/result payloads for the capability-negotiation handshake
//==========================================================================================================

#pragma once

#include <string>

#include "mcpcore/JSONRPCTypes.h"
#include "mcpcore/Protocol.h"

namespace mcpcore {

// Decoded initialize params, as seen by the responding side.
struct InitializeRequest {
    std::string protocolVersion;
    Implementation clientInfo;
    ClientCapabilities capabilities;
};

//==========================================================================================================
// BuildInitializeParams
// Purpose: { protocolVersion, clientInfo: {name, version}, capabilities: {...} }.
//==========================================================================================================
JSONValue BuildInitializeParams(const std::string& protocolVersion,
                                const Implementation& clientInfo,
                                const ClientCapabilities& capabilities);

//==========================================================================================================
// ParseInitializeResult
// Purpose: Reads { serverInfo: {name, version, description?, protocolVersion}, capabilities: {...} }.
// Notes:
//   Missing capability flags read as false. A missing serverInfo.protocolVersion reads as empty.
// Throws:
//   errors::HandshakeError when the result or its serverInfo is not an object.
//==========================================================================================================
InitializeResult ParseInitializeResult(const JSONValue& result);

// Inverse of ParseInitializeResult, for servers.
JSONValue InitializeResultToJSON(const InitializeResult& result);

// Inverse of BuildInitializeParams. Throws std::invalid_argument when params or clientInfo is not an object.
InitializeRequest ParseInitializeParams(const JSONValue& params);

} // namespace mcpcore
