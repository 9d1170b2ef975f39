//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Handshake.cpp
// Purpose: initialize request/result payloads for the capability-negotiation handshake
//==========================================================================================================

#include <stdexcept>

#include "mcpcore/Handshake.h"
#include "mcpcore/errors/Errors.h"

namespace mcpcore {

JSONValue BuildInitializeParams(const std::string& protocolVersion,
                                const Implementation& clientInfo,
                                const ClientCapabilities& capabilities) {
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(clientInfo.name);
    info["version"] = std::make_shared<JSONValue>(clientInfo.version);

    JSONValue::Object params;
    params["protocolVersion"] = std::make_shared<JSONValue>(protocolVersion);
    params["clientInfo"] = std::make_shared<JSONValue>(info);
    params["capabilities"] = std::make_shared<JSONValue>(ClientCapabilitiesToJSON(capabilities));
    return JSONValue{params};
}

InitializeResult ParseInitializeResult(const JSONValue& result) {
    if (!result.isObject()) {
        throw errors::HandshakeError("initialize result is not an object");
    }
    InitializeResult out;
    if (const JSONValue* info = FindMember(result, "serverInfo")) {
        if (!info->isObject()) {
            throw errors::HandshakeError("initialize result has a non-object serverInfo");
        }
        out.serverInfo.name = GetStringMember(*info, "name").value_or("");
        out.serverInfo.version = GetStringMember(*info, "version").value_or("");
        out.serverInfo.description = GetStringMember(*info, "description");
        out.serverInfo.protocolVersion = GetStringMember(*info, "protocolVersion").value_or("");
    }
    if (const JSONValue* caps = FindMember(result, "capabilities")) {
        out.capabilities = ServerCapabilitiesFromJSON(*caps);
    }
    return out;
}

JSONValue InitializeResultToJSON(const InitializeResult& result) {
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(result.serverInfo.name);
    info["version"] = std::make_shared<JSONValue>(result.serverInfo.version);
    if (result.serverInfo.description.has_value()) {
        info["description"] = std::make_shared<JSONValue>(result.serverInfo.description.value());
    }
    info["protocolVersion"] = std::make_shared<JSONValue>(result.serverInfo.protocolVersion);

    JSONValue::Object obj;
    obj["serverInfo"] = std::make_shared<JSONValue>(info);
    obj["capabilities"] = std::make_shared<JSONValue>(ServerCapabilitiesToJSON(result.capabilities));
    return JSONValue{obj};
}

InitializeRequest ParseInitializeParams(const JSONValue& params) {
    if (!params.isObject()) {
        throw std::invalid_argument("initialize params must be an object");
    }
    const JSONValue* info = FindMember(params, "clientInfo");
    if (!info || !info->isObject()) {
        throw std::invalid_argument("initialize params require a clientInfo object");
    }
    InitializeRequest req;
    req.protocolVersion = GetStringMember(params, "protocolVersion").value_or("");
    req.clientInfo.name = GetStringMember(*info, "name").value_or("");
    req.clientInfo.version = GetStringMember(*info, "version").value_or("");
    if (const JSONValue* caps = FindMember(params, "capabilities")) {
        req.capabilities = ClientCapabilitiesFromJSON(*caps);
    }
    return req;
}

} // namespace mcpcore
