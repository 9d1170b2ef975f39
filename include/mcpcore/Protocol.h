//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method names and JSON mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "mcpcore/JSONRPCTypes.h"

namespace mcpcore {
//==========================================================================================================
// MCP Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-05-01";

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* TasksGet = "tasks/get";
    constexpr const char* TasksResult = "tasks/result";
    constexpr const char* TasksList = "tasks/list";
    constexpr const char* TasksCancel = "tasks/cancel";
    constexpr const char* Progress = "notifications/progress";
}

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
// Flags the client advertises during initialize. Immutable once the handshake has run.
struct ClientCapabilities {
    bool supportsConfigurationChange{true};
    bool supportsProgressReporting{true};
    bool supportsCancellation{true};
};

// Flags the server returned. Flags the server omitted read as false.
struct ServerCapabilities {
    bool supportsConfigurationChange{false};
    bool supportsProgressReporting{false};
    bool supportsCancellation{false};
    bool providesTools{false};
    bool providesPrompts{false};
    bool providesResources{false};
};

struct ServerInfo {
    std::string name;
    std::string version;
    std::optional<std::string> description;
    std::string protocolVersion;
};

struct InitializeResult {
    ServerInfo serverInfo;
    ServerCapabilities capabilities;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;
    std::optional<JSONValue> outputSchema;
};

//==========================================================================================================
// ToolCallResult
// Purpose: tools/call result after the tolerance layer has inspected it.
// Fields:
//   isError: Any recognized error shape matched.
//   errorMessage: Best message for the error; set only when isError.
//   content: The "content" member (string, object or array of {type,text}); null when absent.
//   text: Text extracted from content.
//   raw: The untouched result.
//==========================================================================================================
struct ToolCallResult {
    bool isError{false};
    std::optional<std::string> errorMessage;
    JSONValue content;
    std::string text;
    JSONValue raw;
};

////////////////////////////////////////// JSON mapping //////////////////////////////////////////
JSONValue ClientCapabilitiesToJSON(const ClientCapabilities& caps);
ClientCapabilities ClientCapabilitiesFromJSON(const JSONValue& value);
JSONValue ServerCapabilitiesToJSON(const ServerCapabilities& caps);
ServerCapabilities ServerCapabilitiesFromJSON(const JSONValue& value);

JSONValue ToolToJSON(const Tool& tool);

// nullopt when value is not an object with a string "name".
std::optional<Tool> ToolFromJSON(const JSONValue& value);

} // namespace mcpcore
