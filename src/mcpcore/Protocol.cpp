//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: JSON mapping for capability flags and tool descriptors
//==========================================================================================================

#include "mcpcore/Protocol.h"

namespace mcpcore {

namespace {
void putFlag(JSONValue::Object& obj, const char* key, bool v) {
    obj[key] = std::make_shared<JSONValue>(v);
}

bool readFlag(const JSONValue& value, const char* key) {
    return GetBoolMember(value, key).value_or(false);
}
} // namespace

JSONValue ClientCapabilitiesToJSON(const ClientCapabilities& caps) {
    JSONValue::Object obj;
    putFlag(obj, "supportsConfigurationChange", caps.supportsConfigurationChange);
    putFlag(obj, "supportsProgressReporting", caps.supportsProgressReporting);
    putFlag(obj, "supportsCancellation", caps.supportsCancellation);
    return JSONValue{obj};
}

ClientCapabilities ClientCapabilitiesFromJSON(const JSONValue& value) {
    ClientCapabilities caps;
    caps.supportsConfigurationChange = readFlag(value, "supportsConfigurationChange");
    caps.supportsProgressReporting = readFlag(value, "supportsProgressReporting");
    caps.supportsCancellation = readFlag(value, "supportsCancellation");
    return caps;
}

JSONValue ServerCapabilitiesToJSON(const ServerCapabilities& caps) {
    JSONValue::Object obj;
    putFlag(obj, "supportsConfigurationChange", caps.supportsConfigurationChange);
    putFlag(obj, "supportsProgressReporting", caps.supportsProgressReporting);
    putFlag(obj, "supportsCancellation", caps.supportsCancellation);
    putFlag(obj, "providesTools", caps.providesTools);
    putFlag(obj, "providesPrompts", caps.providesPrompts);
    putFlag(obj, "providesResources", caps.providesResources);
    return JSONValue{obj};
}

ServerCapabilities ServerCapabilitiesFromJSON(const JSONValue& value) {
    ServerCapabilities caps;
    caps.supportsConfigurationChange = readFlag(value, "supportsConfigurationChange");
    caps.supportsProgressReporting = readFlag(value, "supportsProgressReporting");
    caps.supportsCancellation = readFlag(value, "supportsCancellation");
    caps.providesTools = readFlag(value, "providesTools");
    caps.providesPrompts = readFlag(value, "providesPrompts");
    caps.providesResources = readFlag(value, "providesResources");
    return caps;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    obj["name"] = std::make_shared<JSONValue>(tool.name);
    if (!tool.description.empty()) {
        obj["description"] = std::make_shared<JSONValue>(tool.description);
    }
    obj["inputSchema"] = std::make_shared<JSONValue>(tool.inputSchema);
    if (tool.outputSchema.has_value()) {
        obj["outputSchema"] = std::make_shared<JSONValue>(tool.outputSchema.value());
    }
    return JSONValue{obj};
}

std::optional<Tool> ToolFromJSON(const JSONValue& value) {
    auto name = GetStringMember(value, "name");
    if (!name.has_value()) {
        return std::nullopt;
    }
    Tool tool;
    tool.name = name.value();
    tool.description = GetStringMember(value, "description").value_or("");
    if (const JSONValue* schema = FindMember(value, "inputSchema")) {
        tool.inputSchema = *schema;
    }
    if (const JSONValue* schema = FindMember(value, "outputSchema")) {
        tool.outputSchema = *schema;
    }
    return tool;
}

} // namespace mcpcore
