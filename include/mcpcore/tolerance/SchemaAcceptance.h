//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaAcceptance.h
// Purpose: Lenient acceptance of tool input schemas during discovery
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "mcpcore/JSONRPCTypes.h"

class Logger;

namespace mcpcore {
namespace tolerance {

struct SchemaVerdict {
    bool accepted{false};
    std::vector<std::string> warnings;
};

//==========================================================================================================
// EvaluateSchema
// Purpose: Rejects a schema only when it is absent (null pointer or JSON null) or cannot be serialized.
//          Structural oddities are collected as warnings and the schema is still accepted:
//            - the schema is not an object
//            - "type" is neither a string nor an array
//            - "properties" is not an object
// Notes:
//   Warnings are logged at WARN, a serialization failure at ERROR.
//==========================================================================================================
SchemaVerdict EvaluateSchema(const JSONValue* schema, const std::shared_ptr<Logger>& logger);

inline bool ShouldAcceptSchema(const JSONValue* schema, const std::shared_ptr<Logger>& logger) {
    return EvaluateSchema(schema, logger).accepted;
}

// DEBUG dump of the schema plus any $defs, $ref, definitions, oneOf and anyOf it carries.
void LogSchemaForDebugging(const std::string& toolName, const JSONValue& schema, const std::shared_ptr<Logger>& logger);

} // namespace tolerance
} // namespace mcpcore
