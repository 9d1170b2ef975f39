//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaAcceptance.cpp
// Purpose: Lenient acceptance of tool input schemas during discovery
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpcore/errors/Errors.h"
#include "mcpcore/tolerance/SchemaAcceptance.h"

namespace mcpcore {
namespace tolerance {

SchemaVerdict EvaluateSchema(const JSONValue* schema, const std::shared_ptr<Logger>& logger) {
    SchemaVerdict verdict;
    if (schema == nullptr || schema->isNull()) {
        LOG_DEBUG(logger, "SchemaAcceptance: schema is absent, rejecting");
        return verdict;
    }
    try {
        (void)SerializeJSON(*schema);
    } catch (const errors::EncodingError& e) {
        LOG_ERROR(logger, "SchemaAcceptance: schema cannot be serialized, rejecting: {}", e.what());
        return verdict;
    }
    verdict.accepted = true;

    if (!schema->isObject()) {
        verdict.warnings.emplace_back("schema is not an object");
    } else {
        if (const JSONValue* type = FindMember(*schema, "type")) {
            if (!type->isString() && !type->isArray()) {
                verdict.warnings.emplace_back("schema type field is neither a string nor an array");
            }
        }
        if (const JSONValue* props = FindMember(*schema, "properties")) {
            if (!props->isObject()) {
                verdict.warnings.emplace_back("schema properties field is not an object");
            }
        }
    }
    for (const auto& w : verdict.warnings) {
        LOG_WARN(logger, "SchemaAcceptance: {}, accepting anyway", w);
    }
    return verdict;
}

void LogSchemaForDebugging(const std::string& toolName, const JSONValue& schema, const std::shared_ptr<Logger>& logger) {
    if (!logger || !logger->isEnabled(Logger::Level::DEBUG)) {
        return;
    }
    try {
        LOG_DEBUG(logger, "Tool schema for {}: {}", toolName, SerializeJSON(schema));
    } catch (const errors::EncodingError& e) {
        LOG_DEBUG(logger, "Tool schema for {}: (failed to serialize: {})", toolName, e.what());
        return;
    }
    for (const char* key : {"$defs", "$ref", "definitions"}) {
        if (const JSONValue* v = FindMember(schema, key)) {
            LOG_DEBUG(logger, "  schema contains {}: {}", key, SerializeJSON(*v));
        }
    }
    for (const char* key : {"oneOf", "anyOf"}) {
        if (const JSONValue* v = FindMember(schema, key)) {
            if (v->isArray()) {
                LOG_DEBUG(logger, "  schema contains {} with {} options", key, std::get<JSONValue::Array>(v->get()).size());
            }
        }
    }
}

} // namespace tolerance
} // namespace mcpcore
