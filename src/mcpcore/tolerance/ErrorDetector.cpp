//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorDetector.cpp
// Purpose: Ordered error-shape and message probes for tools/call results
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpcore/tolerance/ErrorDetector.h"

namespace mcpcore {
namespace tolerance {

namespace {
const JSONValue* nested(const JSONValue& root, const char* outer, const char* inner) {
    const JSONValue* o = FindMember(root, outer);
    if (!o || !o->isObject()) {
        return nullptr;
    }
    const JSONValue* i = FindMember(*o, inner);
    return (i && i->isObject()) ? i : nullptr;
}

bool flagTrue(const JSONValue* obj, const char* key) {
    return obj && GetBoolMember(*obj, key).value_or(false);
}

bool flagStringTrue(const JSONValue* obj, const char* key) {
    return obj && GetStringMember(*obj, key).value_or("") == "true";
}

std::optional<std::string> nonEmptyString(const JSONValue* obj, const char* key) {
    if (!obj) {
        return std::nullopt;
    }
    auto s = GetStringMember(*obj, key);
    if (!s.has_value() || s->empty()) {
        return std::nullopt;
    }
    return s;
}

const JSONValue* errorObject(const JSONValue& result) {
    const JSONValue* e = FindMember(result, "error");
    return (e && e->isObject()) ? e : nullptr;
}
} // namespace

const std::vector<ErrorProbe>& ErrorProbes() {
    static const std::vector<ErrorProbe> probes = {
        {"isError", [](const JSONValue& r) { return flagTrue(&r, "isError"); }},
        {"content.error.isError", [](const JSONValue& r) { return flagTrue(nested(r, "content", "error"), "isError"); }},
        {"content.error.isError (string)",
         [](const JSONValue& r) { return flagStringTrue(nested(r, "content", "error"), "isError"); }},
        {"isError (string)", [](const JSONValue& r) { return flagStringTrue(&r, "isError"); }},
        {"error.isError",
         [](const JSONValue& r) {
             const JSONValue* e = errorObject(r);
             return flagTrue(e, "isError") || flagStringTrue(e, "isError");
         }},
    };
    return probes;
}

const std::vector<MessageProbe>& MessageProbes() {
    static const std::vector<MessageProbe> probes = {
        {"error", [](const JSONValue& r) { return nonEmptyString(&r, "error"); }},
        {"content.error.message", [](const JSONValue& r) { return nonEmptyString(nested(r, "content", "error"), "message"); }},
        {"content.error.error", [](const JSONValue& r) { return nonEmptyString(nested(r, "content", "error"), "error"); }},
        {"error.message", [](const JSONValue& r) { return nonEmptyString(errorObject(r), "message"); }},
        {"error.error", [](const JSONValue& r) { return nonEmptyString(errorObject(r), "error"); }},
    };
    return probes;
}

bool IsError(const JSONValue& result, const std::shared_ptr<Logger>& logger) {
    if (!result.isObject()) {
        return false;
    }
    for (const auto& probe : ErrorProbes()) {
        if (probe.matches(result)) {
            LOG_DEBUG(logger, "ErrorDetector: error detected via {}", probe.name);
            return true;
        }
    }
    return false;
}

std::optional<std::string> GetErrorMessage(const JSONValue& result, const std::shared_ptr<Logger>& logger) {
    if (!IsError(result, logger)) {
        return std::nullopt;
    }
    for (const auto& probe : MessageProbes()) {
        if (auto msg = probe.extract(result)) {
            return msg;
        }
    }
    return std::string(kGenericToolErrorMessage);
}

std::string ExtractTextFromContent(const JSONValue& content) {
    if (content.isString()) {
        return std::get<std::string>(content.get());
    }
    if (content.isArray()) {
        for (const auto& item : std::get<JSONValue::Array>(content.get())) {
            if (!item) continue;
            if (auto text = nonEmptyString(item.get(), "text")) {
                return text.value();
            }
        }
        return "";
    }
    return nonEmptyString(&content, "text").value_or("");
}

} // namespace tolerance
} // namespace mcpcore
