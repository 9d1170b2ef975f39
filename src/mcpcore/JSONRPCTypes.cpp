//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.cpp
// Purpose: JSON-RPC identifier and message envelope helpers
//==========================================================================================================

#include <cmath>
#include <limits>

#include "mcpcore/JSONRPCTypes.h"

namespace mcpcore {

std::string JSONRPCId::ToString() const {
    if (std::holds_alternative<std::string>(value)) {
        return std::get<std::string>(value);
    }
    if (std::holds_alternative<int64_t>(value)) {
        return std::to_string(std::get<int64_t>(value));
    }
    return std::string();
}

JSONValue JSONRPCId::ToJSON() const {
    if (std::holds_alternative<std::string>(value)) {
        return JSONValue(std::get<std::string>(value));
    }
    if (std::holds_alternative<int64_t>(value)) {
        return JSONValue(std::get<int64_t>(value));
    }
    return JSONValue(nullptr);
}

JSONRPCId JSONRPCId::FromJSON(const JSONValue* v) {
    if (v == nullptr) {
        return JSONRPCId();
    }
    if (std::holds_alternative<std::string>(v->value)) {
        return JSONRPCId(std::get<std::string>(v->value));
    }
    if (std::holds_alternative<int64_t>(v->value)) {
        return JSONRPCId(std::get<int64_t>(v->value));
    }
    if (std::holds_alternative<double>(v->value)) {
        // Peers that keep numbers as doubles send 7.0 for 7.
        const double d = std::get<double>(v->value);
        if (std::isfinite(d) && std::floor(d) == d &&
            d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
            d < static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return JSONRPCId(static_cast<int64_t>(d));
        }
    }
    return JSONRPCId();
}

bool operator==(const JSONRPCId& a, const JSONRPCId& b) {
    if (a.IsAbsent() || b.IsAbsent()) {
        return a.IsAbsent() && b.IsAbsent();
    }
    return a.ToString() == b.ToString();
}

const char* MessageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::Request: return "request";
        case MessageKind::Response: return "response";
        case MessageKind::Error: return "error";
        case MessageKind::Notification: return "notification";
        case MessageKind::Invalid: return "invalid";
    }
    return "invalid";
}

MessageKind JSONRPCMessage::Kind() const {
    if (method.has_value()) {
        return id.IsAbsent() ? MessageKind::Notification : MessageKind::Request;
    }
    if (result.has_value() && error.has_value()) {
        return MessageKind::Invalid;
    }
    if (error.has_value()) {
        return MessageKind::Error;
    }
    if (result.has_value()) {
        return MessageKind::Response;
    }
    return MessageKind::Invalid;
}

JSONRPCMessage JSONRPCMessage::MakeRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params) {
    JSONRPCMessage m;
    m.id = std::move(id);
    m.method = std::move(method);
    m.params = std::move(params);
    return m;
}

JSONRPCMessage JSONRPCMessage::MakeNotification(std::string method, std::optional<JSONValue> params) {
    JSONRPCMessage m;
    m.method = std::move(method);
    m.params = std::move(params);
    return m;
}

JSONRPCMessage JSONRPCMessage::MakeResponse(JSONRPCId id, JSONValue result) {
    JSONRPCMessage m;
    m.id = std::move(id);
    m.result = std::move(result);
    return m;
}

JSONRPCMessage JSONRPCMessage::MakeError(JSONRPCId id, int code, std::string message, std::optional<JSONValue> data) {
    JSONRPCMessage m;
    m.id = std::move(id);
    m.error = JSONRPCErrorObject{code, std::move(message), std::move(data)};
    return m;
}

} // namespace mcpcore
