//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.cpp
// Purpose: JSON-RPC 2.0 wire encoding and lenient decoding
//==========================================================================================================

#include "mcpcore/MessageCodec.h"

#include <limits>

#include "mcpcore/errors/Errors.h"

namespace mcpcore {
namespace codec {

namespace {

JSONValue::Object envelope() {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>("2.0");
    return obj;
}

JSONRPCErrorObject decodeErrorMember(const JSONValue& errVal) {
    JSONRPCErrorObject err;
    if (!errVal.isObject()) {
        err.code = JSONRPCErrorCodes::InternalError;
        err.message = errVal.isString() ? std::get<std::string>(errVal.value) : SerializeJSON(errVal);
        return err;
    }
    // Codes that do not fit an int are not JSON-RPC codes.
    auto code = GetIntMember(errVal, "code");
    if (code.has_value() && code.value() >= std::numeric_limits<int>::min() &&
        code.value() <= std::numeric_limits<int>::max()) {
        err.code = static_cast<int>(code.value());
    } else {
        err.code = JSONRPCErrorCodes::InternalError;
    }
    auto message = GetStringMember(errVal, "message");
    err.message = message.has_value() ? message.value() : std::string();
    if (const JSONValue* data = FindMember(errVal, "data")) {
        err.data = *data;
    }
    return err;
}

} // namespace

std::string EncodeRequest(const JSONRPCId& id, const std::string& method, const std::optional<JSONValue>& params) {
    if (id.IsAbsent()) {
        throw errors::EncodingError("request '" + method + "' requires an id");
    }
    auto obj = envelope();
    obj["id"] = std::make_shared<JSONValue>(id.ToJSON());
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return SerializeJSON(JSONValue{std::move(obj)});
}

std::string EncodeNotification(const std::string& method, const std::optional<JSONValue>& params) {
    auto obj = envelope();
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return SerializeJSON(JSONValue{std::move(obj)});
}

std::string EncodeResponse(const JSONRPCId& id, const JSONValue& result) {
    auto obj = envelope();
    obj["id"] = std::make_shared<JSONValue>(id.ToJSON());
    obj["result"] = std::make_shared<JSONValue>(result);
    return SerializeJSON(JSONValue{std::move(obj)});
}

std::string EncodeErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                const std::optional<JSONValue>& data) {
    JSONValue::Object err;
    err["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    err["message"] = std::make_shared<JSONValue>(message);
    if (data.has_value()) {
        err["data"] = std::make_shared<JSONValue>(data.value());
    }
    auto obj = envelope();
    obj["id"] = std::make_shared<JSONValue>(id.ToJSON());
    obj["error"] = std::make_shared<JSONValue>(std::move(err));
    return SerializeJSON(JSONValue{std::move(obj)});
}

std::string EncodeMessage(const JSONRPCMessage& msg) {
    switch (msg.Kind()) {
        case MessageKind::Request:
            return EncodeRequest(msg.id, msg.method.value(), msg.params);
        case MessageKind::Notification:
            return EncodeNotification(msg.method.value(), msg.params);
        case MessageKind::Response:
            return EncodeResponse(msg.id, msg.result.value());
        case MessageKind::Error:
            return EncodeErrorResponse(msg.id, msg.error->code, msg.error->message, msg.error->data);
        case MessageKind::Invalid:
            break;
    }
    throw errors::EncodingError("cannot encode a message with no method, result or error");
}

JSONRPCMessage DecodeMessage(const std::string& text) {
    JSONValue doc = ParseJSON(text);
    if (!doc.isObject()) {
        throw errors::DecodeError("JSON-RPC message must be an object");
    }
    JSONRPCMessage msg;
    if (auto tag = GetStringMember(doc, "jsonrpc")) {
        msg.jsonrpc = tag.value();
    }
    msg.id = JSONRPCId::FromJSON(FindMember(doc, "id"));
    if (auto method = GetStringMember(doc, "method")) {
        msg.method = std::move(method);
    }
    if (const JSONValue* params = FindMember(doc, "params")) {
        msg.params = *params;
    }
    if (const JSONValue* result = FindMember(doc, "result")) {
        msg.result = *result;
    }
    const JSONValue* error = FindMember(doc, "error");
    if (error != nullptr && !error->isNull()) {
        msg.error = decodeErrorMember(*error);
    }
    return msg;
}

} // namespace codec
} // namespace mcpcore
