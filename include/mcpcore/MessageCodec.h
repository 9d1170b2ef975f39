//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageCodec.h
// Purpose: Encode/decode JSON-RPC 2.0 messages to and from single-document wire text
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpcore/JSONRPCTypes.h"

namespace mcpcore {
namespace codec {

//==========================================================================================================
// EncodeRequest
// Purpose: Serializes { jsonrpc, id, method, params? }.
// Throws:
//   errors::EncodingError when id is absent or params cannot be serialized.
//==========================================================================================================
std::string EncodeRequest(const JSONRPCId& id, const std::string& method, const std::optional<JSONValue>& params);

// { jsonrpc, method, params? } with no id.
std::string EncodeNotification(const std::string& method, const std::optional<JSONValue>& params);

// { jsonrpc, id, result }. An absent id is written as null.
std::string EncodeResponse(const JSONRPCId& id, const JSONValue& result);

// { jsonrpc, id, error: { code, message, data? } }.
std::string EncodeErrorResponse(const JSONRPCId& id, int code, const std::string& message,
                                const std::optional<JSONValue>& data = std::nullopt);

//==========================================================================================================
// EncodeMessage
// Purpose: Dispatches on msg.Kind() to the encoder above.
// Throws:
//   errors::EncodingError for Invalid messages or unserializable payloads.
//==========================================================================================================
std::string EncodeMessage(const JSONRPCMessage& msg);

//==========================================================================================================
// DecodeMessage
// Purpose: Parses one frame into a message. Classification is left to JSONRPCMessage::Kind().
// Notes:
//   - A malformed id never rejects the message; it decodes as absent.
//   - A malformed error member decodes with code InternalError and the raw text as message.
// Throws:
//   errors::DecodeError when the text is not JSON or not a JSON object.
//==========================================================================================================
JSONRPCMessage DecodeMessage(const std::string& text);

} // namespace codec
} // namespace mcpcore
