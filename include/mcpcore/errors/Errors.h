//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures, exception taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcpcore/JSONRPCTypes.h"

namespace mcpcore {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed error representation used across the library.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

inline McpError makeMcpError(int code, std::string message, std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Convert the error member of a decoded message to McpError.
inline McpError mcpErrorFromErrorObject(const JSONRPCErrorObject& err) {
    return makeMcpError(err.code, err.message, err.data);
}

// Create a JSONValue error object { code, message, data? } from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    JSONValue::Object obj;
    obj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(err.code));
    obj["message"] = std::make_shared<JSONValue>(err.message);
    if (err.data.has_value()) {
        obj["data"] = std::make_shared<JSONValue>(err.data.value());
    }
    return JSONValue{obj};
}

// Build an error-response message echoing id.
inline JSONRPCMessage makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return JSONRPCMessage::MakeError(id, err.code, err.message, err.data);
}

////////////////////////////////////////// Exception taxonomy //////////////////////////////////////////

// A payload could not be serialized. Local, never retried.
class EncodingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Inbound text is not a JSON document.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The byte stream failed or closed. Fails every pending request on the connection.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The endpoint could not be reached at all (missing socket path, spawn failure).
class TransportUnavailableError : public TransportError {
public:
    using TransportError::TransportError;
};

// The peer replied with a JSON-RPC error object.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(McpError err)
        : std::runtime_error(err.message), error(std::move(err)) {}
    const McpError& GetError() const noexcept { return error; }
    int GetCode() const noexcept { return error.code; }
private:
    McpError error;
};

// A caller-imposed bound elapsed.
class TimeoutError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The initialize exchange failed; the connection must not be used further.
class HandshakeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TaskNotFoundError : public std::runtime_error {
public:
    explicit TaskNotFoundError(const std::string& taskId)
        : std::runtime_error("task not found: " + taskId), id(taskId) {}
    const std::string& TaskId() const noexcept { return id; }
private:
    std::string id;
};

class TaskTerminalError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class InvalidTaskTransitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The task reached `failed`; carries the stored error.
class TaskFailedError : public std::runtime_error {
public:
    explicit TaskFailedError(McpError err)
        : std::runtime_error(err.message), error(std::move(err)) {}
    const McpError& GetError() const noexcept { return error; }
private:
    McpError error;
};

class TaskCanceledError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TaskManagerShutdownError : public TaskCanceledError {
public:
    TaskManagerShutdownError() : TaskCanceledError("task manager shutting down") {}
};

} // namespace errors
} // namespace mcpcore
