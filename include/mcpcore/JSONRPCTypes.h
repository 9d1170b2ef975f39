//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, JSON-RPC 2.0 identifier and message envelope
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcpcore {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(int v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
};

//==========================================================================================================
// SerializeJSON
// Purpose: Compact JSON text for a value.
// Throws:
//   errors::EncodingError for non-finite numbers or null child pointers.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// ParseJSON
// Purpose: Parses exactly one JSON document (surrounding whitespace allowed).
// Throws:
//   errors::DecodeError on malformed input or trailing content.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// FindMember
// Purpose: Looks up key in an object value.
// Returns:
//   Pointer to the member, or nullptr when value is not an object or the key is missing.
//==========================================================================================================
const JSONValue* FindMember(const JSONValue& value, const std::string& key);

// Typed member readers; nullopt when absent or of another type.
std::optional<std::string> GetStringMember(const JSONValue& value, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& value, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& value, const std::string& key);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 identifier: absent, string, or integer.
// Notes:
//   Equality and hashing are value-based over ToString(), so the string "7" and the integer 7
//   name the same pending request. Absent ids only equal other absent ids.
//==========================================================================================================
class JSONRPCId {
public:
    JSONRPCId() = default;
    JSONRPCId(int64_t v) : value(v) {}
    JSONRPCId(int v) : value(static_cast<int64_t>(v)) {}
    JSONRPCId(std::string v) : value(std::move(v)) {}
    JSONRPCId(const char* v) : value(std::string(v ? v : "")) {}

    bool IsAbsent() const { return std::holds_alternative<std::monostate>(value); }
    bool IsString() const { return std::holds_alternative<std::string>(value); }
    bool IsNumber() const { return std::holds_alternative<int64_t>(value); }

    // Canonical rendering used as a map key: integers in decimal, strings verbatim, absent as "".
    std::string ToString() const;

    // Wire form: string, integer, or null when absent.
    JSONValue ToJSON() const;

    //==========================================================================================================
    // Lenient decode of an "id" member.
    // Args:
    //   v: Pointer to the decoded member or nullptr when missing.
    // Returns:
    //   String and integer ids as-is; integral doubles as integers; anything else as absent.
    //==========================================================================================================
    static JSONRPCId FromJSON(const JSONValue* v);

    friend bool operator==(const JSONRPCId& a, const JSONRPCId& b);
    friend bool operator!=(const JSONRPCId& a, const JSONRPCId& b) { return !(a == b); }

private:
    std::variant<std::monostate, std::string, int64_t> value;
};

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC error codes plus MCP-specific codes.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int InvalidRequestId = -32000;
    constexpr int MethodNotAllowed = -32001;
    constexpr int ResourceNotFound = -32002;
    constexpr int ToolNotFound = -32003;
    constexpr int PromptNotFound = -32004;
}

//==========================================================================================================
// JSONRPCErrorObject
// Purpose: The { code, message, data? } payload of an error response.
//==========================================================================================================
struct JSONRPCErrorObject {
    int code{JSONRPCErrorCodes::InternalError};
    std::string message;
    std::optional<JSONValue> data;
};

enum class MessageKind {
    Request,
    Response,
    Error,
    Notification,
    Invalid
};

const char* MessageKindName(MessageKind kind);

//==========================================================================================================
// JSONRPCMessage
// Purpose: One decoded or to-be-encoded wire message.
// Notes:
//   Kind() is derived from which fields are populated:
//     method + id      -> Request
//     method, no id    -> Notification
//     error, no method -> Error
//     result, no method-> Response
//   A message carrying both result and error, or none of method/result/error, is Invalid.
//==========================================================================================================
class JSONRPCMessage {
public:
    std::string jsonrpc = "2.0";
    JSONRPCId id;
    std::optional<std::string> method;
    std::optional<JSONValue> params;
    std::optional<JSONValue> result;
    std::optional<JSONRPCErrorObject> error;

    MessageKind Kind() const;

    static JSONRPCMessage MakeRequest(JSONRPCId id, std::string method, std::optional<JSONValue> params = std::nullopt);
    static JSONRPCMessage MakeNotification(std::string method, std::optional<JSONValue> params = std::nullopt);
    static JSONRPCMessage MakeResponse(JSONRPCId id, JSONValue result);
    static JSONRPCMessage MakeError(JSONRPCId id, int code, std::string message,
                                    std::optional<JSONValue> data = std::nullopt);
};

} // namespace mcpcore

template <>
struct std::hash<mcpcore::JSONRPCId> {
    std::size_t operator()(const mcpcore::JSONRPCId& id) const noexcept {
        return std::hash<std::string>{}(id.ToString());
    }
};
