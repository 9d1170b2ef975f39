//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ErrorDetector.h
// Purpose: Recognizes the error shapes real servers put into tools/call results
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpcore/JSONRPCTypes.h"

class Logger;

namespace mcpcore {
namespace tolerance {

constexpr const char* kGenericToolErrorMessage = "MCP tool error (see nested error object)";

// One recognized error-flag shape. matches() is true only when the shape is present and set.
struct ErrorProbe {
    const char* name;
    std::function<bool(const JSONValue& result)> matches;
};

// One recognized message location. Returns the non-empty message found there.
struct MessageProbe {
    const char* name;
    std::function<std::optional<std::string>(const JSONValue& result)> extract;
};

//==========================================================================================================
// ErrorProbes
// Order:
//   1. isError: true
//   2. content.error.isError: true
//   3. content.error.isError: "true"
//   4. isError: "true"
//   5. error.isError: true | "true"
//==========================================================================================================
const std::vector<ErrorProbe>& ErrorProbes();

//==========================================================================================================
// MessageProbes
// Order:
//   1. error (string)
//   2. content.error.message
//   3. content.error.error
//   4. error.message
//   5. error.error
//==========================================================================================================
const std::vector<MessageProbe>& MessageProbes();

//==========================================================================================================
// IsError
// Purpose: Runs ErrorProbes() in order; the first match wins.
// Notes:
//   A result matching none of the shapes is treated as success, including errors reported in a shape
//   not listed above.
//==========================================================================================================
bool IsError(const JSONValue& result, const std::shared_ptr<Logger>& logger = nullptr);

//==========================================================================================================
// GetErrorMessage
// Returns:
//   nullopt when IsError() is false; otherwise the first MessageProbes() hit, or
//   kGenericToolErrorMessage when no message field is recognized.
//==========================================================================================================
std::optional<std::string> GetErrorMessage(const JSONValue& result, const std::shared_ptr<Logger>& logger = nullptr);

// String content as-is; first non-empty "text" of an item array; "text" of an object; "" otherwise.
std::string ExtractTextFromContent(const JSONValue& content);

} // namespace tolerance
} // namespace mcpcore
