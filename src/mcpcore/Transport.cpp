//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.cpp
// Purpose: Shared helpers for transport factories
//==========================================================================================================

#include "mcpcore/Transport.h"

#include "logging/Logger.h"
#include "mcpcore/MessageCodec.h"
#include "mcpcore/errors/Errors.h"

namespace mcpcore {

namespace {
std::string trim(const std::string& s) {
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}
} // namespace

std::vector<std::pair<std::string, std::string>> ParseTransportConfig(const std::string& config) {
    std::vector<std::pair<std::string, std::string>> out;
    std::size_t i = 0;
    while (i <= config.size()) {
        std::size_t semi = config.find(';', i);
        if (semi == std::string::npos) semi = config.size();
        std::string token = trim(config.substr(i, semi - i));
        i = semi + 1;
        if (token.empty()) continue;
        auto eq = token.find('=');
        if (eq == std::string::npos) {
            out.emplace_back(token, std::string());
        } else {
            out.emplace_back(trim(token.substr(0, eq)), token.substr(eq + 1));
        }
    }
    return out;
}

void DeliverFrame(const std::string& frame, const ITransport::MessageHandler& handler,
                  const std::shared_ptr<Logger>& logger, const char* transportName) {
    JSONRPCMessage message;
    try {
        message = codec::DecodeMessage(frame);
    } catch (const errors::DecodeError& e) {
        LOG_DEBUG(logger, "{}: skipping non-JSON line ({}): {}", transportName, e.what(), frame.substr(0, 200));
        return;
    }
    if (message.Kind() == MessageKind::Invalid) {
        LOG_WARN(logger, "{}: skipping message with no method, result or error: {}", transportName, frame.substr(0, 200));
        return;
    }
    LOG_DEBUG(logger, "{}: received {} ({} bytes)", transportName, MessageKindName(message.Kind()), frame.size());
    if (!handler) {
        LOG_DEBUG(logger, "{}: no message handler; dropping", transportName);
        return;
    }
    try {
        handler(std::move(message));
    } catch (const std::exception& e) {
        LOG_ERROR(logger, "{}: message handler threw: {}", transportName, e.what());
    }
}

} // namespace mcpcore
