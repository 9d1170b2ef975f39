//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport layer interfaces - COM-style abstractions for newline-delimited JSON-RPC streams
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "mcpcore/JSONRPCTypes.h"

class Logger;

namespace mcpcore {

//==========================================================================================================
// ITransport
// Purpose: One bidirectional JSON-RPC connection.
// Notes:
//   - Exactly one reader loop per started transport delivers every decoded inbound message to the
//     message handler, on the reader thread, in arrival order.
//   - Send() is safe from any thread; frames are written under a single write lock and never interleave.
//   - The error handler fires at most once, when the stream ends or fails for any reason other than Stop().
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Opens the stream and launches the reader loop.
    // Returns:
    //   A future that completes when the transport is running, or holds errors::TransportUnavailableError /
    //   errors::TransportError when the endpoint cannot be opened.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Signals shutdown, releases the stream and joins the reader loop. Idempotent.
    // Returns:
    //   A future that completes when the transport has stopped.
    //==========================================================================================================
    virtual std::future<void> Stop() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic session identifier.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Encodes and writes one frame.
    // Args:
    //   message: Request, response, error or notification.
    // Throws:
    //   errors::EncodingError when the payload cannot be serialized (nothing is written).
    //   errors::TransportError when the transport is not connected or the write fails.
    //==========================================================================================================
    virtual void Send(const JSONRPCMessage& message) = 0;

    /////////////////////////////////////////// Inbound handling ///////////////////////////////////////////
    using MessageHandler = std::function<void(JSONRPCMessage message)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

//==========================================================================================================
// ITransportFactory
// Purpose: Factory for creating transports from configuration strings.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance using the provided configuration.
    // Args:
    //   config: Transport-specific "key=value;key=value" string.
    // Returns:
    //   A unique_ptr to a newly created ITransport.
    // Throws:
    //   std::invalid_argument when a required key is missing.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const std::string& config) = 0;
};

//==========================================================================================================
// ParseTransportConfig
// Purpose: Splits "key=value;key=value" into ordered pairs. Repeated keys are preserved in order.
//==========================================================================================================
std::vector<std::pair<std::string, std::string>> ParseTransportConfig(const std::string& config);

//==========================================================================================================
// DeliverFrame
// Purpose: Decodes one inbound frame and hands it to handler. Shared by the stream transports.
// Notes:
//   - Non-JSON lines (server banners, stray prints) are logged at DEBUG and skipped.
//   - Messages of Invalid kind are logged at WARN and skipped.
//   - Exceptions escaping handler are logged; the reader loop keeps running.
//==========================================================================================================
void DeliverFrame(const std::string& frame, const ITransport::MessageHandler& handler,
                  const std::shared_ptr<Logger>& logger, const char* transportName);

} // namespace mcpcore
