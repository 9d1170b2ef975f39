//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.h
// Purpose: MCP client interface - COM-style abstraction for handshake, tool and task operations
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpcore/JSONRPCTypes.h"
#include "mcpcore/Protocol.h"
#include "mcpcore/Transport.h"
#include "mcpcore/tasks/Task.h"

class Logger;

namespace mcpcore {

//==========================================================================================================
// ClientOptions
// Fields:
//   requestTimeout: Bound for ordinary requests (tools/list, tasks/get, SendRequest...).
//   handshakeTimeout: Bound for initialize.
//   toolCallIdleTimeout: tools/call gives up after this long without a reply or a progress notification.
//   toolCallMaxTime: Hard cap on a tools/call regardless of progress.
//   taskResultTimeout: Bound for tasks/result, which blocks server-side until the task is terminal.
//   protocolVersion: Sent in initialize.
//==========================================================================================================
struct ClientOptions {
    std::chrono::milliseconds requestTimeout{30000};
    std::chrono::milliseconds handshakeTimeout{10000};
    std::chrono::milliseconds toolCallIdleTimeout{120000};
    std::chrono::milliseconds toolCallMaxTime{std::chrono::minutes(30)};
    std::chrono::milliseconds taskResultTimeout{std::chrono::minutes(30)};
    std::string protocolVersion{PROTOCOL_VERSION};

    // Defaults overridden by MCPCORE_REQUEST_TIMEOUT_MS, MCPCORE_HANDSHAKE_TIMEOUT_MS,
    // MCPCORE_TOOL_IDLE_TIMEOUT_MS and MCPCORE_TOOL_MAX_TIME_MS.
    static ClientOptions FromEnvironment();
};

//==========================================================================================================
// MCP Client interface
// Notes:
//   - Connect() then Initialize() must both succeed before any other request is issued. Requests issued
//     earlier fail with errors::HandshakeError; after a failed handshake every request fails the same way.
//   - Failures surface through the returned futures: errors::TransportError, errors::TimeoutError,
//     errors::ProtocolError (the peer's code and message verbatim), errors::HandshakeError.
//==========================================================================================================
class IClient {
public:
    virtual ~IClient() = default;

    ////////////////////////////////////////// Connection management ///////////////////////////////////////////
    //==========================================================================================================
    // Wires the transport's handlers and starts it.
    // Args:
    //   transport: The transport implementation to use (takes ownership).
    // Returns:
    //   A future that completes when the transport is running; holds the transport's start error otherwise.
    //==========================================================================================================
    virtual std::future<void> Connect(std::unique_ptr<ITransport> transport) = 0;

    // Stops the transport and fails every pending request.
    virtual std::future<void> Disconnect() = 0;

    virtual bool IsConnected() const = 0;

    // true once Initialize() succeeded on the current connection.
    virtual bool IsInitialized() const = 0;

    ////////////////////////////////////////// Protocol initialization /////////////////////////////////////////
    //==========================================================================================================
    // Performs the initialize handshake under ClientOptions::handshakeTimeout.
    // Args:
    //   clientInfo: Name and version sent as clientInfo.
    //   capabilities: Flags to advertise.
    // Returns:
    //   The server's info and capabilities. On an error reply or timeout the future holds
    //   errors::HandshakeError and the transport is stopped.
    //==========================================================================================================
    virtual std::future<InitializeResult> Initialize(const Implementation& clientInfo,
                                                     const ClientCapabilities& capabilities) = 0;

    // Server info and capabilities captured by the handshake.
    virtual std::optional<InitializeResult> GetServerInfo() const = 0;

    ////////////////////////////////////////// Tools ///////////////////////////////////////////
    //==========================================================================================================
    // Lists tools, optionally restricted to the given names. Tools whose input schema is absent or
    // unserializable are dropped; questionable schemas are kept with a logged warning.
    //==========================================================================================================
    virtual std::future<std::vector<Tool>> ListTools(const std::vector<std::string>& names = {}) = 0;

    //==========================================================================================================
    // Calls a tool. Progress notifications for the call extend the idle timeout up to toolCallMaxTime.
    // Returns:
    //   The result after error-shape detection. A tool-reported error is a result with isError set,
    //   not an exception.
    //==========================================================================================================
    virtual std::future<ToolCallResult> CallTool(const std::string& name, const JSONValue& arguments) = 0;

    ////////////////////////////////////////// Tasks ///////////////////////////////////////////
    virtual std::future<tasks::TaskMetadata> GetTask(const std::string& taskId) = 0;
    virtual std::future<JSONValue> GetTaskResult(const std::string& taskId) = 0;
    virtual std::future<tasks::TaskPage> ListTasks(const std::optional<std::string>& cursor = std::nullopt) = 0;
    virtual std::future<tasks::TaskMetadata> CancelTask(const std::string& taskId) = 0;

    ////////////////////////////////////////// Raw access ///////////////////////////////////////////
    // Returns the result member of the reply.
    virtual std::future<JSONValue> SendRequest(const std::string& method,
                                               const std::optional<JSONValue>& params = std::nullopt) = 0;

    // Throws errors::HandshakeError before a successful handshake, errors::TransportError on write failure.
    virtual void SendNotification(const std::string& method,
                                  const std::optional<JSONValue>& params = std::nullopt) = 0;

    ////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Handlers run on the transport's reader thread and must not block.
    using NotificationHandler = std::function<void(const std::string& method, const JSONValue& params)>;
    virtual void SetNotificationHandler(const std::string& method, NotificationHandler handler) = 0;
    virtual void RemoveNotificationHandler(const std::string& method) = 0;

    using ProgressHandler = std::function<void(const std::string& token, double progress,
                                               std::optional<double> total, const std::string& message)>;
    virtual void SetProgressHandler(ProgressHandler handler) = 0;

    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;

    //==========================================================================================================
    // Handler for server-initiated requests. Runs on its own thread; the returned response or error is
    // sent back with the request's id. Without a handler the client replies MethodNotFound.
    //==========================================================================================================
    using RequestHandler = std::function<JSONRPCMessage(const JSONRPCMessage& request)>;
    virtual void SetRequestHandler(RequestHandler handler) = 0;
};

//==========================================================================================================
// Client
// Purpose: IClient over any ITransport, correlating replies through a ResponseDispatcher.
//==========================================================================================================
class Client : public IClient {
public:
    explicit Client(ClientOptions options, std::shared_ptr<Logger> logger);
    virtual ~Client();

    std::future<void> Connect(std::unique_ptr<ITransport> transport) override;
    std::future<void> Disconnect() override;
    bool IsConnected() const override;
    bool IsInitialized() const override;

    std::future<InitializeResult> Initialize(const Implementation& clientInfo,
                                             const ClientCapabilities& capabilities) override;
    std::optional<InitializeResult> GetServerInfo() const override;

    std::future<std::vector<Tool>> ListTools(const std::vector<std::string>& names = {}) override;
    std::future<ToolCallResult> CallTool(const std::string& name, const JSONValue& arguments) override;

    std::future<tasks::TaskMetadata> GetTask(const std::string& taskId) override;
    std::future<JSONValue> GetTaskResult(const std::string& taskId) override;
    std::future<tasks::TaskPage> ListTasks(const std::optional<std::string>& cursor = std::nullopt) override;
    std::future<tasks::TaskMetadata> CancelTask(const std::string& taskId) override;

    std::future<JSONValue> SendRequest(const std::string& method,
                                       const std::optional<JSONValue>& params = std::nullopt) override;
    void SendNotification(const std::string& method,
                          const std::optional<JSONValue>& params = std::nullopt) override;

    void SetNotificationHandler(const std::string& method, NotificationHandler handler) override;
    void RemoveNotificationHandler(const std::string& method) override;
    void SetProgressHandler(ProgressHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;
    void SetRequestHandler(RequestHandler handler) override;

    // Requests awaiting a reply on the current connection.
    std::size_t PendingRequestCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// IClientFactory
// Purpose: Factory for creating client instances.
//==========================================================================================================
class IClientFactory {
public:
    virtual ~IClientFactory() = default;
    virtual std::unique_ptr<IClient> CreateClient(const ClientOptions& options) = 0;
};

class ClientFactory : public IClientFactory {
public:
    explicit ClientFactory(std::shared_ptr<Logger> logger) : logger(std::move(logger)) {}
    std::unique_ptr<IClient> CreateClient(const ClientOptions& options) override;

private:
    std::shared_ptr<Logger> logger;
};

} // namespace mcpcore
