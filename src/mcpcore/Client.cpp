//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Client.cpp
// Purpose: MCP client implementation - handshake gating, correlation, progress-aware tool calls
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>

#include <fmt/format.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpcore/Client.h"
#include "mcpcore/Deadline.h"
#include "mcpcore/Handshake.h"
#include "mcpcore/ResponseDispatcher.h"
#include "mcpcore/async/FutureAwaitable.h"
#include "mcpcore/async/Task.h"
#include "mcpcore/errors/Errors.h"
#include "mcpcore/tolerance/ErrorDetector.h"
#include "mcpcore/tolerance/SchemaAcceptance.h"

namespace mcpcore {

ClientOptions ClientOptions::FromEnvironment() {
    ClientOptions opts;
    opts.requestTimeout = GetEnvMillisOrDefault("MCPCORE_REQUEST_TIMEOUT_MS", opts.requestTimeout);
    opts.handshakeTimeout = GetEnvMillisOrDefault("MCPCORE_HANDSHAKE_TIMEOUT_MS", opts.handshakeTimeout);
    opts.toolCallIdleTimeout = GetEnvMillisOrDefault("MCPCORE_TOOL_IDLE_TIMEOUT_MS", opts.toolCallIdleTimeout);
    opts.toolCallMaxTime = GetEnvMillisOrDefault("MCPCORE_TOOL_MAX_TIME_MS", opts.toolCallMaxTime);
    return opts;
}

namespace {
using SteadyClock = std::chrono::steady_clock;

std::optional<double> numberOf(const JSONValue* v) {
    if (!v) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->get())) return static_cast<double>(std::get<int64_t>(v->get()));
    if (std::holds_alternative<double>(v->get())) return std::get<double>(v->get());
    return std::nullopt;
}

// Last time a tools/call showed signs of life (sent, or progress received).
class ProgressWatch {
public:
    ProgressWatch() { touch(); }
    void touch() { lastTicks.store(SteadyClock::now().time_since_epoch().count()); }
    SteadyClock::time_point lastActivity() const {
        return SteadyClock::time_point(SteadyClock::duration(lastTicks.load()));
    }
private:
    std::atomic<SteadyClock::rep> lastTicks{0};
};
} // namespace

////////////////////////////////////////// Client::Impl //////////////////////////////////////////
class Client::Impl {
public:
    enum class State { Disconnected, Connected, Ready, Failed };

    ClientOptions options;
    std::shared_ptr<Logger> logger;
    ResponseDispatcher dispatcher;
    std::atomic<int64_t> nextId{1};

    mutable std::mutex stateMutex;
    std::shared_ptr<ITransport> transport;
    State state{State::Disconnected};
    std::string handshakeFailure;
    std::optional<InitializeResult> serverInfo;

    std::mutex handlersMutex;
    std::unordered_map<std::string, NotificationHandler> notificationHandlers;
    ProgressHandler progressHandler;
    ErrorHandler errorHandler;
    std::shared_ptr<RequestHandler> requestHandler;

    std::mutex progressMutex;
    std::unordered_map<std::string, std::shared_ptr<ProgressWatch>> progressWatches;

    Impl(ClientOptions opts, std::shared_ptr<Logger> log)
        : options(std::move(opts)), logger(std::move(log)), dispatcher(logger) {}

    ////////////////////////////////////////// State gating //////////////////////////////////////////
    std::shared_ptr<ITransport> requireReady() const {
        std::lock_guard<std::mutex> lock(stateMutex);
        switch (state) {
            case State::Ready:
                return transport;
            case State::Failed:
                throw errors::HandshakeError("connection unusable: handshake failed: " + handshakeFailure);
            case State::Connected:
                throw errors::HandshakeError("initialize has not completed on this connection");
            case State::Disconnected:
                break;
        }
        throw errors::TransportError("client is not connected");
    }

    void failHandshake(const std::string& reason) {
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            state = State::Failed;
            handshakeFailure = reason;
            t = transport;
        }
        LOG_ERROR(logger, "Client: handshake failed: {}", reason);
        if (t) {
            t->Stop().get();
        }
        dispatcher.FailAll("handshake failed: " + reason);
    }

    ////////////////////////////////////////// Request plumbing //////////////////////////////////////////
    JSONRPCId allocateId() { return JSONRPCId(nextId.fetch_add(1)); }

    // Registers before sending so a fast reply always finds its entry.
    std::future<JSONRPCMessage> sendRegistered(const std::shared_ptr<ITransport>& t, const JSONRPCId& id,
                                               const std::string& method, const std::optional<JSONValue>& params) {
        auto fut = dispatcher.RegisterRequest(id);
        try {
            t->Send(JSONRPCMessage::MakeRequest(id, method, params));
        } catch (const std::exception&) {
            dispatcher.Unregister(id);
            throw;
        }
        return fut;
    }

    static JSONValue resultOf(const JSONRPCMessage& reply) {
        if (reply.Kind() == MessageKind::Error) {
            throw errors::ProtocolError(errors::mcpErrorFromErrorObject(reply.error.value()));
        }
        return reply.result.value_or(JSONValue{});
    }

    JSONValue roundTrip(const std::shared_ptr<ITransport>& t, const std::string& method,
                        const std::optional<JSONValue>& params, std::chrono::milliseconds timeout) {
        JSONRPCId id = allocateId();
        auto fut = sendRegistered(t, id, method, params);
        LOG_DEBUG(logger, "Client: sent {} (id {})", method, id.ToString());
        return resultOf(dispatcher.AwaitResponse(id, fut, timeout));
    }

    //==========================================================================================================
    // Waits for a tools/call reply. The idle deadline moves forward with every progress notification for
    // this call; toolCallMaxTime bounds the whole wait.
    //==========================================================================================================
    JSONRPCMessage awaitToolReply(const JSONRPCId& id, std::future<JSONRPCMessage>& fut,
                                  const std::shared_ptr<ProgressWatch>& watch) {
        const auto hardDeadline = DeadlineAfter(options.toolCallMaxTime);
        while (true) {
            const auto idleDeadline = DeadlineFrom(watch->lastActivity(), options.toolCallIdleTimeout);
            if (fut.wait_until(std::min(idleDeadline, hardDeadline)) == std::future_status::ready) {
                return fut.get();
            }
            const auto now = SteadyClock::now();
            std::string reason;
            if (now >= hardDeadline) {
                reason = fmt::format("tools/call exceeded maximum time of {} ms", options.toolCallMaxTime.count());
            } else if (now >= DeadlineFrom(watch->lastActivity(), options.toolCallIdleTimeout)) {
                reason = fmt::format("tools/call received no reply or progress for {} ms",
                                     options.toolCallIdleTimeout.count());
            } else {
                continue; // progress arrived; wait again
            }
            if (!dispatcher.Unregister(id)) {
                return fut.get();
            }
            LOG_WARN(logger, "Client: {} (id {}, pending={})", reason, id.ToString(), dispatcher.PendingCount());
            throw errors::TimeoutError(reason);
        }
    }

    JSONRPCMessage callToolRoundTrip(const std::shared_ptr<ITransport>& t, const std::string& name,
                                     const JSONValue& arguments) {
        JSONRPCId id = allocateId();
        auto watch = std::make_shared<ProgressWatch>();
        {
            std::lock_guard<std::mutex> lock(progressMutex);
            progressWatches[id.ToString()] = watch;
        }
        JSONValue::Object meta;
        meta["progressToken"] = std::make_shared<JSONValue>(id.ToJSON());
        JSONValue::Object params;
        params["name"] = std::make_shared<JSONValue>(name);
        params["arguments"] = std::make_shared<JSONValue>(arguments);
        params["_meta"] = std::make_shared<JSONValue>(meta);

        struct WatchGuard {
            Impl* impl;
            std::string key;
            ~WatchGuard() {
                std::lock_guard<std::mutex> lock(impl->progressMutex);
                impl->progressWatches.erase(key);
            }
        } guard{this, id.ToString()};

        auto fut = sendRegistered(t, id, Methods::CallTool, JSONValue{params});
        LOG_DEBUG(logger, "Client: calling tool {} (id {})", name, id.ToString());
        return awaitToolReply(id, fut, watch);
    }

    ////////////////////////////////////////// Inbound //////////////////////////////////////////
    void onMessage(JSONRPCMessage msg) {
        switch (msg.Kind()) {
            case MessageKind::Response:
            case MessageKind::Error:
                dispatcher.Dispatch(std::move(msg));
                break;
            case MessageKind::Notification:
                onNotification(msg);
                break;
            case MessageKind::Request:
                onRequest(std::move(msg));
                break;
            case MessageKind::Invalid:
                LOG_WARN(logger, "Client: dropping invalid message");
                break;
        }
    }

    void handleProgress(const JSONValue& params) {
        const JSONValue* tokenVal = FindMember(params, "progressToken");
        JSONRPCId token = JSONRPCId::FromJSON(tokenVal);
        if (token.IsAbsent()) {
            LOG_DEBUG(logger, "Client: progress notification without a usable progressToken");
            return;
        }
        const std::string key = token.ToString();
        {
            std::lock_guard<std::mutex> lock(progressMutex);
            auto it = progressWatches.find(key);
            if (it != progressWatches.end()) {
                it->second->touch();
            }
        }
        ProgressHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            handler = progressHandler;
        }
        if (handler) {
            handler(key, numberOf(FindMember(params, "progress")).value_or(0.0),
                    numberOf(FindMember(params, "total")), GetStringMember(params, "message").value_or(""));
        }
    }

    void onNotification(const JSONRPCMessage& msg) {
        const std::string& method = msg.method.value();
        const JSONValue params = msg.params.value_or(JSONValue{});
        if (method == Methods::Progress) {
            handleProgress(params);
        }
        NotificationHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            auto it = notificationHandlers.find(method);
            if (it != notificationHandlers.end()) {
                handler = it->second;
            }
        }
        if (handler) {
            handler(method, params);
        } else if (method != Methods::Progress) {
            LOG_DEBUG(logger, "Client: no handler for notification {}", method);
        }
    }

    // Server-initiated requests run off the reader thread; the reply goes out on the same transport.
    void onRequest(JSONRPCMessage req) {
        std::shared_ptr<RequestHandler> handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            handler = requestHandler;
        }
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            t = transport;
        }
        if (!t) {
            return;
        }
        std::shared_ptr<Logger> log = logger;
        std::thread([handler, t, log, req = std::move(req)]() {
            JSONRPCMessage reply;
            if (!handler || !*handler) {
                reply = JSONRPCMessage::MakeError(req.id, JSONRPCErrorCodes::MethodNotFound,
                                                  "Method not found: " + req.method.value_or(""));
            } else {
                try {
                    reply = (*handler)(req);
                } catch (const std::exception& e) {
                    LOG_ERROR(log, "Client: request handler for {} threw: {}", req.method.value_or(""), e.what());
                    reply = JSONRPCMessage::MakeError(req.id, JSONRPCErrorCodes::InternalError, e.what());
                }
                const MessageKind kind = reply.Kind();
                if (kind != MessageKind::Response && kind != MessageKind::Error) {
                    reply = JSONRPCMessage::MakeError(req.id, JSONRPCErrorCodes::InternalError,
                                                      "request handler produced no reply");
                }
                reply.id = req.id;
            }
            try {
                t->Send(reply);
            } catch (const std::exception& e) {
                LOG_WARN(log, "Client: failed to reply to {}: {}", req.method.value_or(""), e.what());
            }
        }).detach();
    }

    void onTransportError(const std::string& reason) {
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (state != State::Failed) {
                state = State::Disconnected;
            }
        }
        std::size_t failed = dispatcher.FailAll(reason);
        LOG_WARN(logger, "Client: transport error: {} ({} pending request(s) failed)", reason, failed);
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(handlersMutex);
            handler = errorHandler;
        }
        if (handler) {
            handler(reason);
        }
    }

    ////////////////////////////////////////// Coroutines //////////////////////////////////////////
    async::Task<void> coConnect(std::shared_ptr<ITransport> t);
    async::Task<void> coDisconnect();
    async::Task<InitializeResult> coInitialize(Implementation clientInfo, ClientCapabilities capabilities);
    async::Task<std::vector<Tool>> coListTools(std::vector<std::string> names);
    async::Task<ToolCallResult> coCallTool(std::string name, JSONValue arguments);
    async::Task<JSONValue> coRequest(std::string method, std::optional<JSONValue> params,
                                     std::chrono::milliseconds timeout);
    async::Task<tasks::TaskMetadata> coTaskMetadata(std::string method, std::string taskId);
    async::Task<tasks::TaskPage> coListTasks(std::optional<std::string> cursor);
};

namespace {
JSONValue taskIdParams(const std::string& taskId) {
    JSONValue::Object obj;
    obj["taskId"] = std::make_shared<JSONValue>(taskId);
    return JSONValue{obj};
}
} // namespace

async::Task<void> Client::Impl::coConnect(std::shared_ptr<ITransport> t) {
    if (!t) {
        throw std::invalid_argument("Client::Connect requires a transport");
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (transport) {
            throw std::logic_error("Client is already connected");
        }
        transport = t;
        state = State::Disconnected;
        handshakeFailure.clear();
        serverInfo.reset();
    }
    t->SetMessageHandler([this](JSONRPCMessage msg) { onMessage(std::move(msg)); });
    t->SetErrorHandler([this](const std::string& reason) { onTransportError(reason); });
    try {
        co_await async::makeFutureAwaitable(t->Start());
    } catch (const std::exception& e) {
        LOG_ERROR(logger, "Client: transport failed to start: {}", e.what());
        std::lock_guard<std::mutex> lock(stateMutex);
        transport.reset();
        throw;
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        state = State::Connected;
    }
    LOG_INFO(logger, "Client: connected ({})", t->GetSessionId());
    co_return;
}

async::Task<void> Client::Impl::coDisconnect() {
    std::shared_ptr<ITransport> t;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        t = std::move(transport);
        transport.reset();
        state = State::Disconnected;
    }
    if (t) {
        co_await async::makeFutureAwaitable(t->Stop());
        LOG_INFO(logger, "Client: disconnected ({})", t->GetSessionId());
    }
    dispatcher.FailAll("client disconnected");
    co_return;
}

async::Task<InitializeResult> Client::Impl::coInitialize(Implementation clientInfo, ClientCapabilities capabilities) {
    std::shared_ptr<ITransport> t;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (state == State::Ready) {
            throw std::logic_error("initialize already completed on this connection");
        }
        if (state == State::Failed) {
            throw errors::HandshakeError("connection unusable: handshake failed: " + handshakeFailure);
        }
        if (state != State::Connected || !transport) {
            throw errors::TransportError("client is not connected");
        }
        t = transport;
    }
    JSONValue params = BuildInitializeParams(options.protocolVersion, clientInfo, capabilities);
    LOG_INFO(logger, "Client: initializing as {} {}", clientInfo.name, clientInfo.version);

    InitializeResult result;
    try {
        JSONValue raw = co_await async::offload([this, t, params]() {
            return roundTrip(t, Methods::Initialize, params, options.handshakeTimeout);
        });
        result = ParseInitializeResult(raw);
    } catch (const std::exception& e) {
        failHandshake(e.what());
        throw errors::HandshakeError(std::string("initialize failed: ") + e.what());
    }
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        state = State::Ready;
        serverInfo = result;
    }
    LOG_INFO(logger, "Client: initialized with {} {} (protocol {})", result.serverInfo.name,
             result.serverInfo.version, result.serverInfo.protocolVersion);
    co_return result;
}

async::Task<std::vector<Tool>> Client::Impl::coListTools(std::vector<std::string> names) {
    auto t = requireReady();
    std::optional<JSONValue> params;
    if (!names.empty()) {
        JSONValue::Array arr;
        for (const auto& n : names) {
            arr.push_back(std::make_shared<JSONValue>(n));
        }
        JSONValue::Object obj;
        obj["names"] = std::make_shared<JSONValue>(arr);
        params = JSONValue{obj};
    }
    JSONValue raw = co_await async::offload([this, t, params]() {
        return roundTrip(t, Methods::ListTools, params, options.requestTimeout);
    });

    // Servers answer with either a bare array or { tools: [...] }.
    const JSONValue* list = raw.isArray() ? &raw : FindMember(raw, "tools");
    if (!list || !list->isArray()) {
        throw errors::ProtocolError(errors::makeMcpError(JSONRPCErrorCodes::InternalError,
                                                         "tools/list result carries no tool array"));
    }
    std::vector<Tool> tools;
    for (const auto& item : std::get<JSONValue::Array>(list->get())) {
        if (!item) continue;
        auto tool = ToolFromJSON(*item);
        if (!tool.has_value()) {
            LOG_WARN(logger, "Client: skipping tools/list entry without a name");
            continue;
        }
        if (!names.empty() && std::find(names.begin(), names.end(), tool->name) == names.end()) {
            continue;
        }
        const JSONValue* schema = FindMember(*item, "inputSchema");
        if (!tolerance::ShouldAcceptSchema(schema, logger)) {
            LOG_WARN(logger, "Client: dropping tool {} with unusable input schema", tool->name);
            continue;
        }
        tolerance::LogSchemaForDebugging(tool->name, tool->inputSchema, logger);
        tools.push_back(std::move(tool.value()));
    }
    LOG_DEBUG(logger, "Client: discovered {} tool(s)", tools.size());
    co_return tools;
}

async::Task<ToolCallResult> Client::Impl::coCallTool(std::string name, JSONValue arguments) {
    auto t = requireReady();
    JSONRPCMessage reply = co_await async::offload([this, t, name, arguments]() {
        return callToolRoundTrip(t, name, arguments);
    });
    JSONValue raw = resultOf(reply);

    ToolCallResult out;
    out.isError = tolerance::IsError(raw, logger);
    if (out.isError) {
        out.errorMessage = tolerance::GetErrorMessage(raw, logger);
        LOG_DEBUG(logger, "Client: tool {} reported error: {}", name, out.errorMessage.value_or(""));
    }
    if (const JSONValue* content = FindMember(raw, "content")) {
        out.content = *content;
        out.text = tolerance::ExtractTextFromContent(*content);
    }
    out.raw = std::move(raw);
    co_return out;
}

async::Task<JSONValue> Client::Impl::coRequest(std::string method, std::optional<JSONValue> params,
                                               std::chrono::milliseconds timeout) {
    auto t = requireReady();
    JSONValue result = co_await async::offload([this, t, method, params, timeout]() {
        return roundTrip(t, method, params, timeout);
    });
    co_return result;
}

async::Task<tasks::TaskMetadata> Client::Impl::coTaskMetadata(std::string method, std::string taskId) {
    auto t = requireReady();
    JSONValue params = taskIdParams(taskId);
    JSONValue raw = co_await async::offload([this, t, method, params]() {
        return roundTrip(t, method, params, options.requestTimeout);
    });
    co_return tasks::TaskMetadataFromJSON(raw);
}

async::Task<tasks::TaskPage> Client::Impl::coListTasks(std::optional<std::string> cursor) {
    auto t = requireReady();
    std::optional<JSONValue> params;
    if (cursor.has_value()) {
        JSONValue::Object obj;
        obj["cursor"] = std::make_shared<JSONValue>(cursor.value());
        params = JSONValue{obj};
    }
    JSONValue raw = co_await async::offload([this, t, params]() {
        return roundTrip(t, Methods::TasksList, params, options.requestTimeout);
    });
    co_return tasks::TaskPageFromJSON(raw);
}

////////////////////////////////////////// Client //////////////////////////////////////////
Client::Client(ClientOptions options, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(logger))) {}

Client::~Client() {
    std::shared_ptr<ITransport> t;
    {
        std::lock_guard<std::mutex> lock(pImpl->stateMutex);
        t = std::move(pImpl->transport);
        pImpl->transport.reset();
    }
    if (t) {
        t->Stop().get();
    }
}

std::future<void> Client::Connect(std::unique_ptr<ITransport> transport) {
    return pImpl->coConnect(std::shared_ptr<ITransport>(std::move(transport))).toFuture();
}

std::future<void> Client::Disconnect() {
    return pImpl->coDisconnect().toFuture();
}

bool Client::IsConnected() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->transport && pImpl->transport->IsConnected();
}

bool Client::IsInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->state == Impl::State::Ready;
}

std::future<InitializeResult> Client::Initialize(const Implementation& clientInfo,
                                                 const ClientCapabilities& capabilities) {
    return pImpl->coInitialize(clientInfo, capabilities).toFuture();
}

std::optional<InitializeResult> Client::GetServerInfo() const {
    std::lock_guard<std::mutex> lock(pImpl->stateMutex);
    return pImpl->serverInfo;
}

std::future<std::vector<Tool>> Client::ListTools(const std::vector<std::string>& names) {
    return pImpl->coListTools(names).toFuture();
}

std::future<ToolCallResult> Client::CallTool(const std::string& name, const JSONValue& arguments) {
    return pImpl->coCallTool(name, arguments).toFuture();
}

std::future<tasks::TaskMetadata> Client::GetTask(const std::string& taskId) {
    return pImpl->coTaskMetadata(Methods::TasksGet, taskId).toFuture();
}

std::future<JSONValue> Client::GetTaskResult(const std::string& taskId) {
    return pImpl->coRequest(Methods::TasksResult, taskIdParams(taskId), pImpl->options.taskResultTimeout).toFuture();
}

std::future<tasks::TaskPage> Client::ListTasks(const std::optional<std::string>& cursor) {
    return pImpl->coListTasks(cursor).toFuture();
}

std::future<tasks::TaskMetadata> Client::CancelTask(const std::string& taskId) {
    return pImpl->coTaskMetadata(Methods::TasksCancel, taskId).toFuture();
}

std::future<JSONValue> Client::SendRequest(const std::string& method, const std::optional<JSONValue>& params) {
    return pImpl->coRequest(method, params, pImpl->options.requestTimeout).toFuture();
}

void Client::SendNotification(const std::string& method, const std::optional<JSONValue>& params) {
    auto t = pImpl->requireReady();
    t->Send(JSONRPCMessage::MakeNotification(method, params));
}

void Client::SetNotificationHandler(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->notificationHandlers[method] = std::move(handler);
}

void Client::RemoveNotificationHandler(const std::string& method) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->notificationHandlers.erase(method);
}

void Client::SetProgressHandler(ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->progressHandler = std::move(handler);
}

void Client::SetErrorHandler(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->errorHandler = std::move(handler);
}

void Client::SetRequestHandler(RequestHandler handler) {
    std::lock_guard<std::mutex> lock(pImpl->handlersMutex);
    pImpl->requestHandler = std::make_shared<RequestHandler>(std::move(handler));
}

std::size_t Client::PendingRequestCount() const {
    return pImpl->dispatcher.PendingCount();
}

std::unique_ptr<IClient> ClientFactory::CreateClient(const ClientOptions& options) {
    return std::make_unique<Client>(options, logger);
}

} // namespace mcpcore
