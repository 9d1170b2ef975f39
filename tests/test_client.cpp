//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_client.cpp
// Purpose: End-to-end GoogleTests for Client against the fake server over pipes
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <future>
#include <mutex>
#include <vector>

#include "mcpcore/Client.h"
#include "mcpcore/PipeTransport.hpp"
#include "mcpcore/errors/Errors.h"
#include "TestSupport.h"

using namespace mcpcore;
using namespace std::chrono_literals;

namespace {

JSONValue args(std::initializer_list<std::pair<const char*, JSONValue>> fields) {
    JSONValue::Object obj;
    for (const auto& [key, value] : fields) {
        obj[key] = std::make_shared<JSONValue>(value);
    }
    return JSONValue{obj};
}

std::unique_ptr<ITransport> fakeServer(std::vector<std::string> extra = {}) {
    return std::make_unique<PipeTransport>(testsupport::FakeServerPipeOptions(std::move(extra)),
                                           testsupport::QuietLogger());
}

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        client = std::make_unique<Client>(options(), testsupport::QuietLogger());
        client->Connect(fakeServer()).get();
        client->Initialize(Implementation("tests", "1.0"), ClientCapabilities{}).get();
    }

    void TearDown() override {
        if (client) client->Disconnect().get();
    }

    virtual ClientOptions options() {
        ClientOptions opts;
        opts.requestTimeout = 5s;
        opts.handshakeTimeout = 5s;
        opts.toolCallIdleTimeout = 5s;
        return opts;
    }

    std::unique_ptr<Client> client;
};

} // namespace

////////////////////////////////////////// Handshake //////////////////////////////////////////

TEST_F(ClientTest, HandshakeCapturesServerInfo) {
    EXPECT_TRUE(client->IsConnected());
    EXPECT_TRUE(client->IsInitialized());
    auto info = client->GetServerInfo();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->serverInfo.name, "fake-server");
    EXPECT_EQ(info->serverInfo.version, "1.0.0");
    EXPECT_EQ(info->serverInfo.description.value_or(""), "greets tests");
    EXPECT_EQ(info->serverInfo.protocolVersion, PROTOCOL_VERSION);
    EXPECT_TRUE(info->capabilities.providesTools);
}

TEST_F(ClientTest, SecondInitializeIsLogicError) {
    EXPECT_THROW(client->Initialize(Implementation("tests", "1.0"), ClientCapabilities{}).get(), std::logic_error);
    EXPECT_TRUE(client->IsInitialized());
}

TEST(ClientHandshake, RequestsBeforeConnectAreTransportErrors) {
    Client client(ClientOptions{}, testsupport::QuietLogger());
    EXPECT_FALSE(client.IsConnected());
    EXPECT_THROW(client.ListTools().get(), errors::TransportError);
    EXPECT_THROW(client.Initialize(Implementation("tests", "1.0"), ClientCapabilities{}).get(),
                 errors::TransportError);
}

TEST(ClientHandshake, RequestsBeforeInitializeAreRejected) {
    Client client(ClientOptions{}, testsupport::QuietLogger());
    client.Connect(fakeServer()).get();
    EXPECT_TRUE(client.IsConnected());
    EXPECT_FALSE(client.IsInitialized());
    EXPECT_THROW(client.ListTools().get(), errors::HandshakeError);
    EXPECT_THROW(client.CallTool("echo", args({{"text", JSONValue("hi")}})).get(), errors::HandshakeError);
    EXPECT_THROW(client.SendNotification("notifications/initialized"), errors::HandshakeError);
    EXPECT_EQ(client.PendingRequestCount(), 0u);
    client.Disconnect().get();
}

TEST(ClientHandshake, RefusedInitializeLeavesConnectionUnusable) {
    Client client(ClientOptions{}, testsupport::QuietLogger());
    client.Connect(fakeServer({"--fail-initialize"})).get();
    try {
        client.Initialize(Implementation("tests", "1.0"), ClientCapabilities{}).get();
        FAIL() << "expected HandshakeError";
    } catch (const errors::HandshakeError& e) {
        EXPECT_NE(std::string(e.what()).find("initialize refused"), std::string::npos);
    }
    EXPECT_FALSE(client.IsInitialized());
    EXPECT_FALSE(client.IsConnected());
    EXPECT_FALSE(client.GetServerInfo().has_value());
    EXPECT_THROW(client.ListTools().get(), errors::HandshakeError);
    EXPECT_THROW(client.GetTask("anything").get(), errors::HandshakeError);
    client.Disconnect().get();
}

TEST(ClientHandshake, ConnectFailureSurfacesThroughFuture) {
    Client client(ClientOptions{}, testsupport::QuietLogger());
    PipeTransportOptions opts;
    opts.command = "/nonexistent/mcp-server-binary";
    EXPECT_THROW(client.Connect(std::make_unique<PipeTransport>(opts, testsupport::QuietLogger())).get(),
                 errors::TransportUnavailableError);
    EXPECT_FALSE(client.IsConnected());
    EXPECT_THROW(client.Connect(nullptr).get(), std::invalid_argument);
}

////////////////////////////////////////// Tools //////////////////////////////////////////

TEST_F(ClientTest, ListToolsKeepsUsableSchemas) {
    std::vector<Tool> tools = client->ListTools().get();
    std::vector<std::string> names;
    for (const auto& t : tools) names.push_back(t.name);
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"echo", "numeric_type", "string_properties"}));
}

TEST_F(ClientTest, ListToolsHonoursNameFilter) {
    std::vector<Tool> tools = client->ListTools({"echo", "null_schema"}).get();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_TRUE(tools[0].inputSchema.isObject());
}

TEST_F(ClientTest, CallToolReturnsText) {
    ToolCallResult r = client->CallTool("echo", args({{"text", JSONValue("hello")}})).get();
    EXPECT_FALSE(r.isError);
    EXPECT_FALSE(r.errorMessage.has_value());
    EXPECT_EQ(r.text, "hello");
    EXPECT_TRUE(r.content.isArray());
}

TEST_F(ClientTest, ToolsWithQuestionableSchemasStillCallable) {
    EXPECT_EQ(client->CallTool("numeric_type", args({})).get().text, "numeric_type ok");
    EXPECT_EQ(client->CallTool("string_properties", args({})).get().text, "string_properties ok");
}

TEST_F(ClientTest, ToolReportedErrorsAreValues) {
    ToolCallResult flagged = client->CallTool("flag_error", args({})).get();
    EXPECT_TRUE(flagged.isError);
    EXPECT_EQ(flagged.errorMessage.value_or(""), "disk full");

    ToolCallResult legacy = client->CallTool("legacy_error", args({})).get();
    EXPECT_TRUE(legacy.isError);
    EXPECT_EQ(legacy.errorMessage.value_or(""), "bad arg");
}

TEST_F(ClientTest, JsonRpcErrorReplyIsProtocolError) {
    try {
        client->CallTool("rpc_error", args({})).get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.GetCode(), JSONRPCErrorCodes::ToolNotFound);
        EXPECT_NE(std::string(e.what()).find("no such tool: rpc_error"), std::string::npos);
    }
    EXPECT_EQ(client->PendingRequestCount(), 0u);
}

TEST_F(ClientTest, DuplicateReplyOnlyResolvesOnce) {
    EXPECT_EQ(client->CallTool("duplicate", args({})).get().text, "first");
    EXPECT_EQ(client->CallTool("echo", args({{"text", JSONValue("next")}})).get().text, "next");
}

TEST_F(ClientTest, StringIdReplyMatchesNumericRequest) {
    EXPECT_EQ(client->CallTool("string_id", args({})).get().text, "string id");
}

TEST_F(ClientTest, NoiseOnStdoutIsIgnored) {
    EXPECT_EQ(client->CallTool("noise", args({})).get().text, "after noise");
}

TEST_F(ClientTest, ConcurrentCallsAreCorrelated) {
    std::vector<std::future<ToolCallResult>> calls;
    for (int i = 0; i < 20; ++i) {
        calls.push_back(client->CallTool("echo", args({{"text", JSONValue("call " + std::to_string(i))}})));
    }
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(calls[i].get().text, "call " + std::to_string(i));
    }
    EXPECT_EQ(client->PendingRequestCount(), 0u);
}

////////////////////////////////////////// Progress and timeouts //////////////////////////////////////////

TEST_F(ClientTest, ProgressHandlerReceivesNotifications) {
    std::mutex m;
    std::vector<std::pair<double, std::string>> seen;
    std::optional<double> lastTotal;
    client->SetProgressHandler([&](const std::string&, double progress, std::optional<double> total,
                                   const std::string& message) {
        std::lock_guard<std::mutex> lock(m);
        seen.emplace_back(progress, message);
        lastTotal = total;
    });
    ToolCallResult r = client->CallTool("progress", args({{"steps", JSONValue(static_cast<int64_t>(3))},
                                                          {"intervalMs", JSONValue(static_cast<int64_t>(10))}})).get();
    EXPECT_EQ(r.text, "progress done");
    std::lock_guard<std::mutex> lock(m);
    ASSERT_EQ(seen.size(), 3u);
    EXPECT_DOUBLE_EQ(seen[0].first, 1.0);
    EXPECT_EQ(seen[2].second, "step 3");
    EXPECT_DOUBLE_EQ(lastTotal.value_or(0.0), 3.0);
}

namespace {
class ShortTimeoutClientTest : public ClientTest {
protected:
    ClientOptions options() override {
        ClientOptions opts = ClientTest::options();
        opts.toolCallIdleTimeout = 250ms;
        opts.toolCallMaxTime = 2s;
        return opts;
    }
};
} // namespace

TEST_F(ShortTimeoutClientTest, ProgressExtendsIdleTimeout) {
    // Six steps 100ms apart run well past the idle timeout, but never go quiet for longer than it.
    ToolCallResult r = client->CallTool("progress", args({{"steps", JSONValue(static_cast<int64_t>(6))},
                                                          {"intervalMs", JSONValue(static_cast<int64_t>(100))}})).get();
    EXPECT_EQ(r.text, "progress done");
}

TEST_F(ShortTimeoutClientTest, SilentToolTimesOut) {
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(client->CallTool("silent", args({})).get(), errors::TimeoutError);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 250ms);
    EXPECT_EQ(client->PendingRequestCount(), 0u);
    EXPECT_EQ(client->CallTool("echo", args({{"text", JSONValue("alive")}})).get().text, "alive");
}

TEST_F(ShortTimeoutClientTest, MaxTimeCapsProgressingCall) {
    try {
        client->CallTool("progress", args({{"steps", JSONValue(static_cast<int64_t>(40))},
                                           {"intervalMs", JSONValue(static_cast<int64_t>(100))}})).get();
        FAIL() << "expected TimeoutError";
    } catch (const errors::TimeoutError& e) {
        EXPECT_NE(std::string(e.what()).find("maximum time"), std::string::npos);
    }
}

////////////////////////////////////////// Raw requests //////////////////////////////////////////

TEST_F(ClientTest, SendRequestReturnsResultMember) {
    JSONValue raw = client->SendRequest(Methods::ListTools).get();
    const JSONValue* tools = FindMember(raw, "tools");
    ASSERT_NE(tools, nullptr);
    EXPECT_TRUE(tools->isArray());

    try {
        client->SendRequest("bogus/method").get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.GetCode(), JSONRPCErrorCodes::MethodNotFound);
    }
}

////////////////////////////////////////// Tasks //////////////////////////////////////////

TEST_F(ClientTest, TaskLifecycle) {
    ToolCallResult started = client->CallTool("start_task", args({{"delayMs", JSONValue(static_cast<int64_t>(300))}})).get();
    const std::string taskId = GetStringMember(started.raw, "taskId").value_or("");
    ASSERT_EQ(taskId.size(), 36u);

    tasks::TaskMetadata meta = client->GetTask(taskId).get();
    EXPECT_EQ(meta.taskId, taskId);
    EXPECT_EQ(meta.status, tasks::TaskStatus::Working);

    tasks::TaskPage page = client->ListTasks().get();
    EXPECT_TRUE(std::any_of(page.tasks.begin(), page.tasks.end(),
                            [&](const tasks::TaskMetadata& m) { return m.taskId == taskId; }));

    JSONValue result = client->GetTaskResult(taskId).get();
    const JSONValue* content = FindMember(result, "content");
    ASSERT_NE(content, nullptr);
    EXPECT_TRUE(content->isArray());
    EXPECT_EQ(client->GetTask(taskId).get().status, tasks::TaskStatus::Completed);
}

TEST_F(ClientTest, FailedTaskResultIsProtocolError) {
    ToolCallResult started = client->CallTool("start_task", args({{"delayMs", JSONValue(static_cast<int64_t>(10))},
                                                                  {"fail", JSONValue(true)}})).get();
    const std::string taskId = GetStringMember(started.raw, "taskId").value_or("");
    try {
        client->GetTaskResult(taskId).get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.GetCode(), JSONRPCErrorCodes::InternalError);
        EXPECT_NE(std::string(e.what()).find("task exploded"), std::string::npos);
    }
    EXPECT_EQ(client->GetTask(taskId).get().status, tasks::TaskStatus::Failed);
}

TEST_F(ClientTest, CancelTaskOnceThenInvalidRequest) {
    ToolCallResult started = client->CallTool("start_task", args({{"delayMs", JSONValue(static_cast<int64_t>(5000))}})).get();
    const std::string taskId = GetStringMember(started.raw, "taskId").value_or("");

    tasks::TaskMetadata canceled = client->CancelTask(taskId).get();
    EXPECT_EQ(canceled.status, tasks::TaskStatus::Canceled);
    try {
        client->CancelTask(taskId).get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.GetCode(), JSONRPCErrorCodes::InvalidRequest);
    }
}

TEST_F(ClientTest, UnknownTaskIsProtocolError) {
    try {
        client->GetTask("00000000-0000-4000-8000-000000000000").get();
        FAIL() << "expected ProtocolError";
    } catch (const errors::ProtocolError& e) {
        EXPECT_EQ(e.GetCode(), JSONRPCErrorCodes::InvalidRequestId);
    }
}

////////////////////////////////////////// Server-initiated requests //////////////////////////////////////////

TEST_F(ClientTest, ServerRequestWithoutHandlerGetsMethodNotFound) {
    EXPECT_EQ(client->CallTool("server_request", args({})).get().text, "error -32601");
}

TEST_F(ClientTest, ServerRequestAnsweredByHandler) {
    client->SetRequestHandler([](const JSONRPCMessage& req) {
        EXPECT_EQ(req.method.value_or(""), "ping");
        return JSONRPCMessage::MakeResponse(req.id, args({{"pong", JSONValue(true)}}));
    });
    EXPECT_EQ(client->CallTool("server_request", args({})).get().text, R"(result {"pong":true})");
}

TEST_F(ClientTest, ThrowingRequestHandlerRepliesInternalError) {
    client->SetRequestHandler([](const JSONRPCMessage&) -> JSONRPCMessage {
        throw std::runtime_error("handler broke");
    });
    EXPECT_EQ(client->CallTool("server_request", args({})).get().text, "error -32603");
}

TEST_F(ClientTest, NotificationHandlerSeesProgress) {
    std::atomic<int> count{0};
    client->SetNotificationHandler(Methods::Progress, [&](const std::string& method, const JSONValue& params) {
        EXPECT_EQ(method, Methods::Progress);
        EXPECT_NE(FindMember(params, "progressToken"), nullptr);
        count.fetch_add(1);
    });
    client->CallTool("progress", args({{"steps", JSONValue(static_cast<int64_t>(2))},
                                       {"intervalMs", JSONValue(static_cast<int64_t>(5))}})).get();
    EXPECT_EQ(count.load(), 2);

    client->RemoveNotificationHandler(Methods::Progress);
    client->CallTool("progress", args({{"steps", JSONValue(static_cast<int64_t>(2))},
                                       {"intervalMs", JSONValue(static_cast<int64_t>(5))}})).get();
    EXPECT_EQ(count.load(), 2);
}

////////////////////////////////////////// Connection loss //////////////////////////////////////////

TEST_F(ClientTest, ServerCrashFailsPendingAndNotifies) {
    std::promise<std::string> reported;
    std::atomic<bool> once{false};
    client->SetErrorHandler([&](const std::string& reason) {
        if (!once.exchange(true)) reported.set_value(reason);
    });
    auto slow = client->CallTool("slow", args({{"delayMs", JSONValue(static_cast<int64_t>(3000))}}));
    EXPECT_THROW(client->CallTool("crash", args({})).get(), errors::TransportError);
    EXPECT_THROW(slow.get(), errors::TransportError);

    auto fut = reported.get_future();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "PipeTransport: server closed its stdout");
    EXPECT_FALSE(client->IsInitialized());
    EXPECT_EQ(client->PendingRequestCount(), 0u);
    EXPECT_THROW(client->ListTools().get(), errors::TransportError);
}

TEST_F(ClientTest, DisconnectThenReconnect) {
    client->Disconnect().get();
    EXPECT_FALSE(client->IsConnected());
    EXPECT_FALSE(client->IsInitialized());
    EXPECT_THROW(client->CallTool("echo", args({})).get(), errors::TransportError);

    client->Connect(fakeServer()).get();
    client->Initialize(Implementation("again", "2.0"), ClientCapabilities{}).get();
    EXPECT_EQ(client->GetServerInfo()->serverInfo.description.value_or(""), "greets again");
    EXPECT_EQ(client->CallTool("echo", args({{"text", JSONValue("back")}})).get().text, "back");
}

////////////////////////////////////////// Factory and options //////////////////////////////////////////

TEST(ClientFactory, CreatesWorkingClient) {
    ClientFactory factory(testsupport::QuietLogger());
    std::unique_ptr<IClient> client = factory.CreateClient(ClientOptions{});
    ASSERT_NE(client, nullptr);
    client->Connect(fakeServer()).get();
    client->Initialize(Implementation("factory", "1.0"), ClientCapabilities{}).get();
    EXPECT_EQ(client->ListTools({"echo"}).get().size(), 1u);
    client->Disconnect().get();
}

TEST(ClientOptions, FromEnvironmentOverridesDefaults) {
    ::setenv("MCPCORE_REQUEST_TIMEOUT_MS", "1234", 1);
    ::setenv("MCPCORE_TOOL_IDLE_TIMEOUT_MS", "not-a-number", 1);
    ClientOptions opts = ClientOptions::FromEnvironment();
    ::unsetenv("MCPCORE_REQUEST_TIMEOUT_MS");
    ::unsetenv("MCPCORE_TOOL_IDLE_TIMEOUT_MS");
    EXPECT_EQ(opts.requestTimeout, 1234ms);
    EXPECT_EQ(opts.toolCallIdleTimeout, ClientOptions{}.toolCallIdleTimeout);
    EXPECT_EQ(opts.handshakeTimeout, ClientOptions{}.handshakeTimeout);
}
