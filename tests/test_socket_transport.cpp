//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_socket_transport.cpp
// Purpose: GoogleTests for the Unix domain socket transport against the fake server
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <future>

#include "mcpcore/SocketTransport.hpp"
#include "mcpcore/errors/Errors.h"
#include "mcpcore/tolerance/ErrorDetector.h"
#include "TestSupport.h"

using namespace mcpcore;
using namespace std::chrono_literals;

TEST(SocketTransport, MissingSocketIsUnavailable) {
    SocketTransportOptions opts;
    opts.path = testsupport::UniqueSocketPath("missing");
    SocketTransport t(opts, testsupport::QuietLogger());
    auto fut = t.Start();
    try {
        fut.get();
        FAIL() << "expected TransportUnavailableError";
    } catch (const errors::TransportUnavailableError& e) {
        EXPECT_NE(std::string(e.what()).find("socket not found"), std::string::npos);
    }
    EXPECT_FALSE(t.IsConnected());
}

TEST(SocketTransport, RegularFileIsNotASocket) {
    const std::string path = testsupport::UniqueSocketPath("file");
    { std::ofstream(path) << "not a socket"; }
    SocketTransportOptions opts;
    opts.path = path;
    SocketTransport t(opts, testsupport::QuietLogger());
    EXPECT_THROW(t.Start().get(), errors::TransportUnavailableError);
    std::remove(path.c_str());
}

TEST(SocketTransport, RoundTripWithFakeServer) {
    testsupport::FakeSocketServer server(testsupport::UniqueSocketPath("roundtrip"));
    ASSERT_TRUE(server.Ready());

    SocketTransportOptions opts;
    opts.path = server.Path();
    SocketTransport t(opts, testsupport::QuietLogger());
    testsupport::MessageInbox inbox;
    t.SetMessageHandler(inbox.Handler());
    ASSERT_NO_THROW(t.Start().get());
    EXPECT_TRUE(t.IsConnected());

    t.Send(testsupport::InitializeRequestMessage(1));
    auto init = inbox.Pop();
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ(init->Kind(), MessageKind::Response);
    EXPECT_EQ(init->id, JSONRPCId(1));

    JSONValue::Object args;
    args["text"] = std::make_shared<JSONValue>("over the socket");
    t.Send(testsupport::ToolCallMessage(2, "echo", args));
    auto reply = inbox.Pop();
    ASSERT_TRUE(reply.has_value());
    const JSONValue* content = FindMember(reply->result.value(), "content");
    ASSERT_NE(content, nullptr);
    EXPECT_EQ(tolerance::ExtractTextFromContent(*content), "over the socket");

    ASSERT_NO_THROW(t.Stop().get());
    EXPECT_FALSE(t.IsConnected());
    EXPECT_THROW(t.Send(testsupport::InitializeRequestMessage(3)), errors::TransportError);
}

TEST(SocketTransport, ServerExitReported) {
    testsupport::FakeSocketServer server(testsupport::UniqueSocketPath("exit"));
    ASSERT_TRUE(server.Ready());

    SocketTransportOptions opts;
    opts.path = server.Path();
    SocketTransport t(opts, testsupport::QuietLogger());
    std::promise<std::string> error;
    std::atomic<bool> reported{false};
    t.SetErrorHandler([&](const std::string& reason) {
        if (!reported.exchange(true)) error.set_value(reason);
    });
    t.SetMessageHandler([](JSONRPCMessage) {});
    t.Start().get();

    t.Send(testsupport::ToolCallMessage(1, "crash"));
    auto fut = error.get_future();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "SocketTransport: server closed the connection");
    EXPECT_FALSE(t.IsConnected());
}

TEST(SocketTransportFactory, AcceptsPathForms) {
    SocketTransportFactory factory(testsupport::QuietLogger());
    EXPECT_NE(factory.CreateTransport("unix:///tmp/a.sock"), nullptr);
    EXPECT_NE(factory.CreateTransport("/tmp/b.sock"), nullptr);
    EXPECT_NE(factory.CreateTransport("path=/tmp/c.sock;max_frame_bytes=65536"), nullptr);
    EXPECT_THROW(factory.CreateTransport("max_frame_bytes=10"), std::invalid_argument);
    EXPECT_THROW(factory.CreateTransport("path=/tmp/d.sock;max_frame_bytes=big"), std::invalid_argument);
}
