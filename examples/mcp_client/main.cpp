//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: MCP client example - connects to a server, lists its tools and optionally calls one
//==========================================================================================================

#include "logging/Logger.h"
#include "mcpcore/Client.h"
#include "mcpcore/PipeTransport.hpp"
#include "mcpcore/SocketTransport.hpp"
#include "mcpcore/Protocol.h"
#include "mcpcore/errors/Errors.h"
#include "mcpcore/version.h"
#include <iostream>
#include <optional>

using namespace mcpcore;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--transport")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

static void usage() {
    std::cerr << "usage: mcp_client --transport=pipe --pipecfg=\"command=/path/to/server;arg=--flag\"\n"
              << "       mcp_client --transport=socket --socket=/path/to/server.sock\n"
              << "       [--call=TOOL] [--text=ARG]\n";
}

int main(int argc, char** argv) {
    auto logger = Logger::Default();
    LOG_INFO(logger, "mcp_client {} starting", getVersionString());

    std::string transportKind = getArgValue(argc, argv, "--transport").value_or("pipe");
    std::unique_ptr<ITransport> transport;
    try {
        if (transportKind == "pipe") {
            auto cfg = getArgValue(argc, argv, "--pipecfg");
            if (!cfg.has_value()) {
                usage();
                return 2;
            }
            PipeTransportFactory f(logger);
            transport = f.CreateTransport(*cfg);
        } else if (transportKind == "socket") {
            auto path = getArgValue(argc, argv, "--socket");
            if (!path.has_value()) {
                usage();
                return 2;
            }
            SocketTransportFactory f(logger);
            transport = f.CreateTransport(*path);
        } else {
            LOG_ERROR(logger, "Unknown --transport option: {} (expected pipe|socket)", transportKind);
            return 2;
        }
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(logger, "Bad transport configuration: {}", e.what());
        return 2;
    }

    ClientFactory factory(logger);
    auto client = factory.CreateClient(ClientOptions::FromEnvironment());
    client->SetErrorHandler([logger](const std::string& err) { LOG_WARN(logger, "Connection error: {}", err); });
    client->SetProgressHandler([logger](const std::string& token, double progress, std::optional<double> total,
                                        const std::string& message) {
        LOG_INFO(logger, "Progress [{}] {}/{} {}", token, progress, total.value_or(0.0), message);
    });

    try {
        client->Connect(std::move(transport)).get();

        Implementation info{kClientName, getVersionString()};
        auto init = client->Initialize(info, ClientCapabilities{}).get();
        LOG_INFO(logger, "Server: {} {} - {}", init.serverInfo.name, init.serverInfo.version,
                 init.serverInfo.description.value_or("(no description)"));

        auto tools = client->ListTools().get();
        for (const auto& t : tools) {
            LOG_INFO(logger, "Tool: {} - {}", t.name, t.description);
        }

        if (auto tool = getArgValue(argc, argv, "--call"); tool.has_value()) {
            JSONValue::Object args;
            if (auto text = getArgValue(argc, argv, "--text"); text.has_value()) {
                args["text"] = std::make_shared<JSONValue>(*text);
            }
            auto result = client->CallTool(*tool, JSONValue{args}).get();
            if (result.isError) {
                LOG_ERROR(logger, "Tool {} failed: {}", *tool, result.errorMessage.value_or(""));
            } else {
                std::cout << result.text << std::endl;
            }
        }
    } catch (const errors::HandshakeError& e) {
        LOG_ERROR(logger, "Handshake failed: {}", e.what());
        client->Disconnect().get();
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(logger, "Request failed: {}", e.what());
        client->Disconnect().get();
        return 1;
    }

    // Exit: disconnect transport
    client->Disconnect().get();
    return 0;
}
