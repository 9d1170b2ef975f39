//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeTransport.hpp
// Purpose: Transport over a child process's stdin/stdout
//==========================================================================================================
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "mcpcore/LineFramer.h"
#include "mcpcore/Transport.h"

class Logger;

namespace mcpcore {

//==========================================================================================================
// PipeTransportOptions
// Fields:
//   command: Executable, resolved through PATH.
//   args: Arguments after argv[0].
//   env: Variables added to (or overriding) the parent environment for the child.
//   maxFrameBytes: Longest accepted inbound line.
//   stderrTailLines: How many of the child's most recent stderr lines to retain.
//   stopGracePeriod: Time the child gets after stdin closes before SIGTERM, and again before SIGKILL.
//==========================================================================================================
struct PipeTransportOptions {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::size_t maxFrameBytes{LineFramer::DefaultMaxFrameBytes};
    std::size_t stderrTailLines{50};
    std::chrono::milliseconds stopGracePeriod{2000};
};

//==========================================================================================================
// PipeTransport
// Purpose: Spawns the server and speaks newline-delimited JSON-RPC over its standard streams.
// Notes:
//   - Lines on the child's stdout that are not JSON are logged at DEBUG and skipped.
//   - The child's stderr is drained on its own thread, logged at DEBUG and kept as a bounded tail.
//   - Handlers must be set before Start().
//==========================================================================================================
class PipeTransport : public ITransport {
public:
    PipeTransport(PipeTransportOptions options, std::shared_ptr<Logger> logger);
    virtual ~PipeTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the child and starts the stdout reader and stderr drain threads.
    // Returns:
    //   Ready future; holds errors::TransportUnavailableError when the command cannot be executed.
    //==========================================================================================================
    std::future<void> Start() override;

    //==========================================================================================================
    // Closes the child's stdin, escalates SIGTERM then SIGKILL after the grace period, reaps the child
    // and joins both threads.
    //==========================================================================================================
    std::future<void> Stop() override;

    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const JSONRPCMessage& message) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

    // Most recent stderr lines from the child, oldest first.
    std::vector<std::string> GetStderrTail() const;

    // Child pid while running; -1 otherwise.
    int GetChildPid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// PipeTransportFactory
// Purpose: Builds pipe transports from "command=...;arg=...;arg=...;env=NAME=VALUE;max_frame_bytes=N;
//          stop_grace_ms=N".
//==========================================================================================================
class PipeTransportFactory : public ITransportFactory {
public:
    explicit PipeTransportFactory(std::shared_ptr<Logger> logger) : logger(std::move(logger)) {}
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;

private:
    std::shared_ptr<Logger> logger;
};

} // namespace mcpcore
