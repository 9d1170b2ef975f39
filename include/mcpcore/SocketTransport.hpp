//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SocketTransport.hpp
// Purpose: Transport over a Unix domain stream socket
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "mcpcore/LineFramer.h"
#include "mcpcore/Transport.h"

class Logger;

namespace mcpcore {

struct SocketTransportOptions {
    std::string path;
    std::size_t maxFrameBytes{LineFramer::DefaultMaxFrameBytes};
};

//==========================================================================================================
// SocketTransport
// Purpose: Newline-delimited JSON-RPC over an existing Unix domain socket.
// Notes:
//   - Start() checks that the path exists before connecting; a missing path or a refused connection
//     fails with errors::TransportUnavailableError rather than a generic I/O error.
//   - One Boost.Asio io_context thread runs the read loop; writes are executed on that thread too.
//==========================================================================================================
class SocketTransport : public ITransport {
public:
    SocketTransport(SocketTransportOptions options, std::shared_ptr<Logger> logger);
    virtual ~SocketTransport();

    std::future<void> Start() override;
    std::future<void> Stop() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    void Send(const JSONRPCMessage& message) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SocketTransportFactory
// Purpose: Accepts "path=/run/x.sock", "unix:///run/x.sock" or a bare path; optional max_frame_bytes=N.
//==========================================================================================================
class SocketTransportFactory : public ITransportFactory {
public:
    explicit SocketTransportFactory(std::shared_ptr<Logger> logger) : logger(std::move(logger)) {}
    std::unique_ptr<ITransport> CreateTransport(const std::string& config) override;

private:
    std::shared_ptr<Logger> logger;
};

} // namespace mcpcore
