//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SocketTransport.cpp
// Purpose: Unix domain socket transport built on Boost.Asio local stream sockets
//==========================================================================================================

#include <sys/stat.h>

#include <atomic>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "logging/Logger.h"
#include "mcpcore/MessageCodec.h"
#include "mcpcore/SocketTransport.hpp"
#include "mcpcore/errors/Errors.h"

namespace mcpcore {

namespace net = boost::asio;
using local = net::local::stream_protocol;

class SocketTransport::Impl {
public:
    SocketTransportOptions options;
    std::shared_ptr<Logger> logger;
    LineFramer framer;
    net::io_context ioc;
    local::socket socket{ioc};
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> errorReported{false};
    std::string sessionId;
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    std::mutex lifecycleMutex;
    std::mutex writeMutex; // one frame at a time

    Impl(SocketTransportOptions opts, std::shared_ptr<Logger> log)
        : options(std::move(opts)), logger(std::move(log)), framer(options.maxFrameBytes),
          sessionId("unix-" + options.path) {}

    void reportError(const std::string& reason) {
        if (errorReported.exchange(true)) {
            return;
        }
        LOG_WARN(logger, "SocketTransport[{}]: {}", sessionId, reason);
        if (errorHandler) {
            errorHandler(reason);
        }
    }

    void connect() {
        struct stat st{};
        if (::stat(options.path.c_str(), &st) != 0) {
            throw errors::TransportUnavailableError("SocketTransport: socket not found: " + options.path);
        }
        if (!S_ISSOCK(st.st_mode)) {
            throw errors::TransportUnavailableError("SocketTransport: not a socket: " + options.path);
        }
        boost::system::error_code ec;
        socket.connect(local::endpoint(options.path), ec);
        if (ec) {
            throw errors::TransportUnavailableError("SocketTransport: connect to " + options.path + " failed: " + ec.message());
        }
        connected = true;
        LOG_INFO(logger, "SocketTransport: connected to {}", options.path);
    }

    std::string describe(const boost::system::error_code& ec) const {
        if (ec == net::error::eof) {
            return "SocketTransport: server closed the connection";
        }
        if (ec == net::error::not_found) {
            return "SocketTransport: inbound frame exceeds " + std::to_string(framer.getMaxFrameBytes()) + " bytes";
        }
        return "SocketTransport: read failed: " + ec.message();
    }

    net::awaitable<void> coReadLoop() {
        // The streambuf cap turns an overlong line into error::not_found.
        net::streambuf buffer(framer.getMaxFrameBytes() + 1);
        std::string exitReason;
        while (true) {
            boost::system::error_code ec;
            std::size_t n = co_await net::async_read_until(socket, buffer, '\n',
                                                           net::redirect_error(net::use_awaitable, ec));
            if (ec) {
                if (ec != net::error::operation_aborted) {
                    exitReason = describe(ec);
                }
                break;
            }
            std::string line(net::buffers_begin(buffer.data()), net::buffers_begin(buffer.data()) + static_cast<std::ptrdiff_t>(n));
            buffer.consume(n);
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!line.empty()) {
                DeliverFrame(line, messageHandler, logger, "SocketTransport");
            }
        }
        connected = false;
        if (!stopping.load() && !exitReason.empty()) {
            reportError(exitReason);
        }
        co_return;
    }

    // Queues the write on the io thread, which executes every write in order.
    std::future<boost::system::error_code> postWrite(std::string frame) {
        auto done = std::make_shared<std::promise<boost::system::error_code>>();
        auto result = done->get_future();
        net::post(ioc, [this, frame = std::move(frame), done]() {
            boost::system::error_code wec;
            net::write(socket, net::buffer(frame), wec);
            done->set_value(wec);
        });
        return result;
    }
};

SocketTransport::SocketTransport(SocketTransportOptions options, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(logger))) {}

SocketTransport::~SocketTransport() {
    Stop().get();
}

std::future<void> SocketTransport::Start() {
    std::promise<void> promise;
    auto future = promise.get_future();
    std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
    if (pImpl->started.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("SocketTransport: already started")));
        return future;
    }
    try {
        pImpl->connect();
    } catch (const errors::TransportError&) {
        promise.set_exception(std::current_exception());
        return future;
    }
    pImpl->started = true;
    pImpl->workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(pImpl->ioc));
    Impl* impl = pImpl.get();
    net::co_spawn(pImpl->ioc, pImpl->coReadLoop(), [impl](std::exception_ptr e) {
        if (!e) return;
        try {
            std::rethrow_exception(e);
        } catch (const std::exception& ex) {
            LOG_ERROR(impl->logger, "SocketTransport: read loop terminated: {}", ex.what());
            impl->connected = false;
            impl->reportError(std::string("SocketTransport: read loop terminated: ") + ex.what());
        }
    });
    pImpl->ioThread = std::thread([impl]() { impl->ioc.run(); });
    promise.set_value();
    return future;
}

std::future<void> SocketTransport::Stop() {
    std::promise<void> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
        if (!pImpl->started.load() || pImpl->stopping.exchange(true)) {
            promise.set_value();
            return future;
        }
    }
    LOG_INFO(pImpl->logger, "SocketTransport[{}]: stopping", pImpl->sessionId);
    {
        // Writes queued before this point still run ahead of the close below.
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        pImpl->connected = false;
    }
    Impl* impl = pImpl.get();
    auto closeSocket = [impl]() {
        boost::system::error_code ec;
        impl->socket.shutdown(local::socket::shutdown_both, ec);
        impl->socket.close(ec);
    };
    if (pImpl->ioc.get_executor().running_in_this_thread()) {
        closeSocket();
        pImpl->workGuard.reset();
        pImpl->ioThread.detach();
    } else {
        net::post(pImpl->ioc, closeSocket);
        pImpl->workGuard.reset();
        if (pImpl->ioThread.joinable()) {
            pImpl->ioThread.join();
        }
    }
    promise.set_value();
    return future;
}

bool SocketTransport::IsConnected() const { return pImpl->connected.load(); }
std::string SocketTransport::GetSessionId() const { return pImpl->sessionId; }

void SocketTransport::Send(const JSONRPCMessage& message) {
    std::string frame = pImpl->framer.encode(codec::EncodeMessage(message));
    const std::size_t frameSize = frame.size();
    const bool onIoThread = pImpl->ioc.get_executor().running_in_this_thread();
    boost::system::error_code ec;
    std::future<boost::system::error_code> pendingWrite;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        if (!pImpl->connected.load()) {
            throw errors::TransportError("SocketTransport: not connected");
        }
        if (onIoThread) {
            net::write(pImpl->socket, net::buffer(frame), ec);
        } else {
            // Posted under the lock so Stop() cannot release the io thread before this write is queued.
            pendingWrite = pImpl->postWrite(std::move(frame));
        }
    }
    if (!onIoThread) {
        ec = pendingWrite.get();
    }
    if (ec) {
        pImpl->connected = false;
        std::string failure = "SocketTransport: write failed: " + ec.message();
        pImpl->reportError(failure);
        throw errors::TransportError(failure);
    }
    LOG_DEBUG(pImpl->logger, "SocketTransport[{}]: sent {} bytes", pImpl->sessionId, frameSize);
}

void SocketTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void SocketTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

std::unique_ptr<ITransport> SocketTransportFactory::CreateTransport(const std::string& config) {
    SocketTransportOptions options;
    const std::string scheme = "unix://";
    if (config.rfind(scheme, 0) == 0) {
        options.path = config.substr(scheme.size());
    } else if (!config.empty() && config.front() == '/' && config.find('=') == std::string::npos) {
        options.path = config;
    } else {
        for (const auto& [key, val] : ParseTransportConfig(config)) {
            if (key == "path") {
                options.path = val;
            } else if (key == "max_frame_bytes") {
                try {
                    options.maxFrameBytes = static_cast<std::size_t>(std::stoull(val));
                } catch (const std::exception&) {
                    throw std::invalid_argument("SocketTransportFactory: invalid max_frame_bytes '" + val + "'");
                }
            } else {
                LOG_WARN(logger, "SocketTransportFactory: ignoring unknown key '{}'", key);
            }
        }
    }
    if (options.path.empty()) {
        throw std::invalid_argument("SocketTransportFactory: socket path is required");
    }
    return std::make_unique<SocketTransport>(std::move(options), logger);
}

} // namespace mcpcore
