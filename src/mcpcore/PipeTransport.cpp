//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PipeTransport.cpp
// Purpose: Child-process transport: fork/exec, stdout reader loop, stderr drain, graceful shutdown
//==========================================================================================================

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <cstring>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "logging/Logger.h"
#include "mcpcore/MessageCodec.h"
#include "mcpcore/PipeTransport.hpp"
#include "mcpcore/errors/Errors.h"

extern char** environ;

namespace mcpcore {

namespace {

constexpr int PollIntervalMs = 250;

// Writes to a pipe whose reader has exited must fail with EPIPE instead of killing the process.
void ignoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, []() { ::signal(SIGPIPE, SIG_IGN); });
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string errnoText(int err) {
    return std::string(::strerror(err));
}

} // namespace

class PipeTransport::Impl {
public:
    PipeTransportOptions options;
    std::shared_ptr<Logger> logger;
    LineFramer framer;
    std::atomic<bool> connected{false};
    std::atomic<bool> started{false};
    std::atomic<bool> stopping{false};
    std::atomic<bool> errorReported{false};
    std::atomic<int> childPid{-1};
    std::string sessionId{"pipe-unstarted"};
    ITransport::MessageHandler messageHandler;
    ITransport::ErrorHandler errorHandler;
    std::thread readerThread;
    std::thread stderrThread;
    std::mutex lifecycleMutex;
    std::mutex writeMutex; // serializes frames on the child's stdin
    mutable std::mutex stderrMutex;
    std::deque<std::string> stderrTail;
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int wakeEventFd{-1};

    Impl(PipeTransportOptions opts, std::shared_ptr<Logger> log)
        : options(std::move(opts)), logger(std::move(log)), framer(options.maxFrameBytes) {}

    ~Impl() {
        closeFd(stdinFd);
        closeFd(stdoutFd);
        closeFd(stderrFd);
        closeFd(wakeEventFd);
    }

    void reportError(const std::string& reason) {
        if (errorReported.exchange(true)) {
            return;
        }
        LOG_WARN(logger, "PipeTransport[{}]: {}", sessionId, reason);
        if (errorHandler) {
            errorHandler(reason);
        }
    }

    void spawn() {
        if (options.command.empty()) {
            throw errors::TransportUnavailableError("PipeTransport: no command configured");
        }
        ignoreSigpipeOnce();

        int inPipe[2]{-1, -1};
        int outPipe[2]{-1, -1};
        int errPipe[2]{-1, -1};
        int execPipe[2]{-1, -1};
        auto closeAll = [&]() {
            for (int* p : {inPipe, outPipe, errPipe, execPipe}) {
                closeFd(p[0]);
                closeFd(p[1]);
            }
        };
        if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
            ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
            int err = errno;
            closeAll();
            throw errors::TransportUnavailableError("PipeTransport: pipe2 failed: " + errnoText(err));
        }

        // argv/envp are built before fork; the child only calls async-signal-safe functions.
        std::vector<std::string> argvStore;
        argvStore.push_back(options.command);
        argvStore.insert(argvStore.end(), options.args.begin(), options.args.end());
        std::vector<char*> argv;
        for (auto& a : argvStore) argv.push_back(a.data());
        argv.push_back(nullptr);

        std::vector<std::string> envStore;
        for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
            std::string entry(*e);
            auto eq = entry.find('=');
            if (eq != std::string::npos && options.env.count(entry.substr(0, eq)) > 0) {
                continue;
            }
            envStore.push_back(std::move(entry));
        }
        for (const auto& [name, value] : options.env) {
            envStore.push_back(name + "=" + value);
        }
        std::vector<char*> envp;
        for (auto& e : envStore) envp.push_back(e.data());
        envp.push_back(nullptr);

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            closeAll();
            throw errors::TransportUnavailableError("PipeTransport: fork failed: " + errnoText(err));
        }
        if (pid == 0) {
            ::dup2(inPipe[0], STDIN_FILENO);
            ::dup2(outPipe[1], STDOUT_FILENO);
            ::dup2(errPipe[1], STDERR_FILENO);
            ::execvpe(argv[0], argv.data(), envp.data());
            int err = errno;
            ssize_t ignored = ::write(execPipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        closeFd(inPipe[0]);
        closeFd(outPipe[1]);
        closeFd(errPipe[1]);
        closeFd(execPipe[1]);

        // The exec pipe is close-on-exec: EOF means exec succeeded, an int means it failed with that errno.
        int execErr = 0;
        ssize_t n;
        do {
            n = ::read(execPipe[0], &execErr, sizeof(execErr));
        } while (n < 0 && errno == EINTR);
        closeFd(execPipe[0]);
        if (n == static_cast<ssize_t>(sizeof(execErr))) {
            int status = 0;
            ::waitpid(pid, &status, 0);
            closeAll();
            throw errors::TransportUnavailableError("PipeTransport: cannot execute '" + options.command + "': " +
                                                    errnoText(execErr));
        }

        stdinFd = inPipe[1];
        stdoutFd = outPipe[0];
        stderrFd = errPipe[0];
        wakeEventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wakeEventFd < 0) {
            LOG_ERROR(logger, "PipeTransport: failed to create eventfd (errno={} msg={})", errno, ::strerror(errno));
        }
        childPid = pid;
        sessionId = "pipe-" + std::to_string(pid);
        connected = true;
        LOG_INFO(logger, "PipeTransport: started '{}' (pid={})", options.command, pid);
    }

    bool drainFrames(std::string& buffer, std::string& exitReason) {
        while (true) {
            auto r = framer.tryDecodeEx(buffer);
            if (r.status == LineFramer::DecodeStatus::Incomplete) {
                buffer.erase(0, r.bytesConsumed);
                return true;
            }
            if (r.status == LineFramer::DecodeStatus::FrameTooLarge) {
                exitReason = "PipeTransport: inbound frame exceeds " + std::to_string(framer.getMaxFrameBytes()) + " bytes";
                buffer.clear();
                return false;
            }
            buffer.erase(0, r.bytesConsumed);
            DeliverFrame(r.payload.value(), messageHandler, logger, "PipeTransport");
        }
    }

    void startReader() {
        readerThread = std::thread([this]() {
            std::string buffer;
            std::vector<char> chunk(64 * 1024);
            std::string exitReason;
            while (!stopping.load()) {
                pollfd pfds[2];
                pfds[0].fd = stdoutFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
                int rc = ::poll(pfds, wakeEventFd >= 0 ? 2 : 1, PollIntervalMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    exitReason = "PipeTransport: poll failed: " + errnoText(errno);
                    break;
                }
                if (rc == 0) continue;
                if (wakeEventFd >= 0 && (pfds[1].revents & POLLIN)) break;
                if ((pfds[0].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
                ssize_t n = ::read(stdoutFd, chunk.data(), chunk.size());
                if (n < 0) {
                    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
                    exitReason = "PipeTransport: read error: " + errnoText(errno);
                    break;
                }
                if (n == 0) {
                    exitReason = "PipeTransport: server closed its stdout";
                    break;
                }
                buffer.append(chunk.data(), static_cast<std::size_t>(n));
                if (!drainFrames(buffer, exitReason)) break;
            }
            connected = false;
            if (!stopping.load() && !exitReason.empty()) {
                reportError(exitReason);
            }
        });
    }

    void recordStderrLine(std::string line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) return;
        LOG_DEBUG(logger, "PipeTransport[{}] stderr: {}", sessionId, line);
        std::lock_guard<std::mutex> lock(stderrMutex);
        stderrTail.push_back(std::move(line));
        while (stderrTail.size() > options.stderrTailLines) {
            stderrTail.pop_front();
        }
    }

    void startStderrDrain() {
        stderrThread = std::thread([this]() {
            std::string partial;
            std::vector<char> chunk(4096);
            while (true) {
                pollfd pfds[2];
                pfds[0].fd = stderrFd; pfds[0].events = POLLIN; pfds[0].revents = 0;
                pfds[1].fd = wakeEventFd; pfds[1].events = POLLIN; pfds[1].revents = 0;
                int rc = ::poll(pfds, wakeEventFd >= 0 ? 2 : 1, PollIntervalMs);
                if (rc < 0) {
                    if (errno == EINTR) continue;
                    break;
                }
                if (rc > 0 && (pfds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
                    ssize_t n = ::read(stderrFd, chunk.data(), chunk.size());
                    if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
                    if (n <= 0) break;
                    partial.append(chunk.data(), static_cast<std::size_t>(n));
                    std::size_t eol;
                    while ((eol = partial.find('\n')) != std::string::npos) {
                        recordStderrLine(partial.substr(0, eol));
                        partial.erase(0, eol + 1);
                    }
                    continue;
                }
                if (wakeEventFd >= 0 && rc > 0 && (pfds[1].revents & POLLIN)) break;
                if (stopping.load() && wakeEventFd < 0) break;
            }
            if (!partial.empty()) {
                recordStderrLine(std::move(partial));
            }
        });
    }

    bool waitForExit(pid_t pid, std::chrono::milliseconds within) {
        auto deadline = std::chrono::steady_clock::now() + within;
        while (true) {
            int status = 0;
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid || (r < 0 && errno == ECHILD)) {
                return true;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void terminateChild() {
        pid_t pid = childPid.exchange(-1);
        if (pid <= 0) return;
        if (waitForExit(pid, options.stopGracePeriod)) return;
        LOG_INFO(logger, "PipeTransport: child {} still running after stdin closed; sending SIGTERM", pid);
        ::kill(pid, SIGTERM);
        if (waitForExit(pid, options.stopGracePeriod)) return;
        LOG_WARN(logger, "PipeTransport: child {} ignored SIGTERM; sending SIGKILL", pid);
        ::kill(pid, SIGKILL);
        int status = 0;
        ::waitpid(pid, &status, 0);
    }

    void wake() {
        if (wakeEventFd < 0) return;
        uint64_t one = 1;
        ssize_t w;
        do {
            w = ::write(wakeEventFd, &one, sizeof(one));
        } while (w < 0 && errno == EINTR);
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            LOG_WARN(logger, "PipeTransport: eventfd write failed (errno={} msg={})", errno, ::strerror(errno));
        }
    }

    void joinThread(std::thread& t) {
        if (!t.joinable()) return;
        if (t.get_id() == std::this_thread::get_id()) {
            // Stop() called from a handler running on this thread.
            t.detach();
            return;
        }
        t.join();
    }
};

PipeTransport::PipeTransport(PipeTransportOptions options, std::shared_ptr<Logger> logger)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(logger))) {}

PipeTransport::~PipeTransport() {
    Stop().get();
}

std::future<void> PipeTransport::Start() {
    std::promise<void> promise;
    auto future = promise.get_future();
    std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
    if (pImpl->started.load()) {
        promise.set_exception(std::make_exception_ptr(errors::TransportError("PipeTransport: already started")));
        return future;
    }
    try {
        pImpl->spawn();
    } catch (const errors::TransportError&) {
        promise.set_exception(std::current_exception());
        return future;
    }
    pImpl->started = true;
    pImpl->startReader();
    pImpl->startStderrDrain();
    promise.set_value();
    return future;
}

std::future<void> PipeTransport::Stop() {
    std::promise<void> promise;
    auto future = promise.get_future();
    {
        std::lock_guard<std::mutex> lock(pImpl->lifecycleMutex);
        if (!pImpl->started.load() || pImpl->stopping.exchange(true)) {
            promise.set_value();
            return future;
        }
    }
    LOG_INFO(pImpl->logger, "PipeTransport[{}]: stopping", pImpl->sessionId);
    pImpl->connected = false;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        closeFd(pImpl->stdinFd);
    }
    pImpl->terminateChild();
    pImpl->wake();
    pImpl->joinThread(pImpl->readerThread);
    pImpl->joinThread(pImpl->stderrThread);
    promise.set_value();
    return future;
}

bool PipeTransport::IsConnected() const { return pImpl->connected.load(); }
std::string PipeTransport::GetSessionId() const { return pImpl->sessionId; }

void PipeTransport::Send(const JSONRPCMessage& message) {
    const std::string frame = pImpl->framer.encode(codec::EncodeMessage(message));
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(pImpl->writeMutex);
        if (!pImpl->connected.load() || pImpl->stdinFd < 0) {
            throw errors::TransportError("PipeTransport: not connected");
        }
        std::size_t total = 0;
        while (total < frame.size()) {
            ssize_t w = ::write(pImpl->stdinFd, frame.data() + total, frame.size() - total);
            if (w > 0) {
                total += static_cast<std::size_t>(w);
            } else if (w < 0 && errno == EINTR) {
                continue;
            } else {
                failure = "PipeTransport: write failed: " + errnoText(errno);
                pImpl->connected = false;
                break;
            }
        }
    }
    if (!failure.empty()) {
        pImpl->reportError(failure);
        throw errors::TransportError(failure);
    }
    LOG_DEBUG(pImpl->logger, "PipeTransport[{}]: sent {} bytes", pImpl->sessionId, frame.size());
}

void PipeTransport::SetMessageHandler(MessageHandler handler) { pImpl->messageHandler = std::move(handler); }
void PipeTransport::SetErrorHandler(ErrorHandler handler) { pImpl->errorHandler = std::move(handler); }

std::vector<std::string> PipeTransport::GetStderrTail() const {
    std::lock_guard<std::mutex> lock(pImpl->stderrMutex);
    return std::vector<std::string>(pImpl->stderrTail.begin(), pImpl->stderrTail.end());
}

int PipeTransport::GetChildPid() const { return pImpl->childPid.load(); }

std::unique_ptr<ITransport> PipeTransportFactory::CreateTransport(const std::string& config) {
    PipeTransportOptions options;
    auto parseSize = [](const std::string& key, const std::string& s) -> std::size_t {
        try {
            return static_cast<std::size_t>(std::stoull(s));
        } catch (const std::exception&) {
            throw std::invalid_argument("PipeTransportFactory: invalid " + key + " '" + s + "'");
        }
    };
    for (const auto& [key, val] : ParseTransportConfig(config)) {
        if (key == "command") {
            options.command = val;
        } else if (key == "arg") {
            options.args.push_back(val);
        } else if (key == "env") {
            auto eq = val.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw std::invalid_argument("PipeTransportFactory: env entry must be NAME=VALUE: '" + val + "'");
            }
            options.env[val.substr(0, eq)] = val.substr(eq + 1);
        } else if (key == "max_frame_bytes") {
            options.maxFrameBytes = parseSize(key, val);
        } else if (key == "stop_grace_ms") {
            options.stopGracePeriod = std::chrono::milliseconds(static_cast<int64_t>(parseSize(key, val)));
        } else if (key == "stderr_tail_lines") {
            options.stderrTailLines = parseSize(key, val);
        } else {
            LOG_WARN(logger, "PipeTransportFactory: ignoring unknown key '{}'", key);
        }
    }
    if (options.command.empty()) {
        throw std::invalid_argument("PipeTransportFactory: 'command' is required");
    }
    return std::make_unique<PipeTransport>(std::move(options), logger);
}

} // namespace mcpcore
