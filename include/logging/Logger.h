//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Injectable leveled logger with {fmt} formatting, optional file output and a capture sink.
//==========================================================================================================
#pragma once

#include <atomic>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include <fmt/format.h>

//==========================================================================================================
// Logger
// Purpose: Leveled logger instance passed explicitly to every mcpcore component.
// Notes:
//   - Console output goes to stdout, or stderr when MCPCORE_STDIO_MODE=1 so that log text never
//     lands on a stdio JSON-RPC stream.
//   - MCPCORE_LOG_COLOR (default 1) colours the level label.
//   - A sink, when set, receives every emitted line in addition to the console and file.
//   - Default() exists for the outermost composition point (main, examples); library code never calls it.
//==========================================================================================================
class Logger {
public:
    enum class Level {
        DEBUG = 0,
        INFO  = 1,
        WARN  = 2,
        ERROR = 3,
        FATAL = 4
    };

    using Sink = std::function<void(Level level, const std::string& message)>;

    explicit Logger(Level level = Level::INFO);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    //==========================================================================================================
    // Returns the process-wide convenience logger (created on first use from the environment).
    //==========================================================================================================
    static std::shared_ptr<Logger> Default();

    //==========================================================================================================
    // Creates a logger whose level comes from MCPCORE_LOG_LEVEL (default INFO).
    //==========================================================================================================
    static std::shared_ptr<Logger> FromEnvironment();

    // Convert common level strings to Logger::Level (case-insensitive). Defaults to DEBUG.
    static Level levelFromString(const std::string& lvl);
    static const char* levelName(Level level);

    void setLevel(Level level) { minLevel.store(level); }
    Level getLevel() const { return minLevel.load(); }
    bool isEnabled(Level level) const { return static_cast<int>(level) >= static_cast<int>(minLevel.load()); }

    void setLogFile(const std::string& filePath);
    void setSink(Sink newSink);
    void setConsoleEnabled(bool enabled) { consoleEnabled.store(enabled); }

    //==========================================================================================================
    // Formats with {fmt} runtime format strings. A bad format string degrades to a "Format error" line.
    //==========================================================================================================
    template <typename... Args>
    void logf(Level level, const char* file, unsigned int line, fmt::string_view format, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(format, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = std::string("Format error: ") + e.what();
        }
        log(level, buffer, file, line);
    }

    void log(Level level, const std::string& msg, const char* file, unsigned int line);

private:
    std::atomic<Level> minLevel;
    std::atomic<bool> consoleEnabled{true};
    bool colorEnabled;
    bool useStderr;
    std::mutex mutex;
    std::ofstream logFile;
    Sink sink;
};

// Level-filtered logging macros. The logger expression may be a shared_ptr or raw pointer; null is a no-op.
#define MCPCORE_LOG_AT(logger, level, fmt, ...)                                                         \
    do {                                                                                                \
        auto&& mcpcoreLogRef_ = (logger);                                                               \
        if (mcpcoreLogRef_ && mcpcoreLogRef_->isEnabled(level)) {                                       \
            mcpcoreLogRef_->logf(level, __FILE__, __LINE__, fmt, ##__VA_ARGS__);                        \
        }                                                                                               \
    } while (0)

#define LOG_DEBUG(logger, fmt, ...) MCPCORE_LOG_AT(logger, Logger::Level::DEBUG, fmt, ##__VA_ARGS__)
#define LOG_INFO(logger, fmt, ...)  MCPCORE_LOG_AT(logger, Logger::Level::INFO, fmt, ##__VA_ARGS__)
#define LOG_WARN(logger, fmt, ...)  MCPCORE_LOG_AT(logger, Logger::Level::WARN, fmt, ##__VA_ARGS__)
#define LOG_ERROR(logger, fmt, ...) MCPCORE_LOG_AT(logger, Logger::Level::ERROR, fmt, ##__VA_ARGS__)
