//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger output, file handling and process-wide default instance.
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "env/EnvVars.h"

Logger::Logger(Level level)
    : minLevel(level),
      colorEnabled(GetEnvFlagOrDefault("MCPCORE_LOG_COLOR", true)),
      useStderr(GetEnvFlagOrDefault("MCPCORE_STDIO_MODE", false)) {}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
}

std::shared_ptr<Logger> Logger::Default() {
    static std::shared_ptr<Logger> instance = FromEnvironment();
    return instance;
}

std::shared_ptr<Logger> Logger::FromEnvironment() {
    const std::string lvl = GetEnvOrDefault("MCPCORE_LOG_LEVEL", "INFO");
    return std::make_shared<Logger>(levelFromString(lvl));
}

Logger::Level Logger::levelFromString(const std::string& lvl) {
    std::string s; s.reserve(lvl.size());
    for (char c : lvl) s.push_back(static_cast<char>(::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return Level::DEBUG;
    if (s == "INFO")  return Level::INFO;
    if (s == "WARN" || s == "WARNING")  return Level::WARN;
    if (s == "ERROR") return Level::ERROR;
    if (s == "FATAL") return Level::FATAL;
    return Level::DEBUG;
}

const char* Logger::levelName(Level level) {
    switch (level) {
        case Level::DEBUG: return "DEBUG";
        case Level::INFO:  return "INFO";
        case Level::WARN:  return "WARN";
        case Level::ERROR: return "ERROR";
        case Level::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(mutex);
    if (logFile.is_open()) {
        logFile.close();
    }
    logFile.open(filePath, std::ios::out | std::ios::app);
    if (!logFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    logFile << "\n=== Log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    logFile.flush();
}

void Logger::setSink(Sink newSink) {
    std::lock_guard<std::mutex> lock(mutex);
    sink = std::move(newSink);
}

void Logger::log(Level level, const std::string& msg, const char* file, unsigned int line) {
    const char* label = levelName(level);
    std::ostringstream plain;
    plain << "[" << label << "] " << file << ":" << line << ": " << msg;

    std::lock_guard<std::mutex> lock(mutex);
    if (consoleEnabled.load()) {
        std::ostringstream oss;
        if (colorEnabled) {
            const char* labelColor = (level >= Level::ERROR) ? "\033[38;5;88m" /* burgundy */ : "\033[35m" /* purple */;
            oss << "[" << labelColor << label << "\033[0m] " << file << ":" << line << ": " << msg << '\n';
        } else {
            oss << plain.str() << '\n';
        }
        if (useStderr) {
            std::cerr << oss.str() << std::flush;
        } else {
            std::cout << oss.str() << std::flush;
        }
    }
    if (logFile.is_open()) {
        logFile << plain.str() << '\n';
        logFile.flush();
    }
    if (sink) {
        sink(level, msg);
    }
}
