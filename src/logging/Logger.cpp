//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static members and environment-driven configuration
//==========================================================================================================

#include "logging/Logger.h"

LogLevel Logger::sLogLevel = LogLevel::LOG_INFO_LEVEL;
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

void Logger::configureFromEnv() {
    const std::string lvl = GetEnvOrDefault("MCPRT_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(toLogLevel(levelFromString(lvl)));
    }
    const std::string file = GetEnvOrDefault("MCPRT_LOG_FILE", "");
    if (!file.empty()) {
        setLogFile(file);
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    sLogFile << "\n=== mcprt log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}
