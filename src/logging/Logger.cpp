//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger sinks and level parsing
//==========================================================================================================

#include "logging/Logger.h"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>

#include "env/EnvVars.h"

namespace {

std::mutex& sinkMutex() {
    static std::mutex m;
    return m;
}

std::ofstream& logFile() {
    static std::ofstream f;
    return f;
}

bool envFlag(const char* name, const char* fallback) {
    const std::string v = GetEnvOrDefault(name, fallback);
    return v == "1" || v == "true" || v == "TRUE";
}

const char* baseName(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash != nullptr ? slash + 1 : path;
}

std::string utcTimestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
    ::gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return fmt::format("{}.{:03}Z", buf, ms);
}

// Short stable tag per thread so interleaved HTTP workers can be told apart
unsigned threadTag() {
    return static_cast<unsigned>(std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000u);
}

} // namespace

std::atomic<LogLevel> Logger::sLogLevel{Logger::levelFromString(GetEnvOrDefault("TOOLGATE_LOG_LEVEL", "INFO"))};
std::atomic<bool> Logger::sUseStderr{envFlag("TOOLGATE_STDIO_MODE", "0")};

LogLevel Logger::levelFromString(const std::string& level) {
    std::string s;
    s.reserve(level.size());
    for (char c : level) s.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (s == "DEBUG") return LogLevel::LOG_DEBUG_LEVEL;
    if (s == "WARN" || s == "WARNING") return LogLevel::LOG_WARN_LEVEL;
    if (s == "ERROR") return LogLevel::LOG_ERROR_LEVEL;
    if (s == "OFF" || s == "NONE") return LogLevel::LOG_OFF_LEVEL;
    return LogLevel::LOG_INFO_LEVEL;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::LOG_DEBUG_LEVEL: return "DEBUG";
        case LogLevel::LOG_INFO_LEVEL: return "INFO";
        case LogLevel::LOG_WARN_LEVEL: return "WARN";
        case LogLevel::LOG_ERROR_LEVEL: return "ERROR";
        case LogLevel::LOG_OFF_LEVEL: return "OFF";
    }
    return "INFO";
}

bool Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sinkMutex());
    std::ofstream& f = logFile();
    if (f.is_open()) {
        f.close();
    }
    f.open(filePath, std::ios::out | std::ios::app);
    if (!f.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (" << std::strerror(errno) << ")" << std::endl;
        return false;
    }
    f << "\n=== toolgate log opened at " << utcTimestamp() << " ===\n";
    f.flush();
    return true;
}

void Logger::write(LogLevel level, const std::string& msg, const char* file, unsigned int line) {
    // ANSI color on the level label only; TOOLGATE_LOG_COLOR=0 disables it
    static const bool colorEnabled = envFlag("TOOLGATE_LOG_COLOR", "1");
    const char* label = levelName(level);
    const std::string plain = fmt::format("{} [{}] [t:{}] {}:{}: {}\n", utcTimestamp(), label, threadTag(),
                                          baseName(file), line, msg);

    std::lock_guard<std::mutex> lock(sinkMutex());
    std::ostream& console = sUseStderr.load() ? std::cerr : std::cout;
    if (colorEnabled) {
        const char* color = level >= LogLevel::LOG_ERROR_LEVEL ? "\033[38;5;88m" : level == LogLevel::LOG_WARN_LEVEL ? "\033[33m" : "\033[35m";
        const auto open = plain.find('[');
        console << plain.substr(0, open + 1) << color << label << "\033[0m" << plain.substr(open + 1 + std::strlen(label));
    } else {
        console << plain;
    }
    console.flush();

    std::ofstream& f = logFile();
    if (f.is_open()) {
        f << plain;
        f.flush();
    }
}
