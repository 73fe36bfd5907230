//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.h
// Purpose: Process-wide logging facade with level filtering, optional log file and stderr routing.
//==========================================================================================================
#pragma once

#include <atomic>
#include <string>

#include <fmt/format.h>

enum class LogLevel {
    LOG_DEBUG_LEVEL = 0,
    LOG_INFO_LEVEL = 1,
    LOG_WARN_LEVEL = 2,
    LOG_ERROR_LEVEL = 3,
    LOG_OFF_LEVEL = 4
};

//==========================================================================================================
// Logger
// Purpose: Static sink shared by every gateway thread.
// Notes:
//   Line format: "<UTC time> [LEVEL] [t:<thread>] <file>:<line>: <message>". Console output goes to stdout
//   unless stderr routing is on (stdio mode, where stdout carries envelopes). A log file, when set,
//   receives the same lines. The initial level comes from TOOLGATE_LOG_LEVEL.
//==========================================================================================================
class Logger {
public:
    // Case-insensitive; accepts WARNING and OFF/NONE. Unknown names map to INFO.
    static LogLevel levelFromString(const std::string& level);
    static const char* levelName(LogLevel level);

    static void setLogLevelFromString(const std::string& level) { sLogLevel.store(levelFromString(level)); }
    static LogLevel logLevel() { return sLogLevel.load(); }
    static bool enabled(LogLevel level) { return sLogLevel.load() <= level; }

    static void setUseStderr(bool useStderr) { sUseStderr.store(useStderr); }

    // Appends to filePath. Returns false (and keeps logging to the console) when it cannot be opened.
    static bool setLogFile(const std::string& filePath);

    // Variadic logging using {fmt} with runtime format strings
    template <typename... Args>
    static void logf(LogLevel level, const char* fmtStr, const char* file, unsigned int line, Args&&... args) {
        std::string buffer;
        try {
            buffer = fmt::vformat(fmtStr, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            buffer = fmt::format("Format error in \"{}\": {}", fmtStr, e.what());
        }
        write(level, buffer, file, line);
    }

    static void write(LogLevel level, const std::string& msg, const char* file, unsigned int line);

private:
    static std::atomic<LogLevel> sLogLevel;
    static std::atomic<bool> sUseStderr;
};

// Level-filtered logging macros; arguments are not evaluated when the level is disabled
#define TOOLGATE_LOG_AT(lvl, fmt, ...) \
    if (!Logger::enabled(lvl)) {} else Logger::logf(lvl, fmt, __FILE__, __LINE__, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) TOOLGATE_LOG_AT(LogLevel::LOG_DEBUG_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  TOOLGATE_LOG_AT(LogLevel::LOG_INFO_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  TOOLGATE_LOG_AT(LogLevel::LOG_WARN_LEVEL, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) TOOLGATE_LOG_AT(LogLevel::LOG_ERROR_LEVEL, fmt, ##__VA_ARGS__)

// Function entry/exit tracing in debug builds
#ifdef _DEBUG
namespace {
struct FuncScopeGuard {
    const char* func;
    explicit FuncScopeGuard(const char* f) : func(f) { LOG_DEBUG("ENTER: {}", func); }
    ~FuncScopeGuard() { LOG_DEBUG("EXIT:  {}", func); }
};
}
#define FUNC_SCOPE() [[maybe_unused]] FuncScopeGuard funcScope(__FUNCTION__)
#else
#define FUNC_SCOPE() ((void)0)
#endif
