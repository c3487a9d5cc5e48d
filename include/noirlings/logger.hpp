/*
 * noirlings - Proof-circuit exercise runner
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace noirlings {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    // Parses "error", "warn"/"warning", "info", "debug", "trace" (any case).
    [[nodiscard]] static LogLevel parseLevel(const std::string& text, LogLevel fallback) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::noirlings::Logger::error(msg)
#define LOG_WARN(msg)  ::noirlings::Logger::warn(msg)  
#define LOG_INFO(msg)  ::noirlings::Logger::info(msg)
#define LOG_DEBUG(msg) ::noirlings::Logger::debug(msg)
#define LOG_TRACE(msg) ::noirlings::Logger::trace(msg)
