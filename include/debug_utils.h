// include/debug_utils.h
#pragma once

#include "types.h"

#include <string>
#include <string_view>
#include <sstream>
#include <iostream>
#include <optional>
#include <vector>

namespace elastic {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Process-wide threshold; messages below it are dropped. FATAL is always emitted.
void setLogLevel(LogLevel level);
LogLevel logLevel();
bool shouldLog(LogLevel level);

// Accepts debug/info/warn/error in any case.
std::optional<LogLevel> parseLogLevel(std::string_view text);
std::string_view logLevelName(LogLevel level);

// Renders keys as "[1 2 3]".
std::string formatKeys(const std::vector<Key>& keys);

// Writes one complete line under the log mutex.
void emitLogLine(std::ostream& os, std::string_view tag, const std::string& body);

// Helper function for the variadic template macros
template<typename... Args>
void print_log_line(std::ostream& os, std::string_view tag, Args&&... args) {
    std::ostringstream body;
    (body << ... << std::forward<Args>(args));
    emitLogLine(os, tag, body.str());
}

} // namespace elastic

// --- Logging Macros ---

#define ELASTIC_LOG_AT(level, tag, ...) \
    do { \
        if (elastic::shouldLog(level)) { \
            elastic::print_log_line(std::cerr, tag, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) ELASTIC_LOG_AT(elastic::LogLevel::DEBUG, "DEBUG", __VA_ARGS__)
#define LOG_INFO(...)  ELASTIC_LOG_AT(elastic::LogLevel::INFO, "INFO", __VA_ARGS__)
#define LOG_WARN(...)  ELASTIC_LOG_AT(elastic::LogLevel::WARN, "WARN", __VA_ARGS__)
#define LOG_ERROR(...) ELASTIC_LOG_AT(elastic::LogLevel::ERROR, "ERROR", __VA_ARGS__)
#define LOG_FATAL(...) do { elastic::print_log_line(std::cerr, "FATAL", __VA_ARGS__); } while(0)
