#include "debug_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>

namespace elastic {

namespace {
std::atomic<LogLevel> g_log_level{LogLevel::INFO};
std::mutex g_log_mutex;
} // namespace

void setLogLevel(LogLevel level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel logLevel() {
    return g_log_level.load(std::memory_order_relaxed);
}

bool shouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(logLevel());
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    auto level = magic_enum::enum_cast<LogLevel>(text, magic_enum::case_insensitive);
    if (!level.has_value()) {
        return std::nullopt;
    }
    return *level;
}

std::string_view logLevelName(LogLevel level) {
    return magic_enum::enum_name(level);
}

std::string formatKeys(const std::vector<Key>& keys) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < keys.size(); ++i) {
        if (i > 0) oss << " ";
        oss << keys[i];
    }
    oss << "]";
    return oss.str();
}

void emitLogLine(std::ostream& os, std::string_view tag, const std::string& body) {
    auto now = std::chrono::system_clock::now();
    auto time_t_val = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    localtime_r(&time_t_val, &tm_buf);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    os << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << "." << std::setw(3) << std::setfill('0')
       << ms.count() << std::setfill(' ') << " [" << tag << "] " << body << std::endl;
}

} // namespace elastic
