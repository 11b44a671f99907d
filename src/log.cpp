// ============================================================================
// log.cpp — Leveled diagnostic output to stderr
// ============================================================================

#include "edc/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace edc {

static std::atomic<LogLevel> g_level{LogLevel::Warning};
static std::mutex            g_log_mutex;

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Error:   return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Debug:   return "DEBUG";
    }
    return "?";
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool log_enabled(LogLevel level) noexcept {
    return static_cast<std::uint8_t>(level) <=
           static_cast<std::uint8_t>(log_level());
}

void log_message(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) return;
    std::lock_guard<std::mutex> lk(g_log_mutex);
    std::cerr << "[edc] " << log_level_name(level) << ": " << message << "\n";
}

}  // namespace edc
