// ============================================================================
// edc/log.hpp — Leveled diagnostic output
// ============================================================================
//
// Diagnostics go to std::cerr, one line per message:
//
//   [edc] WARNING: adversarial strategy 'boundary' failed for R001: ...
//
// The threshold is process-wide.  Writes are serialised so that messages
// from OpenMP workers never interleave.
//
// ============================================================================

#ifndef EDC_LOG_HPP
#define EDC_LOG_HPP

#include <cstdint>
#include <string>

namespace edc {

enum class LogLevel : std::uint8_t {
    Error,
    Warning,
    Info,
    Debug
};

const char* log_level_name(LogLevel level) noexcept;

/// Messages above this level are dropped.  Default: Warning.
void     set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;
bool     log_enabled(LogLevel level) noexcept;

void log_message(LogLevel level, const std::string& message);

inline void log_error(const std::string& m)   { log_message(LogLevel::Error, m); }
inline void log_warning(const std::string& m) { log_message(LogLevel::Warning, m); }
inline void log_info(const std::string& m)    { log_message(LogLevel::Info, m); }
inline void log_debug(const std::string& m)   { log_message(LogLevel::Debug, m); }

}  // namespace edc

#endif  // EDC_LOG_HPP
