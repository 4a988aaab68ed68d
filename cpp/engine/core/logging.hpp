#pragma once
/*
===========================================================
Fragment 1.1 - Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Purpose:
  - Process-wide, level-filtered log used by every engine module.
  - Line format: [2026-01-01T12:00:00.000Z][INFO] message

Hardening:
  - noexcept API; a failing sink never reaches the caller.
  - One mutex per process: lines from different threads never interleave.

Sinks:
  - DEBUG/INFO go to the info sink (stdout by default), WARN/ERROR to the
    warn sink (stderr by default). A tool that prints machine-readable
    output on stdout points both sinks at stderr.
===========================================================
*/

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace newsvendor {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3, OFF = 4 };

// Default INFO.
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// "debug" | "info" | "warn" | "error" | "off", any case.
std::optional<LogLevel> parse_log_level(std::string_view s) noexcept;

// Streams must outlive every later log call. nullptr restores the default.
void set_log_sinks(std::ostream* info_sink, std::ostream* warn_sink) noexcept;

void log(LogLevel lvl, std::string_view msg) noexcept;

inline void log_debug(std::string_view msg) noexcept { log(LogLevel::DEBUG, msg); }
inline void log_info(std::string_view msg) noexcept { log(LogLevel::INFO, msg); }
inline void log_warn(std::string_view msg) noexcept { log(LogLevel::WARN, msg); }
inline void log_error(std::string_view msg) noexcept { log(LogLevel::ERROR, msg); }

} // namespace newsvendor
