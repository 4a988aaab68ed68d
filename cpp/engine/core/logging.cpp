/*
===========================================================
Fragment 1.1 - Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
===========================================================
*/

#include "engine/core/logging.hpp"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace newsvendor {
namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

// Guards the sinks and the write itself.
std::mutex g_log_mu;
std::ostream* g_info_sink = nullptr;
std::ostream* g_warn_sink = nullptr;

struct LevelName {
  LogLevel level;
  const char* name;
};

constexpr std::array<LevelName, 5> kLevelNames{{
    {LogLevel::DEBUG, "DEBUG"},
    {LogLevel::INFO, "INFO"},
    {LogLevel::WARN, "WARN"},
    {LogLevel::ERROR, "ERROR"},
    {LogLevel::OFF, "OFF"},
}};

const char* level_name(LogLevel lvl) noexcept {
  for (const LevelName& ln : kLevelNames) {
    if (ln.level == lvl) return ln.name;
  }
  return "INFO";
}

bool same_word(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const int ca = std::toupper(static_cast<unsigned char>(a[i]));
    const int cb = std::toupper(static_cast<unsigned char>(b[i]));
    if (ca != cb) return false;
  }
  return true;
}

// 2026-01-01T12:00:00.000Z
void write_timestamp(std::ostream& os) {
  using clock = std::chrono::system_clock;
  const auto now = clock::now();
  const std::time_t secs = clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &secs);
#else
  gmtime_r(&secs, &tm);
#endif
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
     << std::setw(3) << std::setfill('0') << ms << std::setfill(' ') << 'Z';
}

}  // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

std::optional<LogLevel> parse_log_level(std::string_view s) noexcept {
  for (const LevelName& ln : kLevelNames) {
    if (same_word(s, ln.name)) return ln.level;
  }
  return std::nullopt;
}

void set_log_sinks(std::ostream* info_sink, std::ostream* warn_sink) noexcept {
  std::lock_guard<std::mutex> lk(g_log_mu);
  g_info_sink = info_sink;
  g_warn_sink = warn_sink;
}

void log(LogLevel lvl, std::string_view msg) noexcept {
  if (lvl == LogLevel::OFF) return;
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;

  try {
    // Format outside the lock.
    std::ostringstream line;
    line << '[';
    write_timestamp(line);
    line << "][" << level_name(lvl) << "] " << msg << '\n';
    const std::string text = line.str();

    std::lock_guard<std::mutex> lk(g_log_mu);
    std::ostream* sink = (lvl >= LogLevel::WARN) ? g_warn_sink : g_info_sink;
    if (!sink) sink = (lvl >= LogLevel::WARN) ? &std::cerr : &std::cout;
    *sink << text;
    sink->flush();
  } catch (...) {
    // Logging never throws.
  }
}

} // namespace newsvendor
