/*
================================================================================
Core: Logging (Implementation)
FILE: cpp/engine/core/logging.cpp
================================================================================
*/

#include "engine/core/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace procsim {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

// Guards both the sink and console writes.
std::mutex g_mu;
LogSink g_sink;

// ISO-8601 UTC with second resolution.
std::string stamp_now() {
  const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char buf[32];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return std::string(buf, n);
}

void write_console(LogLevel lvl, const std::string& msg) {
  std::string tag = to_string(lvl);
  tag.resize(5, ' ');
  std::ostream& out = lvl >= LogLevel::WARN ? std::cerr : std::cout;
  out << stamp_now() << ' ' << tag << ' ' << msg << '\n';
  out.flush();
}

} // namespace

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool log_enabled(LogLevel lvl) noexcept {
  return static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

void set_log_sink(LogSink sink) {
  std::lock_guard<std::mutex> lk(g_mu);
  g_sink = std::move(sink);
}

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (s == "debug") return LogLevel::DEBUG;
  if (s == "info") return LogLevel::INFO;
  if (s == "warn" || s == "warning") return LogLevel::WARN;
  if (s == "error") return LogLevel::ERROR;
  return std::nullopt;
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (!log_enabled(lvl)) return;
  try {
    std::lock_guard<std::mutex> lk(g_mu);
    if (g_sink) {
      g_sink(lvl, msg);
    } else {
      write_console(lvl, msg);
    }
  } catch (const std::exception&) {
    // A failing sink or stream never propagates into the engine.
  }
}

} // namespace procsim
