#pragma once
/*
===========================================================
Core: Logging
FILE: cpp/engine/core/logging.hpp
===========================================================
Process-wide, noexcept logging shared by systems, blocks and models.

Levels:
  DEBUG  per-iteration recycle errors, block construction, sample timings
  INFO   campaign summaries
  WARN   failed samples, non-converged reports
  ERROR  unrecoverable CLI failures

By default records go to stdout (DEBUG/INFO) or stderr (WARN/ERROR) as
  2026-10-17T08:00:00Z WARN  model: sample 3 failed: ...
A sink can replace the console; tests install one to capture records.
===========================================================
*/

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace procsim {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Receives records that pass the level filter. Calls are serialized.
using LogSink = std::function<void(LogLevel, const std::string&)>;

void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Cheap check for callers that format messages inside convergence loops.
bool log_enabled(LogLevel lvl) noexcept;

// Install a sink; an empty function restores console output.
void set_log_sink(LogSink sink);

const char* to_string(LogLevel lvl) noexcept;

// Accepts "debug", "info", "warn"/"warning", "error" in any case.
std::optional<LogLevel> parse_log_level(std::string_view text);

void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace procsim
