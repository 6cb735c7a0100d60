#pragma once
/*
===========================================================
Fragment 1.1 — Core: Logging
FILE: cpp/stagegate/core/logging.hpp
===========================================================
Purpose:
  - Single logging sink shared by every stagegate module.
  - Evaluation faults, validator faults and history maintenance
    all report through here.

Hardening:
  - noexcept API; a failing sink never reaches the evaluator.
  - Sink calls are serialized, so lines never interleave.
  - Default sink: WARN/ERROR to stderr, DEBUG/INFO to stdout.
===========================================================
*/

#include <functional>
#include <string>
#include <string_view>

namespace stagegate {

enum class LogLevel : int { DEBUG = 0, INFO = 1, WARN = 2, ERROR = 3 };

// Global verbosity (default INFO).
void set_log_level(LogLevel lvl) noexcept;
LogLevel get_log_level() noexcept;

// Case-insensitive "debug" / "info" / "warn" / "warning" / "error".
// Returns false (and leaves *out untouched) on unknown names.
bool parse_log_level(std::string_view name, LogLevel* out) noexcept;

const char* to_string(LogLevel lvl) noexcept;

// Receives lines that pass the level filter, already timestamped.
using LogSink = std::function<void(LogLevel, const std::string& line)>;

// Replaces the sink; an empty function restores the console sink.
// Hosts route engine output into their own logs, tests capture it.
void set_log_sink(LogSink sink);

// Core logging call. Never throws.
void log(LogLevel lvl, const std::string& msg) noexcept;

} // namespace stagegate
