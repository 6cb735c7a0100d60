/*
===========================================================
Fragment 1.1 — Core: Logging (Implementation)
FILE: cpp/stagegate/core/logging.cpp
===========================================================
*/

#include "stagegate/core/logging.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace stagegate {
namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::INFO)};

struct SinkSlot {
  std::mutex mu;
  LogSink sink;
};

SinkSlot& sink_slot() {
  static SinkSlot slot;
  return slot;
}

void console_sink(LogLevel lvl, const std::string& line) {
  std::ostream& out = (lvl >= LogLevel::WARN) ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

// "2026-03-01T12:00:00Z [WARN] stagegate: <msg>"
std::string format_line(LogLevel lvl, const std::string& msg) {
  const std::time_t tt = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  char stamp[32];
  const std::size_t n = std::strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &tm);

  std::string line(stamp, n);
  line += " [";
  line += to_string(lvl);
  line += "] stagegate: ";
  line += msg;
  return line;
}

}  // namespace

const char* to_string(LogLevel lvl) noexcept {
  switch (lvl) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
  }
  return "INFO";
}

void set_log_level(LogLevel lvl) noexcept {
  g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

LogLevel get_log_level() noexcept {
  return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

bool parse_log_level(std::string_view name, LogLevel* out) noexcept {
  auto is = [&](std::string_view word) {
    if (name.size() != word.size()) return false;
    for (std::size_t i = 0; i < word.size(); ++i) {
      if (std::tolower(static_cast<unsigned char>(name[i])) != word[i]) return false;
    }
    return true;
  };

  LogLevel lvl = LogLevel::INFO;
  if (is("debug")) lvl = LogLevel::DEBUG;
  else if (is("info")) lvl = LogLevel::INFO;
  else if (is("warn") || is("warning")) lvl = LogLevel::WARN;
  else if (is("error")) lvl = LogLevel::ERROR;
  else return false;

  if (out) *out = lvl;
  return true;
}

void set_log_sink(LogSink sink) {
  SinkSlot& slot = sink_slot();
  std::lock_guard<std::mutex> lk(slot.mu);
  slot.sink = std::move(sink);
}

void log(LogLevel lvl, const std::string& msg) noexcept {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  try {
    const std::string line = format_line(lvl, msg);
    SinkSlot& slot = sink_slot();
    std::lock_guard<std::mutex> lk(slot.mu);
    if (slot.sink) {
      slot.sink(lvl, line);
    } else {
      console_sink(lvl, line);
    }
  } catch (const std::exception& e) {
    // Last resort: a broken sink must not fail an evaluation.
    std::fputs("stagegate: log sink failed: ", stderr);
    std::fputs(e.what(), stderr);
    std::fputc('\n', stderr);
  }
}

} // namespace stagegate
