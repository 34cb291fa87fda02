#include "common/log.h"

#include <atomic>
#include <cstdlib>

namespace logu {
namespace {

std::string to_upper(std::string s) {
  for (char& c : s) {
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  }
  return s;
}

int level_from_env() {
  const char* level = std::getenv("PROXIMITY_LOG_LEVEL");
  if (!level || !*level) return static_cast<int>(LogLevel::INFO);
  return static_cast<int>(parse_log_level(level, LogLevel::INFO));
}

std::atomic<int>& level_slot() {
  static std::atomic<int> level{level_from_env()};
  return level;
}

} // namespace

LogLevel parse_log_level(const std::string& text, LogLevel def) {
  const std::string v = to_upper(text);
  if (v == "TRACE") return LogLevel::TRACE;
  if (v == "DEBUG") return LogLevel::DEBUG;
  if (v == "INFO")  return LogLevel::INFO;
  if (v == "WARN")  return LogLevel::WARN;
  if (v == "ERROR") return LogLevel::ERROR;
  return def;
}

LogLevel current_log_level() {
  return static_cast<LogLevel>(level_slot().load(std::memory_order_relaxed));
}

void set_log_level(LogLevel level) {
  level_slot().store(static_cast<int>(level), std::memory_order_relaxed);
}

bool should_log(LogLevel level) {
  return static_cast<int>(level) >= static_cast<int>(current_log_level());
}

} // namespace logu
