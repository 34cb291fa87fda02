#pragma once
/**
 * @file log.h
 * @brief Process-wide log level gate for iostream diagnostics.
 *
 * The level comes from PROXIMITY_LOG_LEVEL (TRACE|DEBUG|INFO|WARN|ERROR,
 * default INFO) and is read once.
 *
 *   if (logu::should_log(logu::LogLevel::WARN)) {
 *     std::cerr << "WARNING: ...\n";
 *   }
 */

#include <string>

namespace logu {

enum class LogLevel : int {
  TRACE = 0,
  DEBUG = 1,
  INFO  = 2,
  WARN  = 3,
  ERROR = 4
};

LogLevel parse_log_level(const std::string& text, LogLevel def);

LogLevel current_log_level();

// Override the environment for the rest of the process (CLI flag, tests).
void set_log_level(LogLevel level);

bool should_log(LogLevel level);

} // namespace logu
