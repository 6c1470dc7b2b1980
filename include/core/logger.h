#pragma once

#include "core/env_config.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <string>

/**
 * @brief Logger utility using Plog
 *
 * Usage:
 *   Logger::init();  // Initialize with default settings
 *   PLOG_INFO << "[Component] Your log message";
 */
namespace Logger {

/**
 * @brief Parse a severity name (NONE, FATAL, ERROR, WARNING, INFO, DEBUG,
 * VERBOSE), case-insensitive
 * @param level_str Severity name
 * @param default_level Returned for an empty or unknown name
 */
inline plog::Severity parseSeverity(const std::string &level_str,
                                    plog::Severity default_level) {
  std::string upper = level_str;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

  if (upper == "NONE")
    return plog::none;
  if (upper == "FATAL")
    return plog::fatal;
  if (upper == "ERROR")
    return plog::error;
  if (upper == "WARNING" || upper == "WARN")
    return plog::warning;
  if (upper == "INFO")
    return plog::info;
  if (upper == "DEBUG")
    return plog::debug;
  if (upper == "VERBOSE" || upper == "TRACE")
    return plog::verbose;
  return default_level;
}

/**
 * @brief Initialize Plog with a size-based rolling file appender
 *
 * LOG_DIR, LOG_LEVEL and LOG_MAX_DAYS environment variables take precedence
 * over the arguments. Files roll at 10MB: log.txt, log.txt.1, ...
 *
 * @param log_dir Directory to store log files (default: ./logs)
 * @param log_level Log level (default: INFO)
 * @param max_files Maximum number of rolled files to keep (0 = keep forever)
 * @param enable_console Whether to also log to console
 */
inline void init(const std::string &log_dir = "",
                 plog::Severity log_level = plog::info, int max_files = 30,
                 bool enable_console = true) {
  std::string log_directory = EnvConfig::getString(
      "LOG_DIR", log_dir.empty() ? std::string("./logs") : log_dir);
  max_files = EnvConfig::getInt("LOG_MAX_DAYS", max_files, 0, 365);
  log_level =
      parseSeverity(EnvConfig::getString("LOG_LEVEL", ""), log_level);

  if (!EnvConfig::tryCreateDirectory(log_directory)) {
    std::cerr << "Logs will be written to current directory." << std::endl;
    log_directory = ".";
  }

  std::string log_file_path = log_directory;
  if (log_file_path.back() != '/') {
    log_file_path += "/";
  }
  log_file_path += "log.txt";

  const size_t max_file_size = 10 * 1024 * 1024;

  static plog::RollingFileAppender<plog::TxtFormatter> rollingFileAppender(
      log_file_path.c_str(), max_file_size, max_files);

  if (enable_console) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(log_level, &consoleAppender).addAppender(&rollingFileAppender);
  } else {
    plog::init(log_level, &rollingFileAppender);
  }

  PLOG_INFO << "========================================";
  PLOG_INFO << "Logger initialized";
  PLOG_INFO << "Log file: " << log_file_path;
  PLOG_INFO << "Log level: " << plog::severityToString(log_level);
  PLOG_INFO << "Max files to keep: "
            << (max_files == 0 ? "unlimited" : std::to_string(max_files));
  PLOG_INFO << "Console logging: " << (enable_console ? "enabled" : "disabled");
  PLOG_INFO << "========================================";
}

} // namespace Logger
