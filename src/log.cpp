#include "log.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace tftpff {

namespace {
LogLevel g_level = LogLevel::Info;
}

void set_log_level(LogLevel level) { g_level = level; }

LogLevel log_level() { return g_level; }

std::optional<LogLevel> parse_log_level(const std::string &name) {
  std::string lower = name;
  for (char &c : lower)
    c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

  if (lower == "off")
    return LogLevel::Off;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "info")
    return LogLevel::Info;
  if (lower == "debug")
    return LogLevel::Debug;
  return std::nullopt;
}

void init_logging_from_env() {
  const char *value = std::getenv("TFTPFF_LOG");
  if (value == nullptr || *value == '\0') {
    set_log_level(LogLevel::Info);
    return;
  }
  std::optional<LogLevel> level = parse_log_level(value);
  if (!level) {
    set_log_level(LogLevel::Info);
    log_stream(LogLevel::Warn) << "Unknown log level '" << value << "' in TFTPFF_LOG. Using info."
                               << std::endl;
    return;
  }
  set_log_level(*level);
}

std::ostream &log_stream(LogLevel level) {
  // No buffer: badbit stays set and every insertion is a no-op.
  static std::ostream discard(nullptr);
  if (!log_enabled(level))
    return discard;
  switch (level) {
  case LogLevel::Error:
    return std::cerr << "Error: ";
  case LogLevel::Warn:
    return std::cerr << "Warning: ";
  case LogLevel::Debug:
    return std::cout << "Debug: ";
  default:
    return std::cout;
  }
}

} // namespace tftpff
