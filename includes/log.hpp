#ifndef TFTPFF_LOG_HPP
#define TFTPFF_LOG_HPP

#include <optional>
#include <ostream>
#include <string>

namespace tftpff {

enum class LogLevel { Off = 0, Error, Warn, Info, Debug };

void set_log_level(LogLevel level);
LogLevel log_level();

inline bool log_enabled(LogLevel level) {
  return level != LogLevel::Off && static_cast<int>(level) <= static_cast<int>(log_level());
}

// Accepts off|error|warn|info|debug, case-insensitive.
std::optional<LogLevel> parse_log_level(const std::string &name);

// Reads the level from TFTPFF_LOG. Falls back to info.
void init_logging_from_env();

// Errors and warnings go to std::cerr with the "Error: " / "Warning: "
// prefix; everything else goes to std::cout. A level that is switched off
// gets a stream that discards its output.
//
//   log_stream(LogLevel::Warn) << "something odd" << std::endl;
std::ostream &log_stream(LogLevel level);

} // namespace tftpff

#endif // TFTPFF_LOG_HPP
