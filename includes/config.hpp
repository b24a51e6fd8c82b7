#ifndef TFTPFF_CONFIG_HPP
#define TFTPFF_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "session.hpp"
#include "tftp_common.hpp"

namespace tftpff {

struct ServerConfig {
  std::string address = "0.0.0.0";
  uint16_t port = TFTP_DEFAULT_PORT;
  std::filesystem::path root;
  std::string user = "root";
  std::string group = "root";
  std::chrono::seconds default_timeout{DEFAULT_TIMEOUT_SEC};
  unsigned max_retries = DEFAULT_MAX_RETRIES;
  size_t max_sessions = DEFAULT_MAX_SESSIONS;
  bool allow_overwrite = true;

  SessionLimits session_limits() const;
};

enum class CommandLine { Run, ShowHelp };

// Fills `config` from argv. Throws std::invalid_argument on unknown options,
// bad values or a missing/invalid --dir.
CommandLine parse_command_line(int argc, char *argv[], ServerConfig &config);

std::string usage(const std::string &program);

} // namespace tftpff

#endif // TFTPFF_CONFIG_HPP
