#include "config.hpp"

#include <getopt.h>

#include <stdexcept>

namespace tftpff {

namespace {

const int OPT_NO_OVERWRITE = 1000;

const option LONG_OPTIONS[] = {
    {"addr", required_argument, nullptr, 'a'},
    {"port", required_argument, nullptr, 'p'},
    {"dir", required_argument, nullptr, 'd'},
    {"user", required_argument, nullptr, 'u'},
    {"group", required_argument, nullptr, 'g'},
    {"timeout", required_argument, nullptr, 't'},
    {"retries", required_argument, nullptr, 'r'},
    {"max-sessions", required_argument, nullptr, 'm'},
    {"no-overwrite", no_argument, nullptr, OPT_NO_OVERWRITE},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

unsigned long parse_number(const std::string &text, unsigned long min, unsigned long max,
                           const std::string &what) {
  unsigned long value = 0;
  size_t consumed = 0;
  try {
    if (text.empty() || text[0] == '-' || text[0] == '+')
      throw std::invalid_argument(text);
    value = std::stoul(text, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("Invalid " + what + " argument '" + text + "'");
  }
  if (consumed != text.size() || value < min || value > max) {
    throw std::invalid_argument("Invalid " + what + " '" + text + "' (expected " +
                                std::to_string(min) + ".." + std::to_string(max) + ")");
  }
  return value;
}

} // namespace

SessionLimits ServerConfig::session_limits() const {
  SessionLimits limits;
  limits.default_timeout = default_timeout;
  limits.max_retries = max_retries;
  return limits;
}

CommandLine parse_command_line(int argc, char *argv[], ServerConfig &config) {
  optind = 0; // glibc: full rescan, so repeated calls see a fresh argv
  opterr = 0;

  int opt;
  while ((opt = getopt_long(argc, argv, ":a:p:d:u:g:t:r:m:h", LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
    case 'a':
      // Validated here so a typo fails before anything is bound.
      Endpoint::parse(optarg, 0);
      config.address = optarg;
      break;
    case 'p':
      config.port = static_cast<uint16_t>(parse_number(optarg, 1, 65535, "port"));
      break;
    case 'd':
      config.root = optarg;
      break;
    case 'u':
      config.user = optarg;
      break;
    case 'g':
      config.group = optarg;
      break;
    case 't':
      config.default_timeout = std::chrono::seconds(
          parse_number(optarg, MIN_TIMEOUT_SEC, MAX_TIMEOUT_SEC, "timeout"));
      break;
    case 'r':
      config.max_retries = static_cast<unsigned>(parse_number(optarg, 0, 255, "retries"));
      break;
    case 'm':
      config.max_sessions = parse_number(optarg, 1, 1000000, "max-sessions");
      break;
    case OPT_NO_OVERWRITE:
      config.allow_overwrite = false;
      break;
    case 'h':
      return CommandLine::ShowHelp;
    case ':':
      throw std::invalid_argument(std::string("Missing value for ") + argv[optind - 1]);
    default:
      throw std::invalid_argument(std::string("Unknown option ") + argv[optind - 1]);
    }
  }

  if (optind < argc) {
    throw std::invalid_argument(std::string("Unexpected argument ") + argv[optind]);
  }
  if (config.root.empty()) {
    throw std::invalid_argument("--dir is required");
  }
  std::error_code ec;
  if (!std::filesystem::is_directory(config.root, ec)) {
    throw std::invalid_argument("Not a directory: " + config.root.string());
  }
  return CommandLine::Run;
}

std::string usage(const std::string &program) {
  return "Usage: " + program +
         " --dir <root> [options]\n"
         "  -a, --addr <ipv4>          address to bind (default 0.0.0.0)\n"
         "  -p, --port <port>          UDP port (default 69)\n"
         "  -d, --dir <root>           directory to serve (required)\n"
         "  -u, --user <name>          user to switch to after binding (default root)\n"
         "  -g, --group <name>         group to switch to after binding (default root)\n"
         "  -t, --timeout <seconds>    default retransmission timeout, 1-255 (default 5)\n"
         "  -r, --retries <count>      retransmissions before giving up (default 5)\n"
         "  -m, --max-sessions <n>     concurrent transfers (default 1024)\n"
         "      --no-overwrite         refuse uploads onto existing files\n"
         "  -h, --help                 show this help\n"
         "Log level is read from TFTPFF_LOG (off, error, warn, info, debug).\n";
}

} // namespace tftpff
