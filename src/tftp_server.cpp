#include <iostream>
#include <stdexcept>

#include "config.hpp"
#include "log.hpp"
#include "privilege.hpp"
#include "server.hpp"

// --- Main Function ---
int main(int argc, char *argv[]) {
  tftpff::init_logging_from_env();

  tftpff::ServerConfig config;
  try {
    if (tftpff::parse_command_line(argc, argv, config) == tftpff::CommandLine::ShowHelp) {
      std::cout << tftpff::usage(argv[0]);
      return 0;
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n" << tftpff::usage(argv[0]);
    return 2;
  }

  try {
    tftpff::Server server(config);
    // Bound to the (possibly privileged) port; give up root before serving.
    tftpff::drop_privilege(config.user, config.group);

    tftpff::install_stop_signals();
    tftpff::set_signal_target(&server);
    try {
      server.run();
    } catch (const std::exception &) {
      // Detach before `server` is destroyed.
      tftpff::set_signal_target(nullptr);
      throw;
    }
    tftpff::set_signal_target(nullptr);
  } catch (const std::exception &e) {
    std::cerr << "Server failed: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
