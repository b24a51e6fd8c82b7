/*
 * Every transfer is served from the port the request arrived on. The server
 * never opens a per-transfer socket; replies to all clients leave through
 * the one bound socket, and the engine tells transfers apart by the
 * client's address and port.
 */

#ifndef TFTPFF_SERVER_HPP
#define TFTPFF_SERVER_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <sys/types.h>

#include "backend.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "tftp_common.hpp"

namespace tftpff {

// Owns one bound, non-blocking IPv4 UDP socket.
class UdpSocket : public DatagramSender {
public:
  // Throws std::runtime_error if the socket cannot be created or bound.
  UdpSocket(const std::string &address, uint16_t port);
  ~UdpSocket() override;

  UdpSocket(const UdpSocket &) = delete;
  UdpSocket &operator=(const UdpSocket &) = delete;

  int fd() const { return sock_; }
  Endpoint local_endpoint() const;

  bool send_to(const Endpoint &peer, const std::vector<char> &packet) override;
  // Returns the datagram length, or -1 when nothing could be read.
  ssize_t receive_from(char *buffer, size_t size, Endpoint &from);

private:
  int sock_ = -1;
};

class Server {
public:
  // Binds the socket and opens the served root; throws std::runtime_error or
  // std::invalid_argument on failure.
  explicit Server(const ServerConfig &config);

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;

  Endpoint local_endpoint() const { return socket_.local_endpoint(); }

  // Serves until stop() is called, then abandons remaining sessions.
  void run();
  // Safe to call from a signal handler or another thread.
  void stop() { stop_requested_.store(true); }

  const Engine &engine() const { return engine_; }

private:
  // Upper bound on one poll() wait so stop() is noticed promptly.
  static constexpr int MAX_WAIT_MS = 1000;

  int poll_timeout_ms() const;

  ServerConfig config_;
  UdpSocket socket_;
  FsBackend backend_;
  Engine engine_;
  std::atomic<bool> stop_requested_{false};
};

// SIGINT, SIGTERM and SIGQUIT call stop() on the current target. Throws
// std::runtime_error if a handler cannot be installed.
void install_stop_signals();
// Pass nullptr before the target is destroyed.
void set_signal_target(Server *server);

} // namespace tftpff

#endif // TFTPFF_SERVER_HPP
