#include "server.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <thread>

#include "log.hpp"

namespace tftpff {

namespace {

// Read from the signal handler, so it must be lock-free.
std::atomic<Server *> g_signal_target{nullptr};
static_assert(std::atomic<Server *>::is_always_lock_free);

extern "C" void handle_stop_signal(int) {
  Server *server = g_signal_target.load();
  if (server != nullptr)
    server->stop();
}

} // namespace

// --- UdpSocket ---

UdpSocket::UdpSocket(const std::string &address, uint16_t port) {
  Endpoint local = Endpoint::parse(address, port);

  sock_ = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
  if (sock_ < 0) {
    throw std::runtime_error("Failed to create listening socket: " + std::string(strerror(errno)));
  }

  int enable = 1;
  if (setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable)) < 0) {
    std::string reason = strerror(errno);
    close(sock_);
    throw std::runtime_error("setsockopt(SO_REUSEADDR) failed: " + reason);
  }

  sockaddr_in server_addr = local.to_sockaddr();
  if (bind(sock_, reinterpret_cast<sockaddr *>(&server_addr), sizeof(server_addr)) < 0) {
    std::string reason = strerror(errno);
    close(sock_);
    throw std::runtime_error("Bind failed on " + local.to_string() + ": " + reason);
  }

  int flags = fcntl(sock_, F_GETFL, 0);
  if (flags < 0 || fcntl(sock_, F_SETFL, flags | O_NONBLOCK) < 0) {
    std::string reason = strerror(errno);
    close(sock_);
    throw std::runtime_error("Failed to make socket non-blocking: " + reason);
  }
}

UdpSocket::~UdpSocket() {
  if (sock_ >= 0)
    close(sock_);
}

Endpoint UdpSocket::local_endpoint() const {
  sockaddr_in addr{};
  socklen_t addr_len = sizeof(addr);
  if (getsockname(sock_, reinterpret_cast<sockaddr *>(&addr), &addr_len) < 0) {
    throw std::runtime_error("getsockname failed: " + std::string(strerror(errno)));
  }
  return Endpoint::from_sockaddr(addr);
}

bool UdpSocket::send_to(const Endpoint &peer, const std::vector<char> &packet) {
  sockaddr_in client_addr = peer.to_sockaddr();
  ssize_t sent = sendto(sock_, packet.data(), packet.size(), 0,
                        reinterpret_cast<sockaddr *>(&client_addr), sizeof(client_addr));
  return sent == static_cast<ssize_t>(packet.size());
}

ssize_t UdpSocket::receive_from(char *buffer, size_t size, Endpoint &from) {
  sockaddr_in client_addr{};
  socklen_t client_addr_len = sizeof(client_addr);
  ssize_t bytes_received = recvfrom(sock_, buffer, size, 0,
                                    reinterpret_cast<sockaddr *>(&client_addr), &client_addr_len);
  if (bytes_received < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      log_stream(LogLevel::Warn) << "recvfrom failed: " << strerror(errno) << ". Continuing..." << std::endl;
      // Avoid busy-looping on a persistent error.
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return -1;
  }
  from = Endpoint::from_sockaddr(client_addr);
  return bytes_received;
}

// --- Server ---

Server::Server(const ServerConfig &config)
    : config_(config), socket_(config.address, config.port),
      backend_(config.root, config.allow_overwrite),
      engine_(backend_, socket_, config.session_limits(), config.max_sessions) {}

int Server::poll_timeout_ms() const {
  std::optional<TimePoint> deadline = engine_.next_deadline();
  if (!deadline)
    return MAX_WAIT_MS;
  auto remaining =
      std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
  if (remaining <= 0)
    return 0;
  // Round up so we wake at or after the deadline, not just before it.
  return remaining + 1 > MAX_WAIT_MS ? MAX_WAIT_MS : static_cast<int>(remaining + 1);
}

void Server::run() {
  Endpoint local = socket_.local_endpoint();
  log_stream(LogLevel::Info) << "TFTP Server listening on " << local.to_string() << ", serving "
                   << backend_.root() << std::endl;

  // Large enough for any UDP payload, so nothing is silently truncated.
  std::vector<char> buffer(65536);

  while (!stop_requested_.load()) {
    pollfd pfd{};
    pfd.fd = socket_.fd();
    pfd.events = POLLIN;

    int ready = poll(&pfd, 1, poll_timeout_ms());
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      throw std::runtime_error("poll failed: " + std::string(strerror(errno)));
    }

    if (ready > 0 && (pfd.revents & POLLIN)) {
      Endpoint client;
      ssize_t bytes_received = socket_.receive_from(buffer.data(), buffer.size(), client);
      if (bytes_received >= 0) {
        try {
          engine_.handle_datagram(client, buffer.data(), static_cast<size_t>(bytes_received),
                                  Clock::now());
        } catch (const std::exception &e) {
          log_stream(LogLevel::Error) << "[" << client.to_string() << "] failed to handle datagram: "
                            << e.what() << std::endl;
        }
      }
    }

    try {
      engine_.handle_timeouts(Clock::now());
    } catch (const std::exception &e) {
      log_stream(LogLevel::Error) << "Failed to process timeouts: " << e.what() << std::endl;
    }
  }

  engine_.shutdown();
  log_stream(LogLevel::Info) << "TFTP Server stopped." << std::endl;
}

// --- Signals ---

void install_stop_signals() {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  for (int sig : {SIGINT, SIGTERM, SIGQUIT}) {
    if (sigaction(sig, &action, nullptr) != 0) {
      throw std::runtime_error("sigaction failed: " + std::string(strerror(errno)));
    }
  }
}

void set_signal_target(Server *server) { g_signal_target.store(server); }

} // namespace tftpff
