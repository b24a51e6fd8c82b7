#ifndef TFTPFF_ENGINE_HPP
#define TFTPFF_ENGINE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "backend.hpp"
#include "packet.hpp"
#include "session.hpp"
#include "session_table.hpp"
#include "tftp_common.hpp"
#include "timer_queue.hpp"

namespace tftpff {

// The single way packets leave the engine. In production this is the bound
// server socket, in tests a recorder.
class DatagramSender {
public:
  virtual ~DatagramSender() = default;
  virtual bool send_to(const Endpoint &peer, const std::vector<char> &packet) = 0;
};

// Demultiplexes every transfer over one socket. Owns the session table and
// the timer queue; both change only through handle_datagram() and
// handle_timeouts(), which must be called from a single thread.
class Engine {
public:
  Engine(FileBackend &backend, DatagramSender &sender,
         const SessionLimits &limits = SessionLimits(),
         size_t max_sessions = DEFAULT_MAX_SESSIONS);

  Engine(const Engine &) = delete;
  Engine &operator=(const Engine &) = delete;

  // Decodes one datagram, routes it and sends the resulting packet, if any.
  // Undecodable datagrams are logged and dropped.
  void handle_datagram(const Endpoint &from, const char *data, size_t size, TimePoint now);

  // Routes a decoded packet and updates the session table and timers. Does
  // not send; the returned Action says what to send.
  Action route(const Endpoint &from, const Packet &packet, TimePoint now);

  // Runs one retry step for every session whose timer expired at `now`.
  void handle_timeouts(TimePoint now);

  std::optional<TimePoint> next_deadline() const { return timers_.next_deadline(); }

  // Abandons all sessions without notifying peers.
  void shutdown();

  size_t session_count() const { return sessions_.size(); }
  const Session *find_session(const Endpoint &peer) const { return sessions_.find(peer); }
  const TimerQueue &timers() const { return timers_; }

private:
  Action open_session(const Endpoint &from, Direction direction, const std::string &filename,
                      const OptionList &options, TimePoint now);
  Action dispatch(Session &session, const Packet &packet);
  void settle(const Endpoint &peer, const Action &action, TimePoint now);
  void send(const Endpoint &peer, const Action &action);

  FileBackend &backend_;
  DatagramSender &sender_;
  SessionLimits limits_;
  SessionTable sessions_;
  TimerQueue timers_;
};

} // namespace tftpff

#endif // TFTPFF_ENGINE_HPP
