#include "engine.hpp"

#include <memory>
#include <type_traits>

#include "log.hpp"
#include "options.hpp"

namespace tftpff {

Engine::Engine(FileBackend &backend, DatagramSender &sender, const SessionLimits &limits,
               size_t max_sessions)
    : backend_(backend), sender_(sender), limits_(limits), sessions_(max_sessions) {}

void Engine::handle_datagram(const Endpoint &from, const char *data, size_t size,
                             TimePoint now) {
  Packet packet;
  CodecError error = CodecError::None;
  if (!decode_packet(data, size, packet, error)) {
    log_stream(LogLevel::Warn) << "[" << from.to_string() << "] dropping " << size
                     << "-byte datagram: " << codec_error_name(error) << std::endl;
    return;
  }
  log_stream(LogLevel::Debug) << "[" << from.to_string() << "] received " << packet_summary(packet)
                    << std::endl;

  Action action = route(from, packet, now);
  send(from, action);
}

Action Engine::route(const Endpoint &from, const Packet &packet, TimePoint now) {
  const ReadRequest *rrq = std::get_if<ReadRequest>(&packet);
  const WriteRequest *wrq = std::get_if<WriteRequest>(&packet);
  bool is_request = rrq != nullptr || wrq != nullptr;

  Session *session = sessions_.find(from);
  if (session != nullptr) {
    if (is_request) {
      // The running transfer is left exactly as it was.
      log_stream(LogLevel::Warn) << "[" << from.to_string() << "] new request while a transfer is active"
                       << std::endl;
      return Action::reply(create_error_packet(TftpErrorCode::IllegalOperation,
                                               "illegal operation"));
    }
    Action action = dispatch(*session, packet);
    settle(from, action, now);
    return action;
  }

  if (!is_request) {
    // Never answer unsolicited traffic, or the server becomes a reflector.
    log_stream(LogLevel::Debug) << "[" << from.to_string() << "] no session, dropping "
                      << packet_summary(packet) << std::endl;
    return Action::no_reply();
  }

  if (rrq != nullptr) {
    log_stream(LogLevel::Info) << "[" << from.to_string() << "] RRQ for " << rrq->filename << std::endl;
    return open_session(from, Direction::Read, rrq->filename, rrq->options, now);
  }
  log_stream(LogLevel::Info) << "[" << from.to_string() << "] WRQ for " << wrq->filename << std::endl;
  return open_session(from, Direction::Write, wrq->filename, wrq->options, now);
}

void Engine::handle_timeouts(TimePoint now) {
  for (const Endpoint &peer : timers_.pop_expired(now)) {
    Session *session = sessions_.find(peer);
    if (session == nullptr)
      continue; // finished between arming and firing

    Action action = session->on_timeout();
    settle(peer, action, now);
    send(peer, action);
  }
}

void Engine::shutdown() {
  if (sessions_.size() > 0) {
    log_stream(LogLevel::Info) << "Abandoning " << sessions_.size() << " active session(s)." << std::endl;
  }
  timers_.clear();
  sessions_.clear();
}

Action Engine::open_session(const Endpoint &from, Direction direction,
                            const std::string &filename, const OptionList &options,
                            TimePoint now) {
  if (sessions_.full()) {
    log_stream(LogLevel::Warn) << "[" << from.to_string() << "] rejecting request, " << sessions_.size()
                     << " sessions active" << std::endl;
    return Action::reply(create_error_packet(TftpErrorCode::NotDefined, "server too busy"));
  }

  std::unique_ptr<FileHandle> file;
  try {
    std::filesystem::path path = backend_.resolve(filename);
    if (direction == Direction::Read) {
      file = backend_.open_for_read(path);
    } else {
      file = backend_.open_for_write(path, true);
    }
  } catch (const BackendError &e) {
    log_stream(LogLevel::Warn) << "[" << from.to_string() << "] " << e.what() << std::endl;
    return Action::reply(create_error_packet(e.code(), error_code_name(e.code())));
  }

  auto session = std::make_unique<Session>(from, direction, filename, std::move(file),
                                           negotiate_options(options), limits_);
  Action action = session->start();
  if (action.kind != Action::Kind::NewSession)
    return action; // could not send the first block; never entered the table

  std::chrono::seconds timeout = session->timeout();
  if (!sessions_.insert(std::move(session))) {
    log_stream(LogLevel::Error) << "[" << from.to_string() << "] could not store new session"
                                << std::endl;
    return Action::reply(create_error_packet(TftpErrorCode::NotDefined, "server too busy"));
  }
  timers_.arm(from, now + timeout);
  return action;
}

Action Engine::dispatch(Session &session, const Packet &packet) {
  return std::visit(
      [&session](const auto &p) -> Action {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, AckPacket>) {
          return session.on_ack(p.block);
        } else if constexpr (std::is_same_v<T, DataPacket>) {
          return session.on_data(p.block, p.payload);
        } else if constexpr (std::is_same_v<T, ErrorPacket>) {
          return session.on_error(p.code, p.message);
        } else if constexpr (std::is_same_v<T, OptionAckPacket>) {
          return session.on_illegal("OACK received from a client");
        } else {
          // Requests are answered by route() before dispatch.
          return Action::no_reply();
        }
      },
      packet);
}

void Engine::settle(const Endpoint &peer, const Action &action, TimePoint now) {
  if (action.kind == Action::Kind::CloseSession) {
    sessions_.erase(peer);
    timers_.cancel(peer);
    return;
  }
  if (action.packet.empty())
    return;
  const Session *session = sessions_.find(peer);
  if (session != nullptr)
    timers_.arm(peer, now + session->timeout());
}

void Engine::send(const Endpoint &peer, const Action &action) {
  if (action.packet.empty())
    return;
  if (!sender_.send_to(peer, action.packet)) {
    // The session keeps its timer, so a lost send is retried like a lost
    // datagram.
    log_stream(LogLevel::Error) << "[" << peer.to_string() << "] sendto failed" << std::endl;
  }
}

} // namespace tftpff
