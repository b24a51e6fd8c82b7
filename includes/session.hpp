#ifndef TFTPFF_SESSION_HPP
#define TFTPFF_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "backend.hpp"
#include "options.hpp"
#include "tftp_common.hpp"

namespace tftpff {

enum class Direction { Read, Write };

enum class SessionState { Negotiating, Transferring, Completed, Aborted };

const char *session_state_name(SessionState state);

// What the engine must do after handing one event to a session or routing
// one datagram. `packet` is sent to the peer whenever it is non-empty,
// including on CloseSession (final ACK or ERROR).
struct Action {
  enum class Kind { NoReply, Reply, NewSession, CloseSession };

  Kind kind = Kind::NoReply;
  std::vector<char> packet;

  static Action no_reply() { return Action(); }
  static Action reply(std::vector<char> packet) { return Action{Kind::Reply, std::move(packet)}; }
  static Action new_session(std::vector<char> packet) {
    return Action{Kind::NewSession, std::move(packet)};
  }
  static Action close_session(std::vector<char> packet = std::vector<char>()) {
    return Action{Kind::CloseSession, std::move(packet)};
  }
};

struct SessionLimits {
  std::chrono::seconds default_timeout{DEFAULT_TIMEOUT_SEC};
  unsigned max_retries = DEFAULT_MAX_RETRIES;
};

// State of one client transfer. A session never touches the socket: every
// handler returns the Action the engine should carry out.
class Session {
public:
  Session(const Endpoint &peer, Direction direction, std::string filename,
          std::unique_ptr<FileHandle> file, const NegotiatedOptions &options,
          const SessionLimits &limits);

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Produces the first reply: OACK when options were accepted, otherwise
  // DATA(1) for a read or ACK(0) for a write. Returns CloseSession with an
  // ERROR packet if the transfer cannot begin.
  Action start();

  Action on_ack(uint16_t block);
  Action on_data(uint16_t block, const std::vector<char> &payload);
  // A peer's ERROR ends the session silently.
  Action on_error(uint16_t code, const std::string &message);
  // One retry step: resend the last packet, or give up after max_retries.
  Action on_timeout();
  // The peer sent something this session can never accept.
  Action on_illegal(const std::string &reason);

  const Endpoint &peer() const { return peer_; }
  Direction direction() const { return direction_; }
  const std::string &filename() const { return filename_; }
  SessionState state() const { return state_; }
  bool terminal() const {
    return state_ == SessionState::Completed || state_ == SessionState::Aborted;
  }
  // Last DATA block sent (read) or last block acknowledged (write).
  uint16_t block() const { return block_; }
  unsigned retries() const { return retries_; }
  size_t blksize() const { return blksize_; }
  std::chrono::seconds timeout() const { return timeout_; }
  const NegotiatedOptions &options() const { return options_; }
  const std::vector<char> &last_packet() const { return last_packet_; }
  uint64_t bytes_transferred() const { return bytes_transferred_; }

private:
  Action transmit(std::vector<char> packet);
  Action send_next_block();
  Action complete(std::vector<char> final_packet);
  Action abort(TftpErrorCode code, const std::string &message);

  Endpoint peer_;
  Direction direction_;
  std::string filename_;
  std::unique_ptr<FileHandle> file_;
  NegotiatedOptions options_;
  size_t blksize_;
  std::chrono::seconds timeout_;
  unsigned max_retries_;

  SessionState state_ = SessionState::Negotiating;
  uint16_t block_ = 0;
  unsigned retries_ = 0;
  bool last_block_sent_ = false;
  std::vector<char> last_packet_;
  std::vector<char> buffer_;
  uint64_t bytes_transferred_ = 0;
};

} // namespace tftpff

#endif // TFTPFF_SESSION_HPP
