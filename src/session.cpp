#include "session.hpp"

#include "log.hpp"
#include "packet.hpp"

namespace tftpff {

const char *session_state_name(SessionState state) {
  switch (state) {
  case SessionState::Negotiating:
    return "negotiating";
  case SessionState::Transferring:
    return "transferring";
  case SessionState::Completed:
    return "completed";
  case SessionState::Aborted:
    return "aborted";
  }
  return "unknown";
}

Session::Session(const Endpoint &peer, Direction direction, std::string filename,
                 std::unique_ptr<FileHandle> file, const NegotiatedOptions &options,
                 const SessionLimits &limits)
    : peer_(peer), direction_(direction), filename_(std::move(filename)), file_(std::move(file)),
      options_(options), blksize_(options.blksize().value_or(DEFAULT_BLKSIZE)),
      timeout_(options.timeout() ? std::chrono::seconds(*options.timeout())
                                 : limits.default_timeout),
      max_retries_(limits.max_retries) {}

Action Session::start() {
  if (state_ != SessionState::Negotiating)
    return Action::no_reply();
  state_ = SessionState::Transferring;

  // RFC 2349: a reader asks with tsize=0 and learns the real size.
  if (direction_ == Direction::Read && options_.has(OptionKind::TransferSize)) {
    options_.set_tsize(file_->size());
  }

  Action first;
  if (!options_.empty()) {
    OptionList accepted = options_.to_option_list();
    log_stream(LogLevel::Debug) << "[" << peer_.to_string() << "] negotiated "
                      << packet_summary(OptionAckPacket{accepted}) << std::endl;
    first = transmit(create_oack_packet(accepted));
  } else if (direction_ == Direction::Read) {
    first = send_next_block();
  } else {
    first = transmit(create_ack_packet(0));
  }

  if (first.kind == Action::Kind::CloseSession)
    return first;
  return Action::new_session(std::move(first.packet));
}

Action Session::on_ack(uint16_t block) {
  if (state_ != SessionState::Transferring)
    return Action::no_reply();
  if (direction_ == Direction::Write)
    return on_illegal("ACK received during a write transfer");

  if (block != block_) {
    // Late or duplicate ACK: discard without touching state.
    log_stream(LogLevel::Debug) << "[" << peer_.to_string() << "] ignoring ACK " << block
                      << " (waiting for " << block_ << ")" << std::endl;
    return Action::no_reply();
  }

  if (last_block_sent_)
    return complete(std::vector<char>());

  retries_ = 0;
  return send_next_block();
}

Action Session::on_data(uint16_t block, const std::vector<char> &payload) {
  if (state_ != SessionState::Transferring)
    return Action::no_reply();
  if (direction_ == Direction::Read)
    return on_illegal("DATA received during a read transfer");

  uint16_t expected = static_cast<uint16_t>(block_ + 1);
  if (block != expected) {
    // Retransmitted or stray block: re-acknowledge the last good one and
    // never persist it twice.
    log_stream(LogLevel::Debug) << "[" << peer_.to_string() << "] received DATA " << block
                      << " (expected " << expected << "). Resending last reply." << std::endl;
    return transmit(last_packet_);
  }
  if (payload.size() > blksize_)
    return on_illegal("DATA block larger than negotiated blksize");

  try {
    file_->write_block(payload.data(), payload.size());
  } catch (const BackendError &e) {
    log_stream(LogLevel::Error) << "[" << peer_.to_string() << "] " << e.what() << std::endl;
    return abort(e.code(), error_code_name(e.code()));
  }

  block_ = block;
  retries_ = 0;
  bytes_transferred_ += payload.size();

  if (payload.size() < blksize_) {
    try {
      file_->commit();
    } catch (const BackendError &e) {
      log_stream(LogLevel::Error) << "[" << peer_.to_string() << "] " << e.what() << std::endl;
      return abort(e.code(), error_code_name(e.code()));
    }
    return complete(create_ack_packet(block));
  }
  return transmit(create_ack_packet(block));
}

Action Session::on_error(uint16_t code, const std::string &message) {
  if (terminal())
    return Action::no_reply();
  log_stream(LogLevel::Warn) << "[" << peer_.to_string() << "] received TFTP Error from client: Code "
                   << code << ": " << message << ". Aborting transfer of " << filename_ << "."
                   << std::endl;
  state_ = SessionState::Aborted;
  file_.reset();
  return Action::close_session();
}

Action Session::on_timeout() {
  if (state_ != SessionState::Transferring)
    return Action::no_reply();

  if (retries_ >= max_retries_) {
    log_stream(LogLevel::Warn) << "[" << peer_.to_string() << "] max retries exceeded waiting on block "
                     << block_ << "." << std::endl;
    return abort(TftpErrorCode::NotDefined, "timeout");
  }

  ++retries_;
  log_stream(LogLevel::Debug) << "[" << peer_.to_string() << "] timeout, resending last packet (attempt "
                    << retries_ << " of " << max_retries_ << ")" << std::endl;
  return Action::reply(last_packet_);
}

Action Session::on_illegal(const std::string &reason) {
  if (terminal())
    return Action::no_reply();
  log_stream(LogLevel::Warn) << "[" << peer_.to_string() << "] " << reason << std::endl;
  return abort(TftpErrorCode::IllegalOperation, "illegal operation");
}

Action Session::transmit(std::vector<char> packet) {
  last_packet_ = std::move(packet);
  return Action::reply(last_packet_);
}

Action Session::send_next_block() {
  buffer_.resize(blksize_);
  size_t bytes_read = 0;
  try {
    bytes_read = file_->read_block(buffer_.data(), blksize_);
  } catch (const BackendError &e) {
    log_stream(LogLevel::Error) << "[" << peer_.to_string() << "] " << e.what() << std::endl;
    return abort(e.code(), error_code_name(e.code()));
  }

  ++block_;
  last_block_sent_ = bytes_read < blksize_;
  bytes_transferred_ += bytes_read;
  return transmit(create_data_packet(block_, buffer_.data(), bytes_read));
}

Action Session::complete(std::vector<char> final_packet) {
  state_ = SessionState::Completed;
  file_.reset();
  log_stream(LogLevel::Info) << "[" << peer_.to_string() << "] "
                   << (direction_ == Direction::Read ? "RRQ" : "WRQ") << " for " << filename_
                   << " completed successfully (" << bytes_transferred_ << " bytes)." << std::endl;
  return Action::close_session(std::move(final_packet));
}

Action Session::abort(TftpErrorCode code, const std::string &message) {
  state_ = SessionState::Aborted;
  file_.reset();
  log_stream(LogLevel::Warn) << "[" << peer_.to_string() << "] aborting transfer of " << filename_
                   << ": " << message << std::endl;
  return Action::close_session(create_error_packet(code, message));
}

} // namespace tftpff
