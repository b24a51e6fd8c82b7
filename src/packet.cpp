#include "packet.hpp"

#include <cctype>
#include <cstring>
#include <stdexcept>

namespace tftpff {

namespace {

void append_u16(std::vector<char> &packet, uint16_t value) {
  packet.push_back(static_cast<char>((value >> 8) & 0xff));
  packet.push_back(static_cast<char>(value & 0xff));
}

void append_string(std::vector<char> &packet, const std::string &value) {
  packet.insert(packet.end(), value.begin(), value.end());
  packet.push_back('\0');
}

void append_options(std::vector<char> &packet, const OptionList &options) {
  for (const OptionEntry &option : options) {
    append_string(packet, option.name);
    append_string(packet, option.value);
  }
}

uint16_t read_u16(const char *ptr) {
  return static_cast<uint16_t>((static_cast<unsigned char>(ptr[0]) << 8) |
                               static_cast<unsigned char>(ptr[1]));
}

// Reads one NUL-terminated string starting at `ptr`. Advances `ptr` past the
// terminator. Returns false if the terminator is missing.
bool read_string(const char *&ptr, const char *end, std::string &out) {
  const char *terminator = static_cast<const char *>(memchr(ptr, '\0', end - ptr));
  if (terminator == nullptr)
    return false;
  out.assign(ptr, terminator - ptr);
  ptr = terminator + 1;
  return true;
}

bool read_options(const char *ptr, const char *end, OptionList &options) {
  while (ptr < end) {
    OptionEntry option;
    if (!read_string(ptr, end, option.name))
      return false;
    if (ptr >= end || !read_string(ptr, end, option.value))
      return false; // name without a value
    options.push_back(std::move(option));
  }
  return true;
}

std::string to_lower(std::string value) {
  for (char &c : value)
    c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
  return value;
}

// Parses RRQ or WRQ
template <typename Request>
CodecError parse_request_packet(const char *buffer, size_t size, Request &request) {
  const char *ptr = buffer + 2;
  const char *end = buffer + size;

  if (!read_string(ptr, end, request.filename) || request.filename.empty())
    return CodecError::Malformed;
  if (ptr >= end || !read_string(ptr, end, request.mode) || request.mode.empty())
    return CodecError::Malformed;
  if (!read_options(ptr, end, request.options))
    return CodecError::Malformed;

  // Only binary transfers are served.
  if (to_lower(request.mode) != "octet")
    return CodecError::UnsupportedMode;
  return CodecError::None;
}

} // namespace

const char *codec_error_name(CodecError error) {
  switch (error) {
  case CodecError::None:
    return "none";
  case CodecError::Malformed:
    return "malformed packet";
  case CodecError::UnsupportedMode:
    return "unsupported transfer mode";
  }
  return "unknown";
}

bool decode_packet(const char *buffer, size_t size, Packet &packet, CodecError &error) {
  error = CodecError::Malformed;
  if (size < 2)
    return false;

  switch (get_opcode(buffer, size)) {
  case TFTP_OPCODE_RRQ: {
    ReadRequest request;
    error = parse_request_packet(buffer, size, request);
    if (error != CodecError::None)
      return false;
    packet = std::move(request);
    return true;
  }
  case TFTP_OPCODE_WRQ: {
    WriteRequest request;
    error = parse_request_packet(buffer, size, request);
    if (error != CodecError::None)
      return false;
    packet = std::move(request);
    return true;
  }
  case TFTP_OPCODE_DATA: {
    if (size < TFTP_HEADER_SIZE || size - TFTP_HEADER_SIZE > MAX_BLKSIZE)
      return false;
    DataPacket data;
    data.block = read_u16(buffer + 2);
    data.payload.assign(buffer + TFTP_HEADER_SIZE, buffer + size);
    packet = std::move(data);
    break;
  }
  case TFTP_OPCODE_ACK: {
    if (size != TFTP_HEADER_SIZE)
      return false;
    AckPacket ack;
    ack.block = read_u16(buffer + 2);
    packet = ack;
    break;
  }
  case TFTP_OPCODE_ERROR: {
    // Need at least header + null terminator
    if (size < TFTP_HEADER_SIZE + 1)
      return false;
    ErrorPacket err;
    err.code = read_u16(buffer + 2);
    const char *ptr = buffer + TFTP_HEADER_SIZE;
    if (!read_string(ptr, buffer + size, err.message))
      return false;
    packet = std::move(err);
    break;
  }
  case TFTP_OPCODE_OACK: {
    OptionAckPacket oack;
    if (!read_options(buffer + 2, buffer + size, oack.options))
      return false;
    packet = std::move(oack);
    break;
  }
  default:
    return false;
  }

  error = CodecError::None;
  return true;
}

std::vector<char> create_rrq_packet(const std::string &filename, const std::string &mode,
                                    const OptionList &options) {
  std::vector<char> packet;
  append_u16(packet, TFTP_OPCODE_RRQ);
  append_string(packet, filename);
  append_string(packet, mode);
  append_options(packet, options);
  return packet;
}

std::vector<char> create_wrq_packet(const std::string &filename, const std::string &mode,
                                    const OptionList &options) {
  std::vector<char> packet;
  append_u16(packet, TFTP_OPCODE_WRQ);
  append_string(packet, filename);
  append_string(packet, mode);
  append_options(packet, options);
  return packet;
}

std::vector<char> create_data_packet(uint16_t block_num, const char *data, size_t data_size) {
  if (data_size > MAX_BLKSIZE) {
    throw std::length_error("Data size exceeds maximum allowed");
  }
  std::vector<char> packet;
  packet.reserve(TFTP_HEADER_SIZE + data_size);
  append_u16(packet, TFTP_OPCODE_DATA);
  append_u16(packet, block_num);
  if (data_size > 0) {
    packet.insert(packet.end(), data, data + data_size);
  }
  return packet;
}

std::vector<char> create_ack_packet(uint16_t block_num) {
  std::vector<char> packet;
  append_u16(packet, TFTP_OPCODE_ACK);
  append_u16(packet, block_num);
  return packet;
}

std::vector<char> create_error_packet(uint16_t error_code, const std::string &error_msg) {
  std::vector<char> packet;
  append_u16(packet, TFTP_OPCODE_ERROR);
  append_u16(packet, error_code);
  append_string(packet, error_msg);
  return packet;
}

std::vector<char> create_error_packet(TftpErrorCode error_code, const std::string &error_msg) {
  return create_error_packet(static_cast<uint16_t>(error_code), error_msg);
}

std::vector<char> create_oack_packet(const OptionList &options) {
  std::vector<char> packet;
  append_u16(packet, TFTP_OPCODE_OACK);
  append_options(packet, options);
  return packet;
}

namespace {

struct Encoder {
  std::vector<char> operator()(const ReadRequest &p) const {
    return create_rrq_packet(p.filename, p.mode, p.options);
  }
  std::vector<char> operator()(const WriteRequest &p) const {
    return create_wrq_packet(p.filename, p.mode, p.options);
  }
  std::vector<char> operator()(const DataPacket &p) const {
    return create_data_packet(p.block, p.payload.data(), p.payload.size());
  }
  std::vector<char> operator()(const AckPacket &p) const { return create_ack_packet(p.block); }
  std::vector<char> operator()(const ErrorPacket &p) const {
    return create_error_packet(p.code, p.message);
  }
  std::vector<char> operator()(const OptionAckPacket &p) const {
    return create_oack_packet(p.options);
  }
};

std::string options_summary(const OptionList &options) {
  std::string out;
  for (const OptionEntry &option : options) {
    out += " " + option.name + "=" + option.value;
  }
  return out;
}

struct Summarizer {
  std::string operator()(const ReadRequest &p) const {
    return "RRQ(\"" + p.filename + "\", " + p.mode + options_summary(p.options) + ")";
  }
  std::string operator()(const WriteRequest &p) const {
    return "WRQ(\"" + p.filename + "\", " + p.mode + options_summary(p.options) + ")";
  }
  std::string operator()(const DataPacket &p) const {
    return "DATA(block=" + std::to_string(p.block) + ", " + std::to_string(p.payload.size()) +
           " bytes)";
  }
  std::string operator()(const AckPacket &p) const {
    return "ACK(block=" + std::to_string(p.block) + ")";
  }
  std::string operator()(const ErrorPacket &p) const {
    return "ERROR(code=" + std::to_string(p.code) + ", \"" + p.message + "\")";
  }
  std::string operator()(const OptionAckPacket &p) const {
    return "OACK(" + options_summary(p.options) + " )";
  }
};

} // namespace

std::vector<char> encode_packet(const Packet &packet) { return std::visit(Encoder(), packet); }

std::string packet_summary(const Packet &packet) { return std::visit(Summarizer(), packet); }

} // namespace tftpff
