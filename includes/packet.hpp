/*
 * RRQ  -> | Opcode (2) | Filename (N) | 0 | Mode (N) | 0 | [ Opt (N) | 0 | Value (N) | 0 ]* |
 * WRQ  -> | Opcode (2) | Filename (N) | 0 | Mode (N) | 0 | [ Opt (N) | 0 | Value (N) | 0 ]* |
 * DATA -> | Opcode (2) | Block (2) | Payload (0..blksize) |
 * ACK  -> | Opcode (2) | Block (2) |
 * ERROR-> | Opcode (2) | ErrorCode (2) | Message (N) | 0 |
 * OACK -> | Opcode (2) | [ Opt (N) | 0 | Value (N) | 0 ]* |
 *
 * All integers are big-endian.
 */

#ifndef TFTPFF_PACKET_HPP
#define TFTPFF_PACKET_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "tftp_common.hpp"

namespace tftpff {

// One name/value pair as it appears on the wire (RFC 2347). Names keep the
// client's spelling; matching is done case-insensitively by negotiation.
struct OptionEntry {
  std::string name;
  std::string value;

  bool operator==(const OptionEntry &other) const {
    return name == other.name && value == other.value;
  }
};

using OptionList = std::vector<OptionEntry>;

struct ReadRequest {
  std::string filename;
  std::string mode;
  OptionList options;
};

struct WriteRequest {
  std::string filename;
  std::string mode;
  OptionList options;
};

struct DataPacket {
  uint16_t block = 0;
  std::vector<char> payload;
};

struct AckPacket {
  uint16_t block = 0;
};

struct ErrorPacket {
  uint16_t code = 0;
  std::string message;
};

struct OptionAckPacket {
  OptionList options;
};

using Packet = std::variant<ReadRequest, WriteRequest, DataPacket, AckPacket,
                            ErrorPacket, OptionAckPacket>;

enum class CodecError {
  None,
  Malformed,       // missing terminator, bad length or unknown opcode
  UnsupportedMode, // well-formed request for anything but octet
};

const char *codec_error_name(CodecError error);

// --- Packet Parsing ---

inline uint16_t get_opcode(const char *buffer, size_t size) {
  if (size < 2)
    return 0; // Invalid packet
  return static_cast<uint16_t>((static_cast<unsigned char>(buffer[0]) << 8) |
                               static_cast<unsigned char>(buffer[1]));
}

// Returns false and sets `error` when the datagram is not a valid TFTP
// packet; `packet` is left untouched in that case.
bool decode_packet(const char *buffer, size_t size, Packet &packet, CodecError &error);

// --- Packet Creation ---

std::vector<char> create_rrq_packet(const std::string &filename,
                                    const std::string &mode = "octet",
                                    const OptionList &options = OptionList());
std::vector<char> create_wrq_packet(const std::string &filename,
                                    const std::string &mode = "octet",
                                    const OptionList &options = OptionList());
std::vector<char> create_data_packet(uint16_t block_num, const char *data, size_t data_size);
std::vector<char> create_ack_packet(uint16_t block_num);
std::vector<char> create_error_packet(uint16_t error_code, const std::string &error_msg);
std::vector<char> create_error_packet(TftpErrorCode error_code, const std::string &error_msg);
std::vector<char> create_oack_packet(const OptionList &options);

std::vector<char> encode_packet(const Packet &packet);

// Short human-readable form for logs, e.g. "DATA(block=3, 512 bytes)".
std::string packet_summary(const Packet &packet);

} // namespace tftpff

#endif // TFTPFF_PACKET_HPP
