#ifndef TFTPFF_TFTP_COMMON_HPP
#define TFTPFF_TFTP_COMMON_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include <netinet/in.h>

namespace tftpff {

// TFTP Opcodes
const uint16_t TFTP_OPCODE_RRQ = 1;
const uint16_t TFTP_OPCODE_WRQ = 2;
const uint16_t TFTP_OPCODE_DATA = 3;
const uint16_t TFTP_OPCODE_ACK = 4;
const uint16_t TFTP_OPCODE_ERROR = 5;
const uint16_t TFTP_OPCODE_OACK = 6; // RFC 2347

// TFTP Error Codes
enum class TftpErrorCode : uint16_t {
  NotDefined = 0,
  FileNotFound = 1,
  AccessViolation = 2,
  DiskFull = 3,
  IllegalOperation = 4,
  UnknownTransferId = 5,
  FileAlreadyExists = 6,
  NoSuchUser = 7,
  OptionRefused = 8, // RFC 2347
};

const char *error_code_name(TftpErrorCode code);

// Constants
const uint16_t TFTP_DEFAULT_PORT = 69;
const size_t TFTP_HEADER_SIZE = 4;     // opcode + block/error code
const size_t DEFAULT_BLKSIZE = 512;    // RFC 1350
const size_t MIN_BLKSIZE = 8;          // RFC 2348
const size_t MAX_BLKSIZE = 65464;      // RFC 2348
const unsigned MIN_TIMEOUT_SEC = 1;    // RFC 2349
const unsigned MAX_TIMEOUT_SEC = 255;  // RFC 2349
const int DEFAULT_TIMEOUT_SEC = 5;
const unsigned DEFAULT_MAX_RETRIES = 5;
const size_t DEFAULT_MAX_SESSIONS = 1024;
// Largest datagram the server ever needs to read: a DATA packet at MAX_BLKSIZE.
const size_t MAX_PACKET_SIZE = TFTP_HEADER_SIZE + MAX_BLKSIZE;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// A client's transfer identifier: IPv4 address and UDP port, both in host
// byte order. This is the only key used to tell sessions apart.
struct Endpoint {
  uint32_t address = 0;
  uint16_t port = 0;

  bool operator==(const Endpoint &other) const {
    return address == other.address && port == other.port;
  }
  bool operator!=(const Endpoint &other) const { return !(*this == other); }

  std::string to_string() const;
  sockaddr_in to_sockaddr() const;
  static Endpoint from_sockaddr(const sockaddr_in &addr);
  // Throws std::invalid_argument when `address` is not a dotted IPv4 address.
  static Endpoint parse(const std::string &address, uint16_t port);
};

struct EndpointHash {
  size_t operator()(const Endpoint &endpoint) const {
    return std::hash<uint64_t>()((static_cast<uint64_t>(endpoint.address) << 16) |
                                 endpoint.port);
  }
};

} // namespace tftpff

#endif // TFTPFF_TFTP_COMMON_HPP
