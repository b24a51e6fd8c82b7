#include "tftp_common.hpp"

#include <stdexcept>

#include <arpa/inet.h>

namespace tftpff {

const char *error_code_name(TftpErrorCode code) {
  switch (code) {
  case TftpErrorCode::NotDefined:
    return "not defined";
  case TftpErrorCode::FileNotFound:
    return "file not found";
  case TftpErrorCode::AccessViolation:
    return "access violation";
  case TftpErrorCode::DiskFull:
    return "disk full";
  case TftpErrorCode::IllegalOperation:
    return "illegal operation";
  case TftpErrorCode::UnknownTransferId:
    return "unknown transfer id";
  case TftpErrorCode::FileAlreadyExists:
    return "file already exists";
  case TftpErrorCode::NoSuchUser:
    return "no such user";
  case TftpErrorCode::OptionRefused:
    return "option refused";
  }
  return "unknown";
}

std::string Endpoint::to_string() const {
  in_addr addr{};
  addr.s_addr = htonl(address);
  char ip[INET_ADDRSTRLEN];
  if (inet_ntop(AF_INET, &addr, ip, INET_ADDRSTRLEN) == nullptr) {
    return "?:" + std::to_string(port);
  }
  return std::string(ip) + ":" + std::to_string(port);
}

sockaddr_in Endpoint::to_sockaddr() const {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(address);
  return addr;
}

Endpoint Endpoint::from_sockaddr(const sockaddr_in &addr) {
  Endpoint endpoint;
  endpoint.address = ntohl(addr.sin_addr.s_addr);
  endpoint.port = ntohs(addr.sin_port);
  return endpoint;
}

Endpoint Endpoint::parse(const std::string &address, uint16_t port) {
  in_addr addr{};
  if (inet_pton(AF_INET, address.c_str(), &addr) != 1) {
    throw std::invalid_argument("Invalid IPv4 address: " + address);
  }
  Endpoint endpoint;
  endpoint.address = ntohl(addr.s_addr);
  endpoint.port = port;
  return endpoint;
}

} // namespace tftpff
