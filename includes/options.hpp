#ifndef TFTPFF_OPTIONS_HPP
#define TFTPFF_OPTIONS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "packet.hpp"

namespace tftpff {

// Options this server honors (RFC 2348, 2349).
enum class OptionKind { BlockSize, Timeout, TransferSize };

const char *option_name(OptionKind kind);

// The accepted subset of a request's options, kept in request order so the
// OACK echoes them the way the client sent them.
class NegotiatedOptions {
public:
  bool empty() const { return order_.empty(); }
  const std::vector<OptionKind> &order() const { return order_; }
  bool has(OptionKind kind) const;

  std::optional<size_t> blksize() const { return blksize_; }
  std::optional<unsigned> timeout() const { return timeout_; }
  std::optional<uint64_t> tsize() const { return tsize_; }

  void set_blksize(size_t value);
  void set_timeout(unsigned value);
  void set_tsize(uint64_t value);

  // Canonical lowercase names, in acceptance order.
  OptionList to_option_list() const;

private:
  void accept(OptionKind kind);

  std::vector<OptionKind> order_;
  std::optional<size_t> blksize_;
  std::optional<unsigned> timeout_;
  std::optional<uint64_t> tsize_;
};

// Keeps recognized options with in-range decimal values. Unknown names,
// out-of-range values and repeats of an already accepted option are dropped.
NegotiatedOptions negotiate_options(const OptionList &requested);

} // namespace tftpff

#endif // TFTPFF_OPTIONS_HPP
