#include "options.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

#include "log.hpp"

namespace tftpff {

namespace {

bool iequals(const std::string &a, const char *b) {
  size_t i = 0;
  for (; i < a.size() && b[i] != '\0'; ++i) {
    if (tolower(static_cast<unsigned char>(a[i])) != tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return i == a.size() && b[i] == '\0';
}

// Strict decimal parse; std::stoull would accept signs and whitespace.
bool parse_decimal(const std::string &text, uint64_t &value) {
  if (text.empty() || text.size() > 20)
    return false;
  uint64_t result = 0;
  for (char c : text) {
    if (!isdigit(static_cast<unsigned char>(c)))
      return false;
    uint64_t digit = static_cast<uint64_t>(c - '0');
    if (result > (std::numeric_limits<uint64_t>::max() - digit) / 10)
      return false;
    result = result * 10 + digit;
  }
  value = result;
  return true;
}

bool find_kind(const std::string &name, OptionKind &kind) {
  for (OptionKind candidate :
       {OptionKind::BlockSize, OptionKind::Timeout, OptionKind::TransferSize}) {
    if (iequals(name, option_name(candidate))) {
      kind = candidate;
      return true;
    }
  }
  return false;
}

} // namespace

const char *option_name(OptionKind kind) {
  switch (kind) {
  case OptionKind::BlockSize:
    return "blksize";
  case OptionKind::Timeout:
    return "timeout";
  case OptionKind::TransferSize:
    return "tsize";
  }
  return "";
}

bool NegotiatedOptions::has(OptionKind kind) const {
  return std::find(order_.begin(), order_.end(), kind) != order_.end();
}

void NegotiatedOptions::accept(OptionKind kind) {
  if (!has(kind))
    order_.push_back(kind);
}

void NegotiatedOptions::set_blksize(size_t value) {
  blksize_ = value;
  accept(OptionKind::BlockSize);
}

void NegotiatedOptions::set_timeout(unsigned value) {
  timeout_ = value;
  accept(OptionKind::Timeout);
}

void NegotiatedOptions::set_tsize(uint64_t value) {
  tsize_ = value;
  accept(OptionKind::TransferSize);
}

OptionList NegotiatedOptions::to_option_list() const {
  OptionList options;
  for (OptionKind kind : order_) {
    OptionEntry entry;
    entry.name = option_name(kind);
    switch (kind) {
    case OptionKind::BlockSize:
      entry.value = std::to_string(*blksize_);
      break;
    case OptionKind::Timeout:
      entry.value = std::to_string(*timeout_);
      break;
    case OptionKind::TransferSize:
      entry.value = std::to_string(*tsize_);
      break;
    }
    options.push_back(std::move(entry));
  }
  return options;
}

NegotiatedOptions negotiate_options(const OptionList &requested) {
  NegotiatedOptions accepted;

  for (const OptionEntry &option : requested) {
    OptionKind kind;
    if (!find_kind(option.name, kind)) {
      log_stream(LogLevel::Debug) << "Ignoring unknown option " << option.name << "=" << option.value
                        << std::endl;
      continue;
    }
    if (accepted.has(kind))
      continue; // first occurrence wins

    uint64_t value = 0;
    bool valid = parse_decimal(option.value, value);
    switch (kind) {
    case OptionKind::BlockSize:
      valid = valid && value >= MIN_BLKSIZE && value <= MAX_BLKSIZE;
      if (valid)
        accepted.set_blksize(static_cast<size_t>(value));
      break;
    case OptionKind::Timeout:
      valid = valid && value >= MIN_TIMEOUT_SEC && value <= MAX_TIMEOUT_SEC;
      if (valid)
        accepted.set_timeout(static_cast<unsigned>(value));
      break;
    case OptionKind::TransferSize:
      if (valid)
        accepted.set_tsize(value);
      break;
    }
    if (!valid) {
      log_stream(LogLevel::Debug) << "Ignoring out-of-range option " << option.name << "=" << option.value
                        << std::endl;
    }
  }
  return accepted;
}

} // namespace tftpff
