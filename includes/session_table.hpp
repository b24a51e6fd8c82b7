#ifndef TFTPFF_SESSION_TABLE_HPP
#define TFTPFF_SESSION_TABLE_HPP

#include <cstddef>
#include <memory>
#include <unordered_map>

#include "session.hpp"
#include "tftp_common.hpp"

namespace tftpff {

// Active sessions keyed by client endpoint, at most one per endpoint and at
// most `capacity` in total.
class SessionTable {
public:
  explicit SessionTable(size_t capacity = DEFAULT_MAX_SESSIONS);

  Session *find(const Endpoint &endpoint);
  const Session *find(const Endpoint &endpoint) const;

  // Returns false when the endpoint already has a session or the table is
  // full; the session is not stored in that case.
  bool insert(std::unique_ptr<Session> session);
  bool erase(const Endpoint &endpoint);
  void clear() { sessions_.clear(); }

  size_t size() const { return sessions_.size(); }
  size_t capacity() const { return capacity_; }
  bool full() const { return sessions_.size() >= capacity_; }

private:
  size_t capacity_;
  std::unordered_map<Endpoint, std::unique_ptr<Session>, EndpointHash> sessions_;
};

} // namespace tftpff

#endif // TFTPFF_SESSION_TABLE_HPP
