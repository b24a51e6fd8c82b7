#include "session_table.hpp"

namespace tftpff {

SessionTable::SessionTable(size_t capacity) : capacity_(capacity) {}

Session *SessionTable::find(const Endpoint &endpoint) {
  auto it = sessions_.find(endpoint);
  return it == sessions_.end() ? nullptr : it->second.get();
}

const Session *SessionTable::find(const Endpoint &endpoint) const {
  auto it = sessions_.find(endpoint);
  return it == sessions_.end() ? nullptr : it->second.get();
}

bool SessionTable::insert(std::unique_ptr<Session> session) {
  if (!session || full())
    return false;
  Endpoint key = session->peer();
  if (sessions_.count(key) != 0)
    return false;
  sessions_.emplace(key, std::move(session));
  return true;
}

bool SessionTable::erase(const Endpoint &endpoint) { return sessions_.erase(endpoint) > 0; }

} // namespace tftpff
