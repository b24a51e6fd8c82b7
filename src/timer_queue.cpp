#include "timer_queue.hpp"

namespace tftpff {

void TimerQueue::arm(const Endpoint &endpoint, TimePoint deadline) {
  cancel(endpoint);
  by_endpoint_[endpoint] = queue_.emplace(deadline, endpoint);
}

bool TimerQueue::cancel(const Endpoint &endpoint) {
  auto it = by_endpoint_.find(endpoint);
  if (it == by_endpoint_.end())
    return false;
  queue_.erase(it->second);
  by_endpoint_.erase(it);
  return true;
}

void TimerQueue::clear() {
  queue_.clear();
  by_endpoint_.clear();
}

bool TimerQueue::armed(const Endpoint &endpoint) const {
  return by_endpoint_.find(endpoint) != by_endpoint_.end();
}

std::optional<TimePoint> TimerQueue::deadline(const Endpoint &endpoint) const {
  auto it = by_endpoint_.find(endpoint);
  if (it == by_endpoint_.end())
    return std::nullopt;
  return it->second->first;
}

std::optional<TimePoint> TimerQueue::next_deadline() const {
  if (queue_.empty())
    return std::nullopt;
  return queue_.begin()->first;
}

std::vector<Endpoint> TimerQueue::pop_expired(TimePoint now) {
  std::vector<Endpoint> expired;
  while (!queue_.empty() && queue_.begin()->first <= now) {
    Endpoint endpoint = queue_.begin()->second;
    queue_.erase(queue_.begin());
    by_endpoint_.erase(endpoint);
    expired.push_back(endpoint);
  }
  return expired;
}

} // namespace tftpff
