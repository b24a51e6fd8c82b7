#ifndef TFTPFF_TIMER_QUEUE_HPP
#define TFTPFF_TIMER_QUEUE_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include "tftp_common.hpp"

namespace tftpff {

// One pending deadline per endpoint. Time is always passed in by the caller,
// so tests drive it without waiting on a real clock.
class TimerQueue {
public:
  // Replaces any deadline already set for `endpoint`.
  void arm(const Endpoint &endpoint, TimePoint deadline);
  bool cancel(const Endpoint &endpoint);
  void clear();

  bool armed(const Endpoint &endpoint) const;
  std::optional<TimePoint> deadline(const Endpoint &endpoint) const;
  std::optional<TimePoint> next_deadline() const;

  // Removes and returns every endpoint whose deadline is <= now, earliest
  // first.
  std::vector<Endpoint> pop_expired(TimePoint now);

  size_t size() const { return by_endpoint_.size(); }

private:
  using Queue = std::multimap<TimePoint, Endpoint>;

  Queue queue_;
  std::unordered_map<Endpoint, Queue::iterator, EndpointHash> by_endpoint_;
};

} // namespace tftpff

#endif // TFTPFF_TIMER_QUEUE_HPP
