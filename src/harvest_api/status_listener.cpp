#include "harvest_api/status_listener.hpp"

#include <algorithm>

namespace harvest_api {

LatestStatusListener::LatestStatusListener(std::size_t event_capacity)
    : capacity_(event_capacity) {}

void LatestStatusListener::on_queue_status(const harvest_core::QueueStatusSnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (latest_ && snapshot.sequence < latest_->sequence) {
    return;
  }
  latest_ = snapshot;
}

void LatestStatusListener::on_worker_event(const harvest_core::WorkerEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++events_seen_;
  if (capacity_ == 0) {
    return;
  }
  events_.push_back(event);
  while (events_.size() > capacity_) {
    events_.pop_front();
  }
}

std::optional<harvest_core::QueueStatusSnapshot> LatestStatusListener::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::vector<harvest_core::WorkerEvent> LatestStatusListener::recent_events(
    std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = limit == 0 ? events_.size() : std::min(limit, events_.size());
  return std::vector<harvest_core::WorkerEvent>(
      events_.end() - static_cast<std::ptrdiff_t>(count), events_.end());
}

std::size_t LatestStatusListener::events_seen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_seen_;
}

}  // namespace harvest_api
