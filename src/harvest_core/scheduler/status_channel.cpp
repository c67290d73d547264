#include "harvest_core/scheduler/status_channel.hpp"

#include <algorithm>
#include <iostream>

namespace harvest_core {

void StatusChannel::subscribe(StatusListenerPtr listener) {
  if (!listener) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void StatusChannel::unsubscribe(const StatusListenerPtr& listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

std::vector<StatusListenerPtr> StatusChannel::listeners() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_;
}

std::size_t StatusChannel::listener_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

void StatusChannel::publish(const QueueStatusSnapshot& snapshot) {
  for (const auto& listener : listeners()) {
    try {
      listener->on_queue_status(snapshot);
    } catch (const std::exception& e) {
      std::cerr << "StatusChannel: listener failed on queue status: " << e.what() << std::endl;
    }
  }
}

void StatusChannel::forward(const WorkerEvent& event) {
  for (const auto& listener : listeners()) {
    try {
      listener->on_worker_event(event);
    } catch (const std::exception& e) {
      std::cerr << "StatusChannel: listener failed on worker event: " << e.what() << std::endl;
    }
  }
}

}  // namespace harvest_core
