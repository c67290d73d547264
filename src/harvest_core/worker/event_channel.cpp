#include "harvest_core/worker/event_channel.hpp"

namespace harvest_core {

bool EventChannel::push(WorkerEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<WorkerEvent> EventChannel::pop() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !events_.empty() || closed_; });
  if (events_.empty()) {
    return std::nullopt;
  }
  WorkerEvent event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::optional<WorkerEvent> EventChannel::pop_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return !events_.empty() || closed_; });
  if (events_.empty()) {
    return std::nullopt;
  }
  WorkerEvent event = std::move(events_.front());
  events_.pop_front();
  return event;
}

void EventChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool EventChannel::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

}  // namespace harvest_core
