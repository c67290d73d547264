#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "harvest_core/types/worker_event.hpp"

namespace harvest_core {

/**
 * @class EventChannel
 * @brief Closable queue carrying the events of one worker run.
 *
 * Any number of threads may push; one consumer pops. Once closed, pushes are
 * refused but events already queued are still delivered, so a consumer drains
 * everything that was accepted before it sees the end of the stream.
 */
class EventChannel {
 public:
  EventChannel() = default;

  // Returns false if the channel is already closed and the event was dropped.
  bool push(WorkerEvent event);

  // Blocks until an event is available. nullopt once closed and drained.
  std::optional<WorkerEvent> pop();

  // Like pop() but gives up after `timeout`; nullopt on timeout as well.
  std::optional<WorkerEvent> pop_for(std::chrono::milliseconds timeout);

  void close();
  bool is_closed() const;
  std::size_t size() const;

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<WorkerEvent> events_;
  bool closed_ = false;
};

using EventChannelPtr = std::shared_ptr<EventChannel>;

}  // namespace harvest_core
