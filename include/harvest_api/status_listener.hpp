#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "harvest_core/scheduler/status_channel.hpp"

namespace harvest_api {

/**
 * @class LatestStatusListener
 * @brief Keeps what the HTTP layer needs to answer status polls.
 *
 * Holds the most recent queue snapshot and a bounded ring of the latest
 * worker events. Older events fall off the front once the ring is full.
 * A snapshot with a lower sequence than the one held is ignored.
 */
class LatestStatusListener : public harvest_core::IStatusListener {
 public:
  explicit LatestStatusListener(std::size_t event_capacity = 200);

  void on_queue_status(const harvest_core::QueueStatusSnapshot& snapshot) override;
  void on_worker_event(const harvest_core::WorkerEvent& event) override;

  std::optional<harvest_core::QueueStatusSnapshot> latest() const;

  // Oldest first. limit 0 returns the whole ring.
  std::vector<harvest_core::WorkerEvent> recent_events(std::size_t limit = 0) const;

  // Total events received, including those no longer buffered.
  std::size_t events_seen() const;

 private:
  mutable std::mutex mutex_;
  std::optional<harvest_core::QueueStatusSnapshot> latest_;
  std::deque<harvest_core::WorkerEvent> events_;
  std::size_t capacity_;
  std::size_t events_seen_ = 0;
};

}  // namespace harvest_api
