#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "harvest_core/scheduler/queue_status.hpp"
#include "harvest_core/types/worker_event.hpp"

namespace harvest_core {

class IStatusListener {
 public:
  virtual ~IStatusListener() = default;
  virtual void on_queue_status(const QueueStatusSnapshot& snapshot) = 0;
  virtual void on_worker_event(const WorkerEvent& /*event*/) {}
};

using StatusListenerPtr = std::shared_ptr<IStatusListener>;

/**
 * @class StatusChannel
 * @brief Fans queue snapshots and worker events out to listeners.
 *
 * Delivery is best effort: a listener that throws is reported on stderr and
 * the remaining listeners still receive the update. Listeners are called
 * outside the channel lock and may subscribe further listeners.
 */
class StatusChannel {
 public:
  void subscribe(StatusListenerPtr listener);
  void unsubscribe(const StatusListenerPtr& listener);

  void publish(const QueueStatusSnapshot& snapshot);
  void forward(const WorkerEvent& event);

  std::size_t listener_count() const;

 private:
  std::vector<StatusListenerPtr> listeners() const;

  mutable std::mutex mutex_;
  std::vector<StatusListenerPtr> listeners_;
};

}  // namespace harvest_core
