#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "harvest_core/db/task_store.hpp"
#include "harvest_core/errors.hpp"
#include "harvest_core/scheduler/queue_status.hpp"
#include "harvest_core/scheduler/status_channel.hpp"
#include "harvest_core/worker/worker_bridge.hpp"

namespace harvest_core {

class SchedulerError : public HarvestError {
 public:
  SchedulerError(ErrorKind kind, const std::string& message) : HarvestError(kind, message) {}
};

struct SchedulerOptions {
  // Pause between the end of one item and pulling the next.
  std::chrono::milliseconds settle_delay{1000};
};

/**
 * @class Scheduler
 * @brief Drains the persistent queue one item at a time through the worker bridge.
 *
 * A dedicated loop thread sleeps until the queue is started, then repeatedly
 * takes the highest priority pending item, runs it and records the outcome
 * once the worker has exited. Only one item is ever running. Stopping reverts
 * the running item to pending so a later start() re-executes it from scratch.
 *
 * Every state change is published to the StatusChannel.
 */
class Scheduler {
 public:
  Scheduler(TaskStore& store,
            IWorkerBridge& bridge,
            StatusChannel& status_channel,
            SchedulerOptions options = {});

  // Calls shutdown().
  ~Scheduler();

  long long enqueue(const JobDescription& job, int priority = 0);

  ControlResult start();
  ControlResult stop();

  /**
   * @brief Deletes a queue item.
   * @return false if no such item exists.
   * @throws SchedulerError ItemNotRemovable if the item is running.
   */
  bool remove(long long queue_id);

  void set_priority(long long queue_id, int priority);
  int clear_completed();
  std::vector<QueueItemDTO> list_items(std::optional<QueueItemStatus> status = std::nullopt);

  // Zeroes when the store cannot be read.
  QueueStats stats();

  SchedulerStatus status() const;
  std::optional<QueueItemDTO> current_item() const;
  QueueStatusSnapshot snapshot();

  /**
   * @brief Stops processing for good.
   *
   * A running worker is stopped and its item reverted to pending, then the
   * loop thread is joined. Safe to call more than once.
   */
  void shutdown();

  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

 private:
  void run_loop();
  void run_item(std::unique_lock<std::mutex>& lock, const QueueItemDTO& item);
  // Stops the bridge and reverts the current item unless its run already ended.
  void interrupt_current_locked();
  void finish_item_locked(long long queue_id,
                          bool success,
                          std::optional<long long> task_id,
                          const std::string& message);

  QueueStatusSnapshot snapshot_locked();
  // Takes and delivers a snapshot under publish_mutex_ so listeners see
  // snapshots in the order they were taken. `lock` is released meanwhile.
  void publish(std::unique_lock<std::mutex>& lock);
  void publish();

  TaskStore& store_;
  IWorkerBridge& bridge_;
  StatusChannel& status_channel_;
  SchedulerOptions options_;

  // Lock order: publish_mutex_ before mutex_.
  std::mutex publish_mutex_;
  std::uint64_t publish_sequence_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  SchedulerStatus status_ = SchedulerStatus::IDLE;
  std::optional<QueueItemDTO> current_item_;
  bool shutting_down_ = false;
  std::thread loop_thread_;
};

}  // namespace harvest_core
