#include "harvest_core/scheduler/scheduler.hpp"

#include <iostream>

namespace harvest_core {

namespace {
const char* const kDefaultFailureMessage = "Task execution failed";
}

Scheduler::Scheduler(TaskStore& store,
                     IWorkerBridge& bridge,
                     StatusChannel& status_channel,
                     SchedulerOptions options)
    : store_(store), bridge_(bridge), status_channel_(status_channel), options_(options) {
  loop_thread_ = std::thread(&Scheduler::run_loop, this);
}

Scheduler::~Scheduler() {
  shutdown();
}

// ============================================================================
// Control
// ============================================================================

long long Scheduler::enqueue(const JobDescription& job, int priority) {
  long long id = store_.enqueue(job, priority);
  std::cout << "Scheduler: enqueued item " << id << " (" << job.kind << ", priority " << priority
            << ")" << std::endl;
  publish();
  return id;
}

ControlResult Scheduler::start() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (shutting_down_) {
    return ControlResult::failure(ErrorKind::QueueNotRunning, "Scheduler is shutting down");
  }
  if (status_ == SchedulerStatus::RUNNING) {
    return ControlResult::failure(ErrorKind::AlreadyRunning, "Queue is already running");
  }
  if (bridge_.is_running()) {
    return ControlResult::failure(ErrorKind::AlreadyRunning,
                                  "A task is currently running. Please wait for it to complete.");
  }
  status_ = SchedulerStatus::RUNNING;
  std::cout << "Scheduler: queue started" << std::endl;
  publish(lock);
  cv_.notify_all();
  return ControlResult::ok("Queue started");
}

ControlResult Scheduler::stop() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (status_ == SchedulerStatus::IDLE) {
    return ControlResult::failure(ErrorKind::QueueNotRunning, "Queue is not running");
  }
  status_ = SchedulerStatus::PAUSED;
  interrupt_current_locked();
  std::cout << "Scheduler: queue paused" << std::endl;
  publish(lock);
  cv_.notify_all();
  return ControlResult::ok("Queue stopped");
}

void Scheduler::interrupt_current_locked() {
  if (bridge_.is_running()) {
    bridge_.stop();
  }
  if (!current_item_) {
    return;
  }
  if (current_item_->task_id) {
    auto task = store_.get_task(*current_item_->task_id);
    if (task && task->status != TaskStatus::RUNNING && task->status != TaskStatus::STOPPED) {
      // The worker exited before the stop; the loop records that outcome.
      return;
    }
  }
  QueueUpdate update;
  update.clear_task = true;
  store_.set_queue_status(current_item_->id, QueueItemStatus::PENDING, update);
  std::cout << "Scheduler: queue item " << current_item_->id << " returned to pending"
            << std::endl;
  current_item_.reset();
}

bool Scheduler::remove(long long queue_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (current_item_ && current_item_->id == queue_id) {
    throw SchedulerError(ErrorKind::ItemNotRemovable,
                         "Cannot remove queue item " + std::to_string(queue_id) +
                             " while it is running");
  }
  if (!store_.remove_queue_item(queue_id)) {
    auto item = store_.get_queue_item(queue_id);
    if (item && item->status == QueueItemStatus::RUNNING) {
      throw SchedulerError(ErrorKind::ItemNotRemovable,
                           "Cannot remove queue item " + std::to_string(queue_id) +
                               " while it is running");
    }
    return false;
  }
  publish(lock);
  return true;
}

void Scheduler::set_priority(long long queue_id, int priority) {
  store_.set_priority(queue_id, priority);
  publish();
}

int Scheduler::clear_completed() {
  int removed = store_.clear_terminal();
  publish();
  return removed;
}

std::vector<QueueItemDTO> Scheduler::list_items(std::optional<QueueItemStatus> status) {
  return store_.list_queue_items(status);
}

QueueStats Scheduler::stats() {
  try {
    return store_.queue_stats();
  } catch (const TaskStoreError& e) {
    std::cerr << "Scheduler: failed to read queue stats: " << e.what() << std::endl;
    return QueueStats{};
  }
}

SchedulerStatus Scheduler::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::optional<QueueItemDTO> Scheduler::current_item() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_item_;
}

QueueStatusSnapshot Scheduler::snapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  return snapshot_locked();
}

void Scheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!shutting_down_) {
      shutting_down_ = true;
      if (status_ == SchedulerStatus::RUNNING) {
        status_ = SchedulerStatus::PAUSED;
      }
      try {
        interrupt_current_locked();
      } catch (const HarvestError& e) {
        std::cerr << "Scheduler: failed to revert running item during shutdown: " << e.what()
                  << std::endl;
      }
    }
  }
  cv_.notify_all();
  if (loop_thread_.joinable() && loop_thread_.get_id() != std::this_thread::get_id()) {
    loop_thread_.join();
    std::cout << "Scheduler: loop joined" << std::endl;
  }
}

// ============================================================================
// Loop
// ============================================================================

void Scheduler::run_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return shutting_down_ || status_ == SchedulerStatus::RUNNING; });
    if (shutting_down_) {
      break;
    }

    std::optional<QueueItemDTO> item;
    try {
      item = store_.next_pending();
    } catch (const TaskStoreError& e) {
      std::cerr << "Scheduler: failed to read next pending item: " << e.what() << std::endl;
    }
    if (!item) {
      status_ = SchedulerStatus::IDLE;
      current_item_.reset();
      std::cout << "Scheduler: no pending items, going idle" << std::endl;
      publish(lock);
      continue;
    }

    run_item(lock, *item);

    cv_.wait_for(lock, options_.settle_delay, [this] {
      return shutting_down_ || status_ != SchedulerStatus::RUNNING;
    });
  }
}

void Scheduler::run_item(std::unique_lock<std::mutex>& lock, const QueueItemDTO& item) {
  try {
    store_.set_queue_status(item.id, QueueItemStatus::RUNNING);
  } catch (const TaskStoreError& e) {
    // next_pending would hand back the same item; pause instead of spinning on it.
    std::cerr << "Scheduler: failed to claim queue item " << item.id << ": " << e.what()
              << ", pausing queue" << std::endl;
    status_ = SchedulerStatus::PAUSED;
    publish(lock);
    return;
  }
  current_item_ = item;
  current_item_->status = QueueItemStatus::RUNNING;
  current_item_->started_at = std::chrono::system_clock::now();

  auto channel = std::make_shared<EventChannel>();
  long long task_id = 0;
  try {
    task_id = bridge_.start(item.job, channel);
  } catch (const WorkerBridgeError& e) {
    std::cerr << "Scheduler: queue item " << item.id << " failed to start: " << e.what()
              << std::endl;
    finish_item_locked(item.id, false, e.task_id(), e.what());
    publish(lock);
    return;
  } catch (const HarvestError& e) {
    std::cerr << "Scheduler: queue item " << item.id << " failed to start: " << e.what()
              << std::endl;
    finish_item_locked(item.id, false, std::nullopt, e.what());
    publish(lock);
    return;
  }

  current_item_->task_id = task_id;
  try {
    QueueUpdate update;
    update.task_id = task_id;
    store_.set_queue_status(item.id, QueueItemStatus::RUNNING, update);
  } catch (const TaskStoreError& e) {
    std::cerr << "Scheduler: failed to bind task " << task_id << " to queue item " << item.id
              << ": " << e.what() << std::endl;
  }
  std::cout << "Scheduler: running queue item " << item.id << " as task " << task_id
            << std::endl;
  publish(lock);

  lock.unlock();
  std::optional<WorkerEvent> terminal;
  while (auto event = channel->pop()) {
    status_channel_.forward(*event);
    if (event->is_terminal()) {
      terminal = std::move(*event);
    }
  }
  lock.lock();

  if (!current_item_ || current_item_->id != item.id) {
    // stop() already put the item back to pending.
    return;
  }
  if (!terminal) {
    std::cerr << "Scheduler: run of queue item " << item.id << " ended without an exit"
              << std::endl;
    try {
      QueueUpdate update;
      update.clear_task = true;
      store_.set_queue_status(item.id, QueueItemStatus::PENDING, update);
    } catch (const TaskStoreError& e) {
      std::cerr << "Scheduler: failed to revert queue item " << item.id << ": " << e.what()
                << std::endl;
    }
    current_item_.reset();
    publish(lock);
    return;
  }

  finish_item_locked(item.id, terminal->success.value_or(false), task_id, terminal->message);
  publish(lock);
}

void Scheduler::finish_item_locked(long long queue_id,
                                   bool success,
                                   std::optional<long long> task_id,
                                   const std::string& message) {
  try {
    QueueUpdate update;
    update.task_id = task_id;
    if (success) {
      store_.set_queue_status(queue_id, QueueItemStatus::COMPLETED, update);
    } else {
      update.error_message = message.empty() ? kDefaultFailureMessage : message;
      store_.set_queue_status(queue_id, QueueItemStatus::FAILED, update);
    }
    std::cout << "Scheduler: queue item " << queue_id << (success ? " completed" : " failed")
              << std::endl;
  } catch (const TaskStoreError& e) {
    // One bad item must not halt the queue.
    std::cerr << "Scheduler: failed to finalize queue item " << queue_id << ": " << e.what()
              << std::endl;
  }
  current_item_.reset();
}

// ============================================================================
// Publishing
// ============================================================================

QueueStatusSnapshot Scheduler::snapshot_locked() {
  QueueStatusSnapshot snapshot;
  snapshot.status = status_;
  snapshot.current_item = current_item_;
  snapshot.stats = stats();
  return snapshot;
}

void Scheduler::publish(std::unique_lock<std::mutex>& lock) {
  lock.unlock();
  {
    std::lock_guard<std::mutex> publish_lock(publish_mutex_);
    QueueStatusSnapshot snapshot;
    {
      std::lock_guard<std::mutex> state_lock(mutex_);
      snapshot = snapshot_locked();
    }
    snapshot.sequence = ++publish_sequence_;
    status_channel_.publish(snapshot);
  }
  lock.lock();
}

void Scheduler::publish() {
  std::unique_lock<std::mutex> lock(mutex_);
  publish(lock);
}

}  // namespace harvest_core
