#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../../common/mocks_test.hpp"
#include "../../common/utilities_test.hpp"
#include "harvest_core/db/pooled_connection.hpp"
#include "harvest_core/scheduler/scheduler.hpp"

namespace harvest_core {

using harvest_tests::TestUtilities;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

const char* const kQuickWorker = R"SH(echo '{"type":"done","count":1}')SH";
const char* const kSlowWorker = R"SH(echo '{"type":"log","message":"working"}'
sleep 5
echo '{"type":"done","count":1}')SH";

// Records what the scheduler publishes.
class RecordingListener : public IStatusListener {
 public:
  void on_queue_status(const QueueStatusSnapshot& snapshot) override {
    long long running = snapshot.stats.running;
    long long seen = max_running.load();
    while (running > seen && !max_running.compare_exchange_weak(seen, running)) {
    }
    ++snapshots;
  }
  void on_worker_event(const WorkerEvent& event) override {
    if (event.type == WorkerEventType::Exit) {
      ++exit_events;
    }
  }

  std::atomic<long long> max_running{0};
  std::atomic<int> snapshots{0};
  std::atomic<int> exit_events{0};
};

// Holds the first snapshot it receives until release() is called.
class GatedListener : public IStatusListener {
 public:
  void on_queue_status(const QueueStatusSnapshot& snapshot) override {
    std::unique_lock<std::mutex> lock(mutex_);
    sequences_.push_back(snapshot.sequence);
    pending_.push_back(snapshot.stats.pending);
    if (sequences_.size() == 1) {
      cv_.notify_all();
      cv_.wait(lock, [this] { return released_; });
    }
  }
  void on_worker_event(const WorkerEvent&) override {}

  bool wait_until_holding() {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(10), [this] { return !sequences_.empty(); });
  }
  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }
  std::vector<std::uint64_t> sequences() {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequences_;
  }
  std::vector<long long> pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool released_ = false;
  std::vector<std::uint64_t> sequences_;
  std::vector<long long> pending_;
};

}  // namespace

class SchedulerTest : public harvest_tests::TaskStoreTestBase {
 protected:
  void SetUp() override {
    harvest_tests::TaskStoreTestBase::SetUp();
    listener_ = std::make_shared<RecordingListener>();
    status_channel_.subscribe(listener_);
  }

  void TearDown() override {
    if (scheduler_) {
      scheduler_->shutdown();
      scheduler_.reset();
    }
    if (bridge_) {
      bridge_->shutdown();
      bridge_.reset();
    }
    mock_bridge_.reset();
    harvest_tests::TaskStoreTestBase::TearDown();
  }

  Scheduler& make_scheduler(const std::string& script) {
    bridge_ = std::make_unique<WorkerBridge>(*task_store_, TestUtilities::shell_worker(script));
    return make_scheduler(*bridge_);
  }

  Scheduler& make_scheduler(IWorkerBridge& bridge) {
    SchedulerOptions options;
    options.settle_delay = std::chrono::milliseconds(50);
    scheduler_ = std::make_unique<Scheduler>(*task_store_, bridge, status_channel_, options);
    return *scheduler_;
  }

  bool wait_until_drained(Scheduler& scheduler, long long expected_finished) {
    return TestUtilities::wait_for([&] {
      auto stats = scheduler.stats();
      return scheduler.status() == SchedulerStatus::IDLE &&
             stats.completed + stats.failed == expected_finished;
    });
  }

  bool wait_until_item_running(Scheduler& scheduler) {
    return TestUtilities::wait_for([&] {
      auto item = scheduler.current_item();
      return item && item->task_id.has_value() && bridge_ && bridge_->is_running();
    });
  }

  StatusChannel status_channel_;
  std::shared_ptr<RecordingListener> listener_;
  std::unique_ptr<WorkerBridge> bridge_;
  std::unique_ptr<NiceMock<harvest_tests::MockWorkerBridge>> mock_bridge_ =
      std::make_unique<NiceMock<harvest_tests::MockWorkerBridge>>();
  std::unique_ptr<Scheduler> scheduler_;
};

TEST_F(SchedulerTest, RunsAllPendingItemsThenGoesIdle) {
  auto& scheduler = make_scheduler(kQuickWorker);
  scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "a"}}));
  scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "b"}}));

  auto result = scheduler.start();
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.message, "Queue started");

  ASSERT_TRUE(wait_until_drained(scheduler, 2));
  QueueStats expected;
  expected.completed = 2;
  expected.total = 2;
  EXPECT_EQ(scheduler.stats(), expected);
  EXPECT_FALSE(scheduler.current_item().has_value());

  auto tasks = task_store_->get_recent_tasks();
  ASSERT_EQ(tasks.size(), 2u);
  for (const auto& task : tasks) {
    EXPECT_EQ(task.status, TaskStatus::COMPLETED);
  }
  for (const auto& item : scheduler.list_items()) {
    EXPECT_TRUE(item.task_id.has_value());
    EXPECT_TRUE(item.completed_at.has_value());
  }
  EXPECT_EQ(listener_->exit_events.load(), 2);
}

TEST_F(SchedulerTest, RunsHigherPriorityItemFirst) {
  auto& scheduler = make_scheduler(kQuickWorker);
  long long low = scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "A"}}), 0);
  long long high = scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "B"}}), 5);

  auto items = scheduler.list_items();
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].id, high);
  EXPECT_EQ(items[1].id, low);

  scheduler.start();
  ASSERT_TRUE(wait_until_drained(scheduler, 2));
  auto first = task_store_->get_queue_item(high);
  auto second = task_store_->get_queue_item(low);
  ASSERT_TRUE(first && second);
  EXPECT_LT(*first->task_id, *second->task_id);
}

TEST_F(SchedulerTest, FailedItemDoesNotHaltQueue) {
  auto& scheduler = make_scheduler(R"SH(case "$1" in
  *'"keyword":"bad"'*) exit 1 ;;
esac
echo '{"type":"done","count":1}')SH");
  long long bad = scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "bad"}}), 5);
  long long good = scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "good"}}));

  scheduler.start();
  ASSERT_TRUE(wait_until_drained(scheduler, 2));

  auto failed = task_store_->get_queue_item(bad);
  ASSERT_TRUE(failed.has_value());
  EXPECT_EQ(failed->status, QueueItemStatus::FAILED);
  EXPECT_EQ(failed->error_message.value_or(""), "Process exited with code 1");
  EXPECT_EQ(task_store_->get_task(*failed->task_id)->status, TaskStatus::FAILED);

  EXPECT_EQ(task_store_->get_queue_item(good)->status, QueueItemStatus::COMPLETED);
}

TEST_F(SchedulerTest, StopRevertsRunningItemAndRestartRerunsIt) {
  auto marker = temp_db_path_.string() + ".marker";
  auto& scheduler = make_scheduler("if [ -f '" + marker +
                                   R"SH(' ]; then echo '{"type":"done","count":1}'; else touch ')SH" +
                                   marker + "'; sleep 5; fi");
  long long id = scheduler.enqueue(TestUtilities::create_test_job());

  scheduler.start();
  ASSERT_TRUE(wait_until_item_running(scheduler));
  long long first_task = *scheduler.current_item()->task_id;

  auto result = scheduler.stop();
  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.message, "Queue stopped");
  EXPECT_EQ(scheduler.status(), SchedulerStatus::PAUSED);
  EXPECT_FALSE(scheduler.current_item().has_value());

  auto item = task_store_->get_queue_item(id);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->status, QueueItemStatus::PENDING);
  EXPECT_FALSE(item->task_id.has_value());
  EXPECT_FALSE(item->started_at.has_value());
  EXPECT_EQ(task_store_->get_task(first_task)->status, TaskStatus::STOPPED);

  ASSERT_TRUE(TestUtilities::wait_for([&] { return !bridge_->is_running(); }));
  EXPECT_TRUE(scheduler.start().success);
  ASSERT_TRUE(wait_until_drained(scheduler, 1));

  item = task_store_->get_queue_item(id);
  EXPECT_EQ(item->status, QueueItemStatus::COMPLETED);
  ASSERT_TRUE(item->task_id.has_value());
  EXPECT_NE(*item->task_id, first_task);
  EXPECT_EQ(task_store_->get_recent_tasks().size(), 2u);

  std::filesystem::remove(marker);
}

TEST_F(SchedulerTest, StartTwiceReportsAlreadyRunning) {
  auto& scheduler = make_scheduler(kSlowWorker);
  scheduler.enqueue(TestUtilities::create_test_job());

  EXPECT_TRUE(scheduler.start().success);
  ASSERT_TRUE(wait_until_item_running(scheduler));

  auto second = scheduler.start();
  EXPECT_FALSE(second.success);
  EXPECT_EQ(second.message, "Queue is already running");
  ASSERT_TRUE(second.error.has_value());
  EXPECT_EQ(*second.error, ErrorKind::AlreadyRunning);

  EXPECT_TRUE(scheduler.stop().success);
}

TEST_F(SchedulerTest, StopWhenIdleReportsNotRunning) {
  auto& scheduler = make_scheduler(kQuickWorker);
  auto result = scheduler.stop();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message, "Queue is not running");
  EXPECT_EQ(result.error.value_or(ErrorKind::Storage), ErrorKind::QueueNotRunning);
}

TEST_F(SchedulerTest, StartWithEmptyQueueGoesIdle) {
  auto& scheduler = make_scheduler(kQuickWorker);
  EXPECT_TRUE(scheduler.start().success);
  EXPECT_TRUE(TestUtilities::wait_for([&] { return scheduler.status() == SchedulerStatus::IDLE; }));
  EXPECT_TRUE(task_store_->get_recent_tasks().empty());
}

TEST_F(SchedulerTest, RemoveGuardsRunningItem) {
  auto& scheduler = make_scheduler(kSlowWorker);
  long long running = scheduler.enqueue(TestUtilities::create_test_job(), 5);
  long long waiting = scheduler.enqueue(TestUtilities::create_test_job(), 0);

  scheduler.start();
  ASSERT_TRUE(wait_until_item_running(scheduler));
  ASSERT_EQ(scheduler.current_item()->id, running);

  try {
    scheduler.remove(running);
    FAIL() << "expected ItemNotRemovable";
  } catch (const SchedulerError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::ItemNotRemovable);
  }
  EXPECT_TRUE(scheduler.remove(waiting));
  EXPECT_FALSE(scheduler.remove(987654));

  scheduler.stop();
}

TEST_F(SchedulerTest, NeverRunsTwoItemsAtOnce) {
  auto& scheduler = make_scheduler(R"SH(sleep 0.2
echo '{"type":"done","count":1}')SH");
  for (int i = 0; i < 3; ++i) {
    scheduler.enqueue(TestUtilities::create_test_job());
  }
  scheduler.start();
  ASSERT_TRUE(wait_until_drained(scheduler, 3));
  EXPECT_EQ(listener_->max_running.load(), 1);
  EXPECT_GT(listener_->snapshots.load(), 0);
}

TEST_F(SchedulerTest, ClearCompletedKeepsUnfinishedItems) {
  auto& scheduler = make_scheduler(kQuickWorker);
  long long pending = scheduler.enqueue(TestUtilities::create_test_job());
  long long completed = scheduler.enqueue(TestUtilities::create_test_job());
  long long failed = scheduler.enqueue(TestUtilities::create_test_job());
  task_store_->set_queue_status(completed, QueueItemStatus::COMPLETED);
  task_store_->set_queue_status(failed, QueueItemStatus::FAILED);

  EXPECT_EQ(scheduler.clear_completed(), 2);
  auto items = scheduler.list_items();
  ASSERT_EQ(items.size(), 1u);
  EXPECT_EQ(items[0].id, pending);
}

TEST_F(SchedulerTest, SetPriorityChangesOrder) {
  auto& scheduler = make_scheduler(kQuickWorker);
  long long a = scheduler.enqueue(TestUtilities::create_test_job(), 1);
  long long b = scheduler.enqueue(TestUtilities::create_test_job(), 2);
  scheduler.set_priority(a, 9);
  auto items = scheduler.list_items(QueueItemStatus::PENDING);
  ASSERT_EQ(items.size(), 2u);
  EXPECT_EQ(items[0].id, a);
  EXPECT_EQ(items[1].id, b);
}

TEST_F(SchedulerTest, ShutdownRevertsRunningItem) {
  auto& scheduler = make_scheduler(kSlowWorker);
  long long id = scheduler.enqueue(TestUtilities::create_test_job());
  scheduler.start();
  ASSERT_TRUE(wait_until_item_running(scheduler));

  scheduler.shutdown();
  EXPECT_EQ(task_store_->get_queue_item(id)->status, QueueItemStatus::PENDING);
  EXPECT_FALSE(scheduler.start().success);

  // Idempotent
  scheduler.shutdown();
}

// ---- with a scripted bridge ----

TEST_F(SchedulerTest, StartFailureMarksItemFailed) {
  auto& bridge = *mock_bridge_;
  ON_CALL(bridge, is_running()).WillByDefault(Return(false));
  EXPECT_CALL(bridge, start(_, _))
      .WillOnce(Invoke([](const JobDescription&, EventChannelPtr channel) -> long long {
        channel->close();
        throw WorkerBridgeError(ErrorKind::ProcessSpawnError, "Worker executable not found: w");
      }));

  auto& scheduler = make_scheduler(bridge);
  long long id = scheduler.enqueue(TestUtilities::create_test_job());
  scheduler.start();
  ASSERT_TRUE(wait_until_drained(scheduler, 1));

  auto item = task_store_->get_queue_item(id);
  EXPECT_EQ(item->status, QueueItemStatus::FAILED);
  EXPECT_EQ(item->error_message.value_or(""), "Worker executable not found: w");
}

TEST_F(SchedulerTest, FailedExitWithoutMessageUsesDefault) {
  auto& bridge = *mock_bridge_;
  long long task_id = task_store_->create_task("search", {});
  EXPECT_CALL(bridge, start(_, _))
      .WillOnce(Invoke([task_id](const JobDescription&, EventChannelPtr channel) {
        WorkerEvent exit_event;
        exit_event.type = WorkerEventType::Exit;
        exit_event.success = false;
        channel->push(exit_event);
        channel->close();
        return task_id;
      }));

  auto& scheduler = make_scheduler(bridge);
  long long id = scheduler.enqueue(TestUtilities::create_test_job());
  scheduler.start();
  ASSERT_TRUE(wait_until_drained(scheduler, 1));

  auto item = task_store_->get_queue_item(id);
  EXPECT_EQ(item->status, QueueItemStatus::FAILED);
  EXPECT_EQ(item->error_message.value_or(""), "Task execution failed");
  EXPECT_EQ(item->task_id.value_or(-1), task_id);
}

TEST_F(SchedulerTest, StartRefusedWhileBridgeBusy) {
  auto& bridge = *mock_bridge_;
  ON_CALL(bridge, is_running()).WillByDefault(Return(true));
  auto& scheduler = make_scheduler(bridge);

  auto result = scheduler.start();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.message, "A task is currently running. Please wait for it to complete.");
  ON_CALL(bridge, is_running()).WillByDefault(Return(false));
}

TEST_F(SchedulerTest, SnapshotsAreDeliveredInTheOrderTaken) {
  auto gated = std::make_shared<GatedListener>();
  status_channel_.subscribe(gated);
  auto& scheduler = make_scheduler(*mock_bridge_);

  std::thread first([&] {
    scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "a"}}));
  });
  const bool holding = gated->wait_until_holding();
  std::thread second([&] {
    scheduler.enqueue(TestUtilities::create_test_job("search", {{"keyword", "b"}}));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  const std::size_t delivered_while_held = gated->sequences().size();
  gated->release();
  first.join();
  second.join();

  EXPECT_TRUE(holding);
  EXPECT_EQ(delivered_while_held, 1u);
  auto sequences = gated->sequences();
  ASSERT_EQ(sequences.size(), 2u);
  EXPECT_LT(sequences[0], sequences[1]);
  EXPECT_EQ(gated->pending(), (std::vector<long long>{1, 2}));
  status_channel_.unsubscribe(gated);
}

TEST_F(SchedulerTest, SpawnFailureBindsFailedTaskToItem) {
  WorkerCommand command;
  command.executable = "/nonexistent/harvest-worker";
  bridge_ = std::make_unique<WorkerBridge>(*task_store_, command);
  auto& scheduler = make_scheduler(*bridge_);
  long long id = scheduler.enqueue(TestUtilities::create_test_job());
  scheduler.start();
  ASSERT_TRUE(wait_until_drained(scheduler, 1));

  auto item = task_store_->get_queue_item(id);
  ASSERT_TRUE(item.has_value());
  EXPECT_EQ(item->status, QueueItemStatus::FAILED);
  ASSERT_TRUE(item->task_id.has_value());

  auto task = task_store_->get_task(*item->task_id);
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, TaskStatus::FAILED);
  EXPECT_EQ(task->error_message.value_or(""), item->error_message.value_or("-"));
}

TEST_F(SchedulerTest, PausesWhenItemCannotBeClaimed) {
  {
    PooledConnection conn(*db_manager_);
    *conn << "CREATE TRIGGER refuse_claim BEFORE UPDATE OF status ON task_queue "
             "WHEN NEW.status = 'running' BEGIN SELECT RAISE(ABORT, 'claim refused'); END";
  }
  EXPECT_CALL(*mock_bridge_, start(_, _)).Times(0);
  auto& scheduler = make_scheduler(*mock_bridge_);
  long long id = scheduler.enqueue(TestUtilities::create_test_job());

  EXPECT_TRUE(scheduler.start().success);
  ASSERT_TRUE(TestUtilities::wait_for(
      [&] { return scheduler.status() == SchedulerStatus::PAUSED; }));

  auto item = task_store_->get_queue_item(id);
  EXPECT_EQ(item->status, QueueItemStatus::PENDING);
  EXPECT_FALSE(item->started_at.has_value());
  EXPECT_FALSE(scheduler.current_item().has_value());
}

}  // namespace harvest_core
