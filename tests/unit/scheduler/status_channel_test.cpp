#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>

#include "../../common/mocks_test.hpp"
#include "harvest_core/scheduler/status_channel.hpp"

namespace harvest_core {

using harvest_tests::MockStatusListener;
using ::testing::_;
using ::testing::Field;
using ::testing::Throw;

TEST(StatusChannelTest, PublishesToEverySubscriber) {
  StatusChannel channel;
  auto first = std::make_shared<MockStatusListener>();
  auto second = std::make_shared<MockStatusListener>();
  channel.subscribe(first);
  channel.subscribe(second);
  EXPECT_EQ(channel.listener_count(), 2u);

  EXPECT_CALL(*first, on_queue_status(Field(&QueueStatusSnapshot::status, SchedulerStatus::RUNNING)));
  EXPECT_CALL(*second, on_queue_status(Field(&QueueStatusSnapshot::status, SchedulerStatus::RUNNING)));

  QueueStatusSnapshot snapshot;
  snapshot.status = SchedulerStatus::RUNNING;
  channel.publish(snapshot);
}

TEST(StatusChannelTest, ThrowingListenerDoesNotBlockOthers) {
  StatusChannel channel;
  auto failing = std::make_shared<MockStatusListener>();
  auto healthy = std::make_shared<MockStatusListener>();
  channel.subscribe(failing);
  channel.subscribe(healthy);

  EXPECT_CALL(*failing, on_queue_status(_)).WillOnce(Throw(std::runtime_error("socket gone")));
  EXPECT_CALL(*healthy, on_queue_status(_)).Times(1);
  EXPECT_CALL(*failing, on_worker_event(_)).WillOnce(Throw(std::runtime_error("socket gone")));
  EXPECT_CALL(*healthy, on_worker_event(Field(&WorkerEvent::message, "hello"))).Times(1);

  EXPECT_NO_THROW(channel.publish(QueueStatusSnapshot{}));
  EXPECT_NO_THROW(channel.forward(WorkerEvent::make_log("info", "hello")));
}

TEST(StatusChannelTest, UnsubscribedListenerReceivesNothing) {
  StatusChannel channel;
  auto listener = std::make_shared<MockStatusListener>();
  channel.subscribe(listener);
  channel.unsubscribe(listener);
  EXPECT_EQ(channel.listener_count(), 0u);

  EXPECT_CALL(*listener, on_queue_status(_)).Times(0);
  channel.publish(QueueStatusSnapshot{});
}

TEST(StatusChannelTest, NullListenerIsIgnored) {
  StatusChannel channel;
  channel.subscribe(nullptr);
  EXPECT_EQ(channel.listener_count(), 0u);
}

}  // namespace harvest_core
