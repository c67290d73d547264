#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <atomic>
#include <string>

#include "../../common/utilities_test.hpp"
#include "harvest_core/db/connection_pool.hpp"
#include "harvest_core/db/database_manager.hpp"
#include "harvest_core/db/pooled_connection.hpp"

namespace harvest_core {

class ConnectionPoolTest : public harvest_tests::TaskStoreTestBase {};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  // Borrow two connections
  PooledConnection c1(*db_manager_);
  PooledConnection c2(*db_manager_);

  EXPECT_EQ(db_manager_->available_connections(), 2u);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);
}

TEST_F(ConnectionPoolTest, ReturnedConnectionsAreReused) {
  {
    PooledConnection conn(*db_manager_);
    EXPECT_EQ(db_manager_->available_connections(), 3u);
  }
  EXPECT_EQ(db_manager_->available_connections(), 4u);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder2 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder3 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder4 = std::make_unique<PooledConnection>(*db_manager_);
  ASSERT_EQ(db_manager_->available_connections(), 0u);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

  // Request another connection on another thread, which should block until one is returned
  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    start_future.wait();
    PooledConnection c5(*db_manager_);
    int count = 0;
    *c5 << "SELECT COUNT(*) FROM sqlite_master" >> count;
    acquired.store(true);
  });

  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset();  // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, BorrowAfterShutdownThrows) {
  db_manager_->shutdown();
  EXPECT_THROW(PooledConnection conn(*db_manager_), std::runtime_error);
}

TEST(ConnectionPoolStandaloneTest, RejectsNonPositivePoolSize) {
  auto path = harvest_tests::TestUtilities::create_temp_test_db();
  EXPECT_THROW(ConnectionPool pool(path.string(), "", 0), std::invalid_argument);
  harvest_tests::TestUtilities::cleanup_temp_db(path);
}

}  // namespace harvest_core
