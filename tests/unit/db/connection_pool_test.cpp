#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <string>
#include <thread>

#include "rag_core/db/pooled_connection.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::PooledConnection;

class ConnectionPoolTest : public DatabaseTestBase {};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  PooledConnection c1(*db_manager_);
  PooledConnection c2(*db_manager_);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GE(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder2 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder3 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder4 = std::make_unique<PooledConnection>(*db_manager_);

  std::promise<void> start_promise;
  std::shared_future<void> start_future(start_promise.get_future());

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

TEST_F(ConnectionPoolTest, ShutdownWakesBlockedBorrower) {
  std::vector<std::unique_ptr<PooledConnection>> holders;
  for (int i = 0; i < 4; ++i) {
    holders.push_back(std::make_unique<PooledConnection>(*db_manager_));
  }

  auto waiter = std::async(std::launch::async, [this] {
    try {
      PooledConnection conn(*db_manager_);
      return false;
    } catch (const std::runtime_error &) {
      return true;
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  db_manager_->shutdown();
  EXPECT_TRUE(waiter.get());
}

}  // namespace rag_tests
