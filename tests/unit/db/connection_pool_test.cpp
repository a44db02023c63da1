#include <gtest/gtest.h>
#include <future>
#include <atomic>
#include <string>

#include "common/utilities_test.hpp"
#include "rag_core/db/database_manager.hpp"
#include "rag_core/db/pooled_connection.hpp"
#include "rag_core/errors.hpp"

namespace rag_tests {

using namespace rag_core;

class ConnectionPoolTest : public ::testing::Test {
protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    // Use a larger pool in this suite to validate multi-connection behavior
    db_manager_ = std::make_unique<DatabaseManager>(temp_db_path_, /*pool_size*/ 4);
  }

  void TearDown() override {
    db_manager_.reset();
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::unique_ptr<DatabaseManager> db_manager_;
};

TEST_F(ConnectionPoolTest, CanBorrowAndReturnConnections) {
  // Borrow two connections
  PooledConnection c1(*db_manager_);
  PooledConnection c2(*db_manager_);

  int count = 0;
  *c1 << "SELECT COUNT(*) FROM sqlite_master" >> count;
  EXPECT_GT(count, 0);
}

TEST_F(ConnectionPoolTest, BlocksWhenPoolExhaustedAndResumes) {
  // Exhaust pool (size=4 from SetUp)
  auto holder1 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder2 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder3 = std::make_unique<PooledConnection>(*db_manager_);
  auto holder4 = std::make_unique<PooledConnection>(*db_manager_);

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

  // Let thread start and block, then release one connection
  start_promise.set_value();
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());
  holder1.reset(); // returns connection to pool

  t.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, BorrowAfterShutdownThrows) {
  db_manager_->shutdown();
  EXPECT_FALSE(db_manager_->is_open());
  EXPECT_THROW({ PooledConnection conn(*db_manager_); }, RepositoryError);
}

TEST(ConnectionPoolConfigTest, RejectsEmptyPool) {
  std::filesystem::path path = TestUtilities::create_temp_test_db();
  EXPECT_THROW({ ConnectionPool pool(path.string(), 0); }, ConfigurationError);
  TestUtilities::cleanup_temp_db(path);
}

} // namespace rag_tests
