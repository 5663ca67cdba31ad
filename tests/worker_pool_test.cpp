// =============================================================================
// worker_pool_test.cpp
// =============================================================================
// Unit tests for zkr::WorkerPool.
//
// Validates:
//   - Scheduled work runs and its shared future becomes ready
//   - Work scheduled before start() runs once the pool starts
//   - Exceptions are captured in the future, not lost in the worker
//   - Several tasks run concurrently on distinct threads
//   - stop() drains queued work; start()/stop() are idempotent
// =============================================================================

#include "zkr/concurrent/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST(WorkerPoolTest, ZeroThreadsIsRaisedToOne) {
  zkr::WorkerPool pool(0);
  EXPECT_EQ(pool.threadCount(), 1u);
}

TEST(WorkerPoolTest, ScheduledWorkRuns) {
  zkr::WorkerPool pool(2);
  pool.start();

  std::atomic<int> value{0};
  auto done = pool.schedule([&value] { value.store(42); });

  ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
  done.get();
  EXPECT_EQ(value.load(), 42);
}

// -----------------------------------------------------------------------------
// Work queued before start() is not dropped.
// -----------------------------------------------------------------------------
TEST(WorkerPoolTest, WorkScheduledBeforeStartRunsAfterStart) {
  zkr::WorkerPool pool(1);

  std::atomic<bool> ran{false};
  auto done = pool.schedule([&ran] { ran.store(true); });

  EXPECT_EQ(done.wait_for(30ms), std::future_status::timeout);
  EXPECT_EQ(pool.pending(), 1u);

  pool.start();
  ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(ran.load());
}

// -----------------------------------------------------------------------------
// A throwing task surfaces its exception to every holder of the future and
// leaves the worker alive for the next task.
// -----------------------------------------------------------------------------
TEST(WorkerPoolTest, ExceptionIsStoredInFuture) {
  zkr::WorkerPool pool(1);
  pool.start();

  auto failed = pool.schedule([] { throw std::runtime_error("boom"); });
  std::shared_future<void> copy = failed;

  ASSERT_EQ(failed.wait_for(2s), std::future_status::ready);
  EXPECT_THROW(failed.get(), std::runtime_error);
  EXPECT_THROW(copy.get(), std::runtime_error);

  std::atomic<bool> ran{false};
  auto next = pool.schedule([&ran] { ran.store(true); });
  ASSERT_EQ(next.wait_for(2s), std::future_status::ready);
  EXPECT_TRUE(ran.load());
}

// -----------------------------------------------------------------------------
// With N threads, N blocking tasks can all be in flight at once.
// -----------------------------------------------------------------------------
TEST(WorkerPoolTest, TasksRunConcurrently) {
  constexpr int kThreads = 3;
  zkr::WorkerPool pool(kThreads);
  pool.start();

  std::mutex mutex;
  std::condition_variable cv;
  int arrived = 0;
  std::set<std::thread::id> thread_ids;

  std::vector<std::shared_future<void>> done;
  for (int i = 0; i < kThreads; ++i) {
    done.push_back(pool.schedule([&] {
      std::unique_lock lock(mutex);
      ++arrived;
      thread_ids.insert(std::this_thread::get_id());
      cv.notify_all();
      // Barrier: only passes if every task is running at the same time.
      cv.wait_for(lock, 2s, [&] { return arrived == kThreads; });
    }));
  }

  for (auto& f : done) {
    ASSERT_EQ(f.wait_for(3s), std::future_status::ready);
  }

  std::lock_guard lock(mutex);
  EXPECT_EQ(arrived, kThreads);
  EXPECT_EQ(thread_ids.size(), static_cast<std::size_t>(kThreads));
}

TEST(WorkerPoolTest, StopDrainsQueuedWork) {
  zkr::WorkerPool pool(1);
  pool.start();

  std::atomic<int> count{0};
  std::vector<std::shared_future<void>> done;
  for (int i = 0; i < 50; ++i) {
    done.push_back(pool.schedule([&count] {
      std::this_thread::sleep_for(1ms);
      count.fetch_add(1);
    }));
  }

  pool.stop();

  EXPECT_EQ(count.load(), 50);
  for (auto& f : done) {
    EXPECT_EQ(f.wait_for(0ms), std::future_status::ready);
  }
}

TEST(WorkerPoolTest, StartStopIdempotent) {
  zkr::WorkerPool pool(2);
  pool.start();
  pool.start();
  pool.stop();
  pool.stop();

  // Restartable after stop().
  pool.start();
  auto done = pool.schedule([] {});
  EXPECT_EQ(done.wait_for(2s), std::future_status::ready);
}
