#include "netloom/thread-pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace netloom {

using namespace std::chrono_literals;

TEST(ThreadPool, RunsAllSubmittedTasks) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(4);
    EXPECT_EQ(pool.nbThreads(), 4U);
    for (int taskPos = 0; taskPos < 1000; ++taskPos) {
      pool.submit([&counter] { counter.fetch_add(1, std::memory_order_relaxed); });
    }
  }
  EXPECT_EQ(counter.load(), 1000);
}

TEST(ThreadPool, TasksRunConcurrently) {
  std::mutex mutex;
  std::set<std::thread::id> threadIds;
  std::atomic<int> nbWaiting{0};
  {
    ThreadPool pool(3);
    for (int taskPos = 0; taskPos < 3; ++taskPos) {
      pool.submit([&] {
        {
          std::scoped_lock lock(mutex);
          threadIds.insert(std::this_thread::get_id());
        }
        // each task waits for the others: only possible if they run on distinct threads
        nbWaiting.fetch_add(1);
        const auto deadline = std::chrono::steady_clock::now() + 2s;
        while (nbWaiting.load() < 3 && std::chrono::steady_clock::now() < deadline) {
          std::this_thread::sleep_for(1ms);
        }
      });
    }
  }
  EXPECT_EQ(threadIds.size(), 3U);
  EXPECT_EQ(nbWaiting.load(), 3);
}

TEST(ThreadPool, ShutdownDrainsQueue) {
  std::atomic<int> counter{0};
  ThreadPool pool(1);
  for (int taskPos = 0; taskPos < 50; ++taskPos) {
    pool.submit([&counter] {
      std::this_thread::sleep_for(100us);
      ++counter;
    });
  }
  pool.shutdown();
  EXPECT_EQ(counter.load(), 50);
  EXPECT_EQ(pool.nbPendingTasks(), 0U);
  EXPECT_THROW(pool.submit([] {}), std::logic_error);
  pool.shutdown();
}

TEST(ThreadPool, ThrowingTaskDoesNotKillWorker) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(1);
    pool.submit([] { throw std::runtime_error("task failure"); });
    pool.submit([&counter] { ++counter; });
  }
  EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPool, NonStandardExceptionDoesNotKillWorker) {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(1);
    pool.submit([] { throw 42; });
    pool.submit([&counter] { ++counter; });
  }
  EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPool, InvalidUsage) {
  EXPECT_THROW(ThreadPool(0), std::invalid_argument);
  ThreadPool pool(1);
  EXPECT_THROW(pool.submit({}), std::invalid_argument);
}

}  // namespace netloom
