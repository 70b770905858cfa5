#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace netloom {

// Fixed-size pool of worker threads consuming a FIFO queue of tasks.
// The destructor (or shutdown()) lets the workers drain the queued tasks before joining them.
class ThreadPool {
 public:
  using Task = std::function<void()>;

  // Throws std::invalid_argument if 'nbThreads' is 0.
  explicit ThreadPool(std::size_t nbThreads);

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) noexcept = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool& operator=(ThreadPool&&) noexcept = delete;

  ~ThreadPool() { shutdown(); }

  // Queues a task. Throws std::logic_error after shutdown() and std::invalid_argument for an empty task.
  // An exception escaping a task is logged and does not stop its worker.
  void submit(Task task);

  // Stops accepting tasks, runs the queued ones and joins the workers. Idempotent.
  // Must not be called from one of the pool tasks.
  void shutdown();

  [[nodiscard]] std::size_t nbThreads() const noexcept { return _workers.size(); }

  [[nodiscard]] std::size_t nbPendingTasks() const;

 private:
  void workerLoop();

  mutable std::mutex _mutex;
  std::condition_variable _cv;
  std::deque<Task> _tasks;
  bool _stopping{false};
  std::vector<std::jthread> _workers;
};

}  // namespace netloom
