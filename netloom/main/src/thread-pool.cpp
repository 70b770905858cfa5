#include "netloom/thread-pool.hpp"

#include <cstddef>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "netloom/log.hpp"

namespace netloom {

ThreadPool::ThreadPool(std::size_t nbThreads) {
  if (nbThreads == 0) {
    throw std::invalid_argument("ThreadPool needs at least one thread");
  }
  _workers.reserve(nbThreads);
  for (std::size_t threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _workers.emplace_back([this] { workerLoop(); });
  }
}

void ThreadPool::submit(Task task) {
  if (!task) {
    throw std::invalid_argument("Cannot submit an empty task");
  }
  {
    std::scoped_lock lock(_mutex);
    if (_stopping) {
      throw std::logic_error("ThreadPool is shut down");
    }
    _tasks.push_back(std::move(task));
  }
  _cv.notify_one();
}

void ThreadPool::shutdown() {
  {
    std::scoped_lock lock(_mutex);
    if (_stopping && _workers.empty()) {
      return;
    }
    _stopping = true;
  }
  _cv.notify_all();
  // jthread joins on destruction
  _workers.clear();
}

std::size_t ThreadPool::nbPendingTasks() const {
  std::scoped_lock lock(_mutex);
  return _tasks.size();
}

void ThreadPool::workerLoop() {
  for (;;) {
    Task task;
    {
      std::unique_lock lock(_mutex);
      _cv.wait(lock, [this] { return _stopping || !_tasks.empty(); });
      if (_tasks.empty()) {
        // stopping and fully drained
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop_front();
    }
    try {
      task();
    } catch (const std::exception& ex) {
      log::error("Uncaught exception in thread pool task: {}", ex.what());
    } catch (...) {
      log::error("Uncaught unknown exception in thread pool task");
    }
  }
}

}  // namespace netloom
