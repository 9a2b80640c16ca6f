#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include "core/logger.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace Utils {

template <typename T> class TaskQueue {
public:
  void push(T value) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(std::move(value));
    cond_.notify_one();
  }

  // Blocks until an item is available; returns false once shut down and
  // drained.
  bool wait_and_pop(T &value) {
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_; });
    if (shutdown_requested_ && queue_.empty())
      return false;

    value = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void shutdown() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shutdown_requested_ = true;
    }
    cond_.notify_all();
  }

private:
  std::mutex mutex_;
  std::queue<T> queue_;
  std::condition_variable cond_;
  bool shutdown_requested_ = false;
};

/**
 * Fixed-size pool of worker threads. Tasks queued before join() are all
 * executed; join() blocks until they have finished.
 */
class WorkerPool {
public:
  explicit WorkerPool(size_t worker_count) {
    if (worker_count == 0)
      worker_count = 1;
    workers_.reserve(worker_count);
    for (size_t i = 0; i < worker_count; ++i)
      workers_.emplace_back([this] { worker_loop(); });
  }

  ~WorkerPool() { join(); }

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  void submit(std::function<void()> task) { queue_.push(std::move(task)); }

  void join() {
    if (joined_)
      return;
    queue_.shutdown();
    for (auto &worker : workers_)
      if (worker.joinable())
        worker.join();
    joined_ = true;
  }

  size_t size() const { return workers_.size(); }

private:
  void worker_loop() {
    std::function<void()> task;
    while (queue_.wait_and_pop(task)) {
      try {
        task();
      } catch (const std::exception &e) {
        LOG(LogLevel::ERROR, LogComponent::CORE,
            "Unhandled exception in worker task: " << e.what());
      }
    }
  }

  TaskQueue<std::function<void()>> queue_;
  std::vector<std::thread> workers_;
  bool joined_ = false;
};

} // namespace Utils

#endif // WORKER_POOL_HPP
