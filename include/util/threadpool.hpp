// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace replichain {
namespace util {

/**
 * Fixed-size worker pool
 *
 * Used to mine independent replicas concurrently. Each task must own the
 * data it mutates; the pool provides no synchronization beyond the queue.
 *
 * Usage:
 *   ThreadPool pool(4);
 *   auto future = pool.enqueue([](){ return 42; });
 *   int result = future.get();  // rethrows a task exception
 */
class ThreadPool {
public:
  // num_threads == 0 selects hardware concurrency
  explicit ThreadPool(size_t num_threads = 0);

  // Drains queued tasks, then joins workers
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  // @throws std::runtime_error if the pool is stopped
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  // Stop accepting tasks (queued tasks still run). Idempotent.
  void shutdown();

  // Join workers (call after shutdown())
  void wait_for_completion();

  size_t size() const { return workers_.size(); }

private:
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stop_{false};
};

template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (stop_.load(std::memory_order_acquire)) {
      throw std::runtime_error("enqueue on stopped ThreadPool");
    }
    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace replichain
