// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/threadpool.hpp"

namespace replichain {
namespace util {

ThreadPool::ThreadPool(size_t num_threads) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0) {
      num_threads = 4;
    }
  }

  workers_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    workers_.emplace_back([this] {
      while (true) {
        std::function<void()> task;
        {
          std::unique_lock<std::mutex> lock(queue_mutex_);
          condition_.wait(lock, [this] {
            return stop_.load(std::memory_order_acquire) || !tasks_.empty();
          });

          if (stop_.load(std::memory_order_acquire) && tasks_.empty()) {
            return;
          }

          task = std::move(tasks_.front());
          tasks_.pop();
        }

        // packaged_task stores any exception in its future
        task();
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
  wait_for_completion();
}

void ThreadPool::shutdown() {
  {
    // Publish under the lock so a waiting worker cannot miss the wakeup
    std::lock_guard<std::mutex> lock(queue_mutex_);
    stop_.store(true, std::memory_order_release);
  }
  condition_.notify_all();
}

void ThreadPool::wait_for_completion() {
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

} // namespace util
} // namespace replichain
