#include "codelens_core/search/signal_worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace codelens_core {

SignalWorkerPool::SignalWorkerPool(size_t num_threads) {
  if (num_threads == 0) {
    throw std::invalid_argument("SignalWorkerPool must have at least one thread");
  }
  threads_.reserve(num_threads);
  for (size_t i = 0; i < num_threads; ++i) {
    threads_.emplace_back([this]() { run_loop(); });
  }
}

SignalWorkerPool::~SignalWorkerPool() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    dropped = queue_.size();
    // Unstarted tasks are destroyed; their futures report broken_promise
    queue_.clear();
  }
  cv_.notify_all();
  if (dropped > 0) {
    std::cout << "[SignalPool] Dropped " << dropped << " queued signals on shutdown"
              << std::endl;
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

size_t SignalWorkerPool::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + running_;
}

void SignalWorkerPool::enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_) {
      throw std::logic_error("SignalWorkerPool is shutting down");
    }
    queue_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void SignalWorkerPool::run_loop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
      if (stopping_ && queue_.empty()) {
        return;
      }
      job = std::move(queue_.front());
      queue_.pop_front();
      ++running_;
    }
    // packaged_task stores any exception in its future
    job();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --running_;
    }
  }
}

}  // namespace codelens_core
