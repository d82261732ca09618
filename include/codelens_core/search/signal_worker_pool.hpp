#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace codelens_core {

/**
 * @class SignalWorkerPool
 * @brief Fixed set of threads that run search signals under a deadline.
 *
 * A signal abandoned by its search keeps running on a pool thread, never on a
 * thread nobody owns. The destructor stops the workers, drops queued tasks and
 * joins every thread, so no task outlives the pool.
 */
class SignalWorkerPool {
 public:
  explicit SignalWorkerPool(size_t num_threads);
  ~SignalWorkerPool();

  // Queues a task; the future reports its result or exception.
  // Throws std::logic_error once the pool is shutting down.
  template <typename Result>
  std::future<Result> submit(std::function<Result()> task) {
    auto packaged = std::make_shared<std::packaged_task<Result()>>(std::move(task));
    std::future<Result> future = packaged->get_future();
    enqueue([packaged]() { (*packaged)(); });
    return future;
  }

  size_t size() const { return threads_.size(); }
  // Tasks queued or running
  size_t pending() const;

  SignalWorkerPool(const SignalWorkerPool&) = delete;
  SignalWorkerPool& operator=(const SignalWorkerPool&) = delete;
  SignalWorkerPool(SignalWorkerPool&&) = delete;
  SignalWorkerPool& operator=(SignalWorkerPool&&) = delete;

 private:
  void enqueue(std::function<void()> job);
  void run_loop();

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::function<void()>> queue_;
  size_t running_ = 0;
  bool stopping_ = false;
  std::vector<std::thread> threads_;
};

}  // namespace codelens_core
