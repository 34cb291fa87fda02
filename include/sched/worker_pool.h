#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace sched {

struct PoolStats {
  std::size_t submitted = 0;
  std::size_t rejected = 0;   // queue full or stopping
  std::size_t completed = 0;
  std::size_t failed = 0;     // TryPost tasks that threw
  std::size_t max_depth = 0;
};

// Fixed-size thread pool with a bounded FIFO queue.
// Submissions never block: a full queue is reported to the caller.
class WorkerPool {
public:
  WorkerPool(std::string name, std::size_t n_threads, std::size_t queue_capacity);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  // False when the queue is at capacity or the pool is stopping.
  bool TryPost(std::function<void()> task);

  // Future-returning variant; nullopt on rejection. Exceptions surface through the future.
  template <typename F>
  std::optional<std::future<std::invoke_result_t<F>>> TrySubmit(F&& f) {
    using R = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
    std::future<R> fut = task->get_future();
    if (!enqueue([task]() { (*task)(); }, false)) return std::nullopt;
    return fut;
  }

  // Wait until the queue is empty and no task is running.
  void Drain();

  // Stop accepting work, finish what is queued, join threads. Idempotent.
  void Shutdown();

  const std::string& Name() const { return name_; }
  std::size_t NumThreads() const { return threads_.size(); }
  std::size_t Capacity() const { return capacity_; }
  std::size_t QueueDepth() const;
  PoolStats GetStats() const;

private:
  struct Item {
    std::function<void()> fn;
    bool log_errors = true;
  };

  bool enqueue(std::function<void()> fn, bool log_errors);
  void WorkerLoop();

  std::string name_;
  std::size_t capacity_ = 0;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<Item> queue_;
  std::size_t active_ = 0;
  bool stop_ = false;
  PoolStats stats_{};

  std::vector<std::thread> threads_;
};

} // namespace sched
