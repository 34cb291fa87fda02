#include "sched/worker_pool.h"

#include "common/log.h"

#include <exception>
#include <iostream>
#include <stdexcept>

namespace sched {

WorkerPool::WorkerPool(std::string name, std::size_t n_threads, std::size_t queue_capacity)
    : name_(std::move(name)), capacity_(queue_capacity) {
  if (n_threads == 0) throw std::runtime_error("WorkerPool(" + name_ + "): n_threads must be > 0");
  if (capacity_ == 0) throw std::runtime_error("WorkerPool(" + name_ + "): queue_capacity must be > 0");

  threads_.reserve(n_threads);
  for (std::size_t i = 0; i < n_threads; ++i) {
    threads_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  Shutdown();
}

bool WorkerPool::TryPost(std::function<void()> task) {
  if (!task) throw std::runtime_error("WorkerPool::TryPost: empty task");
  return enqueue(std::move(task), true);
}

bool WorkerPool::enqueue(std::function<void()> fn, bool log_errors) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_ || queue_.size() >= capacity_) {
      ++stats_.rejected;
      return false;
    }
    queue_.push_back(Item{std::move(fn), log_errors});
    ++stats_.submitted;
    if (queue_.size() > stats_.max_depth) stats_.max_depth = queue_.size();
  }
  cv_.notify_one();
  return true;
}

void WorkerPool::WorkerLoop() {
  while (true) {
    Item item;
    {
      std::unique_lock<std::mutex> lock(mu_);
      cv_.wait(lock, [&]() { return stop_ || !queue_.empty(); });
      if (queue_.empty()) {
        if (stop_) break;
        continue;
      }
      item = std::move(queue_.front());
      queue_.pop_front();
      ++active_;
    }

    bool failed = false;
    try {
      item.fn();
    } catch (const std::exception& e) {
      failed = true;
      if (item.log_errors && logu::should_log(logu::LogLevel::ERROR)) {
        std::cerr << "ERROR: WorkerPool(" << name_ << ") task failed: " << e.what() << "\n";
      }
    }

    {
      std::lock_guard<std::mutex> lock(mu_);
      --active_;
      ++stats_.completed;
      if (failed) ++stats_.failed;
      if (queue_.empty() && active_ == 0) idle_cv_.notify_all();
    }
  }
}

void WorkerPool::Drain() {
  std::unique_lock<std::mutex> lock(mu_);
  idle_cv_.wait(lock, [&]() { return queue_.empty() && active_ == 0; });
}

void WorkerPool::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_ && threads_.empty()) return;
    stop_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) {
    if (t.joinable()) t.join();
  }
  threads_.clear();
}

std::size_t WorkerPool::QueueDepth() const {
  std::lock_guard<std::mutex> lock(mu_);
  return queue_.size();
}

PoolStats WorkerPool::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_;
}

} // namespace sched
