#include "hitl/rt/ThreadPool.hpp"
#include "hitl/util/Logger.hpp"

#include <exception>

namespace hitl::rt {

ThreadPool::ThreadPool(unsigned nThreads) {
  if (nThreads == 0) nThreads = 1;
  threads_.reserve(nThreads);
  for (unsigned i=0;i<nThreads;++i) {
    threads_.emplace_back([this]{ workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

bool ThreadPool::post(std::function<void()> fn) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_) return false;
    q_.push(std::move(fn));
  }
  cv_.notify_one();
  return true;
}

void ThreadPool::drain() {
  std::unique_lock<std::mutex> lk(mx_);
  idleCv_.wait(lk, [this]{ return q_.empty() && active_ == 0; });
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    stopping_ = true;
  }
  cv_.notify_all();
  for (auto& t : threads_) if (t.joinable()) t.join();
}

void ThreadPool::workerLoop() {
  for (;;) {
    std::function<void()> fn;
    {
      std::unique_lock<std::mutex> lk(mx_);
      cv_.wait(lk, [this]{ return stopping_ || !q_.empty(); });
      if (stopping_ && q_.empty()) return;
      fn = std::move(q_.front()); q_.pop();
      ++active_;
    }
    // Keep the pool alive, but never lose the failure.
    try {
      fn();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "pool.task_threw", { {"error", ex.what()} });
    } catch (...) {
      util::logger().log(util::LogLevel::Error, "pool.task_threw", { {"error", "unknown"} });
    }
    {
      std::lock_guard<std::mutex> lk(mx_);
      --active_;
      if (q_.empty() && active_ == 0) idleCv_.notify_all();
    }
  }
}

} // namespace hitl::rt
