#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace hitl::rt {

// Fixed-size worker pool. Waiters that block in Coordinator::requestDecision
// occupy a worker for the whole handshake, so size it for the number of
// concurrent approvals you expect.
class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work; returns false (and drops fn) once shutdown has begun.
  bool post(std::function<void()> fn);

  // Waits until the queue is empty and no task is running.
  void drain();

  // Runs what is already queued, then joins the workers. Idempotent.
  void shutdown();

  std::size_t size() const { return threads_.size(); }

private:
  void workerLoop();

private:
  std::vector<std::thread>          threads_;
  std::mutex                        mx_;
  std::condition_variable           cv_;
  std::condition_variable           idleCv_;
  std::queue<std::function<void()>> q_;
  std::size_t                       active_{0};
  bool                              stopping_{false};
};

} // namespace hitl::rt
