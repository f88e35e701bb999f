#pragma once

#include "hitl/Cancellation.hpp"
#include "hitl/Decision.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace hitl {

enum class WaitStatus : int {
  Pending   = 0,
  Decided   = 1,
  TimedOut  = 2,
  Cancelled = 3
};

const char* toString(WaitStatus s);

struct WaitResult {
  WaitStatus status{WaitStatus::Pending};
  Decision   decision{Decision::Reject};   // meaningful only when Decided
};

// Single-shot rendezvous between one waiter and whichever of {resolver,
// timeout, cancellation} gets there first. Every transition out of Pending
// happens under mx_, so exactly one of them wins and the rest see false.
class WaitHandle : public std::enable_shared_from_this<WaitHandle> {
public:
  static std::shared_ptr<WaitHandle> create();

  WaitHandle(const WaitHandle&)            = delete;
  WaitHandle& operator=(const WaitHandle&) = delete;

  // Blocks until resolved, cancelled or `timeout` elapses. A timeout that
  // fires moves the handle to TimedOut, so a later resolve() loses.
  // Must be called by one thread only, and never while holding a registry lock.
  WaitResult await(std::chrono::milliseconds timeout,
                   const CancellationToken& token = CancellationToken());

  // True if this call delivered the decision.
  bool resolve(Decision d);

  // True if this call moved the handle to Cancelled.
  bool cancel();

  bool isPending() const;
  WaitResult state() const;

private:
  WaitHandle() = default;

  bool settleLocked(WaitStatus st, Decision d);

  mutable std::mutex      mx_;
  std::condition_variable cv_;
  WaitResult              result_;
};

} // namespace hitl
