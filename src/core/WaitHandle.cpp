#include "hitl/WaitHandle.hpp"

namespace hitl {

const char* toString(WaitStatus s) {
  switch (s) {
    case WaitStatus::Pending:   return "pending";
    case WaitStatus::Decided:   return "decided";
    case WaitStatus::TimedOut:  return "timed_out";
    case WaitStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

std::shared_ptr<WaitHandle> WaitHandle::create() {
  return std::shared_ptr<WaitHandle>(new WaitHandle());
}

bool WaitHandle::settleLocked(WaitStatus st, Decision d) {
  if (result_.status != WaitStatus::Pending) return false;
  result_.status   = st;
  result_.decision = d;
  return true;
}

WaitResult WaitHandle::await(std::chrono::milliseconds timeout,
                             const CancellationToken& token) {
  // Hook the caller's cancellation for the duration of the wait only.
  std::weak_ptr<WaitHandle> weak = weak_from_this();
  Subscription sub = token.subscribe([weak] {
    if (auto self = weak.lock()) self->cancel();
  });

  using std::chrono::steady_clock;
  const auto now = steady_clock::now();
  const auto headroom =
      std::chrono::duration_cast<std::chrono::milliseconds>(steady_clock::time_point::max() - now);
  const auto done = [this] { return result_.status != WaitStatus::Pending; };

  std::unique_lock<std::mutex> lk(mx_);
  if (timeout >= headroom) {
    // now + timeout is not representable: no deadline at all.
    cv_.wait(lk, done);
    return result_;
  }
  const bool settled = cv_.wait_until(lk, now + timeout, done);
  if (!settled) {
    settleLocked(WaitStatus::TimedOut, Decision::Reject);
  }
  return result_;
}

bool WaitHandle::resolve(Decision d) {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (!settleLocked(WaitStatus::Decided, d)) return false;
  }
  cv_.notify_all();
  return true;
}

bool WaitHandle::cancel() {
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (!settleLocked(WaitStatus::Cancelled, Decision::Reject)) return false;
  }
  cv_.notify_all();
  return true;
}

bool WaitHandle::isPending() const {
  std::lock_guard<std::mutex> lk(mx_);
  return result_.status == WaitStatus::Pending;
}

WaitResult WaitHandle::state() const {
  std::lock_guard<std::mutex> lk(mx_);
  return result_;
}

} // namespace hitl
