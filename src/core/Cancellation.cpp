#include "hitl/Cancellation.hpp"

#include "hitl/util/Logger.hpp"

#include <exception>
#include <utility>

namespace hitl {

Subscription& Subscription::operator=(Subscription&& o) noexcept {
  if (this != &o) {
    reset();
    st_ = std::move(o.st_);
    id_ = o.id_;
    o.id_ = 0;
  }
  return *this;
}

void Subscription::reset() noexcept {
  if (st_ && id_ != 0) {
    std::lock_guard<std::mutex> lk(st_->mx);
    st_->callbacks.erase(id_);
  }
  st_.reset();
  id_ = 0;
}

bool CancellationToken::isCancelled() const noexcept {
  return st_ && st_->cancelled.load(std::memory_order_acquire);
}

Subscription CancellationToken::subscribe(std::function<void()> fn) const {
  if (!st_ || !fn) return {};
  {
    std::lock_guard<std::mutex> lk(st_->mx);
    if (!st_->cancelled.load(std::memory_order_acquire)) {
      const auto id = st_->nextId++;
      st_->callbacks.emplace(id, std::move(fn));
      return Subscription(st_, id);
    }
  }
  fn();
  return {};
}

CancellationSource::CancellationSource()
  : st_(std::make_shared<detail::CancellationState>()) {}

bool CancellationSource::requestCancel() {
  std::unordered_map<std::uint64_t, std::function<void()>> run;
  {
    std::lock_guard<std::mutex> lk(st_->mx);
    if (st_->cancelled.exchange(true, std::memory_order_acq_rel)) return false;
    run.swap(st_->callbacks);
  }
  // Callbacks run outside the lock so they may subscribe or unsubscribe.
  for (auto& kv : run) {
    try {
      kv.second();
    } catch (const std::exception& ex) {
      util::logger().log(util::LogLevel::Error, "cancel callback threw",
                         { {"error", ex.what()} });
    }
  }
  return true;
}

bool CancellationSource::isCancelled() const noexcept {
  return st_->cancelled.load(std::memory_order_acquire);
}

} // namespace hitl
