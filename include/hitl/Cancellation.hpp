#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

namespace hitl {

namespace detail {
struct CancellationState;
}

class CancellationToken;

// RAII registration of a cancel callback. Dropping it unregisters the
// callback; a callback that is already running is not waited for, so it must
// only touch state it owns (capture shared/weak pointers, not raw this).
class Subscription {
public:
  Subscription() = default;
  Subscription(std::shared_ptr<detail::CancellationState> st, std::uint64_t id)
    : st_(std::move(st)), id_(id) {}
  ~Subscription() { reset(); }

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;
  Subscription(Subscription&& o) noexcept : st_(std::move(o.st_)), id_(o.id_) { o.id_ = 0; }
  Subscription& operator=(Subscription&& o) noexcept;

  void reset() noexcept;

private:
  std::shared_ptr<detail::CancellationState> st_;
  std::uint64_t id_{0};
};

// Read side of a cancellation signal. A default-constructed token can never
// be cancelled.
class CancellationToken {
public:
  CancellationToken() = default;

  bool isCancelled() const noexcept;
  bool canBeCancelled() const noexcept { return static_cast<bool>(st_); }

  // Runs fn once when cancellation is requested. If it already was, fn runs
  // immediately on the calling thread.
  Subscription subscribe(std::function<void()> fn) const;

private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> st)
    : st_(std::move(st)) {}

  std::shared_ptr<detail::CancellationState> st_;
};

// Write side, owned by whoever may abort the waiter (an upstream request,
// a session, process shutdown).
class CancellationSource {
public:
  CancellationSource();

  CancellationToken token() const { return CancellationToken(st_); }

  // Idempotent. Returns true only for the call that flipped the state.
  bool requestCancel();
  bool isCancelled() const noexcept;

private:
  std::shared_ptr<detail::CancellationState> st_;
};

namespace detail {

struct CancellationState {
  std::atomic<bool> cancelled{false};
  std::mutex mx;
  std::uint64_t nextId{1};
  std::unordered_map<std::uint64_t, std::function<void()>> callbacks;
};

} // namespace detail

} // namespace hitl
