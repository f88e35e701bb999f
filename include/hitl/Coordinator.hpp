#pragma once

#include "hitl/Cancellation.hpp"
#include "hitl/Decision.hpp"
#include "hitl/Errors.hpp"
#include "hitl/RequestRegistry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace hitl {

namespace util { class Config; }

struct CoordinatorOptions {
  std::chrono::milliseconds defaultTimeout{std::chrono::seconds(30)};
  Decision timeoutOutcome{Decision::Reject};
  // Replaceable for tests; defaults to makeRequestId().
  std::function<std::string()> idGenerator;

  static CoordinatorOptions fromConfig(const util::Config& cfg);
};

// Human-in-the-loop rendezvous. Waiters block in requestDecision(); the
// transport calls resolve() from any thread. The waiter is the only party
// that removes its entry from the registry.
class Coordinator {
public:
  explicit Coordinator(CoordinatorOptions opts = CoordinatorOptions());
  // Shuts down, then waits for every waiter to finish its cleanup.
  ~Coordinator();

  Coordinator(const Coordinator&)            = delete;
  Coordinator& operator=(const Coordinator&) = delete;

  // Blocks until a decision, the timeout (-> defaultOutcome) or cancellation.
  // Throws ApprovalError (InvalidArgument, Internal) before blocking, and
  // CancelledError if the token fires or the coordinator shuts down.
  Decision requestDecision(const std::string& owner,
                           ToolRequest payload,
                           std::chrono::milliseconds timeout,
                           Decision defaultOutcome,
                           const CancellationToken& token = CancellationToken());

  // Same, with the configured timeout and timeout outcome.
  Decision requestDecision(const std::string& owner,
                           ToolRequest payload,
                           const CancellationToken& token = CancellationToken());

  // True if the id exists, whether or not this decision won the race.
  bool resolve(const std::string& id, Decision decision);

  // Ownership-checked variant: another owner's id is treated as unknown.
  bool resolveFor(const std::string& owner, const std::string& id, Decision decision);

  // Insertion ordered; requests already decided but not yet cleaned up are
  // left out.
  std::vector<PendingSummary> listPending(const std::string& owner) const;

  // Cancels every waiter and refuses new requests. Idempotent.
  void shutdown();

  std::size_t pendingCount() const { return registry_.size(); }
  bool        hasOwner(const std::string& owner) const { return registry_.hasOwner(owner); }
  const CoordinatorOptions& options() const { return opts_; }

private:
  class InFlight;

  bool deliver(const RequestRegistry::Found& found, Decision decision);

  CoordinatorOptions opts_;
  RequestRegistry    registry_;
  std::atomic<bool>  stopping_{false};

  // Handshakes inside requestDecision(), guarded by inflightMx_.
  std::mutex              inflightMx_;
  std::condition_variable inflightCv_;
  std::size_t             inflight_{0};
};

} // namespace hitl
