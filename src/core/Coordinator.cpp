#include "hitl/Coordinator.hpp"

#include "hitl/util/Config.hpp"
#include "hitl/util/Logger.hpp"
#include "hitl/util/Metrics.hpp"

#include <memory>
#include <utility>

namespace hitl {

using util::LogLevel;
using util::logger;

namespace {

// Removes the request from the registry when the handshake scope ends,
// however it ends.
class RemoveOnExit {
public:
  RemoveOnExit(RequestRegistry& reg, std::string owner, std::string id)
    : reg_(reg), owner_(std::move(owner)), id_(std::move(id)) {}
  ~RemoveOnExit() {
    reg_.remove(owner_, id_);
    HITL_METRIC_SET("approval.pending", static_cast<double>(reg_.size()));
  }

  RemoveOnExit(const RemoveOnExit&)            = delete;
  RemoveOnExit& operator=(const RemoveOnExit&) = delete;

private:
  RequestRegistry& reg_;
  std::string owner_;
  std::string id_;
};

std::string millis(std::chrono::milliseconds ms) {
  return std::to_string(ms.count()) + "ms";
}

} // namespace

// Counts a handshake for its whole lifetime, cleanup included.
class Coordinator::InFlight {
public:
  explicit InFlight(Coordinator& c) : c_(c) {
    std::lock_guard<std::mutex> lk(c_.inflightMx_);
    ++c_.inflight_;
  }
  ~InFlight() {
    std::lock_guard<std::mutex> lk(c_.inflightMx_);
    if (--c_.inflight_ == 0) c_.inflightCv_.notify_all();
  }

  InFlight(const InFlight&)            = delete;
  InFlight& operator=(const InFlight&) = delete;

private:
  Coordinator& c_;
};

CoordinatorOptions CoordinatorOptions::fromConfig(const util::Config& cfg) {
  CoordinatorOptions o;
  o.defaultTimeout = std::chrono::seconds(cfg.approvalTimeoutSec);
  o.timeoutOutcome = decisionFromBool(cfg.autoApproveOnTimeout);
  return o;
}

Coordinator::Coordinator(CoordinatorOptions opts)
  : opts_(std::move(opts))
{
  if (!opts_.idGenerator) opts_.idGenerator = &makeRequestId;
}

Coordinator::~Coordinator() {
  shutdown();
  std::unique_lock<std::mutex> lk(inflightMx_);
  inflightCv_.wait(lk, [this] { return inflight_ == 0; });
}

Decision Coordinator::requestDecision(const std::string& owner,
                                      ToolRequest payload,
                                      const CancellationToken& token) {
  return requestDecision(owner, std::move(payload), opts_.defaultTimeout,
                         opts_.timeoutOutcome, token);
}

Decision Coordinator::requestDecision(const std::string& owner,
                                      ToolRequest payload,
                                      std::chrono::milliseconds timeout,
                                      Decision defaultOutcome,
                                      const CancellationToken& token) {
  if (owner.empty()) {
    throw ApprovalError(ErrorCode::InvalidArgument, "owner must not be empty");
  }
  if (timeout.count() <= 0) {
    throw ApprovalError(ErrorCode::InvalidArgument,
                        "timeout must be positive, got " + millis(timeout));
  }
  // Declared before the registry guard so it outlives the removal.
  InFlight inflight(*this);
  if (stopping_.load()) {
    throw CancelledError("<coordinator stopped>");
  }

  auto request = std::make_shared<PendingRequest>(opts_.idGenerator(), owner, std::move(payload));
  const std::string id   = request->id();
  const std::string tool = request->payload().name;

  auto inserted = registry_.insert(owner, request);
  if (!inserted) {
    logger().log(LogLevel::Error, "approval.register_failed",
                 { {"owner", owner}, {"id", id}, {"error", inserted.error().describe()} });
    throw ApprovalError(ErrorCode::Internal, inserted.error().describe());
  }

  RemoveOnExit cleanup(registry_, owner, id);
  HITL_METRIC_HIT("approval.requested");
  HITL_METRIC_SET("approval.pending", static_cast<double>(registry_.size()));

  // shutdown() may have taken its snapshot before our insert landed.
  if (stopping_.load()) request->handle().cancel();

  logger().log(LogLevel::Info, "approval.pending",
               { {"owner", owner}, {"id", id}, {"tool", tool},
                 {"timeout", millis(timeout)}, {"depth", std::to_string(*inserted)} });

  const WaitResult res = request->handle().await(timeout, token);

  switch (res.status) {
    case WaitStatus::Decided:
      HITL_METRIC_HIT(res.decision == Decision::Approve ? "approval.approved" : "approval.rejected");
      logger().log(LogLevel::Info, "approval.decided",
                   { {"owner", owner}, {"id", id}, {"tool", tool},
                     {"decision", toString(res.decision)} });
      return res.decision;

    case WaitStatus::TimedOut:
      HITL_METRIC_HIT("approval.timed_out");
      logger().log(defaultOutcome == Decision::Approve ? LogLevel::Warn : LogLevel::Info,
                   defaultOutcome == Decision::Approve ? "approval.timeout.auto_approve"
                                                       : "approval.timeout.auto_reject",
                   { {"owner", owner}, {"id", id}, {"tool", tool},
                     {"timeout", millis(timeout)} });
      return defaultOutcome;

    case WaitStatus::Cancelled:
      HITL_METRIC_HIT("approval.cancelled");
      logger().log(LogLevel::Info, "approval.cancelled",
                   { {"owner", owner}, {"id", id}, {"tool", tool} });
      throw CancelledError(id);

    case WaitStatus::Pending:
      break;
  }
  logger().log(LogLevel::Error, "approval.await_returned_pending", { {"id", id} });
  throw ApprovalError(ErrorCode::Internal, "wait ended without a terminal state: " + id);
}

bool Coordinator::deliver(const RequestRegistry::Found& found, Decision decision) {
  const std::string& id = found.request->id();
  if (found.request->handle().resolve(decision)) {
    HITL_METRIC_HIT("resolve.accepted");
    logger().log(LogLevel::Debug, "resolve.accepted",
                 { {"owner", found.owner}, {"id", id}, {"decision", toString(decision)} });
  } else {
    HITL_METRIC_HIT("resolve.late");
    logger().log(LogLevel::Debug, "resolve.late",
                 { {"owner", found.owner}, {"id", id}, {"decision", toString(decision)},
                   {"state", toString(found.request->handle().state().status)} });
  }
  return true;
}

bool Coordinator::resolve(const std::string& id, Decision decision) {
  auto found = registry_.find(id);
  if (!found) {
    HITL_METRIC_HIT("resolve.not_found");
    logger().log(LogLevel::Debug, "resolve.not_found",
                 { {"id", id}, {"error", found.error().describe()} });
    return false;
  }
  return deliver(*found, decision);
}

bool Coordinator::resolveFor(const std::string& owner, const std::string& id, Decision decision) {
  auto found = registry_.find(id);
  if (!found || found->owner != owner) {
    HITL_METRIC_HIT("resolve.not_found");
    logger().log(LogLevel::Debug, "resolve.not_found", { {"owner", owner}, {"id", id} });
    return false;
  }
  return deliver(*found, decision);
}

std::vector<PendingSummary> Coordinator::listPending(const std::string& owner) const {
  std::vector<PendingSummary> out;
  for (const auto& r : registry_.list(owner)) {
    if (r->handle().isPending()) out.push_back(r->summary());
  }
  return out;
}

void Coordinator::shutdown() {
  if (stopping_.exchange(true)) return;

  auto outstanding = registry_.all();
  for (const auto& r : outstanding) r->handle().cancel();

  logger().log(LogLevel::Info, "coordinator.shutdown",
               { {"cancelled", std::to_string(outstanding.size())} });
}

} // namespace hitl
