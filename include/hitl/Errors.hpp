#pragma once

#include "hitl/Result.hpp"

#include <stdexcept>
#include <string>

namespace hitl {

// Thrown by Coordinator::requestDecision when the handshake cannot start.
class ApprovalError : public std::runtime_error {
public:
  ApprovalError(ErrorCode code, const std::string& what)
    : std::runtime_error(what), code_(code) {}

  explicit ApprovalError(const Error& err)
    : std::runtime_error(err.describe()), code_(err.code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

// The waiter's own cancellation fired (or the coordinator shut down) before a
// decision arrived. Never converted into a Decision.
class CancelledError : public std::runtime_error {
public:
  explicit CancelledError(const std::string& requestId)
    : std::runtime_error("approval request cancelled: " + requestId),
      requestId_(requestId) {}

  const std::string& requestId() const noexcept { return requestId_; }

private:
  std::string requestId_;
};

} // namespace hitl
