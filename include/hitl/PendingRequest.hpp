#pragma once

#include "hitl/Decision.hpp"
#include "hitl/WaitHandle.hpp"

#include <memory>
#include <string>

namespace hitl {

// One outstanding decision. Everything except the handle's state is fixed at
// construction; the handle lives and dies with the request.
class PendingRequest {
public:
  PendingRequest(std::string id, std::string owner, ToolRequest payload);

  const std::string&       id() const { return id_; }
  const std::string&       owner() const { return owner_; }
  const ToolRequest&       payload() const { return payload_; }
  Clock::time_point        createdAt() const { return createdAt_; }
  WaitHandle&              handle() const { return *handle_; }

  PendingSummary summary() const;

private:
  const std::string       id_;
  const std::string       owner_;
  const ToolRequest       payload_;
  const Clock::time_point createdAt_;
  const std::shared_ptr<WaitHandle> handle_;
};

// 128 random bits from the OS entropy source, formatted as a UUID string.
std::string makeRequestId();

} // namespace hitl
