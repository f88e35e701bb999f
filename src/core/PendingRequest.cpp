#include "hitl/PendingRequest.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <utility>

namespace hitl {

PendingRequest::PendingRequest(std::string id, std::string owner, ToolRequest payload)
  : id_(std::move(id)),
    owner_(std::move(owner)),
    payload_(std::move(payload)),
    createdAt_(Clock::now()),
    handle_(WaitHandle::create())
{}

PendingSummary PendingRequest::summary() const {
  return PendingSummary{ id_, owner_, payload_, createdAt_ };
}

std::string makeRequestId() {
  // random_generator reads the system CSPRNG; one per thread avoids locking.
  thread_local boost::uuids::random_generator gen;
  return boost::uuids::to_string(gen());
}

} // namespace hitl
