#include "hitl/Decision.hpp"
#include "hitl/Result.hpp"

namespace hitl {

const char* toString(Decision d) {
  return d == Decision::Approve ? "approve" : "reject";
}

const char* toString(ErrorCode code) {
  switch (code) {
    case ErrorCode::NotFound:        return "not_found";
    case ErrorCode::DuplicateId:     return "duplicate_id";
    case ErrorCode::Internal:        return "internal";
    case ErrorCode::InvalidArgument: return "invalid_argument";
  }
  return "unknown";
}

} // namespace hitl
